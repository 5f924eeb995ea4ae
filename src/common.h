#ifndef LARYNX_COMMON_H
#define LARYNX_COMMON_H

#include <cstdlib>  // for exit() & abort();
#include <iostream>
#include <string>
#include <cmath>
#include <complex>
#include <cstdint>

using std::cin;
using std::cout;
using std::cerr;
using std::flush;
using std::endl;
using std::ostream;
using std::istream;
using std::string;

extern const char * larynx_logo;

//----( global parameters )---------------------------------------------------

#define DEFAULT_ANALYSIS_SAMPLE_RATE    (16000)
#define DEFAULT_OUTPUT_SAMPLE_RATE      (44100)

//----( compiler-specific )---------------------------------------------------

#ifdef __GNUG__
  #define restrict __restrict__
#else // __GNUG__
  #warning keyword 'restrict' ignored
  #define restrict
#endif // __GNUG__

//----( logging )-------------------------------------------------------------

#define LOG(mess) { cout << mess << endl; }
#define PRINT(arg) LOG(#arg " = " << (arg))
#define PRINT2(arg1,arg2) LOG(#arg1 " = " << (arg1) << ", " \
                              #arg2 " = " << (arg2))
#define PRINT3(arg1,arg2,arg3) LOG(#arg1 " = " << (arg1) << ", " \
                                   #arg2 " = " << (arg2) << ", " \
                                   #arg3 " = " << (arg3))

#define ERROR(mess) {\
    cerr << "ERROR "\
         << mess << "\n\t"\
         << __FILE__ << " : " << __LINE__ << "\n\t"\
         << __PRETTY_FUNCTION__ << endl; \
    abort(); }

#define WARN(mess) {\
    cerr << "WARNING "\
         << mess << "\n\t"\
         << __FILE__ << " : " << __LINE__ << "\n\t"\
         << __PRETTY_FUNCTION__ << endl; }

#define ASSERT(cond, mess) { if (!(cond)) ERROR(mess); }
#define ASSERTW(cond, mess) { if (!(cond)) WARN(mess); }

#define ASSERT_EQ(x,y) ASSERT((x) == (y), \
    "expected " #x " = " #y ",\n\tactual: " << (x) << " vs " << (y))
#define ASSERT_LT(x,y) ASSERT((x) < (y), \
    "expected " #x " < " #y ",\n\tactual: " << (x) << " vs " << (y))
#define ASSERT_LE(x,y) ASSERT((x) <= (y), \
    "expected " #x " <= " #y ",\n\tactual: " << (x) << " vs " << (y))
#define ASSERT_NONNEG(x) ASSERT(0 <= x, \
    "expected " #x " nonnegative,\n\tactual: " << (x))
#define ASSERT_FINITE(x) ASSERT(safe_isfinite(x), \
    "expected " #x " finite,\n\tactual: " << (x))
#define ASSERT_CLOSE(x,y,tol) ASSERT(fabs((x) - (y)) <= (tol), \
    "expected " #x " ~ " #y " within " << (tol) \
    << ",\n\tactual: " << (x) << " vs " << (y))

#define ASSERT_SIZE(vect, vect_size) { \
  ASSERT(vect.size==static_cast<size_t>(vect_size), \
      "vector '" # vect "' has wrong size " \
      << vect.size << ",\n\tshould be " << (vect_size)); }

#ifndef LARYNX_NDEBUG
  #define ASSERT1_LT(x,y) ASSERT_LT(x,y)
#else // LARYNX_NDEBUG
  #define ASSERT1_LT(x,y)
#endif // LARYNX_NDEBUG

// time
double get_elapsed_time ();

class Timer
{
  double m_time;
public:
  Timer () { reset(); }
  void reset () { m_time = get_elapsed_time(); }
  double elapsed () const { return get_elapsed_time() - m_time; }
};

//----( datatypes )-----------------------------------------------------------

typedef std::complex<float> complex;

// these make finiteness testing safe even after optimization

inline bool safe_isfinite (float x)
{
  return (-HUGE_VALF < x) and (x < HUGE_VALF);
}
inline bool safe_isfinite (double x)
{
  return (-HUGE_VAL < x) and (x < HUGE_VAL);
}

//----( memory tools )--------------------------------------------------------

void * malloc_aligned (size_t size, size_t alignment = 16)
  __attribute__ ((malloc));
void free_aligned (void * pointer); // just calls free

inline float * malloc_float (size_t size, size_t alignment = 16)
{
  return (float *) malloc_aligned(sizeof(float) * size, alignment);
}
inline void free_float (float* pointer) { free_aligned(pointer); }

inline complex * malloc_complex (size_t size, size_t alignment = 16)
{
  return (complex *) malloc_aligned(sizeof(complex) * size, alignment);
}
inline void free_complex (complex* pointer) { free_aligned(pointer); }

void copy_float (
    const float * restrict source,
    float * restrict dest,
    size_t size);
void zero_float (float * x, size_t size);
void zero_bytes (void * x, size_t size);

//----( math )----------------------------------------------------------------

template<class T> inline T min (T x, T y) { return (x < y) ? x : y; }
template<class T> inline T max (T x, T y) { return (x > y) ? x : y; }
template<class T> inline void imax (T & x, const T & y) { if (y > x) x = y; }

// clipping
inline float clipped (float x, float LB = 0, float UB = 1)
{
  if (x >= LB) {
    if (x <= UB) {
      return x;
    } else {
      return UB;
    }
  } else {
    return LB;
  }
}

inline size_t roundu (float x) { return max(0l, lrintf(x)); }
inline size_t roundu (double x) { return max(0l, lrint(x)); }

template <class T> inline T safe_div (T num, T denom)
{ return denom == 0 ? 0.0 : num / denom; }

template <class T> inline T sqr (const T& x) { return x*x; }

inline float affine_sum (float x0, float x1, float t)
{
  return x0 + (x1 - x0) * t;
}

//----( random generators )---------------------------------------------------

inline uint32_t random_int () { return random(); }
inline uint32_t random_max () { return RAND_MAX; }

inline float random_01 ()
{
  return (random_int()) * (1.0f / random_max());
}

inline float random_unif (float lb, float ub)
{
  return affine_sum(lb, ub, random_01());
}

inline float random_std ()
{
  // zero mean, unit variance
  const float scale = sqrt(12) / random_max();
  const float shift = -sqrt(3);
  return random_int() * scale + shift;
}

#endif // LARYNX_COMMON_H

