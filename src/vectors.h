#ifndef LARYNX_VECTORS_H
#define LARYNX_VECTORS_H

#include "common.h"

//----( vector classes )------------------------------------------------------

template<class T>
struct Vector
{
  typedef T value_type;

  T * const data;
  const size_t size;
  const bool alias;

  // aliasing
  explicit Vector (size_t s, T * d = NULL)
    : data(d ? d : (T*) malloc_aligned(s * sizeof(T))), size(s), alias(d) {}
  Vector (const Vector<T> & other)
    : data(other.data), size(other.size), alias(true) {}
  ~Vector () { if (not alias) free_aligned(data); }

  // copying
  void operator= (const Vector<T> & other)
  {
    ASSERT_SIZE(other, size);
    for (size_t i = 0; i < size; ++i) { data[i] = other.data[i]; }
  }

  // constant filling
  void zero () { zero_bytes(data, size * sizeof(T)); }
  void set (T value)
  {
    for (size_t i = 0; i < size; ++i) data[i] = value;
  }

  // access
  operator const T * () const { return data; }
  operator       T * ()       { return data; }
  Vector<T> block (size_t stride, size_t number = 0)
  {
    ASSERT_LT(number, size / stride);
    return Vector<T>(stride, data + stride * number);
  }
  const Vector<T> block (size_t stride, size_t number = 0) const
  {
    ASSERT_LT(number, size / stride);
    return Vector<T>(stride, const_cast<T*>(data) + stride * number);
  }

  // stl-style bounds
  typedef T * iterator;
  iterator begin () { return data; }
  iterator end () { return data + size; }
  typedef const T * const_iterator;
  const_iterator begin () const { return data; }
  const_iterator end () const { return data + size; }
};

template<>
struct Vector<float>
{
  typedef float value_type;

  float * const data;
  const size_t size;
  const bool alias;

  // aliasing
  explicit Vector (size_t s, float * d = NULL)
    : data(d ? d : malloc_float(s)), size(s), alias(d) {}
  Vector (const Vector<float> & other)
    : data(other.data), size(other.size), alias(true) {}
  ~Vector<float> () { if (not alias) free_float(data); }

  // copying
  void operator= (const Vector<float> & other)
  {
    ASSERT_SIZE(other, size);
    copy_float(other.data, data, size);
  }

  // constant filling
  void zero () { zero_float(data, size); }
  void set (float value)
  {
    for (size_t i = 0; i < size; ++i) data[i] = value;
  }

  // access
  operator const float * () const { return data; }
  operator       float * ()       { return data; }
  Vector<float> block (size_t stride, size_t number = 0)
  {
    ASSERT_LT(number, size / stride);
    return Vector<float>(stride, data + stride * number);
  }
  const Vector<float> block (size_t stride, size_t number = 0) const
  {
    ASSERT_LT(number, size / stride);
    return Vector<float>(stride, const_cast<float*>(data) + stride * number);
  }

  // stl-style bounds
  typedef float * iterator;
  iterator begin () { return data; }
  iterator end () { return data + size; }
  typedef const float * const_iterator;
  const_iterator begin () const { return data; }
  const_iterator end () const { return data + size; }
};

template<>
struct Vector<complex>
{
  typedef complex value_type;

  complex * const data;
  const size_t size;
  const bool alias;

  explicit Vector (size_t s, complex * d = NULL)
    : data(d ? d : malloc_complex(s)), size(s), alias(d) {}
  Vector (const Vector<complex> & other)
    : data(other.data), size(other.size), alias(true) {}
  ~Vector<complex> () { if (not alias) free_complex(data); }

  void zero () { zero_bytes(data, size * sizeof(complex)); }

  operator const complex * () const { return data; }
  operator       complex * ()       { return data; }

  typedef complex * iterator;
  iterator begin () { return data; }
  iterator end () { return data + size; }
  typedef const complex * const_iterator;
  const_iterator begin () const { return data; }
  const_iterator end () const { return data + size; }
};

//----( reductions )----------------------------------------------------------

float sum (const Vector<float> & x);
float max (const Vector<float> & x);
inline float mean (const Vector<float> & x) { return sum(x) / x.size; }

#endif // LARYNX_VECTORS_H

