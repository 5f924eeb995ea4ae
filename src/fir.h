#ifndef LARYNX_FIR_H
#define LARYNX_FIR_H

#include "common.h"
#include <vector>

namespace Trm
{

//----( rational approximation )----------------------------------------------

/** Best rational approximation numerator / denominator of a number,
  searching denominators in [order, 2 order].
  On return order = denominator - 1.
*/

void rational_approximation (
    double number,
    int & order,
    int & numerator,
    int & denominator);

//----( maximally flat fir )--------------------------------------------------

/** Linear phase lowpass fir filter with a maximally flat passband.

  beta is the center of the transition band and gamma its width, both as
  fractions of the sample rate. Coefficients below cutoff are trimmed.
  Taps are symmetric: n_taps = 2 n_coeffs - 1.
*/

class FirFilter
{
  std::vector<float> m_coeffs;
  std::vector<float> m_data;
  size_t m_ptr;

public:

  enum { LIMIT = 200 };

  FirFilter (float beta, float gamma, float cutoff);

  size_t n_taps () const { return m_coeffs.size(); }
  float tap (size_t i) const { return m_coeffs[i]; }
  float dc_gain () const;

  void reset ();

  // when need_output is false the sample is only buffered
  float filter (float input, bool need_output = true);

private:

  size_t increment (size_t ptr) const
  {
    return ptr + 1 >= m_coeffs.size() ? 0 : ptr + 1;
  }
  size_t decrement (size_t ptr) const
  {
    return ptr == 0 ? m_coeffs.size() - 1 : ptr - 1;
  }
};

} // namespace Trm

#endif // LARYNX_FIR_H
