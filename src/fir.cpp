
#include "fir.h"

#define LOG1(mess)

namespace Trm
{

//----( rational approximation )----------------------------------------------

void rational_approximation (
    double number,
    int & order,
    int & numerator,
    int & denominator)
{
  if (order <= 0) {
    numerator = 0;
    denominator = 0;
    order = -1;
    return;
  }

  double frac = fabs(number - int(number));
  int order_max = min(2 * order, int(FirFilter::LIMIT));

  double min_error = 1;
  int modulus = 0;
  for (int i = order; i <= order_max; ++i) {
    double ps = i * frac;
    int ip = int(ps + 0.5);
    double error = fabs((ps - ip) / i);
    if (error < min_error) {
      min_error = error;
      modulus = ip;
      denominator = i;
    }
  }

  numerator = int(fabs(number)) * denominator + modulus;
  if (number < 0) numerator = -numerator;

  order = denominator - 1;

  if (numerator == denominator) {
    denominator = order_max;
    numerator = denominator - 1;
    order = numerator;
  }
}

//----( maximally flat fir )--------------------------------------------------

namespace
{

// returns the number of coefficients, stored in coeffs[1..n]
int maximally_flat (double beta, double gamma, double * coeffs)
{
  ASSERT(0 < beta and beta < 0.5,
      "fir beta out of range (0,0.5): " << beta);

  double beta_min = min(2 * beta, 1 - 2 * beta);
  ASSERT(0 < gamma and gamma < beta_min,
      "fir gamma out of range (0," << beta_min << "): " << gamma);

  int nt = int(1 / (4 * gamma * gamma));
  ASSERT(nt <= 160, "fir gamma too small: " << gamma);

  // rational approximation to the cutoff point
  double ac = (1 + cos(2 * M_PI * beta)) / 2;
  int numerator = 0;
  int np = 0;
  rational_approximation(ac, nt, numerator, np);
  ASSERT(0 < np and np <= FirFilter::LIMIT,
      "fir design failed for beta = " << beta << ", gamma = " << gamma);

  int n = 2 * np - 1;
  if (numerator == 0) numerator = 1;

  double a[FirFilter::LIMIT + 1];
  double c[FirFilter::LIMIT + 1];
  for (int i = 0; i <= FirFilter::LIMIT; ++i) a[i] = c[i] = 0;

  // magnitude at np points
  a[1] = 1;
  c[1] = 1;
  int ll = nt - numerator;

  for (int i = 2; i <= np; ++i) {
    c[i] = cos(2 * M_PI * (i - 1) / n);
    double x = (1 - c[i]) / 2;
    double y = x;
    double sum = 1;

    if (numerator == nt) continue;

    for (int j = 1; j <= ll; ++j) {
      double z = y;
      for (int jj = 1; jj < numerator; ++jj) {
        z *= 1 + double(j) / jj;
      }
      y *= x;
      sum += z;
    }
    a[i] = sum * pow(1 - x, numerator);
  }

  // weighting coefficients by an n-point idft
  for (int i = 1; i <= np; ++i) {
    coeffs[i] = a[1] / 2;
    for (int j = 2; j <= np; ++j) {
      int m = ((i - 1) * (j - 1)) % n;
      if (m > nt) m = n - m;
      coeffs[i] += c[m + 1] * a[j];
    }
    coeffs[i] *= 2.0 / n;
  }

  return np;
}

// drops high order coefficients below the cutoff
int trim (double cutoff, int n_coeffs, const double * coeffs)
{
  for (int i = n_coeffs; i > 0; --i) {
    if (fabs(coeffs[i]) >= fabs(cutoff)) return i;
  }
  return n_coeffs;
}

} // anonymous namespace

FirFilter::FirFilter (float beta, float gamma, float cutoff)
  : m_ptr(0)
{
  double coeffs[LIMIT + 1];
  int n_coeffs = maximally_flat(beta, gamma, coeffs);
  n_coeffs = trim(cutoff, n_coeffs, coeffs);

  const int n_taps = 2 * n_coeffs - 1;
  m_coeffs.resize(n_taps);
  m_data.resize(n_taps, 0.0f);

  // mirror coefficients n..2,1,2..n
  int ptr = n_coeffs;
  int step = -1;
  for (int i = 0; i < n_taps; ++i) {
    m_coeffs[i] = coeffs[ptr];
    ptr += step;
    if (ptr <= 0) {
      ptr = 2;
      step = 1;
    }
  }

  LOG1("fir filter: beta = " << beta << ", gamma = " << gamma
      << ", " << n_taps << " taps");
}

float FirFilter::dc_gain () const
{
  float total = 0;
  for (size_t i = 0; i < m_coeffs.size(); ++i) total += m_coeffs[i];
  return total;
}

void FirFilter::reset ()
{
  for (size_t i = 0; i < m_data.size(); ++i) m_data[i] = 0;
  m_ptr = 0;
}

float FirFilter::filter (float input, bool need_output)
{
  m_data[m_ptr] = input;

  if (not need_output) {
    m_ptr = decrement(m_ptr);
    return 0;
  }

  float output = 0;
  for (size_t i = 0, I = m_coeffs.size(); i < I; ++i) {
    output += m_data[m_ptr] * m_coeffs[i];
    m_ptr = increment(m_ptr);
  }
  m_ptr = decrement(m_ptr);

  return output;
}

} // namespace Trm

