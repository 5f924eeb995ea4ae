#ifndef LARYNX_RESAMPLE_H
#define LARYNX_RESAMPLE_H

#include "common.h"
#include <vector>
#include <stdint.h>

namespace Trm
{

/** Band-limited sample rate conversion.

  Input samples are buffered in a ring and interpolated through a
  kaiser-windowed sinc with 13 zero crossings. The output position is kept
  in a fixed point time register: 16 bits of sample index above 8 bits of
  filter phase above 8 bits of phase interpolation.

  Converted samples are appended to an external output vector, and the
  largest absolute output value is tracked for normalization.
*/

class SampleRateConverter
{
  enum {
    ZERO_CROSSINGS = 13,
    L_BITS = 8,
    L_RANGE = 1 << L_BITS,
    M_BITS = 8,
    M_RANGE = 1 << M_BITS,
    FRACTION_BITS = L_BITS + M_BITS,
    FRACTION_RANGE = 1 << FRACTION_BITS,
    FILTER_LENGTH = ZERO_CROSSINGS * L_RANGE,
    FILTER_LIMIT = FILTER_LENGTH - 1,
    BUFFER_SIZE = 1024
  };

  const float m_input_rate;
  const float m_output_rate;
  const double m_ratio;

  std::vector<float> & m_output;

  uint32_t m_time_register;
  uint32_t m_time_increment;
  uint32_t m_filter_increment;
  uint32_t m_phase_increment;

  size_t m_fill_ptr;
  size_t m_empty_ptr;
  size_t m_pad_size;
  size_t m_fill_size;
  size_t m_fill_counter;

  float m_max_sample;
  size_t m_num_samples;

  std::vector<double> m_h;
  std::vector<double> m_delta_h;
  std::vector<float> m_buffer;

public:

  SampleRateConverter (
      float input_rate,
      float output_rate,
      std::vector<float> & output);

  float input_rate () const { return m_input_rate; }
  float output_rate () const { return m_output_rate; }
  double ratio () const { return m_ratio; }
  size_t pad_size () const { return m_pad_size; }
  float max_sample () const { return m_max_sample; }
  size_t num_samples () const { return m_num_samples; }

  void reset ();

  void push (float sample);
  void flush ();

private:

  void init_filter ();
  void empty_buffer ();
  void emit (double sample);

  static uint32_t n_value (uint32_t x) { return x >> FRACTION_BITS; }
  static uint32_t l_value (uint32_t x) { return (x >> M_BITS) & (L_RANGE - 1); }
  static uint32_t m_value (uint32_t x) { return x & (M_RANGE - 1); }
  static uint32_t fraction_value (uint32_t x)
  {
    return x & (FRACTION_RANGE - 1);
  }

  static size_t inc (size_t i) { return i + 1 == BUFFER_SIZE ? 0 : i + 1; }
  static size_t dec (size_t i) { return i == 0 ? BUFFER_SIZE - 1 : i - 1; }
};

// modified bessel function of the first kind, order zero
double bessel_i0 (double x);

} // namespace Trm

#endif // LARYNX_RESAMPLE_H
