
#include "resample.h"

#define KAISER_BETA                     (5.658)
#define BESSEL_EPSILON                  (1e-21)
#define LOWPASS_CUTOFF                  (11.0 / 13.0)

#define LOG1(mess)

namespace Trm
{

double bessel_i0 (double x)
{
  double sum = 1;
  double u = 1;
  double half_x = x / 2;
  int n = 1;

  do {
    double temp = half_x / n++;
    u *= temp * temp;
    sum += u;
  } while (u >= BESSEL_EPSILON * sum);

  return sum;
}

SampleRateConverter::SampleRateConverter (
    float input_rate,
    float output_rate,
    std::vector<float> & output)

  : m_input_rate(input_rate),
    m_output_rate(output_rate),
    m_ratio(double(output_rate) / input_rate),
    m_output(output),
    m_time_increment(lrint(FRACTION_RANGE / m_ratio)),
    m_filter_increment(L_RANGE),
    m_phase_increment(lrint(m_ratio * FRACTION_RANGE)),
    m_h(FILTER_LENGTH),
    m_delta_h(FILTER_LENGTH),
    m_buffer(BUFFER_SIZE)
{
  ASSERT_LT(0, input_rate);
  ASSERT_LT(0, output_rate);
  ASSERT(m_time_increment > 0,
      "sample rate ratio too large: " << input_rate << " -> " << output_rate);

  const double rounded_ratio = double(FRACTION_RANGE) / m_time_increment;
  m_pad_size = m_ratio >= 1
             ? size_t(ZERO_CROSSINGS)
             : size_t(ZERO_CROSSINGS / rounded_ratio);
  ASSERT(2 * m_pad_size < BUFFER_SIZE,
      "sample rate ratio too small: " << input_rate << " -> " << output_rate);
  m_fill_size = BUFFER_SIZE - 2 * m_pad_size;

  init_filter();
  reset();

  LOG1("resampling " << input_rate << " -> " << output_rate
      << " Hz, pad = " << m_pad_size);
}

void SampleRateConverter::init_filter ()
{
  // ideal lowpass impulse response
  m_h[0] = LOWPASS_CUTOFF;
  const double x = M_PI / L_RANGE;
  for (size_t i = 1; i < FILTER_LENGTH; ++i) {
    double y = i * x;
    m_h[i] = sin(y * LOWPASS_CUTOFF) / y;
  }

  // kaiser window
  const double inv_i0_beta = 1 / bessel_i0(KAISER_BETA);
  for (size_t i = 0; i < FILTER_LENGTH; ++i) {
    double t = double(i) / FILTER_LENGTH;
    m_h[i] *= bessel_i0(KAISER_BETA * sqrt(1 - t * t)) * inv_i0_beta;
  }

  // differences for phase interpolation
  for (size_t i = 0; i < FILTER_LIMIT; ++i) {
    m_delta_h[i] = m_h[i + 1] - m_h[i];
  }
  m_delta_h[FILTER_LIMIT] = -m_h[FILTER_LIMIT];
}

void SampleRateConverter::reset ()
{
  m_time_register = 0;
  m_fill_ptr = m_pad_size;
  m_empty_ptr = 0;
  m_fill_counter = 0;
  m_max_sample = 0;
  m_num_samples = 0;

  for (size_t i = 0; i < BUFFER_SIZE; ++i) m_buffer[i] = 0;
}

void SampleRateConverter::push (float sample)
{
  m_buffer[m_fill_ptr] = sample;
  m_fill_ptr = inc(m_fill_ptr);

  if (++m_fill_counter >= m_fill_size) {
    empty_buffer();
    m_fill_counter = 0;
  }
}

void SampleRateConverter::flush ()
{
  for (size_t i = 0; i < 2 * m_pad_size; ++i) push(0);
  empty_buffer();
}

inline void SampleRateConverter::emit (double sample)
{
  imax(m_max_sample, float(fabs(sample)));
  ++m_num_samples;
  m_output.push_back(sample);
}

void SampleRateConverter::empty_buffer ()
{
  long end_ptr = long(m_fill_ptr) - long(m_pad_size);
  if (end_ptr < 0) end_ptr += BUFFER_SIZE;
  if (end_ptr < long(m_empty_ptr)) end_ptr += BUFFER_SIZE;

  while (long(m_empty_ptr) < end_ptr) {
    double output = 0;

    if (m_ratio >= 1) {

      // left side of the convolution
      double interp = double(m_value(m_time_register)) / M_RANGE;
      size_t index = m_empty_ptr;
      for (size_t f = l_value(m_time_register);
           f < FILTER_LENGTH;
           f += m_filter_increment, index = dec(index)) {
        output += m_buffer[index] * (m_h[f] + m_delta_h[f] * interp);
      }

      // right side, mirrored in time
      uint32_t mirror = ~m_time_register;
      interp = double(m_value(mirror)) / M_RANGE;
      index = inc(m_empty_ptr);
      for (size_t f = l_value(mirror);
           f < FILTER_LENGTH;
           f += m_filter_increment, index = inc(index)) {
        output += m_buffer[index] * (m_h[f] + m_delta_h[f] * interp);
      }

    } else {

      uint32_t phase = lrint(fraction_value(m_time_register) * m_ratio);
      size_t index = m_empty_ptr;
      for (uint32_t f; (f = phase >> M_BITS) < FILTER_LENGTH;) {
        double impulse = m_h[f]
                       + m_delta_h[f] * (double(m_value(phase)) / M_RANGE);
        output += m_buffer[index] * impulse;
        index = dec(index);
        phase += m_phase_increment;
      }

      phase = lrint(fraction_value(~m_time_register) * m_ratio);
      index = inc(m_empty_ptr);
      for (uint32_t f; (f = phase >> M_BITS) < FILTER_LENGTH;) {
        double impulse = m_h[f]
                       + m_delta_h[f] * (double(m_value(phase)) / M_RANGE);
        output += m_buffer[index] * impulse;
        index = inc(index);
        phase += m_phase_increment;
      }

      // taps are spread by the ratio, so rescale for unit dc gain
      output *= m_ratio;
    }

    emit(output);

    // advance by whole input samples, keeping the fraction
    m_time_register += m_time_increment;
    m_empty_ptr += n_value(m_time_register);
    if (m_empty_ptr >= BUFFER_SIZE) {
      m_empty_ptr -= BUFFER_SIZE;
      end_ptr -= BUFFER_SIZE;
    }
    m_time_register &= FRACTION_RANGE - 1;
  }
}

} // namespace Trm

