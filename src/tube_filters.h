#ifndef LARYNX_TUBE_FILTERS_H
#define LARYNX_TUBE_FILTERS_H

#include "common.h"

namespace Trm
{

//----( aperture filters )----------------------------------------------------

/** Highpass one-pole one-zero filter for sound radiated at an open end.
  y[t] = a (x[t] - x[t-1] + y[t-1])
*/

class RadiationFilter
{
  float m_a20;
  float m_a21;
  float m_b21;
  float m_x;
  float m_y;

public:

  RadiationFilter (float aperture_coeff)
    : m_a20(aperture_coeff),
      m_a21(-aperture_coeff),
      m_b21(-aperture_coeff),
      m_x(0),
      m_y(0)
  {}

  void reset () { m_x = m_y = 0; }
  float filter (float input)
  {
    float output = m_a20 * input + m_a21 * m_x - m_b21 * m_y;
    m_x = input;
    m_y = output;
    return output;
  }
};

/** Lowpass one-pole filter for sound reflected back into the tube.
  y[t] = (1 - a) x[t] + a y[t-1]
*/

class ReflectionFilter
{
  float m_a10;
  float m_b11;
  float m_y;

public:

  ReflectionFilter (float aperture_coeff)
    : m_a10(1 - fabsf(aperture_coeff)),
      m_b11(-aperture_coeff),
      m_y(0)
  {}

  void reset () { m_y = 0; }
  float filter (float input)
  {
    float output = m_a10 * input - m_b11 * m_y;
    m_y = output;
    return output;
  }
};

//----( throat )--------------------------------------------------------------

// lowpass path for sound transmitted through the throat wall

class Throat
{
  float m_a0;
  float m_b1;
  float m_gain;
  float m_y;

public:

  Throat (float sample_rate, float cutoff, float gain)
    : m_a0(2 * cutoff / sample_rate),
      m_b1(1 - m_a0),
      m_gain(gain),
      m_y(0)
  {
    ASSERT_LT(0, sample_rate);
  }

  void reset () { m_y = 0; }
  float process (float input)
  {
    m_y = m_a0 * input + m_b1 * m_y;
    return m_y * m_gain;
  }
};

//----( frication )-----------------------------------------------------------

// two-pole bandpass filter shaping the frication noise

class BandpassFilter
{
  float m_alpha;
  float m_beta;
  float m_gamma;
  float m_x1, m_x2;
  float m_y1, m_y2;

public:

  BandpassFilter () : m_alpha(0), m_beta(0), m_gamma(0) { reset(); }

  void reset () { m_x1 = m_x2 = m_y1 = m_y2 = 0; }
  void update (float sample_rate, float bandwidth, float center_freq)
  {
    float tan_value = tanf(M_PI * bandwidth / sample_rate);
    float cos_value = cosf(2 * M_PI * center_freq / sample_rate);
    m_beta = (1 - tan_value) / (2 * (1 + tan_value));
    m_gamma = (0.5f + m_beta) * cos_value;
    m_alpha = (0.5f - m_beta) / 2;
  }
  float filter (float input)
  {
    float output = 2 * (m_alpha * (input - m_x2)
                      + m_gamma * m_y1
                      - m_beta * m_y2);
    m_x2 = m_x1;
    m_x1 = input;
    m_y2 = m_y1;
    m_y1 = output;
    return output;
  }
};

//----( noise )---------------------------------------------------------------

// one-zero lowpass: y[t] = x[t] + x[t-1]

class NoiseFilter
{
  float m_x;

public:

  NoiseFilter () : m_x(0) {}

  void reset () { m_x = 0; }
  float filter (float input)
  {
    float output = input + m_x;
    m_x = input;
    return output;
  }
};

/** Deterministic multiplicative congruential noise in [-0.5,0.5).
  Resetting restarts the same sequence.
*/

class NoiseSource
{
  double m_seed;

public:

  NoiseSource () { reset(); }

  void reset () { m_seed = 0.7892347; }
  float sample ()
  {
    double product = m_seed * 377.0;
    m_seed = product - int(product);
    return m_seed - 0.5;
  }
};

} // namespace Trm

#endif // LARYNX_TUBE_FILTERS_H
