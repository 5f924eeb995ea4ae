
#include "glottal.h"

#define FIR_BETA                        (0.2f)
#define FIR_GAMMA                       (0.1f)
#define FIR_CUTOFF                      (1e-8f)

namespace Trm
{

Waveform parse_waveform (string name)
{
  if (name == "pulse") return PULSE;
  if (name == "sine") return SINE;
  ERROR("unknown glottal waveform: " << name);
}

const char * waveform_name (Waveform waveform)
{
  switch (waveform) {
    case PULSE: return "pulse";
    case SINE: return "sine";
  }
  return "unknown";
}

GlottalSource::GlottalSource (
    Waveform waveform,
    float sample_rate,
    float rise,
    float fall_min,
    float fall_max)

  : m_waveform(waveform),
    m_half_increment(double(TABLE_LENGTH) / sample_rate / 2),
    m_div1(roundu(TABLE_LENGTH * rise / 100)),
    m_div2(roundu(TABLE_LENGTH * (rise + fall_max) / 100)),
    m_tn_delta(roundu(TABLE_LENGTH * (fall_max - fall_min) / 100)),
    m_table(TABLE_LENGTH, 0.0f),
    m_position(0),
    m_fir(FIR_BETA, FIR_GAMMA, FIR_CUTOFF)
{
  ASSERT_LT(0, sample_rate);
  ASSERT(m_div1 > 0 and m_div1 < m_div2 and m_div2 <= TABLE_LENGTH,
      "bad glottal pulse shape: rise = " << rise
      << ", fall = " << fall_min << ".." << fall_max);
  ASSERT_LE(m_tn_delta, m_div2 - m_div1 - 1);

  if (m_waveform == PULSE) {
    for (size_t i = 0; i < m_div1; ++i) {
      float x = float(i) / m_div1;
      m_table[i] = 3 * sqr(x) - 2 * sqr(x) * x;
    }
    const size_t tn_length = m_div2 - m_div1;
    for (size_t i = m_div1; i < m_div2; ++i) {
      float x = float(i - m_div1) / tn_length;
      m_table[i] = 1 - sqr(x);
    }
  } else {
    for (size_t i = 0; i < TABLE_LENGTH; ++i) {
      m_table[i] = sinf(2 * M_PI * i / TABLE_LENGTH);
    }
  }
}

void GlottalSource::reset ()
{
  m_position = 0;
  m_fir.reset();
}

void GlottalSource::update_wavetable (float amplitude)
{
  const size_t new_div2 = m_div2 - roundu(amplitude * m_tn_delta);
  const float inv_length = 1.0f / (new_div2 - m_div1);

  float x = 0;
  for (size_t i = m_div1; i < new_div2; ++i, x += inv_length) {
    m_table[i] = 1 - sqr(x);
  }
  for (size_t i = new_div2; i < m_div2; ++i) {
    m_table[i] = 0;
  }
}

inline void GlottalSource::increment_position (float frequency)
{
  m_position += frequency * m_half_increment;
  m_position = fmod(m_position, double(TABLE_LENGTH));
}

inline float GlottalSource::interpolate () const
{
  size_t lower = size_t(m_position);
  size_t upper = (lower + 1) % TABLE_LENGTH;
  float t = m_position - lower;
  return m_table[lower] + t * (m_table[upper] - m_table[lower]);
}

float GlottalSource::sample (float frequency)
{
  increment_position(frequency);
  m_fir.filter(interpolate(), false);

  increment_position(frequency);
  return m_fir.filter(interpolate(), true);
}

} // namespace Trm

