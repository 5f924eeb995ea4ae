#ifndef LARYNX_GLOTTAL_H
#define LARYNX_GLOTTAL_H

#include "common.h"
#include "fir.h"
#include <vector>

namespace Trm
{

enum Waveform { PULSE, SINE };

Waveform parse_waveform (string name);
const char * waveform_name (Waveform waveform);

/** Wavetable glottal source.

  The pulse rises as 3x^2 - 2x^3 over rise percent of the period, then
  falls as 1 - x^2 over fall_max percent. Louder pulses fall faster, down
  to fall_min percent. The table is read at twice the sample rate with
  linear interpolation and decimated through a maximally flat fir.
*/

class GlottalSource
{
  enum { TABLE_LENGTH = 512 };

  const Waveform m_waveform;
  const double m_half_increment;

  size_t m_div1;
  size_t m_div2;
  size_t m_tn_delta;

  std::vector<float> m_table;
  double m_position;
  FirFilter m_fir;

public:

  GlottalSource (
      Waveform waveform,
      float sample_rate,
      float rise = 40,
      float fall_min = 16,
      float fall_max = 32);

  Waveform waveform () const { return m_waveform; }
  size_t table_length () const { return TABLE_LENGTH; }
  float table (size_t i) const { return m_table[i]; }
  size_t rise_end () const { return m_div1; }
  size_t fall_end () const { return m_div2; }

  void reset ();

  // shortens the pulse fall for amplitude in [0,1]
  void update_wavetable (float amplitude);

  float sample (float frequency);

private:

  void increment_position (float frequency);
  float interpolate () const;
};

} // namespace Trm

#endif // LARYNX_GLOTTAL_H
