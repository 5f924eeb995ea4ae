#ifndef LARYNX_VOCAL_TRACT_H
#define LARYNX_VOCAL_TRACT_H

/** Articulatory speech synthesis with a tube resonance model.

  The vocal tract is a waveguide of 10 oropharynx sections in 8 regions,
  with a 6 section nasal branch joined at the middle of region 4 through
  the velum. Every sample, pressure waves travel one section in each
  direction and scatter at junctions with coefficients derived from the
  section radii. Glottal pulses enter at the bottom, frication noise is
  injected near the constriction, and sound radiates from mouth and nose.

  Control frames arrive at the control rate (one per synth duration);
  parameters are linearly interpolated over the control period and the
  tube runs at sample_rate = control_rate * control_period, which is set
  by the tract length so that one section is one sample long. Output is
  resampled to the output rate.
*/

#include "common.h"
#include "config.h"
#include "sound.h"
#include "glottal.h"
#include "tube_filters.h"
#include "resample.h"
#include <vector>

namespace Trm
{

enum {
  TOTAL_SECTIONS = 10,
  TOTAL_REGIONS = 8,
  TOTAL_NASAL_SECTIONS = 6,
  TOTAL_FRIC_TAPS = 8
};

//----( conversions )---------------------------------------------------------

// meters per second at a temperature in celsius
inline float speed_of_sound (float temp) { return 331.4f + 0.6f * temp; }

// maps 0..60 dB to 0..1
float amplitude (float db);

// semitones relative to middle C
float frequency (float pitch);

float scattering_coeff (float radius_a, float radius_b);

// splits amplitude between the two taps bracketing position in [0,7]
void frication_taps (float position, float amplitude, float * taps);

//----( configuration )-------------------------------------------------------

struct TubeConfig
{
  float temp;           // celsius
  float loss;           // percent per section
  float mouth_coef;     // Hz
  float nose_coef;      // Hz
  float throat_cutoff;  // Hz
  float throat_vol;     // dB
  float vtl_off;        // cm
  Waveform waveform;
  bool noise_mod;
  float mix_off;        // dB

  TubeConfig ()
    : temp(32),
      loss(0.8f),
      mouth_coef(5000),
      nose_coef(5000),
      throat_cutoff(1500),
      throat_vol(6),
      vtl_off(0),
      waveform(PULSE),
      noise_mod(true),
      mix_off(48)
  {}

  void load (const ConfigParser & config);
};

enum Voice { MALE, FEMALE, CHILD_LARGE, CHILD_SMALL, BABY };

Voice parse_voice (string name);
const char * voice_name (Voice voice);

struct VoiceParams
{
  Voice voice;
  float tract_length;   // cm
  float glot_pulse_fall_min;
  float glot_pulse_fall_max;
  float glot_pitch_ref;
  float breathiness;
  float glot_pulse_rise;
  float aperture_radius;
  float nose_radius[TOTAL_NASAL_SECTIONS - 1];  // fixed sections N2..N6
  float radius1;
  float nose_radius_coef;
  float radius_coef;

  VoiceParams (Voice v = FEMALE) { set(v); }

  void set (Voice v);
  void load (const ConfigParser & config);
};

struct SynthSpec
{
  float duration_msec;  // one control frame
  float volume;         // dB
  float balance;        // -1 = left .. 1 = right
  float output_rate;

  SynthSpec ()
    : duration_msec(25),
      volume(60),
      balance(0),
      output_rate(DEFAULT_OUTPUT_SAMPLE_RATE)
  {}

  void load (const ConfigParser & config);
};

//----( control )-------------------------------------------------------------

enum ControlParam
{
  GLOT_PITCH,
  GLOT_VOL,
  ASP_VOL,
  FRIC_VOL,
  FRIC_POS,
  FRIC_CF,
  FRIC_BW,
  RADIUS_2,
  RADIUS_3,
  RADIUS_4,
  RADIUS_5,
  RADIUS_6,
  RADIUS_7,
  RADIUS_8,
  VELUM,
  NUM_CONTROLS
};

struct Control
{
  float value[NUM_CONTROLS];

  Control () { set_rest(); }

  static const char * name (size_t i);
  static float min_value (size_t i);
  static float max_value (size_t i);
  static float rest_value (size_t i);

  float & operator[] (size_t i) { return value[i]; }
  float operator[] (size_t i) const { return value[i]; }

  void set_rest ();
  void set (const float * values, bool normalized = false);
  float normalized (size_t i) const;
};

ostream & operator<< (ostream & o, const Control & control);

//----( vocal tract )---------------------------------------------------------

class VocalTract
{
public:

  enum State { UNINITIALIZED, READY, SYNTHESIZING };

private:

  enum { TOP = 0, BOTTOM = 1 };

  TubeConfig m_config;
  VoiceParams m_voice;
  SynthSpec m_synth;
  State m_state;

  Control m_target;   // requested for the next frame
  Control m_prev;     // reached at the end of the last frame
  Control m_delta;    // per sample change during a frame
  Control m_current;  // interpolated state

  float m_control_rate;
  size_t m_control_period;
  float m_sample_rate;
  float m_tube_length;

  float m_breathiness_factor;
  float m_crossmix_factor;
  float m_damping_factor;
  float m_prev_glot_amplitude;

  // pressure waves [section][TOP|BOTTOM][buffer]
  float m_oropharynx[TOTAL_SECTIONS][2][2];
  float m_oropharynx_coeffs[TOTAL_REGIONS];
  float m_nasal[TOTAL_NASAL_SECTIONS][2][2];
  float m_nasal_coeffs[TOTAL_NASAL_SECTIONS];
  float m_alpha[3];
  float m_fric_taps[TOTAL_FRIC_TAPS];

  // the buffer written this sample; the other holds the previous sample
  bool m_write_buffer;

  std::vector<float> m_output;

  GlottalSource * m_glottal;
  RadiationFilter * m_mouth_radiation;
  ReflectionFilter * m_mouth_reflection;
  RadiationFilter * m_nasal_radiation;
  ReflectionFilter * m_nasal_reflection;
  Throat * m_throat;
  SampleRateConverter * m_resampler;
  BandpassFilter m_bandpass;
  NoiseFilter m_noise_filter;
  NoiseSource m_noise;

  std::vector<Control> * m_trace;

public:

  VocalTract (
      const TubeConfig & config = TubeConfig(),
      const VoiceParams & voice = VoiceParams(),
      const SynthSpec & synth = SynthSpec());
  ~VocalTract ();

  // parameters, changes take effect at the next init_synth()
  const TubeConfig & config () const { return m_config; }
  const VoiceParams & voice () const { return m_voice; }
  const SynthSpec & synth () const { return m_synth; }
  void set_config (const TubeConfig & config);
  void set_voice (const VoiceParams & voice);
  void set_volume (float db) { m_synth.volume = db; }
  void set_balance (float balance) { m_synth.balance = balance; }

  // a new duration forces reinitialization before the next frame
  void set_duration (float msec);

  // control
  Control & control () { return m_target; }
  const Control & control () const { return m_target; }
  const Control & previous () const { return m_prev; }
  const Control & current () const { return m_current; }
  void set_control (const float * values, bool normalized = false)
  {
    m_target.set(values, normalized);
  }

  // appends the interpolated control used at every sample
  void set_trace (std::vector<Control> * trace) { m_trace = trace; }

  // derived
  State state () const { return m_state; }
  float control_rate () const { return m_control_rate; }
  size_t control_period () const { return m_control_period; }
  float sample_rate () const { return m_sample_rate; }
  float tube_length () const { return m_tube_length; }
  float damping_factor () const { return m_damping_factor; }
  float fric_tap (size_t i) const { return m_fric_taps[i]; }
  float tube_energy () const;

  // synthesis
  void reset ();
  void init_synth ();
  void synthesize (bool reset_first = false);
  void flush ();

  // output at the output rate
  const std::vector<float> & output () const { return m_output; }
  float max_sample () const;
  float mono_scale () const;
  void stereo_scale (float & left, float & right) const;
  void write_output (Sound & sound) const;

private:

  void free_filters ();
  void initialize_synthesizer ();
  void init_nasal_cavity ();
  float region_radius (size_t region) const;
  void compute_tube_coeffs ();
  void synthesize_sample ();
  float propagate (float input, float frication);
};

} // namespace Trm

#endif // LARYNX_VOCAL_TRACT_H
