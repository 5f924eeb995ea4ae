
#include "vocal_tract.h"

#define MIN_RADIUS                      (0.001f)
#define PITCH_BASE                      (220.0f)
#define PITCH_OFFSET                    (3.0f)
#define VOL_MAX                         (60.0f)
#define VT_SCALE                        (0.125f)
#define OUTPUT_SCALE                    (0.95f)

#define LOG1(mess)

namespace Trm
{

// oropharynx sections
enum { S1, S2, S3, S4, S5, S6, S7, S8, S9, S10 };

// oropharynx scattering junctions, C8 is the mouth aperture
enum { C1, C2, C3, C4, C5, C6, C7, C8 };

// nasal sections, N1 is the velum
enum { N1, N2, N3, N4, N5, N6 };

// nasal scattering junctions, NC6 is the nose aperture
enum { NC1, NC2, NC3, NC4, NC5, NC6 };

// frication taps, injected into S3..S10
enum { FC1, FC2, FC3, FC4, FC5, FC6, FC7, FC8 };

// three way junction at the velum
enum { LEFT, RIGHT, UPPER };

//----( conversions )---------------------------------------------------------

float amplitude (float db)
{
  db -= VOL_MAX;
  if (db <= -VOL_MAX) return 0;
  if (db >= 0) return 1;
  return powf(10, db / 20);
}

float frequency (float pitch)
{
  return PITCH_BASE * powf(2, (pitch + PITCH_OFFSET) / 12);
}

float scattering_coeff (float radius_a, float radius_b)
{
  float a2 = sqr(max(MIN_RADIUS, radius_a));
  float b2 = sqr(max(MIN_RADIUS, radius_b));
  return (a2 - b2) / (a2 + b2);
}

void frication_taps (float position, float amplitude, float * taps)
{
  const int integer_part = int(position);
  const float complement = position - integer_part;
  const float remainder = 1 - complement;

  for (int i = FC1; i < TOTAL_FRIC_TAPS; ++i) {
    if (i == integer_part) {
      taps[i] = remainder * amplitude;
      if (i + 1 < TOTAL_FRIC_TAPS) {
        taps[++i] = complement * amplitude;
      }
    } else {
      taps[i] = 0;
    }
  }
}

//----( configuration )-------------------------------------------------------

void TubeConfig::load (const ConfigParser & config)
{
  temp = config("tube.temp", temp);
  loss = config("tube.loss", loss);
  mouth_coef = config("tube.mouth_coef", mouth_coef);
  nose_coef = config("tube.nose_coef", nose_coef);
  throat_cutoff = config("tube.throat_cutoff", throat_cutoff);
  throat_vol = config("tube.throat_vol", throat_vol);
  vtl_off = config("tube.vtl_off", vtl_off);
  waveform = parse_waveform(config("tube.waveform", waveform_name(waveform)));
  noise_mod = config("tube.noise_mod", noise_mod);
  mix_off = config("tube.mix_off", mix_off);

  ASSERT(0 <= loss and loss < 100, "tube.loss out of range [0,100): " << loss);
}

Voice parse_voice (string name)
{
  if (name == "male") return MALE;
  if (name == "female") return FEMALE;
  if (name == "child_large") return CHILD_LARGE;
  if (name == "child_small") return CHILD_SMALL;
  if (name == "baby") return BABY;
  ERROR("unknown voice: " << name);
}

const char * voice_name (Voice voice)
{
  switch (voice) {
    case MALE: return "male";
    case FEMALE: return "female";
    case CHILD_LARGE: return "child_large";
    case CHILD_SMALL: return "child_small";
    case BABY: return "baby";
  }
  return "unknown";
}

void VoiceParams::set (Voice v)
{
  voice = v;

  glot_pulse_rise = 40;
  aperture_radius = 3.05f;
  nose_radius[0] = 1.35f;
  nose_radius[1] = 1.96f;
  nose_radius[2] = 1.91f;
  nose_radius[3] = 1.3f;
  nose_radius[4] = 0.73f;
  radius1 = 0.8f;
  nose_radius_coef = 1;
  radius_coef = 1;

  glot_pulse_fall_min = 24;
  glot_pulse_fall_max = 24;
  breathiness = 1.5f;

  switch (v) {
    case MALE:
      tract_length = 17.5f;
      glot_pitch_ref = -12;
      breathiness = 0.5f;
      break;

    case FEMALE:
      tract_length = 15;
      glot_pulse_fall_min = 32;
      glot_pulse_fall_max = 32;
      glot_pitch_ref = 0;
      break;

    case CHILD_LARGE:
      tract_length = 12.5f;
      glot_pitch_ref = 2.5f;
      break;

    case CHILD_SMALL:
      tract_length = 10;
      glot_pitch_ref = 5;
      break;

    case BABY:
      tract_length = 7.5f;
      glot_pitch_ref = 7.5f;
      break;
  }
}

void VoiceParams::load (const ConfigParser & config)
{
  set(parse_voice(config("voice", voice_name(voice))));

  tract_length = config("voice.tract_length", tract_length);
  glot_pulse_fall_min = config("voice.glot_pulse_fall_min", glot_pulse_fall_min);
  glot_pulse_fall_max = config("voice.glot_pulse_fall_max", glot_pulse_fall_max);
  glot_pitch_ref = config("voice.glot_pitch_ref", glot_pitch_ref);
  breathiness = config("voice.breathiness", breathiness);
  glot_pulse_rise = config("voice.glot_pulse_rise", glot_pulse_rise);
  aperture_radius = config("voice.aperture_radius", aperture_radius);
  radius1 = config("voice.radius1", radius1);
  nose_radius_coef = config("voice.nose_radius_coef", nose_radius_coef);
  radius_coef = config("voice.radius_coef", radius_coef);
}

void SynthSpec::load (const ConfigParser & config)
{
  duration_msec = config("synth.duration_msec", duration_msec);
  volume = config("synth.volume", volume);
  balance = config("synth.balance", balance);
  output_rate = config("synth.output_rate", output_rate);

  ASSERT_LT(0, duration_msec);
  ASSERT_LT(0, output_rate);
  ASSERT(-1 <= balance and balance <= 1,
      "synth.balance out of range [-1,1]: " << balance);
}

//----( control )-------------------------------------------------------------

namespace
{

struct ControlInfo
{
  const char * name;
  float min_value;
  float max_value;
  float rest_value;
};

const ControlInfo g_control_info[NUM_CONTROLS] = {
  {"glot_pitch", -10, 0, 0},
  {"glot_vol", 0, 60, 0},
  {"asp_vol", 0, 10, 0},
  {"fric_vol", 0, 24, 0},
  {"fric_pos", 0, 7, 4},
  {"fric_cf", 1000, 4000, 2500},
  {"fric_bw", 250, 4250, 2000},
  {"radius_2", 0, 3, 1},
  {"radius_3", 0, 3, 1},
  {"radius_4", 0, 3, 1},
  {"radius_5", 0, 3, 1},
  {"radius_6", 0, 3, 1},
  {"radius_7", 0, 3, 1},
  {"radius_8", 0, 3, 1},
  {"velum", 0, 1.5f, 0.1f}
};

} // anonymous namespace

const char * Control::name (size_t i) { return g_control_info[i].name; }
float Control::min_value (size_t i) { return g_control_info[i].min_value; }
float Control::max_value (size_t i) { return g_control_info[i].max_value; }
float Control::rest_value (size_t i) { return g_control_info[i].rest_value; }

void Control::set_rest ()
{
  for (size_t i = 0; i < NUM_CONTROLS; ++i) {
    value[i] = rest_value(i);
  }
}

void Control::set (const float * values, bool normalized)
{
  for (size_t i = 0; i < NUM_CONTROLS; ++i) {
    value[i] = normalized
             ? affine_sum(min_value(i), max_value(i), values[i])
             : values[i];
  }
}

float Control::normalized (size_t i) const
{
  return (value[i] - min_value(i)) / (max_value(i) - min_value(i));
}

ostream & operator<< (ostream & o, const Control & control)
{
  for (size_t i = 0; i < NUM_CONTROLS; ++i) {
    o << (i ? " " : "") << control[i];
  }
  return o;
}

//----( vocal tract )---------------------------------------------------------

VocalTract::VocalTract (
    const TubeConfig & config,
    const VoiceParams & voice,
    const SynthSpec & synth)

  : m_config(config),
    m_voice(voice),
    m_synth(synth),
    m_state(UNINITIALIZED),

    m_control_rate(0),
    m_control_period(0),
    m_sample_rate(0),
    m_tube_length(0),

    m_glottal(NULL),
    m_mouth_radiation(NULL),
    m_mouth_reflection(NULL),
    m_nasal_radiation(NULL),
    m_nasal_reflection(NULL),
    m_throat(NULL),
    m_resampler(NULL),

    m_trace(NULL)
{
  reset();
}

VocalTract::~VocalTract ()
{
  free_filters();
}

void VocalTract::free_filters ()
{
  if (m_glottal) { delete m_glottal; m_glottal = NULL; }
  if (m_mouth_radiation) { delete m_mouth_radiation; m_mouth_radiation = NULL; }
  if (m_mouth_reflection) { delete m_mouth_reflection; m_mouth_reflection = NULL; }
  if (m_nasal_radiation) { delete m_nasal_radiation; m_nasal_radiation = NULL; }
  if (m_nasal_reflection) { delete m_nasal_reflection; m_nasal_reflection = NULL; }
  if (m_throat) { delete m_throat; m_throat = NULL; }
  if (m_resampler) { delete m_resampler; m_resampler = NULL; }
}

void VocalTract::set_config (const TubeConfig & config)
{
  m_config = config;
  m_state = UNINITIALIZED;
}

void VocalTract::set_voice (const VoiceParams & voice)
{
  m_voice = voice;
  m_state = UNINITIALIZED;
}

void VocalTract::set_duration (float msec)
{
  ASSERT_LT(0, msec);
  m_synth.duration_msec = msec;
}

void VocalTract::reset ()
{
  m_control_period = 0;
  m_tube_length = 0;

  zero_float(&m_oropharynx[0][0][0], TOTAL_SECTIONS * 2 * 2);
  zero_float(m_oropharynx_coeffs, TOTAL_REGIONS);
  zero_float(&m_nasal[0][0][0], TOTAL_NASAL_SECTIONS * 2 * 2);
  zero_float(m_nasal_coeffs, TOTAL_NASAL_SECTIONS);
  zero_float(m_alpha, 3);
  zero_float(m_fric_taps, TOTAL_FRIC_TAPS);
  m_write_buffer = true;

  m_damping_factor = 0;
  m_crossmix_factor = 0;
  m_breathiness_factor = 0;
  m_prev_glot_amplitude = -1;

  m_output.clear();

  if (m_resampler) m_resampler->reset();
  if (m_mouth_radiation) m_mouth_radiation->reset();
  if (m_mouth_reflection) m_mouth_reflection->reset();
  if (m_nasal_radiation) m_nasal_radiation->reset();
  if (m_nasal_reflection) m_nasal_reflection->reset();
  if (m_throat) m_throat->reset();
  if (m_glottal) m_glottal->reset();
  m_bandpass.reset();
  m_noise_filter.reset();
  m_noise.reset();
}

void VocalTract::init_synth ()
{
  reset();
  m_control_rate = 1000 / m_synth.duration_msec;
  initialize_synthesizer();

  // no interpolation across a reset
  m_prev = m_target;
  m_current = m_target;

  m_state = READY;
}

void VocalTract::initialize_synthesizer ()
{
  const float length = m_voice.tract_length + m_config.vtl_off;
  ASSERT(length > 0, "illegal tube length: " << length << " cm");

  // one section per sample
  const float c = speed_of_sound(m_config.temp);
  m_control_period = roundu(c * TOTAL_SECTIONS * 100 / (length * m_control_rate));
  ASSERT(m_control_period > 0,
      "control rate " << m_control_rate << " Hz is too fast for the tube");
  m_sample_rate = m_control_rate * m_control_period;
  m_tube_length = c * TOTAL_SECTIONS * 100 / m_sample_rate;
  const float nyquist = m_sample_rate / 2;

  m_breathiness_factor = m_voice.breathiness / 100;
  const float mix_amplitude = amplitude(m_config.mix_off);
  ASSERT(mix_amplitude > 0, "tube.mix_off must be positive: " << m_config.mix_off);
  m_crossmix_factor = 1 / mix_amplitude;
  m_damping_factor = 1 - m_config.loss / 100;

  free_filters();

  m_glottal = new GlottalSource(
      m_config.waveform,
      m_sample_rate,
      m_voice.glot_pulse_rise,
      m_voice.glot_pulse_fall_min,
      m_voice.glot_pulse_fall_max);

  const float mouth_coeff = (nyquist - m_config.mouth_coef) / nyquist;
  m_mouth_radiation = new RadiationFilter(mouth_coeff);
  m_mouth_reflection = new ReflectionFilter(mouth_coeff);

  const float nasal_coeff = (nyquist - m_config.nose_coef) / nyquist;
  m_nasal_radiation = new RadiationFilter(nasal_coeff);
  m_nasal_reflection = new ReflectionFilter(nasal_coeff);

  init_nasal_cavity();

  m_throat = new Throat(
      m_sample_rate,
      m_config.throat_cutoff,
      amplitude(m_config.throat_vol));

  m_resampler = new SampleRateConverter(
      m_sample_rate,
      m_synth.output_rate,
      m_output);

  LOG("vocal tract: " << voice_name(m_voice.voice)
      << ", control period = " << m_control_period
      << ", sample rate = " << m_sample_rate
      << " Hz, tube length = " << m_tube_length << " cm");
}

void VocalTract::init_nasal_cavity ()
{
  const float coef = m_voice.nose_radius_coef;

  // fixed internal sections
  for (size_t i = N2, j = NC2; i < N6; ++i, ++j) {
    m_nasal_coeffs[j] = scattering_coeff(
        coef * m_voice.nose_radius[i - 1],
        coef * m_voice.nose_radius[i]);
  }

  // nose aperture
  m_nasal_coeffs[NC6] = scattering_coeff(
      coef * m_voice.nose_radius[N6 - 1],
      m_voice.aperture_radius);
}

inline float VocalTract::region_radius (size_t region) const
{
  float radius = region == 0
               ? m_voice.radius1
               : m_current[RADIUS_2 + region - 1];
  return max(MIN_RADIUS, m_voice.radius_coef * radius);
}

void VocalTract::compute_tube_coeffs ()
{
  for (size_t i = 0; i < TOTAL_REGIONS - 1; ++i) {
    m_oropharynx_coeffs[i] = scattering_coeff(
        region_radius(i),
        region_radius(i + 1));
  }

  // mouth aperture
  m_oropharynx_coeffs[C8] = scattering_coeff(
      region_radius(TOTAL_REGIONS - 1),
      m_voice.aperture_radius);

  // the junction is in the middle of region 4, so r0 = r1
  const float r0_2 = sqr(region_radius(3));
  const float r1_2 = r0_2;
  const float r2_2 = sqr(max(MIN_RADIUS, m_current[VELUM]));
  const float sum = 2 / (r0_2 + r1_2 + r2_2);
  m_alpha[LEFT] = sum * r0_2;
  m_alpha[RIGHT] = sum * r1_2;
  m_alpha[UPPER] = sum * r2_2;

  // first nasal section
  m_nasal_coeffs[NC1] = scattering_coeff(
      m_current[VELUM],
      m_voice.nose_radius_coef * m_voice.nose_radius[0]);
}

float VocalTract::propagate (float input, float frication)
{
  m_write_buffer = not m_write_buffer;
  const size_t cur = m_write_buffer ? 1 : 0;
  const size_t prv = 1 - cur;

  float (* oro)[2][2] = m_oropharynx;
  float (* nas)[2][2] = m_nasal;
  const float * coeffs = m_oropharynx_coeffs;
  const float * taps = m_fric_taps;
  const float damp = m_damping_factor;
  float delta;

  // glottal input at the bottom of the tube
  oro[S1][TOP][cur] = oro[S1][BOTTOM][prv] * damp + input;

  // S1-S2
  delta = coeffs[C1] * (oro[S1][TOP][prv] - oro[S2][BOTTOM][prv]);
  oro[S2][TOP][cur] = (oro[S1][TOP][prv] + delta) * damp;
  oro[S1][BOTTOM][cur] = (oro[S2][BOTTOM][prv] + delta) * damp;

  // S2-S3 and S3-S4
  for (size_t i = S2, j = C2, k = FC1; i < S4; ++i, ++j, ++k) {
    delta = coeffs[j] * (oro[i][TOP][prv] - oro[i + 1][BOTTOM][prv]);
    oro[i + 1][TOP][cur] = (oro[i][TOP][prv] + delta) * damp
                         + taps[k] * frication;
    oro[i][BOTTOM][cur] = (oro[i + 1][BOTTOM][prv] + delta) * damp;
  }

  // three way junction between the middle of R4 and the nasal cavity
  const float junction = m_alpha[LEFT] * oro[S4][TOP][prv]
                       + m_alpha[RIGHT] * oro[S5][BOTTOM][prv]
                       + m_alpha[UPPER] * nas[N1][BOTTOM][prv];
  oro[S4][BOTTOM][cur] = (junction - oro[S4][TOP][prv]) * damp;
  oro[S5][TOP][cur] = (junction - oro[S5][BOTTOM][prv]) * damp
                    + taps[FC3] * frication;
  nas[N1][TOP][cur] = (junction - nas[N1][BOTTOM][prv]) * damp;

  // R4-R5 (S5-S6)
  delta = coeffs[C4] * (oro[S5][TOP][prv] - oro[S6][BOTTOM][prv]);
  oro[S6][TOP][cur] = (oro[S5][TOP][prv] + delta) * damp
                    + taps[FC4] * frication;
  oro[S5][BOTTOM][cur] = (oro[S6][BOTTOM][prv] + delta) * damp;

  // inside R5 (S6-S7) is a pure delay
  oro[S7][TOP][cur] = oro[S6][TOP][prv] * damp + taps[FC5] * frication;
  oro[S6][BOTTOM][cur] = oro[S7][BOTTOM][prv] * damp;

  // S7-S8, S8-S9, S9-S10
  for (size_t i = S7, j = C5, k = FC6; i < S10; ++i, ++j, ++k) {
    delta = coeffs[j] * (oro[i][TOP][prv] - oro[i + 1][BOTTOM][prv]);
    oro[i + 1][TOP][cur] = (oro[i][TOP][prv] + delta) * damp
                         + taps[k] * frication;
    oro[i][BOTTOM][cur] = (oro[i + 1][BOTTOM][prv] + delta) * damp;
  }

  // mouth: lowpass reflection, highpass radiation
  oro[S10][BOTTOM][cur] = damp * m_mouth_reflection->filter(
      coeffs[C8] * oro[S10][TOP][prv]);
  float output = m_mouth_radiation->filter(
      (1 + coeffs[C8]) * oro[S10][TOP][prv]);

  // nasal cavity
  for (size_t i = N1, j = NC1; i < N6; ++i, ++j) {
    delta = m_nasal_coeffs[j] * (nas[i][TOP][prv] - nas[i + 1][BOTTOM][prv]);
    nas[i + 1][TOP][cur] = (nas[i][TOP][prv] + delta) * damp;
    nas[i][BOTTOM][cur] = (nas[i + 1][BOTTOM][prv] + delta) * damp;
  }

  // nose
  nas[N6][BOTTOM][cur] = damp * m_nasal_reflection->filter(
      m_nasal_coeffs[NC6] * nas[N6][TOP][prv]);
  output += m_nasal_radiation->filter(
      (1 + m_nasal_coeffs[NC6]) * nas[N6][TOP][prv]);

  return output;
}

void VocalTract::synthesize_sample ()
{
  const float f0 = frequency(m_current[GLOT_PITCH] + m_voice.glot_pitch_ref);
  const float ax = amplitude(m_current[GLOT_VOL]);
  const float ah1 = amplitude(m_current[ASP_VOL]);

  compute_tube_coeffs();
  frication_taps(m_current[FRIC_POS], amplitude(m_current[FRIC_VOL]), m_fric_taps);
  m_bandpass.update(m_sample_rate, m_current[FRIC_BW], m_current[FRIC_CF]);

  const float lp_noise = m_noise_filter.filter(m_noise.sample());

  if (m_config.waveform == PULSE and ax != m_prev_glot_amplitude) {
    m_glottal->update_wavetable(ax);
  }

  float pulse = m_glottal->sample(f0);
  const float pulsed_noise = lp_noise * pulse;

  // noisy glottal pulse
  pulse = ax * (pulse * (1 - m_breathiness_factor)
              + pulsed_noise * m_breathiness_factor);

  // cross-mix pure noise with pulsed noise
  float signal = lp_noise;
  if (m_config.noise_mod) {
    const float crossmix = min(1.0f, ax * m_crossmix_factor);
    signal = pulsed_noise * crossmix + lp_noise * (1 - crossmix);
  }

  signal = propagate(
      (pulse + ah1 * signal) * VT_SCALE,
      m_bandpass.filter(signal));

  signal += m_throat->process(pulse * VT_SCALE);

  m_resampler->push(signal);

  m_prev_glot_amplitude = ax;
}

void VocalTract::synthesize (bool reset_first)
{
  const float control_rate = 1000 / m_synth.duration_msec;
  if (m_state == UNINITIALIZED) {
    init_synth();
  } else if (control_rate != m_control_rate) {
    LOG("control rate changed from " << m_control_rate
        << " to " << control_rate << " Hz, reinitializing");
    init_synth();
  } else if (reset_first) {
    init_synth();
  }

  const float control_freq = 1.0f / m_control_period;
  for (size_t i = 0; i < NUM_CONTROLS; ++i) {
    m_delta[i] = (m_target[i] - m_prev[i]) * control_freq;
  }

  for (size_t t = 0; t < m_control_period; ++t) {
    if (m_trace) m_trace->push_back(m_current);

    synthesize_sample();

    for (size_t i = 0; i < NUM_CONTROLS; ++i) {
      m_current[i] += m_delta[i];
    }
  }

  // interpolation resumes from where it actually got
  m_prev = m_current;

  m_state = SYNTHESIZING;
  LOG1("synthesized frame: " << m_target);
}

void VocalTract::flush ()
{
  if (m_resampler) m_resampler->flush();
}

float VocalTract::tube_energy () const
{
  const size_t cur = m_write_buffer ? 1 : 0;

  float energy = 0;
  for (size_t i = 0; i < TOTAL_SECTIONS; ++i) {
    energy += sqr(m_oropharynx[i][TOP][cur]) + sqr(m_oropharynx[i][BOTTOM][cur]);
  }
  for (size_t i = 0; i < TOTAL_NASAL_SECTIONS; ++i) {
    energy += sqr(m_nasal[i][TOP][cur]) + sqr(m_nasal[i][BOTTOM][cur]);
  }
  return energy;
}

//----( output )--------------------------------------------------------------

float VocalTract::max_sample () const
{
  return m_resampler ? m_resampler->max_sample() : 0.0f;
}

float VocalTract::mono_scale () const
{
  return safe_div(OUTPUT_SCALE, max_sample()) * amplitude(m_synth.volume);
}

void VocalTract::stereo_scale (float & left, float & right) const
{
  const float balance = m_synth.balance;
  left = 0.5f - balance / 2;
  right = 0.5f + balance / 2;

  const float new_max = max_sample() * (balance > 0 ? right : left);
  const float scale = safe_div(OUTPUT_SCALE, new_max) * amplitude(m_synth.volume);
  left *= scale;
  right *= scale;
}

void VocalTract::write_output (Sound & sound) const
{
  ASSERT(sound.sample_rate() == m_synth.output_rate,
      "expected output sound at " << m_synth.output_rate
      << " Hz, got " << sound.sample_rate());
  ASSERT(sound.channels() == 1 or sound.channels() == 2,
      "expected mono or stereo output, got "
      << sound.channels() << " channels");

  const size_t frames = m_output.size();
  sound.clear();
  sound.resize(frames);

  if (sound.channels() == 1) {
    const float scale = mono_scale();
    for (size_t t = 0; t < frames; ++t) {
      sound.at(t, 0) = m_output[t] * scale;
    }
  } else {
    float left, right;
    stereo_scale(left, right);
    for (size_t t = 0; t < frames; ++t) {
      sound.at(t, 0) = m_output[t] * left;
      sound.at(t, 1) = m_output[t] * right;
    }
  }
}

} // namespace Trm

