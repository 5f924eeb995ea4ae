
#include "auditory.h"
#include <sstream>

#define LOG1(mess)

namespace Auditory
{

//----( parameters )----------------------------------------------------------

size_t msec_to_samples (float msec, float sample_rate)
{
  return roundu(double(msec) * 0.001 * sample_rate);
}

float samples_to_msec (size_t samples, float sample_rate)
{
  return 1000.0f * samples / sample_rate;
}

void InputSpec::load (const ConfigParser & config)
{
  win_msec = config("input.win_msec", win_msec);
  step_msec = config("input.step_msec", step_msec);
  trial_msec = config("input.trial_msec", trial_msec);
  border_steps = config("input.border_steps", border_steps);
  sample_rate = config("input.sample_rate", sample_rate);
  channels = config("input.channels", channels);
  channel = config("input.channel", channel);

  compute_samples();
}

void InputSpec::compute_samples ()
{
  ASSERT_LT(0, sample_rate);
  ASSERT(0 < step_msec, "input step_msec must be positive, got " << step_msec);

  win_samples = msec_to_samples(win_msec, sample_rate);
  step_samples = msec_to_samples(step_msec, sample_rate);
  trial_samples = msec_to_samples(trial_msec, sample_rate);
  trial_steps = roundu(double(trial_msec) / step_msec);
  total_steps = 2 * border_steps + trial_steps;
}

void DftSpec::load (const ConfigParser & config)
{
  log_pow = config("dft.log_pow", log_pow);
  log_off = config("dft.log_off", log_off);
  log_min = config("dft.log_min", log_min);
  prv_smooth = config("dft.prv_smooth", prv_smooth);
  cur_smooth = config("dft.cur_smooth", cur_smooth);
  window = parse_window(config("dft.window", window_name(window)));
}

Config::Config ()
  : prefix("AudProc")
{
  gabor[0] = GaborSpec(6, 2, true);
  gabor[1] = GaborSpec(12, 4, false);
  gabor[2] = GaborSpec(18, 6, false);
}

void Config::load (const ConfigParser & config)
{
  prefix = config("prefix", prefix);
  input.load(config);
  dft.load(config);
  mel.load(config);
  renorm.load(config);
  mfcc.load(config);
  for (size_t k = 0; k < NUM_GABOR_SCALES; ++k) {
    std::ostringstream name;
    name << "gabor" << (k + 1);
    gabor[k].load(config, name.str());
  }
  kwta.load(config);
}

//----( initialization )------------------------------------------------------

AuditoryProc::AuditoryProc (const Config & config)
  : m_config(config),
    m_initialized(false),

    m_dft_size(0),
    m_dft_use(0),
    m_mel_n_filters_eff(0),

    m_fft(NULL),
    m_window(NULL),
    m_mel(NULL),
    m_cepstrum(NULL),
    m_inhibition(NULL),

    m_sound(NULL),
    m_input_pos(0),
    m_trial_start_pos(0),
    m_trial_end_pos(0),
    m_state(EMPTY),

    m_sink(NULL),
    m_row(0)
{
  for (size_t k = 0; k < NUM_GABOR_SCALES; ++k) m_gabor[k] = NULL;
}

AuditoryProc::~AuditoryProc ()
{
  free_filters();
}

void AuditoryProc::free_filters ()
{
  if (m_fft) { delete m_fft; m_fft = NULL; }
  if (m_window) { delete m_window; m_window = NULL; }
  if (m_mel) { delete m_mel; m_mel = NULL; }
  if (m_cepstrum) { delete m_cepstrum; m_cepstrum = NULL; }
  for (size_t k = 0; k < NUM_GABOR_SCALES; ++k) {
    if (m_gabor[k]) { delete m_gabor[k]; m_gabor[k] = NULL; }
  }
  if (m_inhibition) { delete m_inhibition; m_inhibition = NULL; }
}

void AuditoryProc::set_sink (FeatureSink * sink)
{
  m_sink = sink;
  m_row = 0;
  if (m_initialized) {
    for (size_t c = 0; c < m_config.input.channels; ++c) declare_columns(c);
  }
}

bool AuditoryProc::needs_init () const
{
  return not m_initialized
      or m_dft_size != m_config.input.win_samples
      or m_mel_n_filters_eff != m_config.mel.n_filters + 2;
}

void AuditoryProc::init ()
{
  InputSpec & in = m_config.input;
  in.compute_samples();

  ASSERT(0 < in.step_samples, "input step is shorter than one sample");
  ASSERT(2 <= in.win_samples, "input window is shorter than two samples");
  ASSERT(0 < in.trial_steps, "input trial is shorter than one step");
  ASSERT(0 < in.channels, "at least one channel must be processed");
  ASSERT(m_config.mel.n_filters >= 2,
      "at least 2 mel filters are needed, got " << m_config.mel.n_filters);

  free_filters();

  m_dft_size = in.win_samples;
  m_dft_use = m_dft_size / 2 + 1;
  m_mel_n_filters_eff = m_config.mel.n_filters + 2;

  LOG("initializing auditory filters: window = " << in.win_samples
      << ", step = " << in.step_samples
      << ", steps = " << in.border_steps << " + " << in.trial_steps
      << " + " << in.border_steps
      << ", rate = " << in.sample_rate << "Hz");

  m_fft = new FFT_R2C(m_dft_size);
  m_window = new Vector<float>(m_dft_size);
  fill_window(m_config.dft.window, * m_window);

  m_mel = new MelFilterBank(m_config.mel, m_config.renorm, m_dft_use,
                            in.sample_rate);
  const size_t n_mel = m_mel->size();

  if (m_config.mfcc.on) {
    m_cepstrum = new Cepstrum(n_mel, m_config.mfcc.n_coeff);
  }

  for (size_t k = 0; k < NUM_GABOR_SCALES; ++k) {
    const GaborSpec & spec = m_config.gabor[k];
    if (not spec.on) {
      m_gabor_shape[k] = GaborShape();
      continue;
    }

    m_gabor[k] = new GaborFilterBank(spec);
    m_gabor_shape[k] = m_gabor[k]->shape(in.trial_steps, n_mel);
    LOG(" gabor" << (k + 1) << ": " << spec.n_filters() << " filters of "
        << spec.size_time << " x " << spec.size_freq << " -> "
        << m_gabor_shape[k].x << " x " << m_gabor_shape[k].y << " taps");

    m_gabor_raw[k].resize(spec.n_filters(), m_gabor_shape[k].y,
                          m_gabor_shape[k].x, in.channels);
    m_gabor_out[k].resize(spec.n_filters(), m_gabor_shape[k].y,
                          m_gabor_shape[k].x, in.channels);
  }

  if (m_config.kwta.on) {
    m_inhibition = new Inhibition(m_config.kwta);
  }

  m_dft_power.resize(m_dft_use, in.total_steps, in.channels);
  if (m_config.dft.log_pow) {
    m_dft_log_power.resize(m_dft_use, in.total_steps, in.channels);
  }
  m_mel_trial.resize(n_mel, in.total_steps, in.channels);
  if (m_config.mfcc.on) {
    m_mfcc_trial.resize(m_config.mfcc.n_coeff, in.total_steps, in.channels);
  }

  m_initialized = true;

  if (m_sink) {
    for (size_t c = 0; c < in.channels; ++c) declare_columns(c);
  }

  start_new_sound();
}

bool AuditoryProc::load_sound (const Sound & sound)
{
  if (not sound.valid()) {
    WARN("cannot load an empty or invalid sound");
    return false;
  }

  bool reinit = needs_init();
  if (sound.sample_rate() != m_config.input.sample_rate) {
    WARN("sound sample rate " << sound.sample_rate()
        << "Hz does not match " << m_config.input.sample_rate
        << "Hz, reinitializing filters");
    m_config.input.sample_rate = sound.sample_rate();
    reinit = true;
  }
  if (reinit) init();

  const InputSpec & in = m_config.input;
  if (in.channels > 1) {
    ASSERT(in.channels <= sound.channels(),
        "cannot process " << in.channels << " channels of a sound with "
        << sound.channels());
  } else {
    ASSERT(in.channel < sound.channels(),
        "cannot process channel " << in.channel << " of a sound with "
        << sound.channels());
  }

  m_sound = & sound;
  start_new_sound();
  m_state = LOADED;

  LOG1("loaded sound of " << sound.frames() << " frames");
  return true;
}

void AuditoryProc::start_new_sound ()
{
  m_input_pos = 0;
  m_trial_start_pos = 0;
  m_trial_end_pos = m_config.input.trial_samples;
  m_state = m_sound ? LOADED : EMPTY;
}

size_t AuditoryProc::input_steps_left () const
{
  if (not m_sound) return 0;

  const size_t frames = m_sound->frames();
  if (frames <= m_input_pos) return 0;
  return (frames - m_input_pos) / m_config.input.step_samples;
}

//----( trials )--------------------------------------------------------------

bool AuditoryProc::process_trial ()
{
  if (needs_init()) init();

  if (not m_sound) {
    WARN("no sound loaded");
    return false;
  }
  if (input_steps_left() < 1) {
    WARN("less than one step of input remains, load a new sound");
    return false;
  }

  const InputSpec & in = m_config.input;
  const size_t border = 2 * in.border_steps;
  const size_t start_pos = m_input_pos;
  const bool first = (start_pos == 0);

  m_state = FILLING;

  if (first) {
    m_trial_start_pos = in.border_steps * in.step_samples;
  } else {
    m_trial_start_pos = start_pos - in.border_steps * in.step_samples;
  }
  m_trial_end_pos = m_trial_start_pos + in.trial_samples;

  for (size_t c = 0; c < in.channels; ++c) {
    m_input_pos = start_pos;

    if (first) {
      for (size_t s = 0; s < in.total_steps; ++s) process_step(c, s);
    } else {
      wrap_border(c);
      for (size_t s = border; s < in.total_steps; ++s) process_step(c, s);
    }

    filter_trial(c);
    output_to_table(c);
  }

  ++m_row;
  m_state = TRIAL_READY;
  return true;
}

bool AuditoryProc::step_to_sample (size_t pos)
{
  if (needs_init()) init();

  if (not m_sound or input_steps_left() < 1) {
    WARN("less than one step of input remains, load a new sound");
    return false;
  }

  if (m_input_pos == 0) {
    if (not process_trial()) return false;
  }

  if (pos < m_trial_start_pos) {
    WARN("target sample " << pos << " is before the current trial start "
        << m_trial_start_pos);
    return false;
  }

  const InputSpec & in = m_config.input;
  const size_t steps_fwd = (pos - m_trial_start_pos) / in.step_samples;
  const size_t end_step = in.total_steps - 1;

  // the current trial already covers pos, and is already in the table
  if (steps_fwd == 0) return true;

  m_state = FILLING;

  for (size_t i = 0; i < steps_fwd; ++i) {
    const size_t step_pos = m_input_pos;
    m_trial_start_pos += in.step_samples;
    m_trial_end_pos += in.step_samples;

    for (size_t c = 0; c < in.channels; ++c) {
      m_input_pos = step_pos;
      step_forward(c);
      process_step(c, end_step);
      filter_trial(c);
    }
  }

  for (size_t c = 0; c < in.channels; ++c) output_to_table(c);

  ++m_row;
  m_state = TRIAL_READY;
  return true;
}

void AuditoryProc::copy_step_from_step (
    size_t to_step,
    size_t from_step,
    size_t channel)
{
  m_dft_power.copy_step(to_step, from_step, channel);
  if (m_config.dft.log_pow) {
    m_dft_log_power.copy_step(to_step, from_step, channel);
  }
  m_mel_trial.copy_step(to_step, from_step, channel);
  if (m_config.mfcc.on) {
    m_mfcc_trial.copy_step(to_step, from_step, channel);
  }
}

void AuditoryProc::wrap_border (size_t channel)
{
  const InputSpec & in = m_config.input;
  if (in.border_steps == 0) return;

  const size_t border = 2 * in.border_steps;
  const size_t src_step = in.total_steps - border;
  for (size_t s = 0; s < border; ++s) {
    copy_step_from_step(s, src_step + s, channel);
  }
}

void AuditoryProc::step_forward (size_t channel)
{
  const size_t last = m_config.input.total_steps - 1;
  for (size_t s = 0; s < last; ++s) {
    copy_step_from_step(s, s + 1, channel);
  }
}

//----( steps )---------------------------------------------------------------

void AuditoryProc::process_step (size_t channel, size_t step)
{
  sound_to_window(m_input_pos, channel);
  filter_window(channel, step);
  m_input_pos += m_config.input.step_samples;
}

void AuditoryProc::sound_to_window (size_t pos, size_t channel)
{
  const size_t sound_chan = sound_channel(channel);
  Vector<float> & window_in = m_fft->time_in;
  const Vector<float> & window = * m_window;

  // Sound::sample zero-pads past the end
  for (size_t i = 0; i < m_dft_size; ++i) {
    window_in[i] = window[i] * m_sound->sample(pos + i, sound_chan);
  }
}

void AuditoryProc::filter_window (size_t channel, size_t step)
{
  const DftSpec & dft = m_config.dft;

  m_fft->transform_fwd();

  Vector<float> power = m_dft_power.step(step, channel);
  power_spectrum(m_fft->freq_out, power);

  if (step > 0) {
    const Vector<float> prev = m_dft_power.step(step - 1, channel);
    for (size_t i = 0; i < m_dft_use; ++i) {
      power[i] = dft.prv_smooth * prev[i] + dft.cur_smooth * power[i];
    }
  }

  if (dft.log_pow) {
    Vector<float> log_power = m_dft_log_power.step(step, channel);
    for (size_t i = 0; i < m_dft_use; ++i) {
      log_power[i] = dft.log_power(power[i]);
    }
  }

  Vector<float> mel = m_mel_trial.step(step, channel);
  m_mel->apply(power, mel);

  if (m_config.mfcc.on) {
    Vector<float> mfcc = m_mfcc_trial.step(step, channel);
    m_cepstrum->apply(mel, mfcc);
  }
}

void AuditoryProc::filter_trial (size_t channel)
{
  const InputSpec & in = m_config.input;

  for (size_t k = 0; k < NUM_GABOR_SCALES; ++k) {
    if (not m_gabor[k]) continue;

    m_gabor[k]->filter(m_mel_trial, channel, in.border_steps, in.trial_steps,
                       m_gabor_raw[k]);

    const Vector<float> raw = m_gabor_raw[k].channel(channel);
    Vector<float> out = m_gabor_out[k].channel(channel);
    if (m_inhibition) {
      m_inhibition->compute(raw, out);
    } else {
      out = raw;
    }
  }
}

//----( output )--------------------------------------------------------------

string AuditoryProc::column_name (const char * feature, size_t channel) const
{
  std::ostringstream name;
  name << m_config.prefix << '_' << feature;
  if (m_config.input.channels > 1) name << "_ch" << channel;
  return name.str();
}

namespace
{

inline Shape shape2 (size_t a, size_t b)
{
  Shape s(2);
  s[0] = a;
  s[1] = b;
  return s;
}

inline Shape shape4 (size_t a, size_t b, size_t c, size_t d)
{
  Shape s(4);
  s[0] = a;
  s[1] = b;
  s[2] = c;
  s[3] = d;
  return s;
}

// writes a trial tensor as a [step, feature] cell
void write_steps (
    FeatureSink & sink,
    const string & name,
    size_t row,
    const Tensor3 & trial,
    size_t channel)
{
  Shape index(2);
  for (size_t s = 0; s < trial.steps(); ++s) {
    index[0] = s;
    for (size_t f = 0; f < trial.features(); ++f) {
      index[1] = f;
      sink.write_cell(name, row, index, trial(f, s, channel));
    }
  }
}

// writes a gabor tensor as a [filter, sign, time, freq] cell
void write_gabor (
    FeatureSink & sink,
    const string & name,
    size_t row,
    const Tensor5 & gabor,
    size_t channel)
{
  Shape index(4);
  for (size_t i = 0; i < gabor.filters(); ++i) {
    index[0] = i;
    for (size_t p = 0; p < 2; ++p) {
      index[1] = p;
      for (size_t x = 0; x < gabor.times(); ++x) {
        index[2] = x;
        for (size_t y = 0; y < gabor.freqs(); ++y) {
          index[3] = y;
          sink.write_cell(name, row, index, gabor(i, p, y, x, channel));
        }
      }
    }
  }
}

} // anonymous namespace

void AuditoryProc::declare_columns (size_t channel)
{
  const InputSpec & in = m_config.input;

  m_sink->add_column_if_absent(column_name("dft_pow", channel),
                               shape2(in.total_steps, m_dft_use));
  m_sink->add_column_if_absent(column_name("mel_fbank", channel),
                               shape2(in.total_steps, m_mel->size()));

  for (size_t k = 0; k < NUM_GABOR_SCALES; ++k) {
    if (not m_gabor[k]) continue;

    Shape shape = shape4(m_gabor[k]->n_filters(), 2,
                         m_gabor_shape[k].x, m_gabor_shape[k].y);
    std::ostringstream name;
    name << "mel_gabor" << (k + 1);
    m_sink->add_column_if_absent(
        column_name((name.str() + "_raw").c_str(), channel), shape);
    m_sink->add_column_if_absent(column_name(name.str().c_str(), channel),
                                 shape);
  }

  if (m_config.mfcc.on) {
    m_sink->add_column_if_absent(column_name("mel_mfcc", channel),
                                 shape2(in.total_steps, m_config.mfcc.n_coeff));
  }
}

void AuditoryProc::output_to_table (size_t channel)
{
  if (not m_sink) return;

  declare_columns(channel);

  FeatureSink & sink = * m_sink;
  const Tensor3 & dft = m_config.dft.log_pow ? m_dft_log_power : m_dft_power;
  write_steps(sink, column_name("dft_pow", channel), m_row, dft, channel);
  write_steps(sink, column_name("mel_fbank", channel), m_row, m_mel_trial,
              channel);

  for (size_t k = 0; k < NUM_GABOR_SCALES; ++k) {
    if (not m_gabor[k]) continue;

    std::ostringstream name;
    name << "mel_gabor" << (k + 1);
    write_gabor(sink, column_name((name.str() + "_raw").c_str(), channel),
                m_row, m_gabor_raw[k], channel);
    write_gabor(sink, column_name(name.str().c_str(), channel),
                m_row, m_gabor_out[k], channel);
  }

  if (m_config.mfcc.on) {
    write_steps(sink, column_name("mel_mfcc", channel), m_row, m_mfcc_trial,
                channel);
  }
}

} // namespace Auditory

