#ifndef LARYNX_AUDITORY_H
#define LARYNX_AUDITORY_H

/** Trial-level auditory feature extraction.

  A sound is cut into overlapping windows, one per step. Each window is
  transformed to a power spectrum, projected onto a mel filter bank, and
  optionally to cepstral coefficients. Steps are grouped into trials of
  trial_steps steps padded by border_steps on each side, so a trial buffer
  holds total_steps = 2 border_steps + trial_steps steps:

    | border | border |      trial      |
    0        B        2B                 total

  After the first trial, the last 2B steps of the previous trial are
  wrapped to the front of the buffer and only steps 2B..total are computed
  from new audio. Gabor filters and inhibition then run over the whole
  trial, and the trial is written as one row of the feature sink.
*/

#include "common.h"
#include "vectors.h"
#include "config.h"
#include "window.h"
#include "tensor.h"
#include "sound.h"
#include "fft.h"
#include "mel.h"
#include "gabor.h"
#include "kwta.h"
#include "feature_table.h"

namespace Auditory
{

//----( parameters )----------------------------------------------------------

size_t msec_to_samples (float msec, float sample_rate);
float samples_to_msec (size_t samples, float sample_rate);

struct InputSpec
{
  float win_msec;
  float step_msec;
  float trial_msec;
  size_t border_steps;
  float sample_rate;
  size_t channels;  // number of channels to process
  size_t channel;   // which sound channel to process when channels == 1

  // derived by compute_samples()
  size_t win_samples;
  size_t step_samples;
  size_t trial_samples;
  size_t trial_steps;
  size_t total_steps;

  InputSpec ()
    : win_msec(25),
      step_msec(5),
      trial_msec(100),
      border_steps(12),
      sample_rate(DEFAULT_ANALYSIS_SAMPLE_RATE),
      channels(1),
      channel(0)
  {
    compute_samples();
  }

  void load (const ConfigParser & config);
  void compute_samples ();
};

struct DftSpec
{
  bool log_pow;
  float log_off;
  float log_min;
  float prv_smooth;
  float cur_smooth;
  WindowType window;

  DftSpec ()
    : log_pow(true),
      log_off(0),
      log_min(-100),
      prv_smooth(0),
      cur_smooth(1),
      window(WINDOW_NONE)
  {}

  void load (const ConfigParser & config);

  float log_power (float power) const
  {
    float x = power + log_off;
    return (power == 0 or x <= 0) ? log_min : logf(x);
  }
};

enum { NUM_GABOR_SCALES = 3 };

struct Config
{
  string prefix;
  InputSpec input;
  DftSpec dft;
  MelSpec mel;
  RenormSpec renorm;
  MfccSpec mfcc;
  GaborSpec gabor[NUM_GABOR_SCALES];
  KwtaSpec kwta;

  Config ();

  void load (const ConfigParser & config);
};

//----( processor )-----------------------------------------------------------

class AuditoryProc
{
public:

  enum State { EMPTY, LOADED, FILLING, TRIAL_READY };

private:

  Config m_config;
  bool m_initialized;

  // derived geometry
  size_t m_dft_size;
  size_t m_dft_use;
  size_t m_mel_n_filters_eff;

  // filters, rebuilt by init()
  FFT_R2C * m_fft;
  Vector<float> * m_window;
  MelFilterBank * m_mel;
  Cepstrum * m_cepstrum;
  GaborFilterBank * m_gabor[NUM_GABOR_SCALES];
  GaborShape m_gabor_shape[NUM_GABOR_SCALES];
  Inhibition * m_inhibition;

  // trial buffers, reallocated only on shape change
  Tensor3 m_dft_power;
  Tensor3 m_dft_log_power;
  Tensor3 m_mel_trial;
  Tensor3 m_mfcc_trial;
  Tensor5 m_gabor_raw[NUM_GABOR_SCALES];
  Tensor5 m_gabor_out[NUM_GABOR_SCALES];

  // input
  const Sound * m_sound;
  size_t m_input_pos;
  size_t m_trial_start_pos;
  size_t m_trial_end_pos;
  State m_state;

  // output
  FeatureSink * m_sink;
  size_t m_row;

  // noncopyable
  AuditoryProc (const AuditoryProc &);
  void operator= (const AuditoryProc &);

public:

  AuditoryProc (const Config & config = Config());
  ~AuditoryProc ();

  // changes to geometry are picked up by the next needs_init() check
  Config & config () { return m_config; }
  const Config & config () const { return m_config; }
  const InputSpec & input () const { return m_config.input; }

  // the sink is not owned; NULL disables output
  void set_sink (FeatureSink * sink);

  bool needs_init () const;
  void init ();

  // the sound must outlive processing
  bool load_sound (const Sound & sound);

  size_t input_steps_left () const;

  // returns false without side effects if less than one step remains
  bool process_trial ();

  // slides the current trial forward one step at a time until it starts
  // at or just before sample pos, writing one row if the trial moved.
  // The first call on a new sound also processes the first trial.
  bool step_to_sample (size_t pos);

  // diagnostics
  State state () const { return m_state; }
  size_t input_pos () const { return m_input_pos; }
  size_t trial_start_pos () const { return m_trial_start_pos; }
  size_t trial_end_pos () const { return m_trial_end_pos; }
  size_t rows () const { return m_row; }
  size_t dft_size () const { return m_dft_size; }
  size_t dft_use () const { return m_dft_use; }

  const MelFilterBank & mel_bank () const { return * m_mel; }
  const GaborFilterBank * gabor_bank (size_t k) const { return m_gabor[k]; }
  const GaborShape & gabor_shape (size_t k) const { return m_gabor_shape[k]; }
  const Inhibition * inhibition () const { return m_inhibition; }

  const Tensor3 & dft_power () const { return m_dft_power; }
  const Tensor3 & dft_log_power () const { return m_dft_log_power; }
  const Tensor3 & mel_trial () const { return m_mel_trial; }
  const Tensor3 & mfcc_trial () const { return m_mfcc_trial; }
  const Tensor5 & gabor_raw (size_t k) const { return m_gabor_raw[k]; }
  const Tensor5 & gabor_out (size_t k) const { return m_gabor_out[k]; }

  string column_name (const char * feature, size_t channel) const;

private:

  void free_filters ();
  void start_new_sound ();
  void declare_columns (size_t channel);

  size_t sound_channel (size_t channel) const
  {
    return m_config.input.channels > 1 ? channel : m_config.input.channel;
  }

  void process_step (size_t channel, size_t step);
  void sound_to_window (size_t pos, size_t channel);
  void filter_window (size_t channel, size_t step);
  void filter_trial (size_t channel);
  void output_to_table (size_t channel);

  void copy_step_from_step (size_t to_step, size_t from_step, size_t channel);
  void wrap_border (size_t channel);
  void step_forward (size_t channel);
};

} // namespace Auditory

#endif // LARYNX_AUDITORY_H

