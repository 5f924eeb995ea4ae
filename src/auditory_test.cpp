
#include "common.h"
#include "auditory.h"
#include "args.h"
#include <vector>

using namespace Auditory;

//----( helpers )-------------------------------------------------------------

void fill_noise (Sound & sound, size_t channel, float amplitude)
{
  for (size_t t = 0; t < sound.frames(); ++t) {
    sound.at(t, channel) = amplitude * random_unif(-1, 1);
  }
}

void fill_chirp (Sound & sound, size_t channel, float amplitude)
{
  const float rate = sound.sample_rate();
  for (size_t t = 0; t < sound.frames(); ++t) {
    float time = t / rate;
    float freq = 200 + 3000 * time;
    sound.at(t, channel) = amplitude * sinf(2 * M_PI * freq * time);
  }
}

std::vector<float> snapshot (const Tensor3 & tensor)
{
  const Vector<float> & flat = tensor.flat();
  return std::vector<float>(flat.begin(), flat.end());
}

float snapshot_at (
    const std::vector<float> & snap,
    const Tensor3 & tensor,
    size_t f,
    size_t s,
    size_t c)
{
  return snap[tensor.index(f, s, c)];
}

//----( tests )---------------------------------------------------------------

void test_geometry (Args & args)
{
  InputSpec input;
  PRINT3(input.win_samples, input.step_samples, input.trial_samples);
  PRINT2(input.trial_steps, input.total_steps);

  ASSERT_EQ(input.win_samples, 400u);
  ASSERT_EQ(input.step_samples, 80u);
  ASSERT_EQ(input.trial_samples, 1600u);
  ASSERT_EQ(input.trial_steps, 20u);
  ASSERT_EQ(input.total_steps, 44u);

  ASSERT_EQ(msec_to_samples(25, 22050), 551u);
  ASSERT_CLOSE(samples_to_msec(80, 16000), 5.0f, 1e-6f);

  AuditoryProc proc;
  ASSERT(proc.needs_init(), "a new processor needs initialization");
  proc.init();
  ASSERT(not proc.needs_init(), "initialization did not take");

  ASSERT_EQ(proc.dft_size(), 400u);
  ASSERT_EQ(proc.dft_use(), 201u);
  ASSERT_EQ(proc.mel_trial().features(), 32u);
  ASSERT_EQ(proc.mel_trial().steps(), 44u);
  ASSERT_EQ(proc.mfcc_trial().features(), 13u);
  ASSERT_EQ(proc.gabor_shape(0).x, 10u);
  ASSERT_EQ(proc.gabor_shape(0).y, 13u);
  ASSERT(proc.gabor_bank(0), "first gabor scale is on by default");
  ASSERT(not proc.gabor_bank(1), "second gabor scale is off by default");

  LOG("changing the filter count forces reinitialization");
  proc.config().mel.n_filters = 26;
  ASSERT(proc.needs_init(), "filter count change was not detected");
  proc.init();
  ASSERT_EQ(proc.mel_trial().features(), 26u);
}

void test_silence (Args & args)
{
  const float duration = args.pop(1.0f);

  Sound sound(16000, 1);
  sound.resize(roundu(duration * sound.sample_rate()));

  FeatureTable table;
  AuditoryProc proc;
  proc.set_sink(& table);
  ASSERT(proc.load_sound(sound), "failed to load silence");
  ASSERT_EQ(proc.state(), AuditoryProc::LOADED);

  size_t trials = 0;
  while (proc.input_steps_left()) {
    ASSERT(proc.process_trial(), "trial failed with input remaining");
    ASSERT_EQ(proc.state(), AuditoryProc::TRIAL_READY);
    ++trials;

    const Tensor3 & mel = proc.mel_trial();
    const Tensor3 & mfcc = proc.mfcc_trial();
    const Tensor3 & log_pow = proc.dft_log_power();
    for (size_t s = 0; s < mel.steps(); ++s) {
      for (size_t f = 0; f < mel.features(); ++f) {
        ASSERT_EQ(mel(f, s, 0), 0.0f);
      }
      for (size_t f = 0; f < mfcc.features(); ++f) {
        ASSERT_EQ(mfcc(f, s, 0), 0.0f);
      }
      for (size_t f = 0; f < log_pow.features(); ++f) {
        ASSERT_EQ(log_pow(f, s, 0), proc.config().dft.log_min);
      }
    }
  }
  PRINT(trials);
  ASSERT_EQ(trials, 9u);
  ASSERT_EQ(proc.rows(), trials);

  LOG("every row of the table holds the floor value");
  ASSERT_EQ(table.rows(), trials);
  ASSERT(table.has_column("AudProc_mel_fbank"), "missing mel column");
  ASSERT(table.has_column("AudProc_dft_pow"), "missing dft column");
  ASSERT(table.has_column("AudProc_mel_gabor1_raw"), "missing gabor column");
  ASSERT(table.has_column("AudProc_mel_gabor1"), "missing gabor column");
  ASSERT(table.has_column("AudProc_mel_mfcc"), "missing mfcc column");
  ASSERT(not table.has_column("AudProc_mel_gabor2"), "gabor2 is off");

  const Shape & shape = table.shape("AudProc_mel_gabor1");
  ASSERT_EQ(shape.size(), 4u);
  ASSERT_EQ(shape[0], 7u);
  ASSERT_EQ(shape[1], 2u);
  ASSERT_EQ(shape[2], 10u);
  ASSERT_EQ(shape[3], 13u);

  for (size_t r = 0; r < table.rows(); ++r) {
    const std::vector<float> & cell = table.cell("AudProc_mel_fbank", r);
    ASSERT_EQ(cell.size(), 44u * 32u);
    for (size_t i = 0; i < cell.size(); ++i) {
      ASSERT_EQ(cell[i], 0.0f);
    }
  }
}

void test_insufficient (Args & args)
{
  Sound sound(16000, 1);
  sound.resize(args.pop(5000));
  fill_noise(sound, 0, 0.5f);

  FeatureTable table;
  AuditoryProc proc;
  proc.set_sink(& table);

  LOG("no sound loaded");
  ASSERT(not proc.process_trial(), "processed a trial without a sound");
  ASSERT_EQ(proc.rows(), 0u);

  proc.load_sound(sound);
  while (proc.input_steps_left()) proc.process_trial();

  const size_t input_pos = proc.input_pos();
  const size_t trial_start = proc.trial_start_pos();
  const size_t rows = proc.rows();
  const std::vector<float> mel = snapshot(proc.mel_trial());
  const std::vector<float> power = snapshot(proc.dft_power());
  const std::vector<float> out = snapshot(proc.mfcc_trial());
  PRINT3(input_pos, trial_start, rows);

  LOG("exhausted input fails without side effects");
  for (size_t i = 0; i < 3; ++i) {
    ASSERT(not proc.process_trial(), "processed a trial past the input");
  }
  ASSERT_EQ(proc.input_pos(), input_pos);
  ASSERT_EQ(proc.trial_start_pos(), trial_start);
  ASSERT_EQ(proc.rows(), rows);
  ASSERT_EQ(table.rows(), rows);
  ASSERT(snapshot(proc.mel_trial()) == mel, "mel trial was mutated");
  ASSERT(snapshot(proc.dft_power()) == power, "dft trial was mutated");
  ASSERT(snapshot(proc.mfcc_trial()) == out, "mfcc trial was mutated");

  ASSERT(not proc.step_to_sample(input_pos + 1000),
      "stepped past the input");
  ASSERT_EQ(proc.input_pos(), input_pos);

  LOG("a sound shorter than one step is rejected");
  Sound short_sound(16000, 1);
  short_sound.resize(proc.input().step_samples - 1);
  proc.load_sound(short_sound);
  ASSERT_EQ(proc.input_steps_left(), 0u);
  ASSERT(not proc.process_trial(), "processed a trial from a short sound");

  LOG("an empty sound cannot be loaded");
  Sound empty(16000, 1);
  ASSERT(not proc.load_sound(empty), "loaded an empty sound");
}

void test_border (Args & args)
{
  const size_t num_trials = args.pop(4);
  const float prv_smooth = args.pop(0.3f);

  Config config;
  config.dft.prv_smooth = prv_smooth;
  config.dft.cur_smooth = 1 - prv_smooth;

  AuditoryProc proc(config);
  const InputSpec & in = proc.input();

  Sound sound(16000, 1);
  sound.resize(in.step_samples * (in.total_steps + num_trials * in.trial_steps));
  fill_chirp(sound, 0, 0.3f);
  proc.load_sound(sound);

  const size_t border = 2 * in.border_steps;
  ASSERT_LT(0, border);

  ASSERT(proc.process_trial(), "first trial failed");
  ASSERT_EQ(proc.trial_start_pos(), in.border_steps * in.step_samples);
  ASSERT_EQ(proc.input_pos(), in.total_steps * in.step_samples);

  for (size_t n = 1; n < num_trials; ++n) {
    const Tensor3 & mel = proc.mel_trial();
    const Tensor3 & power = proc.dft_power();
    const Tensor3 & mfcc = proc.mfcc_trial();
    const std::vector<float> prev_mel = snapshot(mel);
    const std::vector<float> prev_power = snapshot(power);
    const std::vector<float> prev_mfcc = snapshot(mfcc);
    const size_t prev_input = proc.input_pos();

    ASSERT(proc.process_trial(), "trial " << n << " failed");
    ASSERT_EQ(proc.input_pos(), prev_input + in.trial_steps * in.step_samples);
    ASSERT_EQ(proc.trial_start_pos(),
              prev_input - in.border_steps * in.step_samples);
    ASSERT_EQ(proc.trial_end_pos(),
              proc.trial_start_pos() + in.trial_samples);

    const size_t src = in.total_steps - border;
    for (size_t s = 0; s < border; ++s) {
      for (size_t f = 0; f < mel.features(); ++f) {
        ASSERT_EQ(mel(f, s, 0), snapshot_at(prev_mel, mel, f, src + s, 0));
      }
      for (size_t f = 0; f < power.features(); ++f) {
        ASSERT_EQ(power(f, s, 0), snapshot_at(prev_power, power, f, src + s, 0));
      }
      for (size_t f = 0; f < mfcc.features(); ++f) {
        ASSERT_EQ(mfcc(f, s, 0), snapshot_at(prev_mfcc, mfcc, f, src + s, 0));
      }
    }

    // the chirp is loud enough to lift every step off the floor
    for (size_t s = border; s < in.total_steps; ++s) {
      ASSERT_LT(0, max(mel.step(s, 0)));
    }
  }
}

void test_channels (Args & args)
{
  Sound sound(16000, 2);
  sound.resize(args.pop(8000));
  fill_noise(sound, 1, 0.5f);

  LOG("processing both channels");
  {
    Config config;
    config.input.channels = 2;
    FeatureTable table;
    AuditoryProc proc(config);
    proc.set_sink(& table);
    proc.load_sound(sound);
    ASSERT(proc.process_trial(), "stereo trial failed");

    ASSERT(table.has_column("AudProc_mel_fbank_ch0"), "missing ch0 column");
    ASSERT(table.has_column("AudProc_mel_fbank_ch1"), "missing ch1 column");
    ASSERT(table.has_column("AudProc_mel_gabor1_ch1"), "missing gabor column");
    ASSERT(not table.has_column("AudProc_mel_fbank"), "unsuffixed column");

    const Tensor3 & mel = proc.mel_trial();
    ASSERT_EQ(mel.channels(), 2u);
    ASSERT_EQ(max(mel.step(20, 0)), 0.0f);
    ASSERT_LT(0, max(mel.step(20, 1)));

    Shape index(2);
    index[0] = 20;
    index[1] = 5;
    ASSERT_EQ(table.value("AudProc_mel_fbank_ch1", 0, index), mel(5, 20, 1));
  }

  LOG("processing only the second channel");
  {
    Config config;
    config.input.channel = 1;
    FeatureTable table;
    AuditoryProc proc(config);
    proc.set_sink(& table);
    proc.load_sound(sound);
    ASSERT(proc.process_trial(), "channel trial failed");

    ASSERT(table.has_column("AudProc_mel_fbank"), "missing column");
    ASSERT_EQ(proc.mel_trial().channels(), 1u);
    ASSERT_LT(0, max(proc.mel_trial().step(20, 0)));
  }
}

void test_step_to_sample (Args & args)
{
  const size_t steps = args.pop(3);

  AuditoryProc proc;
  const InputSpec & in = proc.input();

  Sound sound(16000, 1);
  sound.resize(in.step_samples * (2 * in.total_steps));
  fill_chirp(sound, 0, 0.3f);
  proc.load_sound(sound);

  ASSERT(proc.process_trial(), "first trial failed");
  const size_t start = proc.trial_start_pos();
  const std::vector<float> prev_mel = snapshot(proc.mel_trial());

  ASSERT(proc.step_to_sample(start + steps * in.step_samples + 1),
      "step_to_sample failed");
  ASSERT_EQ(proc.trial_start_pos(), start + steps * in.step_samples);
  ASSERT_EQ(proc.trial_end_pos(), proc.trial_start_pos() + in.trial_samples);
  ASSERT_EQ(proc.rows(), 2u);

  const Tensor3 & mel = proc.mel_trial();
  for (size_t s = 0; s + steps < in.total_steps; ++s) {
    for (size_t f = 0; f < mel.features(); ++f) {
      ASSERT_EQ(mel(f, s, 0), snapshot_at(prev_mel, mel, f, s + steps, 0));
    }
  }

  LOG("positions inside the current trial add no row");
  const size_t moved = proc.trial_start_pos();
  ASSERT(proc.step_to_sample(moved + in.step_samples - 1),
      "step_to_sample failed");
  ASSERT_EQ(proc.trial_start_pos(), moved);
  ASSERT_EQ(proc.rows(), 2u);

  LOG("earlier positions are rejected");
  ASSERT(not proc.step_to_sample(start), "stepped backwards");
  ASSERT_EQ(proc.rows(), 2u);

  LOG("stepping a fresh sound writes the first trial once");
  FeatureTable table;
  AuditoryProc fresh;
  fresh.set_sink(& table);
  fresh.load_sound(sound);
  const size_t first_start = in.border_steps * in.step_samples;
  ASSERT(fresh.step_to_sample(first_start),
      "step_to_sample on a fresh sound failed");
  ASSERT_EQ(fresh.rows(), 1u);
  ASSERT_EQ(table.rows(), 1u);
  ASSERT_EQ(fresh.trial_start_pos(), first_start);

  ASSERT(fresh.step_to_sample(fresh.trial_start_pos() + in.step_samples),
      "one step failed");
  ASSERT_EQ(fresh.rows(), 2u);
  ASSERT_EQ(table.rows(), 2u);
}

void test_rate_mismatch (Args & args)
{
  const float rate = args.pop(22050.0f);

  AuditoryProc proc;
  proc.init();
  ASSERT_EQ(proc.dft_size(), 400u);

  Sound sound(rate, 1);
  sound.resize(roundu(0.5f * rate));
  fill_noise(sound, 0, 0.1f);

  ASSERT(proc.load_sound(sound), "mismatched sound was rejected");
  ASSERT_EQ(proc.input().sample_rate, rate);
  ASSERT_EQ(proc.dft_size(), msec_to_samples(25, rate));
  ASSERT_EQ(proc.mel_bank().sample_rate(), rate);
  ASSERT(proc.process_trial(), "trial failed after reinitialization");
}

const char * help_message =
"Usage: auditory_test [COMMAND = all] [OPTIONS]"
"\nCommands:"
"\n  geometry"
"\n  silence [DURATION]"
"\n  insufficient [FRAMES]"
"\n  border [NUM_TRIALS] [PRV_SMOOTH]"
"\n  channels [FRAMES]"
"\n  step_to_sample [STEPS]"
"\n  rate_mismatch [SAMPLE_RATE]"
;

int main (int argc, char ** argv)
{
  Args args(argc, argv, help_message);

  args
    .case_("geometry", test_geometry)
    .case_("silence", test_silence)
    .case_("insufficient", test_insufficient)
    .case_("border", test_border)
    .case_("channels", test_channels)
    .case_("step_to_sample", test_step_to_sample)
    .case_("rate_mismatch", test_rate_mismatch)
    .default_all();

  return 0;
}

