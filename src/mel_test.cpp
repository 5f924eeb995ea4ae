
#include "common.h"
#include "mel.h"
#include "args.h"
#include <cfloat>

using namespace Auditory;

void test_scale (Args & args)
{
  const size_t num_freqs = args.pop(2000);

  float max_rel_error = 0;
  for (size_t i = 0; i <= num_freqs; ++i) {
    float hz = 1.0f * powf(20000.0f, float(i) / num_freqs);
    float mel = freq_to_mel(hz);
    float hz2 = mel_to_freq(mel);
    imax(max_rel_error, fabsf(hz2 - hz) / hz);
  }
  PRINT(max_rel_error);
  ASSERT_LE(max_rel_error, 4 * FLT_EPSILON);

  ASSERT_CLOSE(freq_to_mel(700), 1127 * logf(2), 1e-3f);
  ASSERT_EQ(freq_to_bin(0, 201, 16000), 0u);
  ASSERT_EQ(freq_to_bin(8000, 201, 16000), 101u);
}

void test_bins (Args & args)
{
  MelSpec spec;
  spec.n_filters = args.pop(32);
  spec.lo_hz = args.pop(120.0f);
  spec.hi_hz = args.pop(10000.0f);
  const float sample_rate = args.pop(16000.0f);
  const size_t fft_bins = args.pop(201);

  RenormSpec renorm;
  MelFilterBank bank(spec, renorm, fft_bins, sample_rate);

  ASSERT_EQ(bank.size(), spec.n_filters);
  ASSERT_EQ(bank.num_points(), spec.n_filters + 2);

  for (size_t p = 1; p < bank.num_points(); ++p) {
    ASSERT_LT(bank.point_mel(p - 1), bank.point_mel(p));
    ASSERT_LT(bank.point_hz(p - 1), bank.point_hz(p));
  }

  for (size_t i = 0; i < bank.size(); ++i) {
    ASSERT_LT(bank.min_bin(i), bank.peak_bin(i));
    ASSERT_LT(bank.peak_bin(i), bank.max_bin(i));
    if (i) {
      ASSERT_LE(bank.min_bin(i - 1), bank.min_bin(i));
      ASSERT_LE(bank.peak_bin(i - 1), bank.peak_bin(i));
      ASSERT_LE(bank.max_bin(i - 1), bank.max_bin(i));
    }

    ASSERT_EQ(bank.weight(i, bank.min_bin(i)), 0.0f);
    ASSERT_EQ(bank.weight(i, bank.peak_bin(i)), 1.0f);
    ASSERT_EQ(bank.weight(i, bank.max_bin(i)), 0.0f);

    // rising then falling
    for (size_t b = bank.min_bin(i); b < bank.peak_bin(i); ++b) {
      ASSERT_LT(bank.weight(i, b), bank.weight(i, b + 1));
    }
    for (size_t b = bank.peak_bin(i); b < bank.max_bin(i); ++b) {
      ASSERT_LT(bank.weight(i, b + 1), bank.weight(i, b));
    }
  }

  LOG("filter bins:");
  for (size_t i = 0; i < bank.size(); ++i) {
    cout << ' ' << bank.min_bin(i) << '/' << bank.peak_bin(i)
         << '/' << bank.max_bin(i);
  }
  cout << endl;
  PRINT(bank.max_bins());
}

void test_apply (Args & args)
{
  const float sample_rate = args.pop(16000.0f);
  const size_t fft_bins = 201;

  MelSpec spec;
  RenormSpec renorm;
  MelFilterBank bank(spec, renorm, fft_bins, sample_rate);

  Vector<float> power(fft_bins);
  Vector<float> mel(bank.size());

  LOG("silence maps to the renormalized log floor");
  power.zero();
  bank.apply(power, mel);
  const float log_floor = renorm(spec.log_min);
  PRINT(log_floor);
  for (size_t i = 0; i < mel.size; ++i) {
    ASSERT_EQ(mel[i], log_floor);
  }

  LOG("a peak bin alone gives log of its power");
  renorm.on = false;
  MelFilterBank raw_bank(spec, renorm, fft_bins, sample_rate);
  const size_t f = bank.size() / 2;
  power.zero();
  power[raw_bank.peak_bin(f)] = 10.0f;
  raw_bank.apply(power, mel);
  ASSERT_CLOSE(mel[f], logf(10.0f), 1e-5f);
  ASSERT_EQ(mel[f + 2], spec.log_min);

  LOG("renormalized energies are clipped to [0,1]");
  for (size_t i = 0; i < fft_bins; ++i) power[i] = 1e6f;
  bank.apply(power, mel);
  for (size_t i = 0; i < mel.size; ++i) {
    ASSERT_LE(0, mel[i]);
    ASSERT_LE(mel[i], 1);
    ASSERT_FINITE(mel[i]);
  }
}

void test_cepstrum (Args & args)
{
  const size_t n_filters = args.pop(32);
  const size_t n_coeff = args.pop(13);

  Cepstrum cepstrum(n_filters, n_coeff);
  Vector<float> mel(n_filters);
  Vector<float> mfcc(n_coeff);

  LOG("a flat spectrum has only a dc term");
  mel.set(0.5f);
  cepstrum.apply(mel, mfcc);

  // type-I dct of a constant c over n points is 2 (n-1) c at k = 0
  float c0 = 2 * (n_filters - 1) * 0.5f;
  ASSERT_CLOSE(mfcc[0], logf(1 + c0 * c0), 1e-4f);
  for (size_t k = 1; k < n_coeff; ++k) {
    ASSERT_CLOSE(mfcc[k], 0, 1e-4f);
  }

  LOG("silence has zero log energy");
  mel.zero();
  cepstrum.apply(mel, mfcc);
  for (size_t k = 0; k < n_coeff; ++k) {
    ASSERT_EQ(mfcc[k], 0.0f);
  }
}

const char * help_message =
"Usage: mel_test [COMMAND = all] [OPTIONS]"
"\nCommands:"
"\n  scale [NUM_FREQS]"
"\n  bins [N_FILTERS] [LO_HZ] [HI_HZ] [SAMPLE_RATE] [FFT_BINS]"
"\n  apply [SAMPLE_RATE]"
"\n  cepstrum [N_FILTERS] [N_COEFF]"
;

int main (int argc, char ** argv)
{
  Args args(argc, argv, help_message);

  args
    .case_("scale", test_scale)
    .case_("bins", test_bins)
    .case_("apply", test_apply)
    .case_("cepstrum", test_cepstrum)
    .default_all();

  return 0;
}

