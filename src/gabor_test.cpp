
#include "common.h"
#include "gabor.h"
#include "args.h"

using namespace Auditory;

void test_kernels (Args & args)
{
  GaborSpec spec(args.pop(6), 2);
  GaborFilterBank bank(spec);

  const size_t T = spec.size_time;
  const size_t F = spec.size_freq;
  Vector<float> kernel(T * F);

  ASSERT_EQ(bank.n_filters(), 3 + spec.n_horiz);

  for (size_t i = 0; i < bank.n_filters(); ++i) {
    bank.get_kernel(i, kernel);

    LOG("kernel " << i << ":");
    for (size_t f = F; f-- > 0;) {
      for (size_t t = 0; t < T; ++t) {
        float k = kernel[t * F + f];
        cout << (k > 0.05f ? " +" : k < -0.05f ? " -" : " .");
      }
      cout << endl;
    }

    float pos = sum_pos(kernel);
    float neg = sum_neg(kernel);
    PRINT2(pos, neg);
    ASSERT_CLOSE(pos, 1, 1e-4f);
    ASSERT_CLOSE(neg, -1, 1e-4f);
  }

  LOG("the vertical kernel is cut to a circle");
  bank.get_kernel(spec.n_horiz, kernel);
  ASSERT_EQ(kernel[0], 0.0f);
  ASSERT_EQ(kernel[T * F - 1], 0.0f);
}

void test_shape (Args & args)
{
  const size_t trial_steps = args.pop(20);
  const size_t n_mel = args.pop(32);

  GaborSpec spec1(6, 2);
  GaborSpec spec2(12, 4);
  GaborSpec spec3(18, 6);

  GaborShape shape1 = GaborFilterBank(spec1).shape(trial_steps, n_mel);
  GaborShape shape2 = GaborFilterBank(spec2).shape(trial_steps, n_mel);
  GaborShape shape3 = GaborFilterBank(spec3).shape(trial_steps, n_mel);

  PRINT2(shape1.x, shape1.y);
  PRINT2(shape2.x, shape2.y);
  PRINT2(shape3.x, shape3.y);

  ASSERT_EQ(shape1.x, (trial_steps - 1) / 2 + 1);
  ASSERT_EQ(shape1.y, (n_mel - 6 - 1) / 2 + 1);
  ASSERT_EQ(shape2.x, (trial_steps - 1) / 4 + 1);
  ASSERT_EQ(shape3.y, (n_mel - 18 - 1) / 6 + 1);
}

void test_flat (Args & args)
{
  const size_t border = args.pop(12);
  const size_t trial_steps = 20;
  const size_t n_mel = 32;
  const size_t channels = 2;

  GaborSpec spec;
  GaborFilterBank bank(spec);
  GaborShape shape = bank.shape(trial_steps, n_mel);

  Tensor3 mel;
  mel.resize(n_mel, 2 * border + trial_steps, channels);
  mel.flat().set(0.7f);

  Tensor5 raw;
  raw.resize(bank.n_filters(), shape.y, shape.x, channels);
  raw.flat().set(-1.0f);

  LOG("balanced kernels give no response to a flat plane");
  bank.filter(mel, 1, border, trial_steps, raw);

  for (size_t i = 0; i < bank.n_filters(); ++i) {
    for (size_t y = 0; y < shape.y; ++y) {
      for (size_t x = 0; x < shape.x; ++x) {
        ASSERT_CLOSE(raw(i, Tensor5::POS, y, x, 1), 0, 1e-4f);
        ASSERT_CLOSE(raw(i, Tensor5::NEG, y, x, 1), 0, 1e-4f);

        // other channels are untouched
        ASSERT_EQ(raw(i, Tensor5::POS, y, x, 0), -1.0f);
      }
    }
  }
}

void test_impulse (Args & args)
{
  const size_t border = 12;
  const size_t trial_steps = 20;
  const size_t n_mel = 32;

  GaborSpec spec;
  GaborFilterBank bank(spec);
  GaborShape shape = bank.shape(trial_steps, n_mel);

  const size_t x = args.pop(2);
  const size_t y = args.pop(3);
  const size_t ft = 1;
  const size_t ff = 2;
  ASSERT_LT(x, shape.x);
  ASSERT_LT(y, shape.y);

  // tap x starts at step x space_time + border - size_time / 2
  const size_t step = x * spec.space_time + border - spec.size_time / 2 + ft;
  const size_t freq = y * spec.space_freq + ff;

  Tensor3 mel;
  mel.resize(n_mel, 2 * border + trial_steps, 1);
  mel(freq, step, 0) = 1;

  Tensor5 raw;
  raw.resize(bank.n_filters(), shape.y, shape.x, 1);
  bank.filter(mel, 0, border, trial_steps, raw);

  for (size_t i = 0; i < bank.n_filters(); ++i) {
    float k = bank.kernel(ft, ff, i);
    float pos = raw(i, Tensor5::POS, y, x, 0);
    float neg = raw(i, Tensor5::NEG, y, x, 0);
    PRINT3(k, pos, neg);

    if (k >= 0) {
      ASSERT_CLOSE(pos, spec.gain * k, 1e-6f);
      ASSERT_EQ(neg, 0.0f);
    } else {
      ASSERT_EQ(pos, 0.0f);
      ASSERT_CLOSE(neg, -spec.gain * k, 1e-6f);
    }
  }
}

const char * help_message =
"Usage: gabor_test [COMMAND = all] [OPTIONS]"
"\nCommands:"
"\n  kernels [SIZE]"
"\n  shape [TRIAL_STEPS] [N_MEL]"
"\n  flat [BORDER_STEPS]"
"\n  impulse [X] [Y]"
;

int main (int argc, char ** argv)
{
  Args args(argc, argv, help_message);

  args
    .case_("kernels", test_kernels)
    .case_("shape", test_shape)
    .case_("flat", test_flat)
    .case_("impulse", test_impulse)
    .default_all();

  return 0;
}

