
#include "common.h"
#include "fir.h"
#include "args.h"

using namespace Trm;

float magnitude (const FirFilter & fir, float freq)
{
  const float center = (fir.n_taps() - 1) / 2.0f;
  float total = 0;
  for (size_t i = 0; i < fir.n_taps(); ++i) {
    total += fir.tap(i) * cosf(2 * M_PI * freq * (i - center));
  }
  return fabsf(total);
}

void test_rational (Args & args)
{
  const float number = args.pop(0.6545085f);

  int order = 25;
  int numerator = 0;
  int denominator = 0;
  rational_approximation(number, order, numerator, denominator);
  PRINT3(numerator, denominator, order);

  ASSERT_LE(25, denominator);
  ASSERT_LE(denominator, 50);
  ASSERT_EQ(order, denominator - 1);
  ASSERT_CLOSE(float(numerator) / denominator, number, 1.0f / denominator);

  LOG("negative numbers keep their sign");
  order = 10;
  rational_approximation(-1.5, order, numerator, denominator);
  PRINT2(numerator, denominator);
  ASSERT_EQ(numerator, -3 * denominator / 2);

  LOG("non-positive order gives nothing");
  order = 0;
  rational_approximation(number, order, numerator, denominator);
  ASSERT_EQ(order, -1);
  ASSERT_EQ(numerator, 0);
  ASSERT_EQ(denominator, 0);
}

void test_design (Args & args)
{
  const float beta = args.pop(0.2f);
  const float gamma = args.pop(0.1f);

  FirFilter fir(beta, gamma, 1e-8f);
  PRINT(fir.n_taps());

  ASSERT_EQ(fir.n_taps() % 2, 1u);
  for (size_t i = 0, I = fir.n_taps(); i < I; ++i) {
    ASSERT_FINITE(fir.tap(i));
    ASSERT_EQ(fir.tap(i), fir.tap(I - 1 - i));
  }

  PRINT3(fir.dc_gain(), magnitude(fir, beta), magnitude(fir, beta + gamma));
  ASSERT_CLOSE(fir.dc_gain(), 1, 1e-4f);
  ASSERT_CLOSE(magnitude(fir, beta / 4), 1, 1e-3f);
  ASSERT_LT(magnitude(fir, beta + gamma), 0.01f);
  ASSERT_LT(magnitude(fir, 0.45f), 0.01f);
}

void test_impulse (Args & args)
{
  const float beta = args.pop(0.2f);
  const float gamma = args.pop(0.1f);

  FirFilter fir(beta, gamma, 1e-8f);
  const size_t T = fir.n_taps();

  LOG("the impulse response is the tap sequence");
  float response = fir.filter(1);
  ASSERT_EQ(response, fir.tap(0));
  for (size_t t = 1; t < T; ++t) {
    response = fir.filter(0);
    ASSERT_CLOSE(response, fir.tap(t), 1e-7f);
  }
  ASSERT_EQ(fir.filter(0), 0.0f);

  LOG("buffering without output still advances the delay line");
  fir.reset();
  fir.filter(1, false);
  response = fir.filter(0, true);
  ASSERT_CLOSE(response, fir.tap(1), 1e-7f);

  LOG("constant input settles to the dc gain");
  fir.reset();
  for (size_t t = 0; t < 2 * T; ++t) response = fir.filter(0.5f);
  ASSERT_CLOSE(response, 0.5f * fir.dc_gain(), 1e-5f);
}

const char * help_message =
"Usage: fir_test [COMMAND = all] [OPTIONS]"
"\nCommands:"
"\n  rational [NUMBER]"
"\n  design [BETA] [GAMMA]"
"\n  impulse [BETA] [GAMMA]"
;

int main (int argc, char ** argv)
{
  Args args(argc, argv, help_message);

  args
    .case_("rational", test_rational)
    .case_("design", test_design)
    .case_("impulse", test_impulse)
    .default_all();

  return 0;
}

