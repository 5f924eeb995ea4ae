
#include "common.h"
#include "resample.h"
#include "args.h"
#include <vector>

using namespace Trm;

void test_bessel (Args & args)
{
  ASSERT_EQ(bessel_i0(0), 1.0);
  ASSERT_CLOSE(bessel_i0(1), 1.2660658777520082, 1e-12);
  ASSERT_CLOSE(bessel_i0(5.658), 49.2597, 1e-3);

  LOG("i0 is even and increasing on the positive axis");
  double prev = 1;
  for (int i = 1; i <= 20; ++i) {
    double x = 0.5 * i;
    ASSERT_EQ(bessel_i0(x), bessel_i0(-x));
    ASSERT_LT(prev, bessel_i0(x));
    prev = bessel_i0(x);
  }
}

void test_dc (Args & args)
{
  const float input_rate = args.pop(23373.0f);
  const float output_rate = args.pop(44100.0f);
  const size_t size = args.pop(3000);
  const float value = 0.5f;

  std::vector<float> output;
  SampleRateConverter conv(input_rate, output_rate, output);
  PRINT3(conv.ratio(), conv.pad_size(), size);

  for (size_t i = 0; i < size; ++i) conv.push(value);
  conv.flush();

  const size_t expected_min = floor(size * conv.ratio());
  const size_t expected_max = ceil((size + 2 * conv.pad_size()) * conv.ratio());
  PRINT3(output.size(), expected_min, expected_max);
  ASSERT_LE(expected_min, output.size());
  ASSERT_LE(output.size(), expected_max + 1);
  ASSERT_EQ(conv.num_samples(), output.size());

  LOG("a constant passes with unit gain away from the edges");
  const size_t mid = output.size() / 2;
  for (size_t i = mid - 100; i < mid + 100; ++i) {
    ASSERT_CLOSE(output[i], value, 0.01f * value);
  }

  float max_abs = 0;
  for (size_t i = 0; i < output.size(); ++i) {
    ASSERT_FINITE(output[i]);
    imax(max_abs, fabsf(output[i]));
  }
  ASSERT_EQ(conv.max_sample(), max_abs);
}

void test_downsample (Args & args)
{
  const float input_rate = args.pop(44100.0f);
  const float output_rate = args.pop(16000.0f);
  const size_t size = 3000;
  const float value = -0.25f;

  std::vector<float> output;
  SampleRateConverter conv(input_rate, output_rate, output);
  PRINT2(conv.ratio(), conv.pad_size());
  ASSERT_LT(conv.ratio(), 1);

  for (size_t i = 0; i < size; ++i) conv.push(value);
  conv.flush();

  PRINT(output.size());
  ASSERT_LE(size_t(floor(size * conv.ratio())), output.size());

  const size_t mid = output.size() / 2;
  for (size_t i = mid - 50; i < mid + 50; ++i) {
    ASSERT_CLOSE(output[i], value, 0.01f * fabsf(value));
  }
}

void test_sine (Args & args)
{
  const float input_rate = 20000;
  const float output_rate = 44100;
  const float freq = args.pop(440.0f);
  const size_t size = 20000;

  std::vector<float> output;
  SampleRateConverter conv(input_rate, output_rate, output);

  for (size_t i = 0; i < size; ++i) {
    conv.push(sinf(2 * M_PI * freq * i / input_rate));
  }
  conv.flush();

  LOG("a passband tone keeps its amplitude and frequency");
  PRINT(conv.max_sample());
  ASSERT_CLOSE(conv.max_sample(), 1, 0.02f);

  size_t crossings = 0;
  const size_t begin = output.size() / 4;
  const size_t end = 3 * output.size() / 4;
  for (size_t i = begin + 1; i < end; ++i) {
    if ((output[i - 1] < 0) != (output[i] < 0)) ++crossings;
  }
  float measured = crossings / 2.0f / ((end - begin) / output_rate);
  PRINT2(freq, measured);
  ASSERT_CLOSE(measured, freq, 0.02f * freq);

  LOG("reset clears statistics and delay line");
  conv.reset();
  output.clear();
  for (size_t i = 0; i < 2000; ++i) conv.push(0);
  conv.flush();
  ASSERT_EQ(conv.max_sample(), 0.0f);
  ASSERT_EQ(conv.num_samples(), output.size());
}

const char * help_message =
"Usage: resample_test [COMMAND = all] [OPTIONS]"
"\nCommands:"
"\n  bessel"
"\n  dc [INPUT_RATE] [OUTPUT_RATE] [SIZE]"
"\n  downsample [INPUT_RATE] [OUTPUT_RATE]"
"\n  sine [FREQ]"
;

int main (int argc, char ** argv)
{
  Args args(argc, argv, help_message);

  args
    .case_("bessel", test_bessel)
    .case_("dc", test_dc)
    .case_("downsample", test_downsample)
    .case_("sine", test_sine)
    .default_all();

  return 0;
}

