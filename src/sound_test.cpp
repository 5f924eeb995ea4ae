
#include "common.h"
#include "sound.h"
#include "args.h"
#include <fstream>

void test_raw (Args & args)
{
  const char * filename = args.pop("/tmp/larynx_sound_test.raw");

  LOG("raw files are little-endian float32");
  {
    // 1.0f, -2.0f, 0.5f, then a partial frame
    const unsigned char bytes[] = {
      0x00, 0x00, 0x80, 0x3f,
      0x00, 0x00, 0x00, 0xc0,
      0x00, 0x00, 0x00, 0x3f,
      0x00, 0x00
    };
    std::ofstream file(filename, std::ios::binary);
    ASSERT(file, "failed to write " << filename);
    file.write(reinterpret_cast<const char *>(bytes), sizeof(bytes));
  }

  Sound sound(16000, 1);
  ASSERT(sound.load_raw(filename), "failed to load " << filename);
  ASSERT_EQ(sound.frames(), 3u);
  ASSERT_EQ(sound.sample(0, 0), 1.0f);
  ASSERT_EQ(sound.sample(1, 0), -2.0f);
  ASSERT_EQ(sound.sample(2, 0), 0.5f);

  LOG("stereo files drop a trailing partial frame");
  Sound stereo(16000, 2);
  ASSERT(stereo.load_raw(filename), "failed to load " << filename);
  ASSERT_EQ(stereo.frames(), 1u);
  ASSERT_EQ(stereo.sample(0, 1), -2.0f);

  LOG("saved files have the same byte layout");
  ASSERT(sound.save_raw(filename), "failed to save " << filename);
  {
    std::ifstream file(filename, std::ios::binary);
    unsigned char bytes[12];
    file.read(reinterpret_cast<char *>(bytes), sizeof(bytes));
    ASSERT(file, "short file " << filename);
    ASSERT_EQ(bytes[3], 0x3f);
    ASSERT_EQ(bytes[2], 0x80);
    ASSERT_EQ(bytes[7], 0xc0);
    ASSERT_EQ(bytes[11], 0x3f);
  }

  LOG("missing files fail without aborting");
  Sound missing(16000, 1);
  ASSERT(not missing.load_raw("/nonexistent/larynx.raw"), "loaded nothing");
  ASSERT_EQ(missing.frames(), 0u);
}

void test_sample (Args & args)
{
  const size_t frames = args.pop(4);

  Sound sound(8000, 2);
  sound.resize(frames);
  for (size_t t = 0; t < frames; ++t) {
    sound.at(t, 0) = t;
    sound.at(t, 1) = -float(t);
  }
  ASSERT(sound.valid(), "filled sound is invalid");
  ASSERT_CLOSE(sound.duration(), frames / 8000.0f, 1e-6f);
  ASSERT_EQ(sound.sample(frames - 1, 1), 1.0f - frames);

  LOG("reads past the end are silent");
  ASSERT_EQ(sound.sample(frames, 0), 0.0f);
  ASSERT_EQ(sound.sample(frames + 100, 1), 0.0f);

  sound.clear();
  ASSERT(not sound.valid(), "empty sound is valid");
}

const char * help_message =
"Usage: sound_test [COMMAND = all] [OPTIONS]"
"\nCommands:"
"\n  raw [TEMP_FILENAME]"
"\n  sample [FRAMES]"
;

int main (int argc, char ** argv)
{
  Args args(argc, argv, help_message);

  args
    .case_("raw", test_raw)
    .case_("sample", test_sample)
    .default_all();

  return 0;
}

