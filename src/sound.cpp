
#include "sound.h"
#include <fstream>
#include <utility>

//----( byte order )----------------------------------------------------------

#if defined(__BYTE_ORDER__) and __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
  #define LARYNX_BIG_ENDIAN
#endif // __BYTE_ORDER__

// raw files are little-endian, the swap is its own inverse
inline void to_little_endian (std::vector<float> & samples)
{
#ifdef LARYNX_BIG_ENDIAN
  for (size_t i = 0; i < samples.size(); ++i) {
    char * bytes = reinterpret_cast<char *>(& samples[i]);
    std::swap(bytes[0], bytes[3]);
    std::swap(bytes[1], bytes[2]);
  }
#endif // LARYNX_BIG_ENDIAN
}

//----( sound )---------------------------------------------------------------

void Sound::append_mono (const std::vector<float> & samples)
{
  ASSERT_EQ(m_channels, 1u);
  m_samples.insert(m_samples.end(), samples.begin(), samples.end());
}

bool Sound::load_raw (const char * filename)
{
  std::ifstream file(filename, std::ios::binary);
  if (not file) {
    WARN("failed to open sound file " << filename);
    return false;
  }

  file.seekg(0, std::ios::end);
  size_t bytes = file.tellg();
  file.seekg(0, std::ios::beg);

  size_t frames = bytes / (sizeof(float) * m_channels);
  m_samples.resize(frames * m_channels);
  file.read(reinterpret_cast<char *>(m_samples.data()),
            m_samples.size() * sizeof(float));
  if (not file) {
    WARN("failed to read " << bytes << " bytes from " << filename);
    m_samples.clear();
    return false;
  }
  to_little_endian(m_samples);

  LOG("loaded " << frames << " frames x " << m_channels << " channels from "
      << filename);
  return true;
}

bool Sound::save_raw (const char * filename) const
{
  std::ofstream file(filename, std::ios::binary);
  if (not file) {
    WARN("failed to open sound file " << filename);
    return false;
  }

  std::vector<float> samples(m_samples);
  to_little_endian(samples);
  file.write(reinterpret_cast<const char *>(samples.data()),
             samples.size() * sizeof(float));
  if (not file) {
    WARN("failed to write " << filename);
    return false;
  }

  LOG("saved " << frames() << " frames to " << filename);
  return true;
}

