#ifndef LARYNX_SOUND_H
#define LARYNX_SOUND_H

#include "common.h"
#include <vector>

/** Decoded pcm audio: interleaved float samples normalized to [-1,1].

  Reads past the end return silence.
  Raw files are headerless little-endian float32, interleaved by channel.
  Big-endian hosts swap bytes on load and save.
*/

class Sound
{
  float m_sample_rate;
  size_t m_channels;
  std::vector<float> m_samples;

public:

  Sound (float sample_rate = DEFAULT_ANALYSIS_SAMPLE_RATE, size_t channels = 1)
    : m_sample_rate(sample_rate),
      m_channels(channels)
  {}

  float sample_rate () const { return m_sample_rate; }
  size_t channels () const { return m_channels; }
  size_t frames () const { return m_samples.size() / m_channels; }
  float duration () const { return frames() / m_sample_rate; }
  bool valid () const
  {
    return m_sample_rate > 0 and m_channels > 0 and not m_samples.empty();
  }

  float sample (size_t frame, size_t channel) const
  {
    ASSERT1_LT(channel, m_channels);
    size_t i = frame * m_channels + channel;
    return i < m_samples.size() ? m_samples[i] : 0.0f;
  }
  float & at (size_t frame, size_t channel)
  {
    ASSERT1_LT(channel, m_channels);
    return m_samples[frame * m_channels + channel];
  }

  void clear () { m_samples.clear(); }
  void resize (size_t frames) { m_samples.resize(frames * m_channels, 0.0f); }
  void append (const float * interleaved, size_t frames)
  {
    m_samples.insert(m_samples.end(), interleaved,
                     interleaved + frames * m_channels);
  }
  void append_mono (const std::vector<float> & samples);

  const std::vector<float> & samples () const { return m_samples; }

  // returns false on io failure
  bool load_raw (const char * filename);
  bool save_raw (const char * filename) const;
};

#endif // LARYNX_SOUND_H

