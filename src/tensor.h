#ifndef LARYNX_TENSOR_H
#define LARYNX_TENSOR_H

/** Trial tensors with named axes over flat aligned storage.

  Storage is reallocated only when the shape changes, so a trial buffer
  persists from one trial to the next and its border region can be
  wrapped in place.

  Tensor3 axes are (feature, step, channel), laid out so that the feature
  vector of a single step is contiguous:

    index(f, s, c) = (c * steps + s) * features + f

  Tensor5 axes are (filter, sign, freq, time, channel), laid out so that
  each channel is one contiguous block:

    index(i, p, y, x, c) = (((c * filters + i) * 2 + p) * freqs + y)
                         * times + x
*/

#include "common.h"
#include "vectors.h"

class Tensor3
{
  size_t m_features;
  size_t m_steps;
  size_t m_channels;
  Vector<float> * m_data;

  // noncopyable
  Tensor3 (const Tensor3 &);
  void operator= (const Tensor3 &);

public:

  Tensor3 () : m_features(0), m_steps(0), m_channels(0), m_data(NULL) {}
  ~Tensor3 () { if (m_data) delete m_data; }

  // returns true if storage was reallocated
  bool resize (size_t features, size_t steps, size_t channels)
  {
    if (m_data and features == m_features and steps == m_steps
               and channels == m_channels) {
      return false;
    }
    if (m_data) delete m_data;
    m_features = features;
    m_steps = steps;
    m_channels = channels;
    m_data = new Vector<float>(features * steps * channels);
    m_data->zero();
    return true;
  }

  size_t features () const { return m_features; }
  size_t steps () const { return m_steps; }
  size_t channels () const { return m_channels; }
  size_t size () const { return m_features * m_steps * m_channels; }
  bool empty () const { return m_data == NULL; }

  size_t index (size_t f, size_t s, size_t c) const
  {
    ASSERT1_LT(f, m_features);
    ASSERT1_LT(s, m_steps);
    ASSERT1_LT(c, m_channels);
    return (c * m_steps + s) * m_features + f;
  }

  float & operator() (size_t f, size_t s, size_t c)
  {
    return m_data->data[index(f, s, c)];
  }
  float operator() (size_t f, size_t s, size_t c) const
  {
    return m_data->data[index(f, s, c)];
  }

  // aliases the feature vector at (step, channel)
  Vector<float> step (size_t s, size_t c)
  {
    return Vector<float>(m_features, m_data->data + index(0, s, c));
  }
  const Vector<float> step (size_t s, size_t c) const
  {
    return Vector<float>(m_features, m_data->data + index(0, s, c));
  }

  void copy_step (size_t dst, size_t src, size_t c)
  {
    copy_float(m_data->data + index(0, src, c),
               m_data->data + index(0, dst, c),
               m_features);
  }

  void zero () { if (m_data) m_data->zero(); }
  Vector<float> & flat () { return * m_data; }
  const Vector<float> & flat () const { return * m_data; }
};

class Tensor5
{
  size_t m_filters;
  size_t m_freqs;
  size_t m_times;
  size_t m_channels;
  Vector<float> * m_data;

  // noncopyable
  Tensor5 (const Tensor5 &);
  void operator= (const Tensor5 &);

public:

  enum Sign { POS = 0, NEG = 1 };

  Tensor5 ()
    : m_filters(0), m_freqs(0), m_times(0), m_channels(0), m_data(NULL)
  {}
  ~Tensor5 () { if (m_data) delete m_data; }

  bool resize (size_t filters, size_t freqs, size_t times, size_t channels)
  {
    if (m_data and filters == m_filters and freqs == m_freqs
               and times == m_times and channels == m_channels) {
      return false;
    }
    if (m_data) delete m_data;
    m_filters = filters;
    m_freqs = freqs;
    m_times = times;
    m_channels = channels;
    m_data = new Vector<float>(channel_size() * channels);
    m_data->zero();
    return true;
  }

  size_t filters () const { return m_filters; }
  size_t freqs () const { return m_freqs; }
  size_t times () const { return m_times; }
  size_t channels () const { return m_channels; }
  size_t channel_size () const { return m_filters * 2 * m_freqs * m_times; }
  bool empty () const { return m_data == NULL; }

  size_t index (size_t i, size_t p, size_t y, size_t x, size_t c) const
  {
    ASSERT1_LT(i, m_filters);
    ASSERT1_LT(p, size_t(2));
    ASSERT1_LT(y, m_freqs);
    ASSERT1_LT(x, m_times);
    ASSERT1_LT(c, m_channels);
    return (((c * m_filters + i) * 2 + p) * m_freqs + y) * m_times + x;
  }

  float & operator() (size_t i, size_t p, size_t y, size_t x, size_t c)
  {
    return m_data->data[index(i, p, y, x, c)];
  }
  float operator() (size_t i, size_t p, size_t y, size_t x, size_t c) const
  {
    return m_data->data[index(i, p, y, x, c)];
  }

  Vector<float> channel (size_t c)
  {
    return m_data->block(channel_size(), c);
  }
  const Vector<float> channel (size_t c) const
  {
    return m_data->block(channel_size(), c);
  }

  void zero () { if (m_data) m_data->zero(); }
  Vector<float> & flat () { return * m_data; }
  const Vector<float> & flat () const { return * m_data; }
};

#endif // LARYNX_TENSOR_H

