#ifndef LARYNX_GABOR_H
#define LARYNX_GABOR_H

/** Oriented gabor filters over the (time step x mel filter) plane.

  Each scale has 3 + n_horiz kernels:
    n_horiz horizontal narrow-band kernels, spaced evenly over frequency,
    one vertical kernel (broadband onset/offset),
    two diagonal kernels (rising, falling sweeps).
  A kernel is a sine carrier times a gaussian envelope, optionally cut to
  a circle, normalized so the positive lobe sums to 1 and the negative
  lobe to -1.

  Each response is split into a rectified pair: (act, 0) if the sum is
  nonnegative, else (0, act), where act = gain |sum|.
*/

#include "common.h"
#include "vectors.h"
#include "config.h"
#include "tensor.h"

namespace Auditory
{

struct GaborSpec
{
  bool on;
  size_t size_time;
  size_t size_freq;
  size_t space_time;
  size_t space_freq;
  float gain;
  size_t n_horiz;
  float wave_len;
  float sigma_len;
  float sigma_width;
  float sigma_len_horiz;
  float sigma_width_horiz;
  float phase_offset;
  bool circle_edge;

  GaborSpec (size_t size = 6, size_t space = 2, bool a_on = true)
    : on(a_on),
      size_time(size),
      size_freq(size),
      space_time(space),
      space_freq(space),
      gain(2),
      n_horiz(4),
      wave_len(1.5),
      sigma_len(0.6),
      sigma_width(0.3),
      sigma_len_horiz(0.3),
      sigma_width_horiz(0.1),
      phase_offset(0),
      circle_edge(true)
  {}

  // reads keys like gabor1.size_time
  void load (const ConfigParser & config, const string & prefix);

  size_t n_filters () const { return 3 + n_horiz; }
};

// output geometry; x counts time taps, y counts freq taps
struct GaborShape
{
  size_t x;
  size_t y;

  GaborShape () : x(0), y(0) {}
  GaborShape (size_t a_x, size_t a_y) : x(a_x), y(a_y) {}
};

class GaborFilterBank
{
  const GaborSpec m_spec;

  // kernels[(t * size_freq + f) * n_filters + i]
  Vector<float> m_kernels;

public:

  GaborFilterBank (const GaborSpec & spec);

  const GaborSpec & spec () const { return m_spec; }
  size_t n_filters () const { return m_spec.n_filters(); }

  float kernel (size_t t, size_t f, size_t i) const
  {
    return m_kernels[(t * m_spec.size_freq + f) * n_filters() + i];
  }
  // copies kernel i into a size_time * size_freq vector, time major
  void get_kernel (size_t i, Vector<float> & out) const;

  GaborShape shape (size_t trial_steps, size_t n_mel) const;

  /** Convolves one channel of a mel trial.

    The trial has 2 border + trial_steps steps;
    raw must be shaped (n_filters, shape.y, shape.x, channels).
  */
  void filter (
      const Tensor3 & mel,
      size_t channel,
      size_t border_steps,
      size_t trial_steps,
      Tensor5 & raw) const;

private:

  void render ();
};

} // namespace Auditory

#endif // LARYNX_GABOR_H

