
#include "gabor.h"
#include <vector>

namespace Auditory
{

void GaborSpec::load (const ConfigParser & config, const string & prefix)
{
  on = config(prefix + ".on", on);
  size_time = config(prefix + ".size_time", size_time);
  size_freq = config(prefix + ".size_freq", size_freq);
  space_time = config(prefix + ".space_time", space_time);
  space_freq = config(prefix + ".space_freq", space_freq);
  gain = config(prefix + ".gain", gain);
  n_horiz = config(prefix + ".n_horiz", n_horiz);
  wave_len = config(prefix + ".wave_len", wave_len);
  sigma_len = config(prefix + ".sigma_len", sigma_len);
  sigma_width = config(prefix + ".sigma_width", sigma_width);
  sigma_len_horiz = config(prefix + ".sigma_len_horiz", sigma_len_horiz);
  sigma_width_horiz = config(prefix + ".sigma_width_horiz", sigma_width_horiz);
  phase_offset = config(prefix + ".phase_offset", phase_offset);
  circle_edge = config(prefix + ".circle_edge", circle_edge);
}

GaborFilterBank::GaborFilterBank (const GaborSpec & spec)
  : m_spec(spec),
    m_kernels(spec.size_time * spec.size_freq * spec.n_filters())
{
  ASSERT_LT(0, spec.size_time);
  ASSERT_LT(0, spec.size_freq);
  ASSERT(0 < spec.space_time and 0 < spec.space_freq,
      "gabor spacing must be positive, got "
      << spec.space_time << " x " << spec.space_freq);
  ASSERT_LT(0, spec.wave_len);
  ASSERT(0 < spec.sigma_len and 0 < spec.sigma_width
     and 0 < spec.sigma_len_horiz and 0 < spec.sigma_width_horiz,
      "gabor sigmas must be positive");

  render();
}

//----( kernels )-------------------------------------------------------------

namespace
{

struct Envelope
{
  float angle;
  float center_f;
  float len_norm;
  float wd_norm;
};

} // anonymous namespace

void GaborFilterBank::render ()
{
  const GaborSpec & s = m_spec;
  const size_t T = s.size_time;
  const size_t F = s.size_freq;
  const size_t I = n_filters();

  const float two_pi_norm = 2 * M_PI / s.wave_len;
  const float ctr_t = (T - 1) / 2.0f;
  const float ctr_f = (F - 1) / 2.0f;
  const float ang_inc = M_PI / 4;
  const float radius_t = T / 2.0f;
  const float radius_f = F / 2.0f;
  const float len_norm = 1 / (2 * sqr(s.sigma_len));
  const float wd_norm = 1 / (2 * sqr(s.sigma_width));
  const float hor_len_norm = 1 / (2 * sqr(s.sigma_len_horiz));
  const float hor_wd_norm = 1 / (2 * sqr(s.sigma_width_horiz));
  const float hctr_inc = (F - 1) / (s.n_horiz + 1.0f);

  // the carrier runs across the envelope's length, along the rotated x axis:
  // angle 0 is vertical (broadband in time), -pi/2 is horizontal
  std::vector<Envelope> envelopes(I);
  size_t i = 0;
  for (size_t h = 0; h < s.n_horiz; ++h, ++i) {
    Envelope e = {-2 * ang_inc, hctr_inc * (h + 1), hor_len_norm, hor_wd_norm};
    envelopes[i] = e;
  }
  {
    Envelope e = {0, ctr_f, len_norm, wd_norm};
    envelopes[i++] = e;
  }
  for (int ang = 1; ang <= 3; ang += 2, ++i) {
    Envelope e = {-ang * ang_inc, ctr_f, len_norm, wd_norm};
    envelopes[i] = e;
  }

  for (i = 0; i < I; ++i) {
    const Envelope & e = envelopes[i];
    const float c = cosf(e.angle);
    const float sn = sinf(e.angle);

    for (size_t t = 0; t < T; ++t) {
      for (size_t f = 0; f < F; ++f) {
        float xfn = (t - ctr_t) / radius_t;
        float yfn = (f - e.center_f) / radius_f;

        float value = 0;
        if (not (s.circle_edge and hypotf(xfn, yfn) > 1)) {
          float nx = xfn * c - yfn * sn;
          float ny = yfn * c + xfn * sn;
          float gauss = expf(-(e.wd_norm * sqr(nx) + e.len_norm * sqr(ny)));
          value = gauss * sinf(two_pi_norm * nx + s.phase_offset);
        }
        m_kernels[(t * F + f) * I + i] = value;
      }
    }

    float pos = 0, neg = 0;
    for (size_t tf = 0; tf < T * F; ++tf) {
      float value = m_kernels[tf * I + i];
      if (value > 0) pos += value; else neg += value;
    }
    float pos_norm = pos > 0 ? 1 / pos : 0.0f;
    float neg_norm = neg < 0 ? -1 / neg : 0.0f;
    for (size_t tf = 0; tf < T * F; ++tf) {
      float & value = m_kernels[tf * I + i];
      value *= value > 0 ? pos_norm : neg_norm;
    }
  }
}

void GaborFilterBank::get_kernel (size_t i, Vector<float> & out) const
{
  ASSERT_LT(i, n_filters());
  ASSERT_SIZE(out, m_spec.size_time * m_spec.size_freq);

  for (size_t t = 0; t < m_spec.size_time; ++t) {
    for (size_t f = 0; f < m_spec.size_freq; ++f) {
      out[t * m_spec.size_freq + f] = kernel(t, f, i);
    }
  }
}

//----( convolution )---------------------------------------------------------

GaborShape GaborFilterBank::shape (size_t trial_steps, size_t n_mel) const
{
  ASSERT(m_spec.size_freq < n_mel,
      "gabor size_freq = " << m_spec.size_freq
      << " must be smaller than the mel filter count " << n_mel);
  ASSERT_LT(0, trial_steps);

  return GaborShape(
      (trial_steps - 1) / m_spec.space_time + 1,
      (n_mel - m_spec.size_freq - 1) / m_spec.space_freq + 1);
}

void GaborFilterBank::filter (
    const Tensor3 & mel,
    size_t channel,
    size_t border_steps,
    size_t trial_steps,
    Tensor5 & raw) const
{
  const GaborSpec & s = m_spec;
  const size_t I = n_filters();
  const GaborShape sh = shape(trial_steps, mel.features());

  ASSERT_EQ(mel.steps(), 2 * border_steps + trial_steps);
  ASSERT_EQ(raw.filters(), I);
  ASSERT_EQ(raw.freqs(), sh.y);
  ASSERT_EQ(raw.times(), sh.x);

  const int t_half = s.size_time / 2;
  const int t_off = t_half - int(border_steps);
  const int t_min = max(t_off, 0);
  const int t_max = int(trial_steps) - t_min;
  const int f_max = int(mel.features()) - int(s.size_freq);

  size_t t_idx = 0;
  for (int st = t_min; st < t_max; st += s.space_time, ++t_idx) {
    const int in_st = st - t_off;
    ASSERT(t_idx < sh.x, "gabor time tap " << t_idx << " out of range " << sh.x);
    ASSERT(in_st + int(s.size_time) <= int(mel.steps()),
        "gabor window at step " << in_st << " overruns the trial");

    size_t f_idx = 0;
    for (int flt = 0; flt < f_max; flt += s.space_freq, ++f_idx) {
      ASSERT(f_idx < sh.y, "gabor freq tap " << f_idx << " out of range " << sh.y);

      for (size_t i = 0; i < I; ++i) {
        float sum = 0;
        for (size_t ff = 0; ff < s.size_freq; ++ff) {
          for (size_t ft = 0; ft < s.size_time; ++ft) {
            sum += kernel(ft, ff, i) * mel(flt + ff, in_st + ft, channel);
          }
        }

        float act = s.gain * fabsf(sum);
        if (sum >= 0) {
          raw(i, Tensor5::POS, f_idx, t_idx, channel) = act;
          raw(i, Tensor5::NEG, f_idx, t_idx, channel) = 0;
        } else {
          raw(i, Tensor5::POS, f_idx, t_idx, channel) = 0;
          raw(i, Tensor5::NEG, f_idx, t_idx, channel) = act;
        }
      }
    }
  }
}

} // namespace Auditory

