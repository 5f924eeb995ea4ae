
#include "kwta.h"

#define LOG1(mess)

namespace Auditory
{

//----( activation function )-------------------------------------------------

void NoisyXX1::update ()
{
  ASSERT_LT(0, nvar);
  ASSERT_LT(0, interp_range);

  sig_gain_nvar = sig_gain / nvar;
  sig_mult_eff = sig_mult * powf(gain * nvar, sig_mult_pow);
  sig_val_at_0 = 0.5f * sig_mult_eff;
  interp_val = xx1_gain_cor(interp_range) - sig_val_at_0;
}

float NoisyXX1::xx1_gain_cor (float x) const
{
  float gain_cor_fact = (gain_cor_range - (x / nvar)) / gain_cor_range;
  if (gain_cor_fact < 0) return xx1(gain * x);

  float new_gain = gain * (1 - gain_cor * gain_cor_fact);
  return xx1(new_gain * x);
}

float NoisyXX1::operator() (float x) const
{
  if (x < 0) {
    return sig_mult_eff / (1 + expf(-(x * sig_gain_nvar)));
  } else if (x < interp_range) {
    float interp = 1 - ((interp_range - x) / interp_range);
    return sig_val_at_0 + interp * interp_val;
  } else {
    return xx1_gain_cor(x);
  }
}

//----( parameters )----------------------------------------------------------

void KwtaSpec::load (const ConfigParser & config)
{
  on = config("kwta.on", on);
  iters = config("kwta.iters", iters);
  gi = config("kwta.gi", gi);
  ff = config("kwta.ff", ff);
  fb = config("kwta.fb", fb);
  fb_tau = config("kwta.fb_tau", fb_tau);
  max_vs_avg = config("kwta.max_vs_avg", max_vs_avg);
  ff0 = config("kwta.ff0", ff0);
  act_tau = config("kwta.act_tau", act_tau);
  gbar_e = config("kwta.gbar_e", gbar_e);
  gbar_l = config("kwta.gbar_l", gbar_l);
  gbar_i = config("kwta.gbar_i", gbar_i);
  erev_e = config("kwta.erev_e", erev_e);
  erev_l = config("kwta.erev_l", erev_l);
  erev_i = config("kwta.erev_i", erev_i);
  xx1.thr = config("kwta.thr", xx1.thr);
  xx1.gain = config("kwta.gain", xx1.gain);
  xx1.nvar = config("kwta.nvar", xx1.nvar);
  xx1.update();
}

//----( inhibition )----------------------------------------------------------

Inhibition::Inhibition (const KwtaSpec & spec)
  : m_spec(spec),
    m_gi(0)
{
  ASSERT_LT(0, spec.fb_tau);
  ASSERT_LT(0, spec.act_tau);
  ASSERT(spec.xx1.thr != spec.erev_e,
      "kwta threshold must differ from the excitatory reversal potential");
}

void Inhibition::compute (const Vector<float> & raw, Vector<float> & act)
{
  ASSERT_SIZE(act, raw.size);
  ASSERT_LT(0, raw.size);

  const KwtaSpec & s = m_spec;
  const size_t size = raw.size;
  const float fb_dt = 1 / s.fb_tau;
  const float act_dt = 1 / s.act_tau;

  // raw conductances are fixed over the settling iterations
  float avg_ge = mean(raw);
  float max_ge = max(raw);
  float ffi = s.ff_inhib(avg_ge, max_ge);

  act.zero();
  float avg_act = 0;
  float fbi = 0;

  for (size_t iter = 0; iter < s.iters; ++iter) {
    fbi += fb_dt * (s.fb * avg_act - fbi);
    m_gi = s.gi * (ffi + fbi);

    const float ge_thr = s.ge_thresh(m_gi);

    double sum_act = 0;
    for (size_t i = 0; i < size; ++i) {
      float new_act = s.xx1(raw[i] * s.gbar_e - ge_thr);
      act[i] += act_dt * (new_act - act[i]);
      sum_act += act[i];
    }
    avg_act = sum_act / size;
  }

  LOG1("inhibition settled to gi = " << m_gi << ", avg act = " << avg_act);
}

} // namespace Auditory

