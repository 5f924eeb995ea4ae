#ifndef LARYNX_KWTA_H
#define LARYNX_KWTA_H

/** Lateral inhibition via feed-forward / feed-back (FFFB) inhibition.

  Raw activations are treated as excitatory conductances. A single
  inhibitory conductance is shared by all units of a channel:

    ffi = ff max(0, avg_ge + max_vs_avg (max_ge - avg_ge) - ff0)
    fbi += (fb avg_act - fbi) / fb_tau
    gi = gi_mult (ffi + fbi)

  and each unit's rate code relaxes toward the noisy-XX1 response to its
  excitatory drive above the inhibition-dependent threshold. A fixed
  number of settling iterations is run.

  References:
  (R1) R. O'Reilly, Y. Munakata et al. (2012)
    "Computational Cognitive Neuroscience", ch. 2-3
*/

#include "common.h"
#include "vectors.h"
#include "config.h"

namespace Auditory
{

// x / (x + 1) convolved with gaussian noise, with a linear interpolation
// bridging the sigmoidal subthreshold part and the XX1 part
struct NoisyXX1
{
  float thr;
  float gain;
  float nvar;
  float sig_mult;
  float sig_mult_pow;
  float sig_gain;
  float interp_range;
  float gain_cor_range;
  float gain_cor;

  // derived
  float sig_gain_nvar;
  float sig_mult_eff;
  float sig_val_at_0;
  float interp_val;

  NoisyXX1 ()
    : thr(0.5),
      gain(100),
      nvar(0.005),
      sig_mult(0.33),
      sig_mult_pow(0.8),
      sig_gain(3),
      interp_range(0.01),
      gain_cor_range(10),
      gain_cor(0.1)
  {
    update();
  }

  void update ();

  static float xx1 (float x) { return x / (x + 1); }
  float xx1_gain_cor (float x) const;
  float operator() (float x) const;
};

struct KwtaSpec
{
  bool on;
  size_t iters;

  // fffb inhibition
  float gi;
  float ff;
  float fb;
  float fb_tau;
  float max_vs_avg;
  float ff0;

  // rate-coded units
  float act_tau;
  float gbar_e;
  float gbar_l;
  float gbar_i;
  float erev_e;
  float erev_l;
  float erev_i;
  NoisyXX1 xx1;

  KwtaSpec ()
    : on(true),
      iters(20),
      gi(1.8),
      ff(1),
      fb(1),
      fb_tau(1.4),
      max_vs_avg(0),
      ff0(0.1),
      act_tau(3),
      gbar_e(0.5),
      gbar_l(0.2),
      gbar_i(1.0),
      erev_e(1.0),
      erev_l(0.3),
      erev_i(0.3)
  {}

  void load (const ConfigParser & config);

  float ff_inhib (float avg_ge, float max_ge) const
  {
    float netin = avg_ge + max_vs_avg * (max_ge - avg_ge);
    return netin > ff0 ? ff * (netin - ff0) : 0.0f;
  }

  // excitatory conductance at which a unit reaches threshold
  float ge_thresh (float gi_eff) const
  {
    return (gbar_i * gi_eff * (erev_i - xx1.thr)
          + gbar_l * (erev_l - xx1.thr))
         / (xx1.thr - erev_e);
  }
};

class Inhibition
{
  const KwtaSpec m_spec;
  float m_gi;

public:

  Inhibition (const KwtaSpec & spec);

  const KwtaSpec & spec () const { return m_spec; }

  // final shared inhibitory conductance of the last call
  float gi () const { return m_gi; }

  void compute (const Vector<float> & raw, Vector<float> & act);
};

} // namespace Auditory

#endif // LARYNX_KWTA_H

