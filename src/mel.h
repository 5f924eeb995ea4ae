#ifndef LARYNX_MEL_H
#define LARYNX_MEL_H

/** Triangular mel filter banks over fft power spectra.

  The bank has n_filters triangles whose min, peak, max points are
  n_filters + 2 points spaced evenly in mel between lo_hz and hi_hz.
  Filter i rises linearly from 0 at min_bin(i) to 1 at peak_bin(i),
  then falls linearly to 0 at max_bin(i).

  Energies are log compressed and optionally renormalized to [0,1].
  The cepstrum is the type-I dct of the (compressed) mel energies,
  with c0 replaced by log(1 + c0^2).

  References:
  (R1) S. Davis, P. Mermelstein (1980)
    "Comparison of parametric representations for monosyllabic word
    recognition in continuously spoken sentences"
*/

#include "common.h"
#include "vectors.h"
#include "config.h"
#include "fft.h"
#include <vector>

namespace Auditory
{

//----( scales )--------------------------------------------------------------

float freq_to_mel (float hz);
float mel_to_freq (float mel);

// bin = floor((n_fft + 1) hz / sample_rate)
size_t freq_to_bin (float hz, size_t n_fft, float sample_rate);

//----( parameters )----------------------------------------------------------

struct MelSpec
{
  float lo_hz;
  float hi_hz;
  size_t n_filters;
  float log_off;  // added to each energy before the log
  float log_min;  // used in place of log(0)

  MelSpec ()
    : lo_hz(120),
      hi_hz(10000),
      n_filters(32),
      log_off(0),
      log_min(-10)
  {}

  void load (const ConfigParser & config);
};

struct RenormSpec
{
  bool on;
  float min;
  float max;

  RenormSpec () : on(true), min(-10), max(7) {}

  void load (const ConfigParser & config);

  float scale () const { return 1 / (max - min); }
  float operator() (float x) const
  {
    return on ? clipped((x - min) * scale()) : x;
  }
};

struct MfccSpec
{
  bool on;
  size_t n_coeff;

  MfccSpec () : on(true), n_coeff(13) {}

  void load (const ConfigParser & config);
};

//----( filter bank )---------------------------------------------------------

class MelFilterBank
{
  const MelSpec m_spec;
  const RenormSpec m_renorm;
  const size_t m_fft_bins;
  const float m_sample_rate;

  std::vector<float> m_pts_mel;
  std::vector<float> m_pts_hz;
  std::vector<size_t> m_pts_bin;

  // one row per filter, over bins min_bin(i)..max_bin(i) inclusive
  std::vector<std::vector<float> > m_rows;

  struct Weights;
  Weights * m_weights;

  // noncopyable
  MelFilterBank (const MelFilterBank &);
  void operator= (const MelFilterBank &);

public:

  MelFilterBank (
      const MelSpec & spec,
      const RenormSpec & renorm,
      size_t fft_bins,
      float sample_rate);
  ~MelFilterBank ();

  size_t size () const { return m_spec.n_filters; }
  size_t fft_bins () const { return m_fft_bins; }
  float sample_rate () const { return m_sample_rate; }
  const MelSpec & spec () const { return m_spec; }
  const RenormSpec & renorm () const { return m_renorm; }

  size_t num_points () const { return m_pts_bin.size(); }
  float point_mel (size_t p) const { return m_pts_mel[p]; }
  float point_hz (size_t p) const { return m_pts_hz[p]; }

  size_t min_bin (size_t i) const { return m_pts_bin[i]; }
  size_t peak_bin (size_t i) const { return m_pts_bin[i + 1]; }
  size_t max_bin (size_t i) const { return m_pts_bin[i + 2]; }
  size_t max_bins () const;

  // zero outside the support of filter i
  float weight (size_t i, size_t bin) const;

  // power has fft_bins entries, mel has size() entries
  void apply (const Vector<float> & power, Vector<float> & mel) const;
};

//----( cepstrum )------------------------------------------------------------

class Cepstrum
{
  const size_t m_size_in;
  const size_t m_n_coeff;
  DCT_I m_dct;

public:

  Cepstrum (size_t n_filters, size_t n_coeff);

  size_t size_in () const { return m_size_in; }
  size_t size_out () const { return m_n_coeff; }

  void apply (const Vector<float> & mel, Vector<float> & mfcc);
};

} // namespace Auditory

#endif // LARYNX_MEL_H

