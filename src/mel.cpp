
#include "mel.h"
#include <Eigen/Eigen>
#include <Eigen/Sparse>

#define LOG1(mess)

namespace Auditory
{

//----( scales )--------------------------------------------------------------

float freq_to_mel (float hz)
{
  return 1127.0 * log(1.0 + double(hz) / 700.0);
}

float mel_to_freq (float mel)
{
  return 700.0 * (exp(double(mel) / 1127.0) - 1.0);
}

size_t freq_to_bin (float hz, size_t n_fft, float sample_rate)
{
  ASSERT_LT(0, sample_rate);
  ASSERT_NONNEG(hz);
  return floor((n_fft + 1.0) * hz / sample_rate);
}

//----( parameters )----------------------------------------------------------

void MelSpec::load (const ConfigParser & config)
{
  lo_hz = config("mel.lo_hz", lo_hz);
  hi_hz = config("mel.hi_hz", hi_hz);
  n_filters = config("mel.n_filters", n_filters);
  log_off = config("mel.log_off", log_off);
  log_min = config("mel.log_min", log_min);
}

void RenormSpec::load (const ConfigParser & config)
{
  on = config("renorm.on", on);
  min = config("renorm.min", min);
  max = config("renorm.max", max);
}

void MfccSpec::load (const ConfigParser & config)
{
  on = config("mfcc.on", on);
  n_coeff = config("mfcc.n_coeff", n_coeff);
}

//----( filter bank )---------------------------------------------------------

struct MelFilterBank::Weights
{
  typedef Eigen::SparseMatrix<float, Eigen::RowMajor> Matrix;
  Matrix matrix;

  Weights (size_t rows, size_t cols) : matrix(rows, cols) {}
};

MelFilterBank::MelFilterBank (
    const MelSpec & spec,
    const RenormSpec & renorm,
    size_t fft_bins,
    float sample_rate)

  : m_spec(spec),
    m_renorm(renorm),
    m_fft_bins(fft_bins),
    m_sample_rate(sample_rate),

    m_pts_mel(spec.n_filters + 2),
    m_pts_hz(spec.n_filters + 2),
    m_pts_bin(spec.n_filters + 2),
    m_rows(spec.n_filters),

    m_weights(new Weights(spec.n_filters, fft_bins))
{
  ASSERT_LT(0, spec.n_filters);
  ASSERT(0 < spec.lo_hz, "mel lo_hz must be positive, got " << spec.lo_hz);
  ASSERT(spec.lo_hz < spec.hi_hz,
      "mel lo_hz = " << spec.lo_hz << " must be below hi_hz = " << spec.hi_hz);
  ASSERTW(spec.hi_hz < sample_rate / 2,
      "mel hi_hz = " << spec.hi_hz << " is above the nyquist frequency "
      << (sample_rate / 2));
  if (renorm.on) {
    ASSERT(renorm.min < renorm.max,
        "empty renormalization range [" << renorm.min << ", " << renorm.max
        << "]");
  }

  const size_t num_pts = spec.n_filters + 2;
  const float lo_mel = freq_to_mel(spec.lo_hz);
  const float hi_mel = freq_to_mel(spec.hi_hz);
  const float mel_incr = (hi_mel - lo_mel) / (spec.n_filters + 1);

  for (size_t p = 0; p < num_pts; ++p) {
    float mel = lo_mel + p * mel_incr;
    float hz = mel_to_freq(mel);
    m_pts_mel[p] = mel;
    m_pts_hz[p] = hz;
    m_pts_bin[p] = freq_to_bin(hz, fft_bins, sample_rate);
  }
  ASSERT(m_pts_bin.back() < fft_bins,
      "mel filter bin " << m_pts_bin.back() << " exceeds fft size "
      << fft_bins);

  std::vector<Eigen::Triplet<float> > entries;

  for (size_t i = 0; i < spec.n_filters; ++i) {
    const size_t mn = min_bin(i);
    const size_t pk = peak_bin(i);
    const size_t mx = max_bin(i);
    ASSERT(mn < pk and pk < mx,
        "degenerate mel filter " << i << " with bins " << mn << ", "
        << pk << ", " << mx << "; use fewer filters or a longer window");

    const float rise = pk - mn;
    const float fall = mx - pk;

    std::vector<float> & row = m_rows[i];
    row.resize(mx - mn + 1);
    for (size_t bin = mn; bin <= mx; ++bin) {
      float w = bin < pk ? (bin - mn) / rise
                         : (mx - bin) / fall;
      row[bin - mn] = w;
      if (w > 0) entries.push_back(Eigen::Triplet<float>(i, bin, w));
    }
  }

  m_weights->matrix.setFromTriplets(entries.begin(), entries.end());
  m_weights->matrix.makeCompressed();

  LOG1("built " << spec.n_filters << " mel filters over " << fft_bins
      << " bins, " << entries.size() << " nonzero weights");
}

MelFilterBank::~MelFilterBank ()
{
  delete m_weights;
}

size_t MelFilterBank::max_bins () const
{
  const size_t n = m_pts_bin.size();
  return m_pts_bin[n - 1] - m_pts_bin[n - 3] + 1;
}

float MelFilterBank::weight (size_t i, size_t bin) const
{
  ASSERT_LT(i, size());
  const size_t mn = min_bin(i);
  if (bin < mn or bin > max_bin(i)) return 0;
  return m_rows[i][bin - mn];
}

void MelFilterBank::apply (
    const Vector<float> & power,
    Vector<float> & mel) const
{
  ASSERT_SIZE(power, m_fft_bins);
  ASSERT_SIZE(mel, size());

  Eigen::Map<const Eigen::VectorXf> x(power.data, power.size);
  Eigen::Map<Eigen::VectorXf> y(mel.data, mel.size);
  y.noalias() = m_weights->matrix * x;

  for (size_t i = 0; i < mel.size; ++i) {
    float sum = mel[i] + m_spec.log_off;
    float value = sum > 0 ? logf(sum) : m_spec.log_min;
    mel[i] = m_renorm(value);
  }
}

//----( cepstrum )------------------------------------------------------------

Cepstrum::Cepstrum (size_t n_filters, size_t n_coeff)
  : m_size_in(n_filters),
    m_n_coeff(n_coeff),
    m_dct(n_filters)
{
  ASSERT(0 < n_coeff and n_coeff <= n_filters,
      "mfcc n_coeff = " << n_coeff << " must be in [1, " << n_filters << "]");
}

void Cepstrum::apply (const Vector<float> & mel, Vector<float> & mfcc)
{
  ASSERT_SIZE(mel, m_size_in);
  ASSERT_SIZE(mfcc, m_n_coeff);

  m_dct.time_in = mel;
  m_dct.transform();

  for (size_t k = 0; k < m_n_coeff; ++k) {
    mfcc[k] = m_dct.freq_out[k];
  }

  // log energy in place of c0
  mfcc[0] = logf(1 + sqr(mfcc[0]));
}

} // namespace Auditory

