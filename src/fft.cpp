
#include "fft.h"

#define LOG1(mess)

//----( misc functions )------------------------------------------------------

void power_spectrum (const Vector<complex> & freq, Vector<float> & power)
{
  ASSERT_SIZE(power, freq.size);

  for (size_t k = 0; k < freq.size; ++k) {
    power[k] = norm(freq[k]);
  }
}

//----( fftw wrappers )-------------------------------------------------------

// plans are made before any data is written, so FFTW_MEASURE may scribble
// over the buffers

fftwf_plan make_plan (size_t size, float * input, complex * output)
{
  return fftwf_plan_dft_r2c_1d(size,
                               input,
                               reinterpret_cast<fftwf_complex*>(output),
                               FFTW_MEASURE);
}

fftwf_plan make_dct_plan (size_t size, float * input, float * output)
{
  return fftwf_plan_r2r_1d(size, input, output, FFTW_REDFT00, FFTW_MEASURE);
}

//----( fast fourier transform classes )--------------------------------------

FFT_R2C::FFT_R2C (size_t size)
  : m_size(size),
    time_in(m_size),
    freq_out(m_size/2 + 1),
    m_fwd_plan(make_plan(m_size, time_in, freq_out))
{
  ASSERT_LT(0, size);
  ASSERT(m_fwd_plan, "fftw failed to plan r2c transform of size " << size);
  LOG1("initializing fft transform of size " << size);

  time_in.zero();
}

FFT_R2C::~FFT_R2C ()
{
  fftwf_destroy_plan(m_fwd_plan);
}

DCT_I::DCT_I (size_t size)
  : m_size(size),
    time_in(m_size),
    freq_out(m_size),
    m_plan(NULL)
{
  ASSERT(size >= 2, "type-I dct requires at least 2 points, got " << size);
  m_plan = make_dct_plan(m_size, time_in, freq_out);
  ASSERT(m_plan, "fftw failed to plan dct of size " << size);

  time_in.zero();
}

DCT_I::~DCT_I ()
{
  fftwf_destroy_plan(m_plan);
}

