
/** FFT objects wrapping FFTW3.

  FFTW3 = fastest fourier transform in the west, version 3.
        @ http://www.fftw.org

  Note on Precision:
    Single-precision (23-24 bits) is plenty for 16-bit audio data.
    This requires linking with -lfftw3f instesd of -lfftw3,
    and prepending fftwf_ instead of fftw_.
    See fftw manual ss. 4.3.2, pp. 21-22 for details.

  Analysis windows are sized in milliseconds, so transform sizes are
  arbitrary rather than powers of two; fftw handles any size.

  References:
  (R1) http://www.fftw.org/fftw3_doc/
  (R2) fftw manual ss. 2.5.2 "Real even/odd DFTs (cosine/sine transforms)"
*/

#ifndef LARYNX_FFT_H
#define LARYNX_FFT_H

#include "common.h"
#include "vectors.h"
#include <fftw3.h>

//----( misc functions )------------------------------------------------------

// power[k] = |freq[k]|^2
void power_spectrum (const Vector<complex> & freq, Vector<float> & power);

//----( fast fourier transform classes )--------------------------------------

class FFT_R2C
{
  const size_t m_size;

public:
  Vector<float> time_in;
  Vector<complex> freq_out;

private:
  fftwf_plan m_fwd_plan;

public:
  FFT_R2C (size_t size);
  ~FFT_R2C ();

  // diagnostics
  size_t size_in  () const { return m_size; }
  size_t size_out () const { return m_size/2 + 1; }

  void transform_fwd (void) { fftwf_execute(m_fwd_plan); }
};

/** Unnormalized type-I discrete cosine transform (FFTW_REDFT00),

    Y[k] = X[0] + (-1)^k X[n-1] + 2 sum_{j=1}^{n-2} X[j] cos(pi j k / (n-1))

  which requires n >= 2.
*/

class DCT_I
{
  const size_t m_size;

public:
  Vector<float> time_in;
  Vector<float> freq_out;

private:
  fftwf_plan m_plan;

public:
  DCT_I (size_t size);
  ~DCT_I ();

  size_t size () const { return m_size; }

  void transform (void) { fftwf_execute(m_plan); }
};

#endif // LARYNX_FFT_H

