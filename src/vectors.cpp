
#include "vectors.h"

//----( reductions )----------------------------------------------------------

float sum (const Vector<float> & x)
{
  const float * restrict x_ = x.data;

  double result = 0;
  for (size_t i = 0, I = x.size; i < I; ++i) result += x_[i];
  return result;
}

float max (const Vector<float> & x)
{
  ASSERT_LT(0, x.size);

  float result = x[0];
  for (size_t i = 1; i < x.size; ++i) imax(result, x[i]);
  return result;
}

