#ifndef LARYNX_WINDOW_H
#define LARYNX_WINDOW_H

/** Window functions map [-1,1] --> RR

                        ^  w(t)              Satisfying:
                    __--|--__                  w(0) = "max value"
                 _-~    |    ~-_               w(x) = w(-x)
               _/       |       \_
             _/         |         \_
      ___--~~           |           ~~--___
   -+-------------------+-------------------+------> t
   -1                   0                   1

  Analysis frames default to a rectangular (NONE) window.
*/

#include "common.h"
#include "vectors.h"

inline float window_Hann (float t)
{
  ASSERT((-1 <= t) and (t <= 1), "window argument out of range: " << t);
  return (1 + cosf(M_PI * t)) / 2;
}

inline float window_Hamming (float t)
{
  ASSERT((-1 <= t) and (t <= 1), "window argument out of range: " << t);
  return 0.54f + 0.46f * cosf(M_PI * t);
}

enum WindowType { WINDOW_NONE, WINDOW_HANN, WINDOW_HAMMING };

inline WindowType parse_window (const string & name)
{
  if (name == "none") return WINDOW_NONE;
  if (name == "hann") return WINDOW_HANN;
  if (name == "hamming") return WINDOW_HAMMING;
  ERROR("unknown window type: " << name);
  return WINDOW_NONE;
}

inline const char * window_name (WindowType type)
{
  switch (type) {
    case WINDOW_HANN: return "hann";
    case WINDOW_HAMMING: return "hamming";
    default: return "none";
  }
}

// samples the window at the centers of size equal bins
inline void fill_window (WindowType type, Vector<float> & window)
{
  const size_t size = window.size;
  for (size_t i = 0; i < size; ++i) {
    float t = 2 * (i + 0.5f) / size - 1;
    switch (type) {
      case WINDOW_NONE: window[i] = 1; break;
      case WINDOW_HANN: window[i] = window_Hann(t); break;
      case WINDOW_HAMMING: window[i] = window_Hamming(t); break;
    }
  }
}

#endif // LARYNX_WINDOW_H

