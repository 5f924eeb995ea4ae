
#include "common.h"
#include <cstdio>
#include <cstring>
#include <sys/time.h>
#include <errno.h>

const char * larynx_logo =
"  _\n"
" | |    __ _ _ __ _   _ _ __ __  __\n"
" | |   / _` | '__| | | | '_ \\\\ \\/ /  Speech Analysis & Articulatory Synthesis\n"
" | |__| (_| | |  | |_| | | | |>  <\n"
" |_____\\__,_|_|   \\__, |_| |_/_/\\_\\\n"
"                  |___/";

//----( memory tools )--------------------------------------------------------

void * malloc_aligned (size_t size, size_t alignment)
{
  void * result = NULL;
  int info = posix_memalign(&result, alignment, max(size, size_t(1)));

  switch (info) {
    case 0: break;

    case ENOMEM:
      ERROR("malloc_aligned(" << size << ", " << alignment << ") failed"
          " due to lack of memory");
      break;

    case EINVAL:
      ERROR("malloc_aligned(" << size << ", " << alignment << ") failed"
          " on invalid alignment");
      break;

    default:
      ERROR("malloc_aligned(" << size << ", " << alignment << ") failed"
          " for unkown reason.\n\terror code = " << info);
  }

  return result;
}

void free_aligned (void * pointer) { free(pointer); }

void copy_float (
    const float * restrict source,
    float * restrict dest,
    size_t size)
{
  memcpy(dest, source, size * sizeof(float));
}

void zero_float (float * x, size_t size)
{
  memset(x, 0, size * sizeof(float));
}
void zero_bytes (void * x, size_t size)
{
  memset(x, 0, size);
}

//----( time )----------------------------------------------------------------

double get_elapsed_time ()
{
  static timeval g_begin_time;
  static bool g_initialized = false;

  if (not g_initialized) {
    gettimeofday(& g_begin_time, NULL);
    g_initialized = true;
  }

  timeval time;
  gettimeofday(& time, NULL);

  return time.tv_sec - g_begin_time.tv_sec
       + (time.tv_usec - g_begin_time.tv_usec) * 1e-6;
}

