#pragma once

/* compile-time defaults; runtime overrides come from ~/.tedrc (see settings.hpp) */

#ifndef TED_WRITE_CHUNK_SIZE
#define TED_WRITE_CHUNK_SIZE (64 * 1024)
#endif

#ifndef TED_RC_FILE_NAME
#define TED_RC_FILE_NAME ".tedrc"
#endif

#ifndef TED_DEFAULT_STATUS_LINE
#define TED_DEFAULT_STATUS_LINE 1
#endif

#ifndef TED_DEFAULT_COLOR
#define TED_DEFAULT_COLOR 1
#endif

#define TED_VERSION "0.1.0"
