#pragma once
/*
 * Logging
 *
 * Leveled printf-style macros. Verbosity is fixed at compile time with
 * TED_LOG_LEVEL (0 = errors only, 1 = info (default), 2 = debug).
 * Records go to $TED_LOG_FILE when set; otherwise to stderr, except while
 * the curses screen owns the terminal, when they are dropped.
 */
#include <cstdio>

#ifndef TED_LOG_LEVEL
#define TED_LOG_LEVEL 1
#endif

FILE* log_stream();
bool log_open_from_env();
void log_close();
void log_set_screen_active(bool active);

#define TED_LOG_WRITE(tag, fmt, ...) \
  do { \
    if (FILE* ted_log_f_ = log_stream()) { \
      std::fprintf(ted_log_f_, "[TED][" tag "] " fmt "\n", ##__VA_ARGS__); \
      std::fflush(ted_log_f_); \
    } \
  } while (0)

#define TED_ERR(fmt, ...) TED_LOG_WRITE("ERR", fmt, ##__VA_ARGS__)

#if TED_LOG_LEVEL >= 1
#define TED_INFO(fmt, ...) TED_LOG_WRITE("INFO", fmt, ##__VA_ARGS__)
#else
#define TED_INFO(fmt, ...) ((void)0)
#endif

#if TED_LOG_LEVEL >= 2
#define TED_DBG(fmt, ...) TED_LOG_WRITE("DBG", fmt, ##__VA_ARGS__)
#else
#define TED_DBG(fmt, ...) ((void)0)
#endif
