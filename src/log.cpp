#include "log.hpp"
#include <cstdlib>

static FILE* g_log_file = nullptr;
static bool g_screen_active = false;

FILE* log_stream() {
  if (g_log_file) return g_log_file;
  return g_screen_active ? nullptr : stderr;
}

bool log_open_from_env() {
  const char* path = std::getenv("TED_LOG_FILE");
  if (!path || !*path) return false;
  log_close();
  g_log_file = std::fopen(path, "a");
  return g_log_file != nullptr;
}

void log_close() {
  if (g_log_file) { std::fclose(g_log_file); g_log_file = nullptr; }
}

void log_set_screen_active(bool active) { g_screen_active = active; }
