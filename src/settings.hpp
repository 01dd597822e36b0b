#pragma once
/*
 * Settings
 *
 * Purpose: runtime options, defaulted from config.hpp and overridden by
 *          `set` commands read from ~/.tedrc.
 * Format: one command per line; '#', '"' and '//' start comment lines;
 *         a leading ':' is ignored. `set name value` or `set name=value`.
 */
#include <string>
#include <optional>
#include <filesystem>
#include "config.hpp"
#include "cmd_registry.hpp"

struct Settings {
  bool status_line = TED_DEFAULT_STATUS_LINE != 0;
  bool color = TED_DEFAULT_COLOR != 0;
};

class SettingsCommands {
public:
  explicit SettingsCommands(Settings& settings);
  // Runs one rc line. Returns false (with msg) for unknown commands or bad values.
  bool execute_line(const std::string& line, std::string& msg);

private:
  void register_toggle(const std::string& option, bool& target);

  Settings& settings_;
  CommandRegistry registry_;
};

std::optional<std::filesystem::path> default_rc_path();

// Applies every line of `path`. Returns false only if the file cannot be read;
// per-line problems leave the last one in msg and loading continues.
bool load_rc_file(const std::filesystem::path& path, Settings& settings, std::string& msg);
