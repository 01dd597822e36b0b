#include "settings.hpp"
#include <sstream>
#include <vector>
#include <cstdlib>
#include <cctype>
#include "file_reader.hpp"
#include "log.hpp"

SettingsCommands::SettingsCommands(Settings& settings) : settings_(settings) {
  register_toggle("statusline", settings_.status_line);
  register_toggle("color", settings_.color);
}

void SettingsCommands::register_toggle(const std::string& option, bool& target) {
  bool* t = &target;
  registry_.register_command("set " + option, [t, option](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { *t = !*t; msg = option + (*t ? " on" : " off"); return true; }
    const std::string& v = args[0];
    if (v == "on" || v == "true" || v == "1") { *t = true; msg = option + " on"; return true; }
    if (v == "off" || v == "false" || v == "0") { *t = false; msg = option + " off"; return true; }
    msg = "set " + option + ": use set " + option + " on|off";
    return false;
  });
}

static std::string trim(const std::string& s) {
  auto is_space = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && is_space((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && is_space((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

bool SettingsCommands::execute_line(const std::string& line, std::string& msg) {
  std::string s = trim(line);
  if (!s.empty() && s[0] == ':') s = trim(s.substr(1));
  if (s.empty()) return true;
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  std::string name = cmd;
  if (cmd == "set" && !args.empty()) {
    std::string opt = args[0];
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      value = opt.substr(eq + 1);
      opt = opt.substr(0, eq);
    }
    name = "set " + opt;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    args = std::move(subargs);
  }
  bool ok = false;
  if (!registry_.execute(name, args, msg, ok)) {
    msg = "unknown command: " + name;
    return false;
  }
  return ok;
}

std::optional<std::filesystem::path> default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return std::nullopt;
  return std::filesystem::path(home) / TED_RC_FILE_NAME;
}

bool load_rc_file(const std::filesystem::path& path, Settings& settings, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmap_read_lines(path, lines, msg)) return false;
  msg.clear();
  SettingsCommands cmds(settings);
  for (const std::string& raw : lines) {
    std::string s = trim(raw);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    std::string m;
    if (!cmds.execute_line(s, m)) {
      TED_INFO("%s: %s", path.string().c_str(), m.c_str());
      msg = m;
    }
  }
  return true;
}
