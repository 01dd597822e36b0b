#include <cstdio>
#include <optional>
#include <filesystem>
#include "config.hpp"
#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "editor.hpp"
#include "settings.hpp"
#include "log.hpp"

static void print_usage(const char* prog) {
  std::fprintf(stderr, "ted " TED_VERSION "\n");
  std::fprintf(stderr, "usage: %s [file]\n", prog);
  std::fprintf(stderr, "- without a file an empty buffer is opened\n");
}

int main(int argc, char** argv) {
  if (argc > 2) {
    print_usage(argc > 0 ? argv[0] : "ted");
    return 1;
  }
  log_open_from_env();
  std::optional<std::filesystem::path> path;
  if (argc == 2) path = std::filesystem::path(argv[1]);

  Settings settings;
  std::string rc_msg;
  if (auto rc = default_rc_path()) {
    std::error_code ec;
    if (std::filesystem::exists(*rc, ec) && !load_rc_file(*rc, settings, rc_msg)) {
      TED_ERR("%s", rc_msg.c_str());
    }
  }

  {
    Terminal term;
    NcursesTerminal nt;
    Editor ed(nt, path, settings);
    if (!rc_msg.empty()) ed.set_message(rc_msg);
    ed.run();
  }
  log_close();
  return 0;
}
