#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc-file commands.
 * Design: map name → handler (args vector, message out, success); caller parses and routes.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  // Returns false if no handler is registered; `ok` carries the handler's result.
  bool execute(const std::string& name, const std::vector<std::string>& args, std::string& msg, bool& ok) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    ok = it->second(args, msg);
    return true;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
