#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch editor commands by name.
 * Design: map name -> handler (args vector). Key bindings, rc lines and
 * prompts all route through execute_line().
 * Note: "set" options register as "set <option>"; execute_line() accepts
 * both "set opt value" and "set opt=value".
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <sstream>
#include <utility>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;

  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }

  bool execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    it->second(args);
    return true;
  }

  // false with err set when the line names no registered command
  bool execute_line(const std::string& line, std::string& err) const {
    std::istringstream iss(line);
    std::string name;
    iss >> name;
    if (name.empty()) { err = "empty command"; return false; }
    std::vector<std::string> args;
    for (std::string a; iss >> a;) args.push_back(a);
    if (name == "set" && !args.empty()) {
      std::string opt = args[0];
      args.erase(args.begin());
      size_t eq = opt.find('=');
      if (eq != std::string::npos) {
        if (eq + 1 < opt.size()) args.insert(args.begin(), opt.substr(eq + 1));
        opt.resize(eq);
      }
      name = "set " + opt;
    }
    if (!execute(name, args)) { err = "unknown command: " + name; return false; }
    return true;
  }

private:
  std::unordered_map<std::string, Handler> map_;
};
