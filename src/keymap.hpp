#pragma once
/*
 * Keymap
 *
 * Purpose: translate key codes into registered command names.
 * Keys without a binding fall through to text editing in the Editor.
 */
#include <string>
#include <unordered_map>
#include <vector>

struct KeyBinding {
  int key;
  std::string command;
  std::string help;
};

class Keymap {
public:
  static Keymap defaults();
  void bind(int key, const std::string& command, const std::string& help = std::string());
  const std::string* lookup(int key) const;
  // bindings in registration order, for the help buffer
  const std::vector<KeyBinding>& bindings() const { return order_; }
  static std::string key_name(int key);
private:
  std::unordered_map<int, size_t> map_;
  std::vector<KeyBinding> order_;
};

constexpr int ctrl_key(char c) { return c & 0x1f; }
