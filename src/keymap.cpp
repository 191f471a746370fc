#include "keymap.hpp"
#include <ncurses.h>

Keymap Keymap::defaults() {
  Keymap km;
  km.bind(KEY_F(1), "help", "Show help in a new buffer");
  km.bind(ctrl_key('g'), "info", "Show buffer information");
  km.bind(ctrl_key('l'), "number", "Toggle line numbers");
  km.bind(ctrl_key('n'), "new", "Create a new buffer");
  km.bind(ctrl_key('o'), "open", "Open a file in a new buffer");
  km.bind(ctrl_key('q'), "quit", "Quit");
  km.bind(ctrl_key('s'), "save", "Save current buffer");
  km.bind(ctrl_key('e'), "saveas", "Save current buffer as");
  km.bind(ctrl_key('w'), "close", "Close buffer and exit if it was the last buffer");
  km.bind(ctrl_key('y'), "redo", "Redo last typing");
  km.bind(ctrl_key('z'), "undo", "Undo last typing");
  km.bind(KEY_PPAGE, "prev", "Switch to previous buffer");
  km.bind(KEY_NPAGE, "next", "Switch to next buffer");
  return km;
}

void Keymap::bind(int key, const std::string& command, const std::string& help) {
  auto it = map_.find(key);
  if (it != map_.end()) {
    order_[it->second].command = command;
    if (!help.empty()) order_[it->second].help = help;
    return;
  }
  map_[key] = order_.size();
  order_.push_back({key, command, help});
}

const std::string* Keymap::lookup(int key) const {
  auto it = map_.find(key);
  if (it == map_.end()) return nullptr;
  return &order_[it->second].command;
}

std::string Keymap::key_name(int key) {
  if (key >= 1 && key <= 26) return std::string("Control-") + static_cast<char>('A' + key - 1);
  if (key >= KEY_F(1) && key <= KEY_F(12)) return "F" + std::to_string(key - KEY_F(0));
  switch (key) {
    case KEY_PPAGE: return "Page Up";
    case KEY_NPAGE: return "Page Down";
    default: break;
  }
  if (key >= 32 && key <= 126) return std::string(1, static_cast<char>(key));
  return "key " + std::to_string(key);
}
