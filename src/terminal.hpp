#pragma once
/*
 * TerminalSession
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main before any NcursesTerminal; destructor restores
 * the terminal even when the editor exits through an exception.
 * Note: raw mode so Ctrl-S/Ctrl-Q/Ctrl-Z reach the editor as keys.
 */
class TerminalSession {
public:
  TerminalSession();
  ~TerminalSession();
  TerminalSession(const TerminalSession&) = delete;
  TerminalSession& operator=(const TerminalSession&) = delete;
};
