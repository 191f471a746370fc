#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "editor.hpp"
#include "config.hpp"
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <vector>
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

static void init_logging(bool verbose) {
  const char* home = std::getenv("HOME");
  std::filesystem::path log_path = home ? std::filesystem::path(home) / WR_LOG_FILE_NAME
                                        : std::filesystem::path(WR_LOG_FILE_NAME);
  static std::string log_file = log_path.string();
  static plog::RollingFileAppender<plog::TxtFormatter> fileAppender(log_file.c_str(), WR_LOG_MAX_SIZE, WR_LOG_MAX_FILES);
  plog::init(verbose ? plog::verbose : plog::info, &fileAppender);
}

int main(int argc, char** argv) {
  bool verbose = false;
  std::vector<std::filesystem::path> files;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "-v") == 0) verbose = true;
    else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
      std::cout << "Usage: wroom [-v] [file ...]\n";
      return 0;
    }
    else files.emplace_back(argv[i]);
  }
  init_logging(verbose);
  PLOGI << "wroom starting with " << files.size() << " file(s)";
  TerminalSession session;
  NcursesTerminal term;
  Editor ed(term, files, Editor::default_rc_path());
  ed.run();
  PLOGI << "wroom exiting";
  return 0;
}
