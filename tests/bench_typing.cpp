#include "undo_manager.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

// types N units of prose, then undoes and redoes the whole session
int main(int argc, char** argv) {
  long N = 20000;
  if (argc > 1) {
    long v = std::strtol(argv[1], nullptr, 10);
    if (v > 0) N = v;
  }
  const std::string prose = "the quick brown fox jumps over the lazy dog\n";
  TextBuffer b;
  UndoManager um(b);

  auto t0 = std::chrono::steady_clock::now();
  for (long i = 0; i < N; ++i) {
    b.insert(b.cursor(), std::string(1, prose[static_cast<size_t>(i) % prose.size()]));
  }
  auto t1 = std::chrono::steady_clock::now();
  size_t records = um.undo_size();
  std::string msg;
  while (um.can_undo()) um.undo(msg);
  auto t2 = std::chrono::steady_clock::now();
  while (um.can_redo()) um.redo(msg);
  auto t3 = std::chrono::steady_clock::now();

  std::chrono::duration<double> dt_type = t1 - t0;
  std::chrono::duration<double> dt_undo = t2 - t1;
  std::chrono::duration<double> dt_redo = t3 - t2;
  std::cout << "[typing] " << N << " units took " << dt_type.count()
            << "s, records=" << records << "\n";
  std::cout << "[undo]   all took " << dt_undo.count() << "s, size=" << b.size() << "\n";
  std::cout << "[redo]   all took " << dt_redo.count() << "s, size=" << b.size() << "\n";
  return 0;
}
