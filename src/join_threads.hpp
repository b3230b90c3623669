#pragma once
#include <thread>
#include <vector>

// Joins every started thread when the scope ends, unwinding included.
struct JoinThreads {
  std::vector<std::thread>& threads;
  ~JoinThreads() {
    for (auto& t : threads)
      if (t.joinable()) t.join();
  }
};
