/* @file main.cpp
 * @brief anod-runner <config.json>: run the configured experiments on the attached supply
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

#include <pthread.h>

#include "core/SystemCoordinator.hpp"

using anod::core::SystemCoordinator;

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "usage: " << argv[0] << " <config.json>\n";
    return 2;
  }

  // SIGINT/SIGTERM are taken by the watcher thread only; SIGUSR1 releases it at exit
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  sigaddset(&signals, SIGUSR1);
  if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
    std::cerr << "[main] cannot block signals\n";
    return 1;
  }

  SystemCoordinator coordinator;
  std::thread watcher([&coordinator, &signals] {
    int sig = 0;
    while (sigwait(&signals, &sig) == 0) {
      if (sig == SIGUSR1)
        return;
      std::cerr << "\n[main] signal " << sig << ", aborting run\n";
      coordinator.handleAbort();
    }
  });

  int status = 0;
  try {
    coordinator.initialize(argv[1]);
    status = coordinator.run() ? 0 : 1;

    for (const auto& r : coordinator.results()) {
      std::cout << r.name << ": " << anod::core::toString(r.state) << ", " << r.ticks
                << " ticks, " << r.recorded << " rows";
      if (!r.faultReason.empty())
        std::cout << " (" << r.faultReason << ")";
      std::cout << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n";
    status = 1;
  }

  if (pthread_kill(watcher.native_handle(), SIGUSR1) == 0) {
    watcher.join();
  } else {
    std::cerr << "[main] cannot release the signal watcher\n";
    watcher.detach();
  }
  return status;
}
