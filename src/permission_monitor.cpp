/**
 * @file permission_monitor.cpp
 * @brief Реализация фонового опроса прав
 */

#include "capswitch/permission_monitor.hpp"

#include <iostream>

namespace capswitch {

PermissionMonitor::PermissionMonitor(PermissionOracle &oracle,
                                     PermissionFlag &flag,
                                     ChangeCallback on_change)
    : oracle_(oracle), flag_(flag), on_change_(std::move(on_change)) {}

PermissionMonitor::~PermissionMonitor() { stop(); }

bool PermissionMonitor::poll_once() {
  return oracle_.is_trusted(/*prompt_user=*/false);
}

bool PermissionMonitor::tick() {
  const bool trusted = poll_once();
  const bool prev = flag_.exchange(trusted);
  if (prev == trusted) {
    return false;
  }

  std::cerr << "[capswitch] Input device access "
            << (trusted ? "granted" : "revoked") << "\n";
  if (on_change_) {
    on_change_(trusted);
  }
  return true;
}

void PermissionMonitor::start(std::chrono::milliseconds interval) {
  if (thread_.joinable()) {
    return;
  }

  thread_ = std::jthread([this, interval](std::stop_token st) {
    run(st, interval);
  });
}

void PermissionMonitor::stop() {
  if (!thread_.joinable()) {
    return;
  }
  thread_.request_stop();
  thread_.join();
  thread_ = std::jthread{};
}

void PermissionMonitor::run(std::stop_token st,
                            std::chrono::milliseconds interval) {
  while (!st.stop_requested()) {
    {
      // wait_for с stop_token просыпается сразу по request_stop()
      std::unique_lock<std::mutex> lock(wait_mu_);
      wait_cv_.wait_for(lock, st, interval, [] { return false; });
    }
    if (st.stop_requested()) {
      break;
    }
    tick();
  }
}

} // namespace capswitch
