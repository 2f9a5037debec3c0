/**
 * @file background_worker.hpp
 * @brief Один фоновый поток, исполняющий задачи строго по очереди
 *
 * Здесь запускаются внешние команды и прочие блокирующие операции, которые
 * нельзя выполнять ни в потоке перехвата, ни в координирующем контексте.
 */

#pragma once

#include <iostream>
#include <thread>

#include "capswitch/concurrent_queue.hpp"
#include "capswitch/dispatcher.hpp"

namespace capswitch {

class BackgroundWorker final : public Dispatcher {
public:
  explicit BackgroundWorker(const char *name) : name_(name) {
    thread_ = std::jthread([this](std::stop_token st) { run(st); });
  }

  ~BackgroundWorker() override {
    thread_.request_stop();
    queue_.notify_all();
  }

  BackgroundWorker(const BackgroundWorker &) = delete;
  BackgroundWorker &operator=(const BackgroundWorker &) = delete;

  void post(Task task) override { queue_.push(std::move(task)); }

private:
  void run(std::stop_token st) {
    while (!st.stop_requested()) {
      auto task = queue_.pop_wait(st);
      if (!task) {
        break;
      }
      if (*task) {
        (*task)();
      }
    }

    // Оставшиеся задачи дорабатываем: среди них может быть откат ремапа
    Task rest;
    while (queue_.try_pop(rest)) {
      if (rest) {
        rest();
      }
    }
    std::cerr << "[capswitch] Worker '" << name_ << "' stopped\n";
  }

  const char *name_;
  ConcurrentQueue<Task> queue_;
  std::jthread thread_;
};

} // namespace capswitch
