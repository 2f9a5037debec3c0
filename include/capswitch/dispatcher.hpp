/**
 * @file dispatcher.hpp
 * @brief Постановка задач в определённый контекст исполнения
 *
 * Рабочие потоки никогда не трогают состояние координатора напрямую: они
 * постят замыкание в координирующий контекст через Dispatcher.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>

#include "capswitch/concurrent_queue.hpp"

namespace capswitch {

using Task = std::function<void()>;

class Dispatcher {
public:
  virtual ~Dispatcher() = default;

  /// Потокобезопасно. Задачи исполняются в порядке постановки.
  virtual void post(Task task) = 0;
};

/**
 * @brief Очередь, которую разбирает владелец контекста
 *
 * Используется как главный цикл headless режима и в тестах.
 */
class QueueDispatcher final : public Dispatcher {
public:
  void post(Task task) override { queue_.push(std::move(task)); }

  /// Исполняет всё, что уже стоит в очереди (включая задачи, поставленные
  /// по ходу). Возвращает число исполненных задач.
  std::size_t run_pending() {
    std::size_t count = 0;
    Task task;
    while (queue_.try_pop(task)) {
      if (task) {
        task();
      }
      ++count;
    }
    return count;
  }

  /// Ждёт первую задачу не дольше timeout, затем разбирает остаток очереди
  template <class Rep, class Period>
  std::size_t run_for(std::chrono::duration<Rep, Period> timeout) {
    auto first = queue_.pop_wait_for(timeout);
    if (!first) {
      return 0;
    }
    if (*first) {
      (*first)();
    }
    return 1 + run_pending();
  }

  [[nodiscard]] std::size_t pending() const { return queue_.size(); }

private:
  ConcurrentQueue<Task> queue_;
};

} // namespace capswitch
