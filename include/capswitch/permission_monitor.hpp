/**
 * @file permission_monitor.hpp
 * @brief Кэш флага доступа к устройствам ввода и фоновый опрос
 *
 * PermissionFlag — единственное значение, которое пишут монитор и
 * координатор, а читает поток перехвата. Чтение — спин-лок на несколько
 * инструкций, без системных вызовов.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "capswitch/spin_lock.hpp"

namespace capswitch {

/// Флаг "доступ есть". Изначально false.
class PermissionFlag {
public:
  PermissionFlag() = default;

  PermissionFlag(const PermissionFlag &) = delete;
  PermissionFlag &operator=(const PermissionFlag &) = delete;

  [[nodiscard]] bool read() const noexcept {
    std::lock_guard<SpinLock> lock(lock_);
    return value_;
  }

  void store(bool value) noexcept {
    std::lock_guard<SpinLock> lock(lock_);
    value_ = value;
  }

  /// Записывает новое значение и возвращает предыдущее
  bool exchange(bool value) noexcept {
    std::lock_guard<SpinLock> lock(lock_);
    bool prev = value_;
    value_ = value;
    return prev;
  }

private:
  mutable SpinLock lock_;
  bool value_ = false;
};

/// Источник истины о доступе. Любая ошибка внутри должна означать "нет".
class PermissionOracle {
public:
  virtual ~PermissionOracle() = default;

  /**
   * @brief Проверяет, есть ли у процесса нужные права
   *
   * @param prompt_user Попросить пользователя выдать права, если это
   *        возможно на данной платформе
   */
  [[nodiscard]] virtual bool is_trusted(bool prompt_user) = 0;
};

/**
 * @brief Периодический опрос оракула
 *
 * Работает в отдельном потоке. При изменении флага вызывает on_change
 * (в потоке монитора), который должен только запостить пересчёт состояния в
 * координирующий контекст.
 */
class PermissionMonitor {
public:
  using ChangeCallback = std::function<void(bool)>;

  PermissionMonitor(PermissionOracle &oracle, PermissionFlag &flag,
                    ChangeCallback on_change);

  ~PermissionMonitor();

  PermissionMonitor(const PermissionMonitor &) = delete;
  PermissionMonitor &operator=(const PermissionMonitor &) = delete;

  /// Одиночный опрос без запроса прав у пользователя
  [[nodiscard]] bool poll_once();

  /// Запускает фоновый опрос. Повторный вызов ничего не делает.
  void start(std::chrono::milliseconds interval);

  /// Останавливает опрос и дожидается потока
  void stop();

  [[nodiscard]] bool read_flag() const noexcept { return flag_.read(); }

  [[nodiscard]] bool is_running() const noexcept {
    return thread_.joinable();
  }

  /**
   * @brief Один шаг опроса: обновить флаг, сообщить об изменении
   * @return true если значение флага изменилось
   */
  bool tick();

private:
  void run(std::stop_token st, std::chrono::milliseconds interval);

  PermissionOracle &oracle_;
  PermissionFlag &flag_;
  ChangeCallback on_change_;

  std::mutex wait_mu_;
  std::condition_variable_any wait_cv_;
  std::jthread thread_;
};

} // namespace capswitch
