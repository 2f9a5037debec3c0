/**
 * @file command_runner.hpp
 * @brief Запуск внешних утилит вне горячего пути и координирующего контекста
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace capswitch {

/// Результат запуска внешней команды
struct CommandOutcome {
  /// Процесс удалось запустить (fork + exec)
  bool launched = false;
  int exit_status = -1;
  /// Команда не уложилась в таймаут и была убита
  bool timed_out = false;
  /// Объединённый stdout + stderr
  std::string output;
  /// Описание ошибки запуска/ожидания
  std::string error;

  [[nodiscard]] bool ok() const noexcept {
    return launched && !timed_out && exit_status == 0;
  }
};

class CommandRunner {
public:
  using Completion = std::function<void(CommandOutcome)>;

  virtual ~CommandRunner() = default;

  /**
   * @brief Ставит команду в очередь исполнения
   *
   * Команды исполняются строго по одной в порядке постановки.
   * @param done Вызывается в потоке раннера. Должен только передать
   *        результат дальше.
   */
  virtual void run_async(std::vector<std::string> argv,
                         std::chrono::milliseconds timeout,
                         Completion done) = 0;

  /// Ставит команду в ту же очередь и дожидается её результата
  [[nodiscard]] virtual CommandOutcome
  run_sync(std::vector<std::string> argv, std::chrono::milliseconds timeout) = 0;
};

} // namespace capswitch
