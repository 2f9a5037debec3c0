/**
 * @file process_command_runner.hpp
 * @brief CommandRunner на fork/execv с ограничением времени
 */

#pragma once

#include "capswitch/background_worker.hpp"
#include "capswitch/command_runner.hpp"

namespace capswitch {

class ProcessCommandRunner final : public CommandRunner {
public:
  ProcessCommandRunner();

  void run_async(std::vector<std::string> argv,
                 std::chrono::milliseconds timeout, Completion done) override;

  [[nodiscard]] CommandOutcome
  run_sync(std::vector<std::string> argv,
           std::chrono::milliseconds timeout) override;

  /**
   * @brief Запускает процесс и ждёт его в текущем потоке
   *
   * argv[0] — абсолютный путь, PATH не используется. Вывод собирается через
   * pipe. По истечении timeout процесс получает SIGKILL.
   */
  [[nodiscard]] static CommandOutcome
  execute(const std::vector<std::string> &argv,
          std::chrono::milliseconds timeout);

private:
  BackgroundWorker worker_;
};

} // namespace capswitch
