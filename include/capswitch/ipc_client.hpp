/**
 * @file ipc_client.hpp
 * @brief IPC клиент для связи с агентом capswitch
 *
 * Используется capswitchctl для отправки команд и получения ответа.
 */

#pragma once

#include <optional>
#include <string>

namespace capswitch {

/// Разобранный ответ агента
struct IpcResponse {
  bool success = false;
  std::string message;
};

/**
 * @brief IPC клиент для связи с агентом через Unix Domain Socket
 */
class IpcClient {
public:
  /**
   * @brief Timeout для операций (в миллисекундах)
   *
   * Больше серверного ожидания главного цикла, чтобы успеть получить
   * ответ "Timed out" от самого агента.
   */
  static constexpr int kTimeoutMs = 3000;

  explicit IpcClient(std::string socket_path);

  /**
   * @brief Отправляет команду и получает ответ
   * @param command Строка команды без перевода строки
   * @return Ответ агента или nullopt, если агент недоступен
   */
  [[nodiscard]] std::optional<IpcResponse>
  send_command(const std::string &command) const;

  /// Проверяет, слушает ли агент сокет
  [[nodiscard]] bool is_agent_available() const;

  [[nodiscard]] const std::string &socket_path() const noexcept {
    return socket_path_;
  }

private:
  std::string socket_path_;
};

/// Разбор ответа "OK ..." / "ERROR ..."
[[nodiscard]] std::optional<IpcResponse>
parse_ipc_response(const std::string &raw);

} // namespace capswitch
