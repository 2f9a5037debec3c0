/**
 * @file ipc_server.hpp
 * @brief IPC сервер для управления capswitch через Unix Domain Socket
 *
 * Позволяет capswitchctl и скриптам:
 * - Получать текущий статус и список раскладок
 * - Выбирать/снимать раскладки
 * - Запрашивать пересчёт состояния
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <thread>

namespace capswitch {

/// Имя сокета внутри $XDG_RUNTIME_DIR
inline constexpr std::string_view kIpcSocketName = "capswitch.sock";

/// Длиннее строки команды не бывают
inline constexpr std::size_t kMaxCommandLength = 255;

/// Команды IPC протокола
enum class IpcCommand {
  Unknown,
  Status,   // STATUS -> состояние и выбранные раскладки
  Sources,  // SOURCES -> список раскладок
  Select,   // SELECT <id> -> OK|ERROR
  Deselect, // DESELECT <id> -> OK|ERROR
  Refresh   // REFRESH -> состояние после пересчёта
};

/// Результат выполнения команды
struct IpcResult {
  bool success = false;
  std::string message;
};

/// Разбор строки команды: имя и аргумент
[[nodiscard]] IpcCommand parse_ipc_command(std::string_view line,
                                           std::string &argument);

/// Путь сокета для текущего пользователя
[[nodiscard]] std::string default_ipc_socket_path();

/**
 * @brief IPC сервер на Unix Domain Socket
 *
 * Работает в отдельном потоке, не блокирует основной цикл.
 * Использует poll для неблокирующего приёма соединений.
 */
class IpcServer {
public:
  /// Обработчик команды. Выполняется в IPC-потоке, поэтому должен сам
  /// передать работу в координирующий контекст.
  using CommandHandler =
      std::function<IpcResult(IpcCommand, const std::string &)>;

  IpcServer(std::string socket_path, CommandHandler handler);

  ~IpcServer();

  // Запрет копирования
  IpcServer(const IpcServer &) = delete;
  IpcServer &operator=(const IpcServer &) = delete;

  /**
   * @brief Запускает IPC сервер в отдельном потоке
   * @return true если сервер успешно запущен
   */
  bool start();

  /**
   * @brief Останавливает IPC сервер
   *
   * Ожидает завершения потока (join).
   */
  void stop();

  [[nodiscard]] bool is_running() const noexcept;

  [[nodiscard]] const std::string &socket_path() const noexcept {
    return socket_path_;
  }

private:
  /// Основной цикл сервера (выполняется в отдельном потоке)
  void server_loop(std::stop_token st);

  /// Обрабатывает входящее соединение
  void handle_client(int client_fd, std::stop_token st);

  /**
   * @brief Читает строку команды с ограничением по времени
   *
   * Молчащий клиент не держит сервер дольше kClientReadTimeout, а запрос
   * остановки прерывает ожидание.
   * @return false если команды нет
   */
  [[nodiscard]] bool read_command_line(int client_fd, std::stop_token st,
                                       std::string &line);

  /// Создаёт и настраивает серверный сокет
  [[nodiscard]] int create_socket();

  std::string socket_path_;
  CommandHandler handler_;

  std::atomic<bool> running_{false};
  std::jthread server_thread_;
  int server_fd_ = -1;
};

} // namespace capswitch
