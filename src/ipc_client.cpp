/**
 * @file ipc_client.cpp
 * @brief Реализация IPC клиента для связи с агентом capswitch
 */

#include "capswitch/ipc_client.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <string_view>

namespace capswitch {

namespace {

/// Создаёт подключение к серверу
int connect_to_server(const std::string &socket_path) {
  if (socket_path.size() >= sizeof(sockaddr_un::sun_path)) {
    return -1;
  }

  int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return -1;
  }

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

  if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    close(fd);
    return -1;
  }

  return fd;
}

bool write_all(int fd, std::string_view data) {
  while (!data.empty()) {
    ssize_t written = write(fd, data.data(), data.size());
    if (written < 0 && errno == EINTR) {
      continue;
    }
    if (written <= 0) {
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(written));
  }
  return true;
}

/// Читает ответ до закрытия соединения сервером
std::optional<std::string> read_until_eof(int fd, int timeout_ms) {
  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

  std::string response;
  char buffer[512];
  for (;;) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                          deadline - Clock::now())
                          .count();
    if (left <= 0) {
      return std::nullopt;
    }

    pollfd pfd = {fd, POLLIN, 0};
    int ret = poll(&pfd, 1, static_cast<int>(left));
    if (ret < 0 && errno == EINTR) {
      continue;
    }
    if (ret <= 0) {
      return std::nullopt;
    }

    ssize_t bytes_read = read(fd, buffer, sizeof(buffer));
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    if (bytes_read < 0) {
      return std::nullopt;
    }
    if (bytes_read == 0) {
      break;
    }
    response.append(buffer, static_cast<std::size_t>(bytes_read));
  }

  if (response.empty()) {
    return std::nullopt;
  }
  return response;
}

} // namespace

std::optional<IpcResponse> parse_ipc_response(const std::string &raw) {
  std::string response = raw;
  // Удаляем trailing newline
  while (!response.empty() &&
         (response.back() == '\n' || response.back() == '\r')) {
    response.pop_back();
  }

  IpcResponse parsed;
  std::string_view rest;
  if (response.starts_with("OK")) {
    parsed.success = true;
    rest = std::string_view(response).substr(2);
  } else if (response.starts_with("ERROR")) {
    parsed.success = false;
    rest = std::string_view(response).substr(5);
  } else {
    return std::nullopt;
  }

  if (!rest.empty() && rest.front() != ' ') {
    return std::nullopt;
  }
  if (!rest.empty()) {
    rest.remove_prefix(1);
  }
  parsed.message.assign(rest.begin(), rest.end());
  return parsed;
}

IpcClient::IpcClient(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

std::optional<IpcResponse>
IpcClient::send_command(const std::string &command) const {
  int fd = connect_to_server(socket_path_);
  if (fd < 0) {
    return std::nullopt;
  }

  // Отправляем команду
  if (!write_all(fd, command + "\n")) {
    close(fd);
    return std::nullopt;
  }

  // Сервер закрывает соединение после ответа
  auto raw = read_until_eof(fd, kTimeoutMs);
  close(fd);

  if (!raw) {
    return std::nullopt;
  }
  return parse_ipc_response(*raw);
}

bool IpcClient::is_agent_available() const {
  int fd = connect_to_server(socket_path_);
  if (fd < 0) {
    return false;
  }
  close(fd);
  return true;
}

} // namespace capswitch
