/**
 * @file ipc_server.cpp
 * @brief Реализация IPC сервера на Unix Domain Socket
 */

#include "capswitch/ipc_server.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

namespace capswitch {

namespace {

/// Сколько ждём строку команды от подключившегося клиента
constexpr auto kClientReadTimeout = std::chrono::milliseconds{1000};

/// Шаг ожидания: остановка сервера не ждёт дольше одного шага
constexpr int kClientPollSliceMs = 100;

/// Удаляет пробелы с начала и конца строки
std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

/// Проверяет, слушает ли кто-то сокет
bool is_socket_active(const std::string &socket_path) {
  int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    // Консервативно: если не можем проверить — считаем сокет "живым",
    // чтобы не удалить чужой/рабочий путь.
    return true;
  }

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

  bool active = false;
  if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0) {
    active = true;
  } else {
    // ECONNREFUSED/ENOENT — стейл-файл без слушателя.
    active = !(errno == ECONNREFUSED || errno == ENOENT);
  }

  close(fd);
  return active;
}

} // namespace

IpcCommand parse_ipc_command(std::string_view line, std::string &argument) {
  line = trim(line);
  argument.clear();

  const auto space_pos = line.find(' ');
  const std::string_view name = line.substr(0, space_pos);
  if (space_pos != std::string_view::npos) {
    const std::string_view arg = trim(line.substr(space_pos + 1));
    argument.assign(arg.begin(), arg.end());
  }

  if (name == "STATUS") {
    return IpcCommand::Status;
  }
  if (name == "SOURCES") {
    return IpcCommand::Sources;
  }
  if (name == "SELECT") {
    return IpcCommand::Select;
  }
  if (name == "DESELECT") {
    return IpcCommand::Deselect;
  }
  if (name == "REFRESH") {
    return IpcCommand::Refresh;
  }
  return IpcCommand::Unknown;
}

std::string default_ipc_socket_path() {
  const char *runtime = std::getenv("XDG_RUNTIME_DIR");
  if (runtime && *runtime != '\0') {
    return std::string(runtime) + "/" + std::string(kIpcSocketName);
  }
  return "/tmp/capswitch-" + std::to_string(::getuid()) + ".sock";
}

IpcServer::IpcServer(std::string socket_path, CommandHandler handler)
    : socket_path_(std::move(socket_path)), handler_(std::move(handler)) {}

IpcServer::~IpcServer() { stop(); }

bool IpcServer::start() {
  if (running_.load()) {
    return true;
  }

  server_fd_ = create_socket();
  if (server_fd_ < 0) {
    return false;
  }

  running_.store(true);
  server_thread_ =
      std::jthread([this](std::stop_token st) { server_loop(st); });

  std::cerr << "[capswitch-ipc] Server started on " << socket_path_ << "\n";
  return true;
}

void IpcServer::stop() {
  if (!running_.load()) {
    return;
  }

  running_.store(false);

  // Ждём завершения потока (poll просыпается по таймауту)
  if (server_thread_.joinable()) {
    server_thread_.request_stop();
    server_thread_.join();
  }

  if (server_fd_ >= 0) {
    close(server_fd_);
    server_fd_ = -1;
  }

  unlink(socket_path_.c_str());
  std::cerr << "[capswitch-ipc] Server stopped\n";
}

bool IpcServer::is_running() const noexcept { return running_.load(); }

int IpcServer::create_socket() {
  if (socket_path_.size() >= sizeof(sockaddr_un::sun_path)) {
    std::cerr << "[capswitch-ipc] Socket path is too long: " << socket_path_
              << "\n";
    return -1;
  }

  // Второй экземпляр не должен отнимать сокет у работающего
  if (access(socket_path_.c_str(), F_OK) == 0) {
    if (is_socket_active(socket_path_)) {
      std::cerr << "[capswitch-ipc] Socket is in use by another instance: "
                << socket_path_ << "\n";
      return -1;
    }
    std::cerr << "[capswitch-ipc] Replacing stale socket: " << socket_path_
              << "\n";
    unlink(socket_path_.c_str());
  }

  int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    std::cerr << "[capswitch-ipc] Failed to create socket: " << strerror(errno)
              << "\n";
    return -1;
  }

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

  if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    std::cerr << "[capswitch-ipc] Failed to bind socket (" << socket_path_
              << "): " << strerror(errno) << "\n";
    close(fd);
    return -1;
  }

  // Только владелец: сокет позволяет менять выбор раскладок
  if (chmod(socket_path_.c_str(), 0600) < 0) {
    std::cerr << "[capswitch-ipc] Warning: failed to chmod socket: "
              << strerror(errno) << "\n";
  }

  if (listen(fd, 5) < 0) {
    std::cerr << "[capswitch-ipc] Failed to listen (" << socket_path_
              << "): " << strerror(errno) << "\n";
    close(fd);
    unlink(socket_path_.c_str());
    return -1;
  }

  return fd;
}

void IpcServer::server_loop(std::stop_token st) {
  while (running_.load() && !st.stop_requested()) {
    pollfd pfd = {server_fd_, POLLIN, 0};
    int ret = poll(&pfd, 1, 500); // Timeout 500ms для проверки running_

    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::cerr << "[capswitch-ipc] Poll error: " << strerror(errno) << "\n";
      break;
    }

    if (ret == 0) {
      continue;
    }

    if (pfd.revents & POLLIN) {
      int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
      if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && running_.load()) {
          std::cerr << "[capswitch-ipc] Accept error: " << strerror(errno)
                    << "\n";
        }
        continue;
      }

      handle_client(client_fd, st);
      close(client_fd);
    }
  }
}

bool IpcServer::read_command_line(int client_fd, std::stop_token st,
                                  std::string &line) {
  line.clear();
  char buffer[256];
  const auto deadline = std::chrono::steady_clock::now() + kClientReadTimeout;

  while (line.size() < kMaxCommandLength && !st.stop_requested()) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      if (line.empty()) {
        std::cerr << "[capswitch-ipc] Client sent no command, dropping\n";
        return false;
      }
      // Строка без перевода строки: разбираем то, что пришло
      break;
    }

    pollfd pfd = {client_fd, POLLIN, 0};
    const int ret = poll(&pfd, 1,
                         static_cast<int>(std::min<std::int64_t>(
                             left.count(), kClientPollSliceMs)));
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    if (ret == 0) {
      continue;
    }

    const ssize_t n = read(client_fd, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      return false;
    }
    if (n == 0) {
      break;
    }
    line.append(buffer, static_cast<std::size_t>(n));
    if (line.find('\n') != std::string::npos) {
      break;
    }
  }

  if (st.stop_requested()) {
    return false;
  }
  if (const auto nl = line.find('\n'); nl != std::string::npos) {
    line.resize(nl);
  }
  if (line.size() > kMaxCommandLength) {
    line.resize(kMaxCommandLength);
  }
  return !line.empty();
}

void IpcServer::handle_client(int client_fd, std::stop_token st) {
  std::string raw;
  if (!read_command_line(client_fd, st, raw)) {
    return;
  }

  const std::string_view line = trim(raw);

  std::string argument;
  const IpcCommand command = parse_ipc_command(line, argument);

  std::cerr << "[capswitch-ipc] Received command: " << line << "\n";

  IpcResult result;
  if (command == IpcCommand::Unknown) {
    result = {false, "Unknown command"};
  } else if (!handler_) {
    result = {false, "Not supported"};
  } else {
    result = handler_(command, argument);
  }

  std::string response = result.success ? "OK" : "ERROR";
  if (!result.message.empty()) {
    response += " ";
    response += result.message;
  }
  response += "\n";

  std::string_view rest = response;
  while (!rest.empty()) {
    ssize_t written = write(client_fd, rest.data(), rest.size());
    if (written < 0 && errno == EINTR) {
      continue;
    }
    if (written <= 0) {
      // Клиент ушёл, не дождавшись ответа
      break;
    }
    rest.remove_prefix(static_cast<std::size_t>(written));
  }
}

} // namespace capswitch
