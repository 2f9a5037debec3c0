/**
 * @file process_command_runner.cpp
 * @brief Реализация запуска внешних команд
 */

#include "capswitch/process_command_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <future>
#include <iostream>
#include <memory>

namespace capswitch {

namespace {

/// Код выхода дочернего процесса, если execv не удался
constexpr int kExecFailedStatus = 127;

/// Ограничение на объём собираемого вывода
constexpr std::size_t kMaxOutput = 4096;

int wait_child(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno == EINTR) {
      continue;
    }
    return -1;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

ProcessCommandRunner::ProcessCommandRunner() : worker_("commands") {}

void ProcessCommandRunner::run_async(std::vector<std::string> argv,
                                     std::chrono::milliseconds timeout,
                                     Completion done) {
  worker_.post([argv = std::move(argv), timeout, done = std::move(done)] {
    CommandOutcome out = execute(argv, timeout);
    if (done) {
      done(std::move(out));
    }
  });
}

CommandOutcome
ProcessCommandRunner::run_sync(std::vector<std::string> argv,
                               std::chrono::milliseconds timeout) {
  auto promise = std::make_shared<std::promise<CommandOutcome>>();
  auto future = promise->get_future();
  worker_.post([argv = std::move(argv), timeout, promise] {
    promise->set_value(execute(argv, timeout));
  });
  return future.get();
}

CommandOutcome
ProcessCommandRunner::execute(const std::vector<std::string> &argv,
                              std::chrono::milliseconds timeout) {
  CommandOutcome out;

  if (argv.empty() || argv.front().empty()) {
    out.error = "empty command";
    return out;
  }

  // Готовим argv в родителе (в дочернем процессе никаких аллокаций/iostream).
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    cargv.push_back(const_cast<char *>(arg.c_str()));
  }
  cargv.push_back(nullptr);

  std::array<int, 2> fds{-1, -1};
  if (::pipe2(fds.data(), O_CLOEXEC) < 0) {
    out.error = std::string("pipe2() failed: ") + std::strerror(errno);
    return out;
  }

  const int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

  pid_t pid = ::fork();
  if (pid < 0) {
    out.error = std::string("fork() failed: ") + std::strerror(errno);
    ::close(fds[0]);
    ::close(fds[1]);
    if (devnull >= 0) {
      ::close(devnull);
    }
    return out;
  }

  if (pid == 0) {
    if (devnull >= 0) {
      (void)::dup2(devnull, STDIN_FILENO);
    }
    (void)::dup2(fds[1], STDOUT_FILENO);
    (void)::dup2(fds[1], STDERR_FILENO);
    ::execv(cargv[0], cargv.data());
    _exit(kExecFailedStatus);
  }

  ::close(fds[1]);
  if (devnull >= 0) {
    ::close(devnull);
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::array<char, 512> buffer{};
  bool eof = false;

  while (!eof) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      out.timed_out = true;
      break;
    }

    pollfd pfd{fds[0], POLLIN, 0};
    int ret = ::poll(&pfd, 1, static_cast<int>(left.count()));
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      out.error = std::string("poll() failed: ") + std::strerror(errno);
      break;
    }
    if (ret == 0) {
      continue;
    }

    ssize_t n = ::read(fds[0], buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      out.error = std::string("read() failed: ") + std::strerror(errno);
      break;
    }
    if (n == 0) {
      eof = true;
      break;
    }
    if (out.output.size() < kMaxOutput) {
      out.output.append(buffer.data(), static_cast<std::size_t>(n));
    }
  }
  ::close(fds[0]);

  if (!eof) {
    // Таймаут или ошибка чтения: процесс больше не ждём
    (void)::kill(pid, SIGKILL);
  }

  out.exit_status = wait_child(pid);
  out.launched = out.exit_status != kExecFailedStatus;
  if (!out.launched && out.error.empty()) {
    out.error = "failed to execute " + argv.front();
  }
  if (out.timed_out) {
    out.error = "timed out after " + std::to_string(timeout.count()) + " ms";
  }

  return out;
}

} // namespace capswitch
