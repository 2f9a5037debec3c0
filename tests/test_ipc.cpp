#include "capswitch/ipc_client.hpp"
#include "capswitch/ipc_commands.hpp"
#include "capswitch/ipc_server.hpp"

#include "fakes.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

[[noreturn]] void test_fail(const char *expr, const char *file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr)                                                            \
  do {                                                                         \
    if (!(expr)) {                                                             \
      test_fail(#expr, __FILE__, __LINE__);                                    \
    }                                                                          \
  } while (0)

using capswitch::Config;
using capswitch::Coordinator;
using capswitch::CoordinatorDeps;
using capswitch::execute_ipc_command;
using capswitch::IpcClient;
using capswitch::IpcCommand;
using capswitch::IpcResult;
using capswitch::IpcServer;
using capswitch::MemoryPreferenceStore;
using capswitch::OperationalState;
using capswitch::parse_ipc_command;
using capswitch::parse_ipc_response;
using capswitch::QueueDispatcher;
using capswitch::test::FakeDirectory;
using capswitch::test::FakeLoginItem;
using capswitch::test::FakeOracle;
using capswitch::test::FakeRunner;
using capswitch::test::FakeTapFactory;
using capswitch::test::make_source;

std::string temp_socket_path() {
  return "/tmp/capswitch-test-" + std::to_string(::getpid()) + ".sock";
}

void test_parse_commands() {
  std::string arg;
  CHECK(parse_ipc_command("STATUS", arg) == IpcCommand::Status);
  CHECK(arg.empty());
  CHECK(parse_ipc_command("  SOURCES\n", arg) == IpcCommand::Sources);
  CHECK(parse_ipc_command("SELECT de(nodeadkeys)\n", arg) ==
        IpcCommand::Select);
  CHECK(arg == "de(nodeadkeys)");
  CHECK(parse_ipc_command("DESELECT  us ", arg) == IpcCommand::Deselect);
  CHECK(arg == "us");
  CHECK(parse_ipc_command("REFRESH", arg) == IpcCommand::Refresh);
  CHECK(parse_ipc_command("status", arg) == IpcCommand::Unknown);
  CHECK(parse_ipc_command("", arg) == IpcCommand::Unknown);
}

void test_parse_responses() {
  auto ok = parse_ipc_response("OK slot 1\n");
  CHECK(ok && ok->success && ok->message == "slot 1");

  auto multi = parse_ipc_response("OK Active\nstatus: Switcher: Active\n");
  CHECK(multi && multi->message == "Active\nstatus: Switcher: Active");

  auto bare = parse_ipc_response("OK\n");
  CHECK(bare && bare->success && bare->message.empty());

  auto err = parse_ipc_response("ERROR Unknown command\n");
  CHECK(err && !err->success && err->message == "Unknown command");

  CHECK(!parse_ipc_response("garbage"));
  CHECK(!parse_ipc_response("OKAY"));
}

void test_server_round_trip() {
  const std::string path = temp_socket_path();
  IpcServer server{path, [](IpcCommand command, const std::string &argument) {
                     if (command == IpcCommand::Select) {
                       return IpcResult{true, "picked " + argument};
                     }
                     return IpcResult{true, "line1\nline2"};
                   }};
  CHECK(server.start());
  CHECK(server.is_running());

  IpcClient client{path};
  CHECK(client.is_agent_available());

  auto response = client.send_command("SELECT fr");
  CHECK(response && response->success);
  CHECK(response->message == "picked fr");

  response = client.send_command("STATUS");
  CHECK(response && response->message == "line1\nline2");

  response = client.send_command("REBOOT");
  CHECK(response && !response->success);
  CHECK(response->message == "Unknown command");

  // Второй экземпляр не может занять живой сокет
  IpcServer second{path, nullptr};
  CHECK(!second.start());

  server.stop();
  CHECK(!server.is_running());
  CHECK(!std::filesystem::exists(path));
  CHECK(!client.send_command("STATUS"));
}

/// Подключается и ничего не отправляет
int connect_silent_client(const std::string &path) {
  const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  CHECK(fd >= 0);
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
  CHECK(::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) ==
        0);
  return fd;
}

void test_silent_client_does_not_block_stop() {
  const std::string path = temp_socket_path();
  IpcServer server{path, [](IpcCommand, const std::string &) {
                     return IpcResult{true, ""};
                   }};
  CHECK(server.start());

  const int fd = connect_silent_client(path);
  // Даём серверу принять соединение и начать ждать команду
  std::this_thread::sleep_for(std::chrono::milliseconds{100});

  const auto started = std::chrono::steady_clock::now();
  server.stop();
  const auto elapsed = std::chrono::steady_clock::now() - started;

  CHECK(!server.is_running());
  CHECK(elapsed < std::chrono::milliseconds{900});
  ::close(fd);
}

void test_silent_client_is_dropped() {
  const std::string path = temp_socket_path();
  IpcServer server{path, [](IpcCommand, const std::string &) {
                     return IpcResult{true, "alive"};
                   }};
  CHECK(server.start());

  const int fd = connect_silent_client(path);

  // Молчащий клиент отключается по таймауту, следующий обслуживается
  IpcClient client{path};
  auto response = client.send_command("STATUS");
  CHECK(response && response->success);
  CHECK(response->message == "alive");

  char byte = 0;
  CHECK(::read(fd, &byte, 1) == 0);
  ::close(fd);
  server.stop();
}

/// Координатор с подставными зависимостями для команд
struct Agent {
  FakeOracle oracle;
  FakeDirectory directory;
  FakeDirectory switch_directory;
  FakeTapFactory tap_factory;
  FakeRunner runner;
  MemoryPreferenceStore preferences;
  FakeLoginItem login_item;
  QueueDispatcher main;
  QueueDispatcher background;
  std::unique_ptr<Coordinator> coordinator;

  Agent() {
    oracle.trusted = true;
    directory.sources = {make_source("us", "English (US)", 0),
                         make_source("fr", "French", 1),
                         make_source("ru", "Russian", 2)};
    Config config;
    config.permission.poll_interval = std::chrono::hours(1);
    coordinator = std::make_unique<Coordinator>(CoordinatorDeps{
        config, oracle, directory, switch_directory, tap_factory, runner,
        preferences, login_item, main, background});
    coordinator->launch();
  }

  ~Agent() { coordinator->shutdown(); }
};

void test_commands_drive_coordinator() {
  Agent agent;
  Coordinator &c = *agent.coordinator;

  auto res = execute_ipc_command(c, IpcCommand::Sources, "");
  CHECK(res.success);
  CHECK(res.message.starts_with("3\n"));
  CHECK(res.message.find("  us\tEnglish (US)") != std::string::npos);

  res = execute_ipc_command(c, IpcCommand::Select, "us");
  CHECK(res.success && res.message == "slot 1");
  res = execute_ipc_command(c, IpcCommand::Select, "us");
  CHECK(res.success && res.message == "already selected");
  res = execute_ipc_command(c, IpcCommand::Select, "fr");
  CHECK(res.success && res.message == "slot 2");
  CHECK(c.state() == OperationalState::Active);

  res = execute_ipc_command(c, IpcCommand::Select, "ru");
  CHECK(!res.success);
  res = execute_ipc_command(c, IpcCommand::Select, "xx");
  CHECK(!res.success);
  res = execute_ipc_command(c, IpcCommand::Select, "");
  CHECK(!res.success);

  res = execute_ipc_command(c, IpcCommand::Status, "");
  CHECK(res.success);
  CHECK(res.message.starts_with("Active\n"));
  CHECK(res.message.find("slot1: us (English (US))") != std::string::npos);
  CHECK(res.message.find("slot2: fr (French)") != std::string::npos);

  res = execute_ipc_command(c, IpcCommand::Sources, "");
  CHECK(res.message.find("* fr\tFrench") != std::string::npos);

  res = execute_ipc_command(c, IpcCommand::Deselect, "fr");
  CHECK(res.success);
  CHECK(c.state() == OperationalState::Configuring);
  res = execute_ipc_command(c, IpcCommand::Deselect, "fr");
  CHECK(!res.success);

  res = execute_ipc_command(c, IpcCommand::Refresh, "");
  CHECK(res.success);
  CHECK(res.message.starts_with("Configuring\n"));
}

void test_handler_waits_for_main_context() {
  Agent agent;
  auto handler = capswitch::make_ipc_handler(*agent.coordinator, agent.main,
                                             std::chrono::milliseconds(50));

  // Никто не разбирает очередь: ответ по таймауту
  auto res = handler(IpcCommand::Status, "");
  CHECK(!res.success);

  // Задача осталась в очереди и безопасно выполняется позже
  CHECK(agent.main.pending() == 1);
  (void)agent.main.run_pending();
}

} // namespace

#undef CHECK

int main() {
  test_parse_commands();
  test_parse_responses();
  test_server_round_trip();
  test_silent_client_does_not_block_stop();
  test_silent_client_is_dropped();
  test_commands_drive_coordinator();
  test_handler_waits_for_main_context();

  std::cout << "OK\n";
  return 0;
}
