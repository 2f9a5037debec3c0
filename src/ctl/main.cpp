/**
 * @file main.cpp
 * @brief Точка входа capswitchctl
 *
 * Утилита командной строки для работающего агента capswitch:
 * статус, список раскладок, выбор и снятие выбора.
 */

#include "capswitch/ipc_client.hpp"
#include "capswitch/ipc_server.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_version() {
  std::cout << "capswitchctl 1.0.0\n"
            << "Control utility for the capswitch agent\n";
}

void print_usage(const char *argv0) {
  std::cout << "Usage: " << argv0 << " [options] <command> [argument]\n"
            << "\n"
            << "Commands:\n"
            << "  status          Show state and selected layouts\n"
            << "  sources         List available layouts (* = selected)\n"
            << "  select <id>     Select a layout for switching\n"
            << "  deselect <id>   Remove a layout from the selection\n"
            << "  refresh         Re-check permissions and layouts\n"
            << "\n"
            << "Options:\n"
            << "  -s, --socket <path>  Agent socket (default: "
            << capswitch::default_ipc_socket_path() << ")\n"
            << "  -h, --help           Show this help\n"
            << "  -v, --version        Show version\n";
}

/// Имя подкоманды -> строка протокола
std::string to_wire_command(std::string_view name) {
  if (name == "status") {
    return "STATUS";
  }
  if (name == "sources") {
    return "SOURCES";
  }
  if (name == "select") {
    return "SELECT";
  }
  if (name == "deselect") {
    return "DESELECT";
  }
  if (name == "refresh") {
    return "REFRESH";
  }
  return {};
}

bool needs_argument(std::string_view name) {
  return name == "select" || name == "deselect";
}

} // namespace

int main(int argc, char *argv[]) {
  std::string socket_path = capswitch::default_ipc_socket_path();
  std::vector<std::string> positional;

  // Обработка аргументов командной строки
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      print_version();
      return 0;
    }
    if (arg == "-s" || arg == "--socket") {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << "\n";
        return 2;
      }
      socket_path = argv[++i];
      continue;
    }
    positional.emplace_back(arg);
  }

  if (positional.empty()) {
    print_usage(argv[0]);
    return 2;
  }

  const std::string &name = positional.front();
  std::string command = to_wire_command(name);
  if (command.empty()) {
    std::cerr << "Unknown command: " << name << "\n";
    return 2;
  }

  if (needs_argument(name)) {
    if (positional.size() != 2) {
      std::cerr << "Command '" << name << "' takes exactly one layout id\n";
      return 2;
    }
    command += " " + positional[1];
  } else if (positional.size() != 1) {
    std::cerr << "Command '" << name << "' takes no arguments\n";
    return 2;
  }

  capswitch::IpcClient client(socket_path);
  auto response = client.send_command(command);
  if (!response) {
    std::cerr << "capswitch agent is not reachable at " << socket_path << "\n";
    return 1;
  }

  if (!response->success) {
    std::cerr << "Error: " << response->message << "\n";
    return 1;
  }

  if (!response->message.empty()) {
    std::cout << response->message << "\n";
  }
  return 0;
}
