/**
 * @file ipc_commands.cpp
 * @brief Реализация IPC команд
 */

#include "capswitch/ipc_commands.hpp"

#include <future>
#include <memory>
#include <sstream>

namespace capswitch {

namespace {

std::string format_status(const Coordinator &coordinator) {
  const StatusSnapshot s = coordinator.snapshot();
  std::ostringstream out;
  out << to_string(s.state) << "\n";
  out << "status: " << status_line(s) << "\n";
  out << "permission: " << (s.has_permission ? "granted" : "missing") << "\n";
  out << "interception: " << (s.tap_active ? "on" : "off") << "\n";
  out << "remap: " << to_string(s.remap) << (s.remap_busy ? " (busy)" : "")
      << "\n";
  out << "launch_at_login: " << (s.launch_at_login ? "on" : "off") << "\n";

  const SlotResolution res = coordinator.selection().resolve_slots();
  const std::optional<InputSourceDescriptor> *resolved[] = {&res.first,
                                                            &res.second};
  for (std::size_t i = 0; i < kSlotCount; ++i) {
    out << "slot" << (i + 1) << ": ";
    const auto &id = coordinator.selection().persisted_id(i);
    if (!id) {
      out << "-";
    } else if (*resolved[i]) {
      out << *id << " (" << (*resolved[i])->localized_name << ")";
    } else {
      out << *id << " (unavailable)";
    }
    if (i + 1 < kSlotCount) {
      out << "\n";
    }
  }
  return out.str();
}

std::string format_sources(const Coordinator &coordinator) {
  const StatusSnapshot s = coordinator.snapshot();
  std::ostringstream out;
  out << s.sources.size();
  for (const auto &entry : s.sources) {
    out << "\n" << (entry.selected ? "* " : "  ") << entry.source.identifier
        << "\t" << entry.source.localized_name;
  }
  return out.str();
}

} // namespace

IpcResult execute_ipc_command(Coordinator &coordinator, IpcCommand command,
                              const std::string &argument) {
  switch (command) {
  case IpcCommand::Status:
    return {true, format_status(coordinator)};

  case IpcCommand::Sources:
    coordinator.refresh();
    return {true, format_sources(coordinator)};

  case IpcCommand::Refresh:
    coordinator.refresh();
    return {true, format_status(coordinator)};

  case IpcCommand::Select: {
    if (argument.empty()) {
      return {false, "Missing layout id"};
    }
    coordinator.refresh();
    switch (coordinator.select_source(argument)) {
    case SelectResult::AssignedFirst:
      return {true, "slot 1"};
    case SelectResult::AssignedSecond:
      return {true, "slot 2"};
    case SelectResult::AlreadySelected:
      return {true, "already selected"};
    case SelectResult::Rejected:
      return {false, "two layouts are already selected"};
    case SelectResult::UnknownSource:
      return {false, "unknown layout " + argument};
    }
    return {false, "Unexpected result"};
  }

  case IpcCommand::Deselect:
    if (argument.empty()) {
      return {false, "Missing layout id"};
    }
    if (!coordinator.deselect_source(argument)) {
      return {false, "layout " + argument + " is not selected"};
    }
    return {true, "deselected"};

  case IpcCommand::Unknown:
    break;
  }
  return {false, "Unknown command"};
}

IpcServer::CommandHandler make_ipc_handler(Coordinator &coordinator,
                                           Dispatcher &main,
                                           std::chrono::milliseconds timeout) {
  return [&coordinator, &main, timeout](IpcCommand command,
                                        const std::string &argument) {
    auto promise = std::make_shared<std::promise<IpcResult>>();
    auto future = promise->get_future();

    main.post([&coordinator, command, argument, promise] {
      promise->set_value(execute_ipc_command(coordinator, command, argument));
    });

    if (future.wait_for(timeout) != std::future_status::ready) {
      return IpcResult{false, "Timed out waiting for the agent"};
    }
    return future.get();
  };
}

} // namespace capswitch
