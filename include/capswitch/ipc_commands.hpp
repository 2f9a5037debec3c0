/**
 * @file ipc_commands.hpp
 * @brief Исполнение IPC команд над координатором
 */

#pragma once

#include <chrono>
#include <string>

#include "capswitch/coordinator.hpp"
#include "capswitch/dispatcher.hpp"
#include "capswitch/ipc_server.hpp"

namespace capswitch {

/// Выполняет команду. Только в координирующем контексте.
[[nodiscard]] IpcResult execute_ipc_command(Coordinator &coordinator,
                                            IpcCommand command,
                                            const std::string &argument);

/**
 * @brief Обработчик для IpcServer
 *
 * Переносит команду в координирующий контекст и ждёт ответ не дольше
 * timeout.
 */
[[nodiscard]] IpcServer::CommandHandler
make_ipc_handler(Coordinator &coordinator, Dispatcher &main,
                 std::chrono::milliseconds timeout);

} // namespace capswitch
