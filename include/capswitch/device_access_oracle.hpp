/**
 * @file device_access_oracle.hpp
 * @brief Проверка прав на evdev и uinput
 *
 * Для перехвата нужно читать /dev/input/event* и писать в /dev/uinput.
 * Обычно это даёт членство в группе input или udev-правило.
 */

#pragma once

#include <filesystem>

#include "capswitch/permission_monitor.hpp"

namespace capswitch {

class DeviceAccessOracle final : public PermissionOracle {
public:
  DeviceAccessOracle(std::filesystem::path input_dir,
                     std::filesystem::path uinput_path);

  /// При prompt_user пишет в лог, какие права нужно выдать. Системного
  /// диалога запроса прав на Linux нет.
  [[nodiscard]] bool is_trusted(bool prompt_user) override;

private:
  [[nodiscard]] bool can_read_event_nodes() const;
  [[nodiscard]] bool can_write_uinput() const;

  std::filesystem::path input_dir_;
  std::filesystem::path uinput_path_;
};

} // namespace capswitch
