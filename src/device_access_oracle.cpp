/**
 * @file device_access_oracle.cpp
 * @brief Реализация проверки прав на устройства ввода
 */

#include "capswitch/device_access_oracle.hpp"

#include <unistd.h>

#include <iostream>
#include <system_error>

namespace capswitch {

DeviceAccessOracle::DeviceAccessOracle(std::filesystem::path input_dir,
                                       std::filesystem::path uinput_path)
    : input_dir_(std::move(input_dir)), uinput_path_(std::move(uinput_path)) {}

bool DeviceAccessOracle::can_read_event_nodes() const {
  std::error_code ec;
  std::filesystem::directory_iterator it{input_dir_, ec};
  if (ec) {
    return false;
  }

  for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
    if (ec) {
      return false;
    }
    const std::filesystem::path &path = it->path();
    if (!path.filename().string().starts_with("event")) {
      continue;
    }
    if (::access(path.c_str(), R_OK) == 0) {
      return true;
    }
  }
  return false;
}

bool DeviceAccessOracle::can_write_uinput() const {
  return ::access(uinput_path_.c_str(), R_OK | W_OK) == 0;
}

bool DeviceAccessOracle::is_trusted(bool prompt_user) {
  const bool events = can_read_event_nodes();
  const bool uinput = can_write_uinput();
  const bool trusted = events && uinput;

  if (!trusted && prompt_user) {
    std::cerr << "[capswitch] Access to input devices is required.\n";
    if (!events) {
      std::cerr << "[capswitch]   cannot read " << input_dir_.string()
                << "/event*\n";
    }
    if (!uinput) {
      std::cerr << "[capswitch]   cannot open " << uinput_path_.string()
                << " for writing\n";
    }
    std::cerr << "[capswitch]   add your user to the 'input' group "
                 "(sudo usermod -aG input $USER) and log in again\n";
  }

  return trusted;
}

} // namespace capswitch
