/**
 * @file autostart.cpp
 * @brief Реализация XDG autostart
 */

#include "capswitch/autostart.hpp"
#include "capswitch/file_util.hpp"
#include "capswitch/types.hpp"

#include <fstream>
#include <iostream>

namespace capswitch {

XdgAutostart::XdgAutostart(std::filesystem::path desktop_file,
                           std::filesystem::path executable)
    : desktop_file_(std::move(desktop_file)),
      executable_(std::move(executable)) {}

std::filesystem::path XdgAutostart::default_path() {
  return home_relative(kAutostartRelPath);
}

std::string XdgAutostart::desktop_entry() const {
  std::string out;
  out += "[Desktop Entry]\n";
  out += "Type=Application\n";
  out += "Name=capswitch\n";
  out += "Comment=Switch between two keyboard layouts with Caps Lock\n";
  out += "Exec=" + executable_.string() + "\n";
  out += "Icon=input-keyboard\n";
  out += "Terminal=false\n";
  out += "NoDisplay=true\n";
  out += "X-GNOME-Autostart-enabled=true\n";
  return out;
}

bool XdgAutostart::is_enabled() const {
  if (desktop_file_.empty()) {
    return false;
  }

  std::ifstream file{desktop_file_};
  if (!file.is_open()) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    if (line == "Hidden=true" || line == "X-GNOME-Autostart-enabled=false") {
      return false;
    }
  }
  return true;
}

LoginItemResult XdgAutostart::set_enabled(bool enabled) {
  LoginItemResult res;

  if (desktop_file_.empty()) {
    res.error = "HOME is not set";
    res.enabled = false;
    return res;
  }

  if (enabled) {
    res.ok = write_file_atomic(desktop_file_, desktop_entry(), &res.error);
  } else {
    std::error_code ec;
    std::filesystem::remove(desktop_file_, ec);
    res.ok = !ec;
    if (ec) {
      res.error = "cannot remove " + desktop_file_.string() + ": " +
                  ec.message();
    }
  }

  res.enabled = is_enabled();
  std::cerr << "[capswitch] Launch at login: "
            << (res.enabled ? "enabled" : "disabled");
  if (!res.ok) {
    std::cerr << " (error: " << res.error << ")";
  }
  std::cerr << "\n";
  return res;
}

} // namespace capswitch
