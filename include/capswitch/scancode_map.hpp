/**
 * @file scancode_map.hpp
 * @brief Таблица клавиш, которые можно назначить триггером
 *
 * Constexpr таблица: имя в конфиге -> evdev код, родной X keysym и модификатор,
 * к которому клавиша привязана по умолчанию. Keysym и модификатор нужны
 * контроллеру ремапа, чтобы явно восстановить исходное поведение клавиши.
 */

#pragma once

#include <linux/input.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "capswitch/types.hpp"

namespace capswitch {

/// Смещение между evdev кодом и X11 keycode (evdev + 8)
inline constexpr int kX11KeycodeOffset = 8;

struct KeyNameMapping {
  std::string_view name;
  ScanCode code;
  /// Родной keysym клавиши в X11
  std::string_view keysym;
  /// Модификатор xmodmap, за которым закреплена клавиша (пусто — нет)
  std::string_view modifier;
};

inline constexpr auto kTriggerKeys = std::to_array<KeyNameMapping>({
    {"capslock", KEY_CAPSLOCK, "Caps_Lock", "lock"},
    {"scrolllock", KEY_SCROLLLOCK, "Scroll_Lock", ""},
    {"pause", KEY_PAUSE, "Pause", ""},
    {"insert", KEY_INSERT, "Insert", ""},
    {"compose", KEY_COMPOSE, "Menu", ""},
    {"rightctrl", KEY_RIGHTCTRL, "Control_R", "control"},
    {"rightmeta", KEY_RIGHTMETA, "Super_R", "mod4"},
});

/// Поиск описания клавиши по коду
[[nodiscard]] constexpr const KeyNameMapping *
find_trigger_key(ScanCode code) noexcept {
  for (const auto &mapping : kTriggerKeys) {
    if (mapping.code == code) {
      return &mapping;
    }
  }
  return nullptr;
}

/// Имя из конфига ("capslock") -> evdev код
[[nodiscard]] constexpr std::optional<ScanCode>
key_name_to_code(std::string_view name) noexcept {
  for (const auto &mapping : kTriggerKeys) {
    if (mapping.name == name) {
      return mapping.code;
    }
  }
  return std::nullopt;
}

/// evdev код -> X11 keycode
[[nodiscard]] constexpr int to_x11_keycode(ScanCode code) noexcept {
  return static_cast<int>(code) + kX11KeycodeOffset;
}

} // namespace capswitch
