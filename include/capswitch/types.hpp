/**
 * @file types.hpp
 * @brief Базовые типы и структуры данных capswitch
 *
 * Общие для ядра, платформенного слоя и трея типы: коды клавиш, состояния
 * автомата, описание источника ввода, классы ошибок.
 */

#pragma once

#include <linux/input.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace capswitch {

// ===========================================================================
// Константы
// ===========================================================================

/// Путь к системному конфигурационному файлу
inline constexpr std::string_view kConfigPath = "/etc/capswitch/config.yaml";

/// Путь к пользовательскому конфигу (относительно $HOME)
inline constexpr std::string_view kUserConfigRelPath =
    ".config/capswitch/config.yaml";

/// Хранилище пользовательских настроек (выбранные раскладки и флаги)
inline constexpr std::string_view kStateRelPath = ".config/capswitch/state";

/// XDG autostart entry (относительно $HOME)
inline constexpr std::string_view kAutostartRelPath =
    ".config/autostart/capswitch.desktop";

/// Префикс имени наших виртуальных устройств. Такие устройства никогда не
/// захватываются повторно.
inline constexpr std::string_view kVirtualDevicePrefix = "capswitch";

// ===========================================================================
// Типы для работы с событиями ввода
// ===========================================================================

/// Скан-код клавиши (обёртка над linux/input.h константами)
using ScanCode = std::uint16_t;

/// Значение события клавиши
enum class KeyState : std::int32_t { Release = 0, Press = 1, Repeat = 2 };

/// Событие клавиши, передаваемое фильтру
struct KeyEvent {
  ScanCode code = 0;
  KeyState state = KeyState::Press;
};

/// Решение фильтра по событию
enum class FilterVerdict { PassThrough, Consume };

// ===========================================================================
// Операционное состояние
// ===========================================================================

/// Состояние агента. Никогда не хранится, только выводится
/// (см. state_machine.hpp).
enum class OperationalState { PermissionsRequired, Configuring, Active };

[[nodiscard]] constexpr std::string_view
to_string(OperationalState state) noexcept {
  switch (state) {
  case OperationalState::PermissionsRequired:
    return "PermissionsRequired";
  case OperationalState::Configuring:
    return "Configuring";
  case OperationalState::Active:
    return "Active";
  }
  return "Unknown";
}

// ===========================================================================
// Источники ввода
// ===========================================================================

/// Раскладка клавиатуры в том виде, в каком её видит система
struct InputSourceDescriptor {
  /// Стабильный идентификатор ("us", "ru", "de(nodeadkeys)")
  std::string identifier;
  /// Человекочитаемое имя ("English (US)")
  std::string localized_name;
  /// Можно ли выбрать источник вручную
  bool selectable = true;
  /// Индекс XKB группы для активации
  int group = 0;

  bool operator==(const InputSourceDescriptor &) const = default;
};

// ===========================================================================
// Типы результатов операций
// ===========================================================================

/// Результат парсинга конфигурации
enum class ConfigResult { Ok, FileNotFound, ParseError, InvalidValue };

/// Классы ошибок, о которых сообщают компоненты
enum class ErrorKind {
  PermissionDenied,
  SourceUnavailable,
  SwitchFailed,
  RemapCommandFailed,
  TapRegistrationFailed
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::PermissionDenied:
    return "permission denied";
  case ErrorKind::SourceUnavailable:
    return "input source unavailable";
  case ErrorKind::SwitchFailed:
    return "layout switch failed";
  case ErrorKind::RemapCommandFailed:
    return "remap command failed";
  case ErrorKind::TapRegistrationFailed:
    return "key interception registration failed";
  }
  return "unknown error";
}

} // namespace capswitch
