/**
 * @file config.hpp
 * @brief Конфигурация capswitch
 *
 * Типобезопасная конфигурация с YAML парсингом.
 * Все значения имеют разумные дефолты.
 */

#pragma once

#include <linux/input.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "capswitch/types.hpp"

namespace capswitch {

// ===========================================================================
// Структура конфигурации
// ===========================================================================

/// Клавиша, которую перехватываем
struct TriggerConfig {
  ScanCode key = KEY_CAPSLOCK;
};

/// Проверка доступа к устройствам ввода
struct PermissionConfig {
  /// Период опроса. Ограничивает устаревание флага доступа.
  std::chrono::milliseconds poll_interval{3000};
  std::filesystem::path input_dir{"/dev/input"};
  std::filesystem::path uinput_path{"/dev/uinput"};
};

/// Системный ремап клавиши через внешнюю утилиту
struct RemapConfig {
  bool enabled = true;
  /// Абсолютный путь к утилите (xmodmap)
  std::filesystem::path utility{"/usr/bin/xmodmap"};
  /// Keysym-заглушка, на который переназначается клавиша в Active
  std::string placeholder = "F18";
  /// Сколько ждём завершения утилиты, прежде чем убить её
  std::chrono::milliseconds timeout{5000};
  /// Пауза перед повтором неудавшейся команды; удваивается до 64x.
  /// 0 — повторять при каждом пересчёте
  std::chrono::milliseconds retry_backoff{5000};
};

/// Поведение трея
struct TrayConfig {
  /// Период фонового пересчёта состояния (0 — только по открытию меню)
  std::chrono::milliseconds refresh_interval{2000};
  /// Показывать подсказку "выберите раскладки" при нажатии в Configuring
  bool configure_hint = true;
};

/// Полная конфигурация приложения
struct Config {
  TriggerConfig trigger;
  PermissionConfig permission;
  RemapConfig remap;
  TrayConfig tray;
  std::filesystem::path config_path{std::string{kConfigPath}};
};

// ===========================================================================
// Загрузчик конфигурации
// ===========================================================================

/// Результат загрузки конфигурации из файла.
///
/// В отличие от `load_config()`, это API НЕ делает скрытых фолбэков и
/// позволяет вызывающему коду принять решение (fail-fast / fallback).
struct ConfigLoadOutcome {
  Config config;
  ConfigResult result = ConfigResult::Ok;
  std::filesystem::path used_path;
  std::string error;
};

/**
 * @brief Загружает конфигурацию из конкретного файла
 *
 * @param path Абсолютный или относительный путь к конфигу
 * @return ConfigLoadOutcome с кодом результата и сообщением ошибки
 */
[[nodiscard]] ConfigLoadOutcome load_config_checked(std::filesystem::path path);

/**
 * @brief Загружает конфигурацию из YAML файла (best-effort)
 *
 * Если запрошен системный путь и существует пользовательский конфиг,
 * используется пользовательский. При ошибках возвращает дефолты.
 */
[[nodiscard]] Config load_config(std::string_view path = kConfigPath);

/**
 * @brief Парсит интервал в миллисекундах
 *
 * @param value Строка с целым числом >= 0
 */
[[nodiscard]] std::optional<std::chrono::milliseconds>
parse_interval_ms(std::string_view value);

/**
 * @brief Валидирует конфигурацию
 *
 * @return true если все значения в допустимых пределах
 */
[[nodiscard]] bool validate_config(const Config &config);

} // namespace capswitch
