/**
 * @file autostart.hpp
 * @brief Запуск при входе в систему (XDG autostart)
 */

#pragma once

#include <filesystem>
#include <string>

namespace capswitch {

/// Результат изменения настройки автозапуска
struct LoginItemResult {
  bool ok = false;
  /// Фактическое состояние после операции
  bool enabled = false;
  std::string error;
};

class LoginItem {
public:
  virtual ~LoginItem() = default;

  [[nodiscard]] virtual bool is_enabled() const = 0;

  /// Может блокироваться на файловых операциях: вызывать в фоновом потоке
  [[nodiscard]] virtual LoginItemResult set_enabled(bool enabled) = 0;
};

/**
 * @brief ~/.config/autostart/capswitch.desktop
 *
 * Запись с Hidden=true считается выключенной (так её отключают
 * настройки окружения рабочего стола).
 */
class XdgAutostart final : public LoginItem {
public:
  XdgAutostart(std::filesystem::path desktop_file,
               std::filesystem::path executable);

  /// Путь по умолчанию от $HOME
  [[nodiscard]] static std::filesystem::path default_path();

  [[nodiscard]] bool is_enabled() const override;
  [[nodiscard]] LoginItemResult set_enabled(bool enabled) override;

  /// Содержимое .desktop файла
  [[nodiscard]] std::string desktop_entry() const;

private:
  std::filesystem::path desktop_file_;
  std::filesystem::path executable_;
};

} // namespace capswitch
