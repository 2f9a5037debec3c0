/**
 * @file input_source_directory.hpp
 * @brief Доступ к системному списку раскладок
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "capswitch/types.hpp"

namespace capswitch {

/**
 * @brief Системный каталог источников ввода
 *
 * current_group() и activate_group() вызываются в потоке перехвата: один
 * запрос к X серверу, без выделения памяти.
 */
class InputSourceDirectory {
public:
  virtual ~InputSourceDirectory() = default;

  /// Все клавиатурные раскладки. nullopt — каталог недоступен.
  [[nodiscard]] virtual std::optional<std::vector<InputSourceDescriptor>>
  list_sources() = 0;

  /// Группа активной раскладки. nullopt — не удалось узнать.
  [[nodiscard]] virtual std::optional<int> current_group() = 0;

  /// Делает группу активной. @return true при успехе
  [[nodiscard]] virtual bool activate_group(int group) = 0;
};

} // namespace capswitch
