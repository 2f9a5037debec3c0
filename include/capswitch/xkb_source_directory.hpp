/**
 * @file xkb_source_directory.hpp
 * @brief Раскладки как XKB группы текущего X дисплея
 *
 * Идентификатор раскладки берётся из свойства _XKB_RULES_NAMES корневого
 * окна ("us", "de(nodeadkeys)"), имя — из имён групп XKB.
 * Экземпляр не потокобезопасен: у каждого потока свой экземпляр и своё
 * соединение с X сервером.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "capswitch/input_source_directory.hpp"

struct _XDisplay;

namespace capswitch {

class XkbSourceDirectory final : public InputSourceDirectory {
public:
  XkbSourceDirectory() = default;
  ~XkbSourceDirectory() override;

  XkbSourceDirectory(const XkbSourceDirectory &) = delete;
  XkbSourceDirectory &operator=(const XkbSourceDirectory &) = delete;

  [[nodiscard]] std::optional<std::vector<InputSourceDescriptor>>
  list_sources() override;

  [[nodiscard]] std::optional<int> current_group() override;

  [[nodiscard]] bool activate_group(int group) override;

  /// Раскладки и варианты из _XKB_RULES_NAMES, по одному на группу
  [[nodiscard]] std::optional<std::vector<std::string>> layout_identifiers();

  /// Открывает соединение при необходимости. Экземпляр для потока
  /// перехвата открывается заранее, чтобы первое нажатие не ждало X сервер
  [[nodiscard]] bool open();

private:
  void close();

  _XDisplay *display_ = nullptr;
};

} // namespace capswitch
