/**
 * @file selection_manager.hpp
 * @brief Два слота выбранных раскладок и их разрешение по живому списку
 *
 * Работает только в координирующем контексте.
 */

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "capswitch/input_source_directory.hpp"
#include "capswitch/preference_store.hpp"
#include "capswitch/state_machine.hpp"
#include "capswitch/types.hpp"

namespace capswitch {

/// Результат разрешения слотов
struct SlotResolution {
  std::optional<InputSourceDescriptor> first;
  std::optional<InputSourceDescriptor> second;
  std::size_t count = 0;
};

enum class SelectResult {
  AssignedFirst,
  AssignedSecond,
  /// Уже выбрана, ничего не изменилось
  AlreadySelected,
  /// Обе ячейки заняты доступными раскладками
  Rejected,
  /// Такой раскладки нет в текущем списке
  UnknownSource
};

class SelectionManager {
public:
  /// Загружает сохранённые идентификаторы из store
  explicit SelectionManager(PreferenceStore &store);

  SelectionManager(const SelectionManager &) = delete;
  SelectionManager &operator=(const SelectionManager &) = delete;

  /**
   * @brief Обновляет снимок доступных раскладок
   *
   * Отбрасывает невыбираемые и безымянные, а также повторы идентификаторов.
   * При недоступности каталога снимок становится пустым.
   * @return false если каталог недоступен
   */
  bool refresh_available_sources(InputSourceDirectory &directory);

  [[nodiscard]] const std::vector<InputSourceDescriptor> &
  available() const noexcept {
    return available_;
  }

  /// Слоты, сопоставленные с последним снимком
  [[nodiscard]] SlotResolution resolve_slots() const;

  /// Выбирает раскладку в первый фактически пустой слот (слот 1 приоритетен)
  [[nodiscard]] SelectResult select(std::string_view id);

  /// Очищает слот с этой раскладкой. @return false если она не выбрана
  bool deselect(std::string_view id);

  /// Сохранённый идентификатор слота (0 или 1)
  [[nodiscard]] const std::optional<std::string> &
  persisted_id(std::size_t slot) const {
    return slots_.at(slot);
  }

  [[nodiscard]] bool is_selected(std::string_view id) const;

private:
  [[nodiscard]] std::optional<InputSourceDescriptor>
  find_available(std::string_view id) const;

  void persist(std::size_t slot);

  PreferenceStore &store_;
  std::array<std::optional<std::string>, kSlotCount> slots_;
  std::vector<InputSourceDescriptor> available_;
};

} // namespace capswitch
