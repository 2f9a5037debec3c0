/**
 * @file selection_manager.cpp
 * @brief Реализация менеджера выбора раскладок
 */

#include "capswitch/selection_manager.hpp"

#include <algorithm>
#include <iostream>

namespace capswitch {

namespace {

constexpr std::array<std::string_view, kSlotCount> kSlotKeys = {
    kPrefSelectedSource1, kPrefSelectedSource2};

} // namespace

SelectionManager::SelectionManager(PreferenceStore &store) : store_(store) {
  for (std::size_t i = 0; i < kSlotCount; ++i) {
    auto value = store_.get(kSlotKeys[i]);
    if (value && !value->empty()) {
      slots_[i] = std::move(*value);
    }
  }
}

bool SelectionManager::refresh_available_sources(
    InputSourceDirectory &directory) {
  auto sources = directory.list_sources();
  available_.clear();

  if (!sources) {
    std::cerr << "[capswitch] Input source list is unavailable\n";
    return false;
  }

  for (auto &source : *sources) {
    if (!source.selectable || source.localized_name.empty() ||
        source.identifier.empty()) {
      continue;
    }
    const bool duplicate =
        std::any_of(available_.begin(), available_.end(),
                    [&](const InputSourceDescriptor &known) {
                      return known.identifier == source.identifier;
                    });
    if (duplicate) {
      continue;
    }
    available_.push_back(std::move(source));
  }
  return true;
}

std::optional<InputSourceDescriptor>
SelectionManager::find_available(std::string_view id) const {
  for (const auto &source : available_) {
    if (source.identifier == id) {
      return source;
    }
  }
  return std::nullopt;
}

SlotResolution SelectionManager::resolve_slots() const {
  SlotResolution res;
  if (slots_[0]) {
    res.first = find_available(*slots_[0]);
  }
  if (slots_[1]) {
    res.second = find_available(*slots_[1]);
  }
  res.count = (res.first ? 1 : 0) + (res.second ? 1 : 0);
  return res;
}

bool SelectionManager::is_selected(std::string_view id) const {
  return std::any_of(slots_.begin(), slots_.end(),
                     [id](const std::optional<std::string> &slot) {
                       return slot && *slot == id;
                     });
}

SelectResult SelectionManager::select(std::string_view id) {
  if (is_selected(id)) {
    return SelectResult::AlreadySelected;
  }
  if (!find_available(id)) {
    return SelectResult::UnknownSource;
  }

  // Слот считается пустым, если он не задан или его раскладка пропала
  for (std::size_t i = 0; i < kSlotCount; ++i) {
    if (!slots_[i] || !find_available(*slots_[i])) {
      slots_[i] = std::string{id};
      persist(i);
      return i == 0 ? SelectResult::AssignedFirst
                    : SelectResult::AssignedSecond;
    }
  }

  return SelectResult::Rejected;
}

bool SelectionManager::deselect(std::string_view id) {
  for (std::size_t i = 0; i < kSlotCount; ++i) {
    if (slots_[i] && *slots_[i] == id) {
      slots_[i].reset();
      persist(i);
      return true;
    }
  }
  return false;
}

void SelectionManager::persist(std::size_t slot) {
  bool ok = slots_[slot] ? store_.set(kSlotKeys[slot], *slots_[slot])
                         : store_.remove(kSlotKeys[slot]);
  if (!ok) {
    std::cerr << "[capswitch] Selection is kept in memory only\n";
  }
}

} // namespace capswitch
