/**
 * @file state_machine.hpp
 * @brief Вывод операционного состояния и план побочных эффектов перехода
 *
 * Состояние никогда не хранится как источник истины: оно каждый раз заново
 * выводится из флага доступа и числа разрешённых слотов. План перехода —
 * чистая функция, координатор только исполняет его.
 */

#pragma once

#include <cstddef>
#include <optional>

#include "capswitch/types.hpp"

namespace capswitch {

/// Сколько слотов выбора существует
inline constexpr std::size_t kSlotCount = 2;

/**
 * @brief Выводит состояние из входов
 *
 * !perm -> PermissionsRequired; perm && 2 слота -> Active; иначе Configuring.
 */
[[nodiscard]] constexpr OperationalState
derive_state(bool has_permission, std::size_t resolved_count) noexcept {
  if (!has_permission) {
    return OperationalState::PermissionsRequired;
  }
  if (resolved_count >= kSlotCount) {
    return OperationalState::Active;
  }
  return OperationalState::Configuring;
}

/// Нужен ли перехват в этом состоянии
[[nodiscard]] constexpr bool requires_tap(OperationalState state) noexcept {
  return state == OperationalState::Configuring ||
         state == OperationalState::Active;
}

/// Что должен сделать координатор, чтобы привести систему к состоянию
struct TransitionPlan {
  bool destroy_tap = false;
  bool create_tap = false;
  bool apply_remap = false;
  bool revert_remap = false;

  [[nodiscard]] constexpr bool empty() const noexcept {
    return !destroy_tap && !create_tap && !apply_remap && !revert_remap;
  }

  constexpr bool operator==(const TransitionPlan &) const noexcept = default;
};

/**
 * @brief Строит план перехода
 *
 * @param next Новое состояние
 * @param has_permission Свежий флаг доступа
 * @param tap_exists Существует ли регистрация перехвата
 * @param remap_heading Куда движется ремап с учётом команды в полёте и
 *        отложенной: true — к применённому, false — к снятому, nullopt —
 *        состояние неизвестно (например, после таймаута команды)
 *
 * Уничтожение перехвата планируется раньше любых уведомлений UI: координатор
 * исполняет destroy_tap первым.
 */
[[nodiscard]] constexpr TransitionPlan
plan_transition(OperationalState next, bool has_permission, bool tap_exists,
                std::optional<bool> remap_heading) noexcept {
  TransitionPlan plan;

  const bool want_applied = next == OperationalState::Active;
  if (want_applied) {
    plan.apply_remap = remap_heading != true;
  } else {
    plan.revert_remap = remap_heading != false;
  }

  const bool want_tap = has_permission && requires_tap(next);
  if (tap_exists &&
      (!has_permission || next == OperationalState::PermissionsRequired)) {
    plan.destroy_tap = true;
  }
  if (!tap_exists && want_tap) {
    plan.create_tap = true;
  }

  return plan;
}

} // namespace capswitch
