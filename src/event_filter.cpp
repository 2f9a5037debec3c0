/**
 * @file event_filter.cpp
 * @brief Реализация фильтра событий
 */

#include "capswitch/event_filter.hpp"

namespace capswitch {

EventFilter::EventFilter(ScanCode trigger, const PermissionFlag &permission,
                         const SwitchGate &gate,
                         InputSourceDirectory &directory, Hooks hooks)
    : trigger_(trigger), permission_(permission), gate_(gate),
      directory_(directory), hooks_(std::move(hooks)) {}

FilterVerdict EventFilter::on_key(const KeyEvent &event) {
  if (event.code != trigger_ || event.state != KeyState::Press) {
    return FilterVerdict::PassThrough;
  }

  // Без доступа пропускаем событие: клавиатура не должна "умереть"
  if (!permission_.read()) {
    if (!permission_lost_sent_.exchange(true, std::memory_order_acq_rel) &&
        hooks_.permission_lost) {
      hooks_.permission_lost();
    }
    return FilterVerdict::PassThrough;
  }

  const auto [state, targets] = gate_.load();
  if (state != OperationalState::Active) {
    if (configure_hint_.load(std::memory_order_relaxed) &&
        !configuration_hint_sent_.exchange(true, std::memory_order_acq_rel) &&
        hooks_.configuration_needed) {
      hooks_.configuration_needed();
    }
    return FilterVerdict::PassThrough;
  }

  if (!targets) {
    if (hooks_.switch_failed) {
      hooks_.switch_failed(ErrorKind::SourceUnavailable);
    }
    return FilterVerdict::Consume;
  }

  switch_layout(*targets);
  return FilterVerdict::Consume;
}

void EventFilter::switch_layout(const SwitchTargets &targets) {
  // Асимметричное правило: только слот 1 ведёт на слот 2, любая другая
  // раскладка (включая невыбранную) ведёт на слот 1
  const std::optional<int> current = directory_.current_group();
  if (!current && hooks_.switch_failed) {
    hooks_.switch_failed(ErrorKind::SwitchFailed);
  }
  const int target = (current && *current == targets.first_group)
                         ? targets.second_group
                         : targets.first_group;

  if (!directory_.activate_group(target) && hooks_.switch_failed) {
    hooks_.switch_failed(ErrorKind::SwitchFailed);
  }
}

} // namespace capswitch
