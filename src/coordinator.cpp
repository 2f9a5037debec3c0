/**
 * @file coordinator.cpp
 * @brief Реализация координатора
 */

#include "capswitch/coordinator.hpp"

#include <iostream>

namespace capswitch {

std::string_view to_string(RederiveReason reason) noexcept {
  switch (reason) {
  case RederiveReason::Launch:
    return "launch";
  case RederiveReason::MenuOpened:
    return "menu opened";
  case RederiveReason::SelectionChanged:
    return "selection changed";
  case RederiveReason::PermissionChanged:
    return "permission changed";
  case RederiveReason::PermissionLost:
    return "permission lost";
  case RederiveReason::SourceUnavailable:
    return "source unavailable";
  case RederiveReason::Refresh:
    return "refresh";
  }
  return "unknown";
}

std::string status_line(const StatusSnapshot &snapshot) {
  switch (snapshot.state) {
  case OperationalState::PermissionsRequired:
    return "Permissions are required";
  case OperationalState::Active:
    return "Switcher: Active";
  case OperationalState::Configuring:
    break;
  }
  return snapshot.resolved_count == 1 ? "Select 1 more layout..."
                                      : "Select 2 layouts...";
}

Coordinator::Coordinator(CoordinatorDeps deps)
    : deps_(std::move(deps)), selection_(deps_.preferences),
      remap_(deps_.config.remap, deps_.config.trigger.key, deps_.runner,
             deps_.main),
      monitor_(deps_.oracle, permission_, [this](bool) {
        request_rederive(RederiveReason::PermissionChanged);
      }) {
  EventFilter::Hooks hooks;
  hooks.permission_lost = [this] {
    request_rederive(RederiveReason::PermissionLost);
  };
  hooks.configuration_needed = [this] {
    post_main([this] {
      if (observer_) {
        observer_->on_configuration_needed();
      } else {
        acknowledge_configuration_hint();
      }
    });
  };
  hooks.switch_failed = [this](ErrorKind kind) {
    post_main([this, kind] { handle_switch_failure(kind); });
  };

  filter_ = std::make_shared<EventFilter>(deps_.config.trigger.key,
                                          permission_, gate_,
                                          deps_.switch_directory,
                                          std::move(hooks));
  filter_->set_configure_hint(deps_.config.tray.configure_hint);

  remap_.set_failure_callback(
      [this](RemapDirection direction, const CommandOutcome &out) {
        handle_remap_failure(direction, out);
      });
}

Coordinator::~Coordinator() { shutdown(); }

void Coordinator::post_main(Task task) {
  std::weak_ptr<bool> alive = alive_;
  deps_.main.post([alive, task = std::move(task)] {
    auto token = alive.lock();
    if (token && *token) {
      task();
    }
  });
}

void Coordinator::launch() {
  if (launched_ || shut_down_) {
    return;
  }
  launched_ = true;

  std::cerr << "[capswitch] Starting (trigger keycode "
            << deps_.config.trigger.key << ")\n";

  launch_at_login_ = deps_.login_item.is_enabled();
  rederive(RederiveReason::Launch);
  monitor_.start(deps_.config.permission.poll_interval);
}

void Coordinator::shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;

  std::cerr << "[capswitch] Shutting down\n";

  monitor_.stop();
  destroy_tap();
  gate_.publish(OperationalState::PermissionsRequired, std::nullopt);
  remap_.revert_now();
  *alive_ = false;
}

void Coordinator::request_rederive(RederiveReason reason) {
  post_main([this, reason] { rederive(reason); });
}

void Coordinator::rederive(RederiveReason reason) {
  if (shut_down_) {
    return;
  }

  // Наблюдатель может вызвать нас повторно (например, из модального окна):
  // такой пересчёт выполняется после текущего, а не внутри него
  if (in_rederive_) {
    rederive_again_ = true;
    again_reason_ = reason;
    return;
  }

  in_rederive_ = true;
  rederive_once(reason);
  while (rederive_again_ && !shut_down_) {
    rederive_again_ = false;
    rederive_once(again_reason_);
  }
  in_rederive_ = false;
}

void Coordinator::rederive_once(RederiveReason reason) {
  // 1. Свежая проверка прав: флаг может отставать на период опроса
  const bool perm = deps_.oracle.is_trusted(/*prompt_user=*/false);
  const bool perm_was = permission_.exchange(perm);
  filter_->acknowledge_permission_lost();
  if (perm != perm_was) {
    std::cerr << "[capswitch] Input device access: "
              << (perm ? "granted" : "missing") << "\n";
  }

  // 2. Раскладки и слоты
  selection_.refresh_available_sources(deps_.directory);
  const SlotResolution res = selection_.resolve_slots();

  // 3. Новое состояние и план
  OperationalState next = derive_state(perm, res.count);
  TransitionPlan plan =
      plan_transition(next, perm, tap_ != nullptr, remap_.heading());

  // 4. Перехват снимается раньше любых уведомлений
  if (plan.destroy_tap) {
    destroy_tap();
  }

  bool tap_failed = false;
  if (plan.create_tap) {
    std::string error;
    if (!create_tap(error)) {
      tap_failed = true;
      next = OperationalState::PermissionsRequired;
      plan = plan_transition(next, perm, false, remap_.heading());
    }
  }
  if (tap_) {
    tap_failure_reported_ = false;
  }

  // 5. Публикация для потока перехвата
  publish_gate(next, res);

  // 6. Ремап. После ошибки команда повторяется по таймеру паузы или сразу
  // при смене состояния
  if (next != state_) {
    remap_.clear_backoff();
  }
  if (plan.apply_remap) {
    remap_.apply();
  } else if (plan.revert_remap) {
    remap_.revert();
  }
  if (remap_.heading() == (next == OperationalState::Active) &&
      !remap_.busy()) {
    remap_failure_reported_ = false;
  }

  const OperationalState prev = state_;
  state_ = next;
  if (prev != next) {
    std::cerr << "[capswitch] State: " << to_string(prev) << " -> "
              << to_string(next) << " (" << to_string(reason) << ")\n";
    if (next != OperationalState::Configuring) {
      filter_->acknowledge_configuration_needed();
    }
  }

  notify_status();

  // 7. Инструкции и приветствие
  const bool show_guidance =
      next == OperationalState::PermissionsRequired &&
      (prev != next || reason == RederiveReason::Launch ||
       (tap_failed && !tap_failure_reported_));
  if (tap_failed) {
    tap_failure_reported_ = true;
  }

  if (show_guidance) {
    if (reason == RederiveReason::Launch) {
      // На Linux это только подсказка в логе
      (void)deps_.oracle.is_trusted(/*prompt_user=*/true);
    }
    if (observer_) {
      observer_->on_permission_guidance(/*user_requested=*/false);
    }
  }

  maybe_show_welcome();
}

bool Coordinator::create_tap(std::string &error) {
  std::shared_ptr<EventFilter> filter = filter_;
  tap_ = deps_.tap_factory.create(
      deps_.config.trigger.key,
      [filter](const KeyEvent &event) { return filter->on_key(event); },
      error);

  if (!tap_) {
    std::cerr << "[capswitch] Failed to register key interception: "
              << (error.empty() ? std::string{"unknown error"} : error)
              << "\n";
    return false;
  }

  tap_->set_enabled(true);
  std::cerr << "[capswitch] Key interception registered\n";
  return true;
}

void Coordinator::destroy_tap() {
  if (!tap_) {
    return;
  }
  tap_.reset();
  std::cerr << "[capswitch] Key interception removed\n";
}

void Coordinator::publish_gate(OperationalState next,
                               const SlotResolution &res) {
  if (next == OperationalState::Active && res.first && res.second) {
    gate_.publish(next, SwitchTargets{res.first->group, res.second->group});
    return;
  }
  gate_.publish(next, std::nullopt);
}

void Coordinator::maybe_show_welcome() {
  if (!tap_) {
    return;
  }
  auto shown = deps_.preferences.get(kPrefHasShownWelcome);
  if (shown && *shown == "true") {
    return;
  }
  if (!deps_.preferences.set(kPrefHasShownWelcome, "true")) {
    std::cerr << "[capswitch] Could not persist welcome flag\n";
  }
  std::cerr << "[capswitch] Showing welcome guide\n";
  if (observer_) {
    observer_->on_welcome();
  }
}

void Coordinator::notify_status() {
  if (observer_) {
    observer_->on_status_changed(snapshot());
  }
}

SelectResult Coordinator::select_source(std::string_view id) {
  const SelectResult result = selection_.select(id);
  switch (result) {
  case SelectResult::AssignedFirst:
  case SelectResult::AssignedSecond:
    std::cerr << "[capswitch] Selected layout " << id << " (slot "
              << (result == SelectResult::AssignedFirst ? 1 : 2) << ")\n";
    rederive(RederiveReason::SelectionChanged);
    break;
  case SelectResult::Rejected:
    std::cerr << "[capswitch] Two layouts are already selected, ignoring "
              << id << "\n";
    if (observer_) {
      observer_->on_selection_rejected();
    }
    break;
  case SelectResult::UnknownSource:
    std::cerr << "[capswitch] Unknown layout: " << id << "\n";
    break;
  case SelectResult::AlreadySelected:
    break;
  }
  return result;
}

bool Coordinator::deselect_source(std::string_view id) {
  if (!selection_.deselect(id)) {
    return false;
  }
  std::cerr << "[capswitch] Deselected layout " << id << "\n";
  rederive(RederiveReason::SelectionChanged);
  return true;
}

void Coordinator::request_permission_guidance() {
  (void)deps_.oracle.is_trusted(/*prompt_user=*/true);
  if (observer_) {
    observer_->on_permission_guidance(/*user_requested=*/true);
  }
}

void Coordinator::show_welcome_guide() {
  if (observer_) {
    observer_->on_welcome();
  }
}

void Coordinator::acknowledge_configuration_hint() {
  filter_->acknowledge_configuration_needed();
}

void Coordinator::set_launch_at_login(bool enabled) {
  std::weak_ptr<bool> alive = alive_;
  LoginItem &item = deps_.login_item;
  Dispatcher &main = deps_.main;

  deps_.background.post([this, alive, &item, &main, enabled] {
    LoginItemResult res = item.set_enabled(enabled);
    main.post([this, alive, res = std::move(res)] {
      auto token = alive.lock();
      if (!token || !*token) {
        return;
      }
      launch_at_login_ = res.enabled;
      if (observer_) {
        observer_->on_launch_at_login_changed(res.enabled,
                                              res.ok ? std::string{}
                                                     : res.error);
      }
      notify_status();
    });
  });
}

void Coordinator::handle_switch_failure(ErrorKind kind) {
  std::cerr << "[capswitch] Trigger consumed, but " << to_string(kind)
            << "\n";
  // Раскладка могла исчезнуть: пересчёт сбросит слоты в Configuring
  rederive(RederiveReason::SourceUnavailable);
}

void Coordinator::handle_remap_failure(RemapDirection direction,
                                       const CommandOutcome &out) {
  if (remap_failure_reported_) {
    return;
  }
  remap_failure_reported_ = true;

  std::string detail = "Could not " + std::string{to_string(direction)} +
                       " the key remapping";
  if (!out.error.empty()) {
    detail += ": " + out.error;
  } else if (out.launched) {
    detail += " (exit status " + std::to_string(out.exit_status) + ")";
  }
  if (observer_) {
    observer_->on_error(ErrorKind::RemapCommandFailed, detail);
  }
}

StatusSnapshot Coordinator::snapshot() const {
  StatusSnapshot s;
  s.state = state_;
  s.has_permission = permission_.read();
  s.tap_active = tap_ != nullptr;

  const SlotResolution res = selection_.resolve_slots();
  s.resolved_count = res.count;

  for (const auto &source : selection_.available()) {
    StatusSnapshot::SourceEntry entry;
    entry.source = source;
    entry.selected = selection_.is_selected(source.identifier);
    entry.enabled = res.count < kSlotCount || entry.selected;
    s.sources.push_back(std::move(entry));
  }
  if (res.first) {
    s.selected_names.push_back(res.first->localized_name);
  }
  if (res.second) {
    s.selected_names.push_back(res.second->localized_name);
  }

  s.launch_at_login = launch_at_login_;
  s.remap = remap_.belief();
  s.remap_busy = remap_.busy();
  return s;
}

} // namespace capswitch
