/**
 * @file remap_controller.cpp
 * @brief Реализация контроллера ремапа
 */

#include "capswitch/remap_controller.hpp"
#include "capswitch/scancode_map.hpp"

#include <algorithm>
#include <iostream>

namespace capswitch {

namespace {

/// Пауза растёт до retry_backoff * 64
constexpr unsigned kMaxBackoffShift = 6;

} // namespace

std::vector<std::string> build_remap_command(const RemapConfig &config,
                                             ScanCode trigger,
                                             RemapDirection direction) {
  const KeyNameMapping *key = find_trigger_key(trigger);
  const std::string keycode = std::to_string(to_x11_keycode(trigger));
  const std::string native{key ? key->keysym : std::string_view{"NoSymbol"}};
  const std::string modifier{key ? key->modifier : std::string_view{}};

  std::vector<std::string> argv;
  argv.push_back(config.utility.string());

  auto expr = [&argv](std::string e) {
    argv.emplace_back("-e");
    argv.push_back(std::move(e));
  };

  if (direction == RemapDirection::Apply) {
    expr("keycode " + keycode + " = " + native);
    if (!modifier.empty()) {
      expr("remove " + modifier + " = " + native);
    }
    expr("keycode " + keycode + " = " + config.placeholder);
  } else {
    expr("keycode " + keycode + " = " + native);
    if (!modifier.empty()) {
      expr("add " + modifier + " = " + native);
    }
  }

  return argv;
}

RemapController::RemapController(RemapConfig config, ScanCode trigger,
                                 CommandRunner &runner, Dispatcher &dispatcher)
    : config_(std::move(config)), trigger_(trigger), runner_(runner),
      dispatcher_(dispatcher) {}

std::optional<bool> RemapController::heading() const noexcept {
  if (pending_) {
    return *pending_ == RemapDirection::Apply;
  }
  if (in_flight_) {
    return *in_flight_ == RemapDirection::Apply;
  }
  switch (belief_) {
  case RemapBelief::Applied:
    return true;
  case RemapBelief::NotApplied:
    return false;
  case RemapBelief::Unknown:
    break;
  }
  return std::nullopt;
}

void RemapController::request(RemapDirection direction) {
  if (!config_.enabled || !*alive_) {
    return;
  }

  if (failed_ && *failed_ != direction) {
    clear_backoff();
  }

  if (in_flight_) {
    // Последнее намерение побеждает. Совпадение с командой в полёте
    // отменяет отложенную.
    if (*in_flight_ == direction) {
      pending_.reset();
    } else {
      pending_ = direction;
    }
    return;
  }

  const RemapBelief target = direction == RemapDirection::Apply
                                 ? RemapBelief::Applied
                                 : RemapBelief::NotApplied;
  if (belief_ == target) {
    return;
  }

  if (failed_ && std::chrono::steady_clock::now() < retry_at_) {
    return;
  }

  launch(direction);
}

void RemapController::clear_backoff() noexcept {
  failed_.reset();
  failures_ = 0;
  retry_at_ = {};
}

void RemapController::launch(RemapDirection direction) {
  in_flight_ = direction;
  ++issued_;

  std::cerr << "[capswitch] Remap: " << to_string(direction) << "\n";

  std::weak_ptr<bool> alive = alive_;
  Dispatcher &dispatcher = dispatcher_;
  runner_.run_async(
      build_remap_command(config_, trigger_, direction), config_.timeout,
      [this, alive, &dispatcher, direction](CommandOutcome out) {
        dispatcher.post([this, alive, direction, out = std::move(out)] {
          auto token = alive.lock();
          if (!token || !*token) {
            return;
          }
          on_complete(direction, out);
        });
      });
}

void RemapController::on_complete(RemapDirection direction,
                                  const CommandOutcome &out) {
  in_flight_.reset();

  if (out.ok()) {
    belief_ = direction == RemapDirection::Apply ? RemapBelief::Applied
                                                 : RemapBelief::NotApplied;
    std::cerr << "[capswitch] Remap " << to_string(direction) << " done\n";
    clear_backoff();
  } else {
    if (out.timed_out) {
      // Неизвестно, успела ли утилита что-то поменять
      belief_ = RemapBelief::Unknown;
    }
    std::cerr << "[capswitch] Remap " << to_string(direction)
              << " failed (status " << out.exit_status << ")";
    if (!out.error.empty()) {
      std::cerr << ": " << out.error;
    }
    if (!out.output.empty()) {
      std::cerr << "\n[capswitch]   " << out.output;
    }
    std::cerr << "\n";

    if (failed_ != direction) {
      failures_ = 0;
    }
    failed_ = direction;
    const unsigned shift = std::min(failures_, kMaxBackoffShift);
    ++failures_;
    retry_at_ = std::chrono::steady_clock::now() +
                config_.retry_backoff * (1u << shift);

    if (on_failure_) {
      on_failure_(direction, out);
    }
  }

  if (pending_) {
    const RemapDirection next = *pending_;
    pending_.reset();
    request(next);
  }
}

bool RemapController::revert_now() {
  if (!*alive_) {
    return belief_ == RemapBelief::NotApplied;
  }
  *alive_ = false;
  pending_.reset();

  if (!config_.enabled) {
    return true;
  }
  if (!in_flight_ && belief_ == RemapBelief::NotApplied) {
    return true;
  }

  ++issued_;
  std::cerr << "[capswitch] Remap: revert (shutdown)\n";
  CommandOutcome out = runner_.run_sync(
      build_remap_command(config_, trigger_, RemapDirection::Revert),
      config_.timeout);
  in_flight_.reset();

  if (!out.ok()) {
    belief_ = RemapBelief::Unknown;
    std::cerr << "[capswitch] Remap revert failed at shutdown: "
              << (out.error.empty() ? out.output : out.error) << "\n";
    return false;
  }

  belief_ = RemapBelief::NotApplied;
  return true;
}

} // namespace capswitch
