/**
 * @file event_filter.hpp
 * @brief Решение по каждому нажатию клавиши-триггера (горячий путь)
 *
 * Вызывается в потоке перехвата на каждое событие. Не блокируется, не пишет
 * в лог, не трогает состояние координатора. Видит только:
 * - код триггера,
 * - флаг доступа (спин-лок),
 * - опубликованное координатором состояние и цели переключения (атомики),
 * - порт активации раскладки,
 * - хуки, которые только постят задачи в координирующий контекст.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

#include "capswitch/input_source_directory.hpp"
#include "capswitch/permission_monitor.hpp"
#include "capswitch/types.hpp"

namespace capswitch {

/// Цели переключения: XKB группы слотов 1 и 2
struct SwitchTargets {
  int first_group = -1;
  int second_group = -1;

  bool operator==(const SwitchTargets &) const = default;
};

/**
 * @brief Публикация состояния для потока перехвата
 *
 * Пишет координатор, читает фильтр. Состояние и обе группы упакованы в одно
 * атомарное слово, поэтому фильтр всегда видит согласованную тройку без
 * блокировок и без выделения памяти.
 */
class SwitchGate {
public:
  SwitchGate() = default;

  SwitchGate(const SwitchGate &) = delete;
  SwitchGate &operator=(const SwitchGate &) = delete;

  /// targets имеют смысл только для Active
  void publish(OperationalState state,
               std::optional<SwitchTargets> targets) noexcept {
    word_.store(pack(state, targets), std::memory_order_release);
  }

  [[nodiscard]] OperationalState state() const noexcept {
    return unpack_state(word_.load(std::memory_order_acquire));
  }

  [[nodiscard]] std::optional<SwitchTargets> targets() const noexcept {
    return unpack_targets(word_.load(std::memory_order_acquire));
  }

  /// Состояние и цели одним чтением
  [[nodiscard]] std::pair<OperationalState, std::optional<SwitchTargets>>
  load() const noexcept {
    const std::uint32_t word = word_.load(std::memory_order_acquire);
    return {unpack_state(word), unpack_targets(word)};
  }

private:
  // Биты 0-7: состояние, 8-15: группа слота 1 + 1, 16-23: группа слота 2 + 1.
  // Ноль в поле группы означает "целей нет".
  static constexpr std::uint32_t kByte = 0xFF;

  [[nodiscard]] static std::uint32_t
  pack(OperationalState state,
       const std::optional<SwitchTargets> &targets) noexcept {
    std::uint32_t word = static_cast<std::uint32_t>(state) & kByte;
    if (targets && targets->first_group >= 0 && targets->second_group >= 0 &&
        targets->first_group < static_cast<int>(kByte) &&
        targets->second_group < static_cast<int>(kByte)) {
      word |= (static_cast<std::uint32_t>(targets->first_group) + 1) << 8;
      word |= (static_cast<std::uint32_t>(targets->second_group) + 1) << 16;
    }
    return word;
  }

  [[nodiscard]] static OperationalState
  unpack_state(std::uint32_t word) noexcept {
    return static_cast<OperationalState>(word & kByte);
  }

  [[nodiscard]] static std::optional<SwitchTargets>
  unpack_targets(std::uint32_t word) noexcept {
    const std::uint32_t first = (word >> 8) & kByte;
    const std::uint32_t second = (word >> 16) & kByte;
    if (first == 0 || second == 0) {
      return std::nullopt;
    }
    return SwitchTargets{static_cast<int>(first) - 1,
                         static_cast<int>(second) - 1};
  }

  static_assert(std::atomic<std::uint32_t>::is_always_lock_free);

  std::atomic<std::uint32_t> word_{
      static_cast<std::uint32_t>(OperationalState::PermissionsRequired)};
};

class EventFilter {
public:
  /// Хуки вызываются в потоке перехвата и обязаны только постить задачу
  struct Hooks {
    /// Флаг доступа false, а событие пришло: нужен пересчёт состояния
    std::function<void()> permission_lost;
    /// Нажатие в Configuring: подсказать выбрать раскладки
    std::function<void()> configuration_needed;
    /// Переключение не удалось (событие всё равно поглощено)
    std::function<void(ErrorKind)> switch_failed;
  };

  EventFilter(ScanCode trigger, const PermissionFlag &permission,
              const SwitchGate &gate, InputSourceDirectory &directory,
              Hooks hooks);

  EventFilter(const EventFilter &) = delete;
  EventFilter &operator=(const EventFilter &) = delete;

  /**
   * @brief Решение по событию
   *
   * 1. Не триггер или не нажатие -> PassThrough.
   * 2. Нет доступа -> PassThrough + один запрос пересчёта.
   * 3. Не Active -> PassThrough + одна подсказка.
   * 4. Active -> переключение на "другую" раскладку, Consume даже при ошибке.
   */
  [[nodiscard]] FilterVerdict on_key(const KeyEvent &event);

  [[nodiscard]] ScanCode trigger() const noexcept { return trigger_; }

  /// Координатор обработал запрос пересчёта, можно слать следующий
  void acknowledge_permission_lost() noexcept {
    permission_lost_sent_.store(false, std::memory_order_release);
  }

  /// Подсказка показана и закрыта, можно показывать снова
  void acknowledge_configuration_needed() noexcept {
    configuration_hint_sent_.store(false, std::memory_order_release);
  }

  void set_configure_hint(bool enabled) noexcept {
    configure_hint_.store(enabled, std::memory_order_relaxed);
  }

private:
  void switch_layout(const SwitchTargets &targets);

  const ScanCode trigger_;
  const PermissionFlag &permission_;
  const SwitchGate &gate_;
  InputSourceDirectory &directory_;
  Hooks hooks_;

  std::atomic<bool> permission_lost_sent_{false};
  std::atomic<bool> configuration_hint_sent_{false};
  std::atomic<bool> configure_hint_{true};
};

} // namespace capswitch
