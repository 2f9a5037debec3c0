/**
 * @file remap_controller.hpp
 * @brief Идемпотентное включение/снятие системного ремапа клавиши-триггера
 *
 * В Active клавиша переназначается на keysym-заглушку, чтобы нажатие,
 * просочившееся мимо перехвата, не включило Caps Lock. Вне Active
 * родное поведение восстанавливается явной командой.
 *
 * Все методы вызываются в координирующем контексте. Команды исполняет
 * CommandRunner в своём потоке; результат возвращается через Dispatcher.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "capswitch/command_runner.hpp"
#include "capswitch/config.hpp"
#include "capswitch/dispatcher.hpp"
#include "capswitch/types.hpp"

namespace capswitch {

enum class RemapDirection { Apply, Revert };

/// Что контроллер знает о системном ремапе
enum class RemapBelief { NotApplied, Applied, Unknown };

[[nodiscard]] constexpr std::string_view
to_string(RemapDirection direction) noexcept {
  return direction == RemapDirection::Apply ? "apply" : "revert";
}

[[nodiscard]] constexpr std::string_view to_string(RemapBelief belief) noexcept {
  switch (belief) {
  case RemapBelief::NotApplied:
    return "not applied";
  case RemapBelief::Applied:
    return "applied";
  case RemapBelief::Unknown:
    return "unknown";
  }
  return "unknown";
}

/**
 * @brief Строит argv утилиты для направления
 *
 * Обе команды идемпотентны: apply сначала возвращает родной keysym (чтобы
 * его можно было убрать из модификатора), revert явно отображает клавишу
 * саму на себя и возвращает её в модификатор.
 */
[[nodiscard]] std::vector<std::string>
build_remap_command(const RemapConfig &config, ScanCode trigger,
                    RemapDirection direction);

class RemapController {
public:
  /// Вызывается в координирующем контексте при неуспехе команды
  using FailureCallback =
      std::function<void(RemapDirection, const CommandOutcome &)>;

  RemapController(RemapConfig config, ScanCode trigger, CommandRunner &runner,
                  Dispatcher &dispatcher);

  RemapController(const RemapController &) = delete;
  RemapController &operator=(const RemapController &) = delete;

  void apply() { request(RemapDirection::Apply); }
  void revert() { request(RemapDirection::Revert); }

  /**
   * @brief Куда движется ремап
   *
   * Учитывает отложенную команду, затем команду в полёте, затем убеждение.
   * nullopt — состояние неизвестно, следующий запрос выполнится в любом
   * направлении. Пауза после ошибки на heading() не влияет.
   */
  [[nodiscard]] std::optional<bool> heading() const noexcept;

  [[nodiscard]] RemapBelief belief() const noexcept { return belief_; }
  [[nodiscard]] bool busy() const noexcept { return in_flight_.has_value(); }
  [[nodiscard]] bool enabled() const noexcept { return config_.enabled; }

  /// Сколько команд было запущено (для диагностики и тестов)
  [[nodiscard]] std::size_t commands_issued() const noexcept {
    return issued_;
  }

  /// Снимает паузу после ошибки: следующий запрос выполнится сразу
  void clear_backoff() noexcept;

  void set_failure_callback(FailureCallback cb) {
    on_failure_ = std::move(cb);
  }

  /**
   * @brief Синхронный откат при завершении
   *
   * Выполняется после команды в полёте (общая очередь раннера). После вызова
   * результаты ранее запущенных команд игнорируются.
   * @return true если ремап снят или не был применён
   */
  bool revert_now();

private:
  void request(RemapDirection direction);
  void launch(RemapDirection direction);
  void on_complete(RemapDirection direction, const CommandOutcome &out);

  RemapConfig config_;
  ScanCode trigger_;
  CommandRunner &runner_;
  Dispatcher &dispatcher_;
  FailureCallback on_failure_;

  RemapBelief belief_ = RemapBelief::NotApplied;
  std::optional<RemapDirection> in_flight_;
  std::optional<RemapDirection> pending_;
  std::size_t issued_ = 0;

  /// Направление последней неудавшейся команды и когда её можно повторить.
  /// Запрос противоположного направления сбрасывает паузу.
  std::optional<RemapDirection> failed_;
  std::chrono::steady_clock::time_point retry_at_{};
  unsigned failures_ = 0;

  /// Завершения, пришедшие после revert_now() или разрушения, отбрасываются
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace capswitch
