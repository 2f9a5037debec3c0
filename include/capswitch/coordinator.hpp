/**
 * @file coordinator.hpp
 * @brief Координатор: пересчёт состояния и его побочные эффекты
 *
 * Единственный владелец регистрации перехвата, контроллера ремапа и
 * выбора раскладок. Все методы, кроме request_rederive(), вызываются в
 * координирующем контексте (главный цикл GLib или очередь headless режима).
 * Пересчёты выполняются строго последовательно.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "capswitch/autostart.hpp"
#include "capswitch/command_runner.hpp"
#include "capswitch/config.hpp"
#include "capswitch/dispatcher.hpp"
#include "capswitch/event_filter.hpp"
#include "capswitch/event_tap.hpp"
#include "capswitch/input_source_directory.hpp"
#include "capswitch/permission_monitor.hpp"
#include "capswitch/preference_store.hpp"
#include "capswitch/remap_controller.hpp"
#include "capswitch/selection_manager.hpp"
#include "capswitch/state_machine.hpp"
#include "capswitch/types.hpp"

namespace capswitch {

/// Что запустило пересчёт (для логов и выбора текста подсказки)
enum class RederiveReason {
  Launch,
  MenuOpened,
  SelectionChanged,
  PermissionChanged,
  PermissionLost,
  SourceUnavailable,
  Refresh
};

[[nodiscard]] std::string_view to_string(RederiveReason reason) noexcept;

/// Снимок для UI
struct StatusSnapshot {
  struct SourceEntry {
    InputSourceDescriptor source;
    bool selected = false;
    /// Пункт меню активен (при двух выбранных — только выбранные)
    bool enabled = true;
  };

  OperationalState state = OperationalState::PermissionsRequired;
  bool has_permission = false;
  bool tap_active = false;
  std::size_t resolved_count = 0;
  std::vector<SourceEntry> sources;
  /// Имена разрешённых слотов в порядке слотов
  std::vector<std::string> selected_names;
  bool launch_at_login = false;
  RemapBelief remap = RemapBelief::NotApplied;
  bool remap_busy = false;
};

/// Строка статуса для меню ("Switcher: Active" и т.п.)
[[nodiscard]] std::string status_line(const StatusSnapshot &snapshot);

/**
 * @brief Получатель уведомлений координатора
 *
 * Вызывается в координирующем контексте. Модальные окна реализация
 * показывает сама, не более одного одновременно.
 */
class StatusObserver {
public:
  virtual ~StatusObserver() = default;

  virtual void on_status_changed(const StatusSnapshot &snapshot) = 0;

  /// @param user_requested Пользователь сам открыл инструкцию из меню
  virtual void on_permission_guidance(bool user_requested) = 0;

  virtual void on_welcome() = 0;

  /// Нажатие триггера до выбора двух раскладок. Реализация должна вызвать
  /// Coordinator::acknowledge_configuration_hint(), когда подсказка закрыта.
  virtual void on_configuration_needed() = 0;

  /// Обе ячейки заняты, выбор отклонён
  virtual void on_selection_rejected() = 0;

  virtual void on_error(ErrorKind kind, const std::string &detail) = 0;

  /// Результат изменения автозапуска (error пуст при успехе)
  virtual void on_launch_at_login_changed(bool enabled,
                                          const std::string &error) = 0;
};

/// Внешние зависимости координатора
struct CoordinatorDeps {
  Config config;
  PermissionOracle &oracle;
  /// Каталог для списков раскладок (координирующий контекст)
  InputSourceDirectory &directory;
  /// Каталог для переключения (поток перехвата)
  InputSourceDirectory &switch_directory;
  EventTapFactory &tap_factory;
  CommandRunner &runner;
  PreferenceStore &preferences;
  LoginItem &login_item;
  /// Координирующий контекст
  Dispatcher &main;
  /// Фоновые блокирующие операции (автозапуск)
  Dispatcher &background;
};

class Coordinator {
public:
  explicit Coordinator(CoordinatorDeps deps);
  ~Coordinator();

  Coordinator(const Coordinator &) = delete;
  Coordinator &operator=(const Coordinator &) = delete;

  /// Наблюдатель должен пережить координатор или быть снят (nullptr)
  void set_observer(StatusObserver *observer) noexcept {
    observer_ = observer;
  }

  /// Первый пересчёт и запуск фонового опроса прав
  void launch();

  /**
   * @brief Остановка
   *
   * Останавливает опрос, снимает перехват, синхронно откатывает ремап.
   * Повторный вызов ничего не делает.
   */
  void shutdown();

  /// Потокобезопасно: ставит пересчёт в координирующий контекст
  void request_rederive(RederiveReason reason);

  /// Полный пересчёт состояния и приведение системы к нему
  void rederive(RederiveReason reason);

  [[nodiscard]] SelectResult select_source(std::string_view id);
  bool deselect_source(std::string_view id);

  void refresh() { rederive(RederiveReason::Refresh); }
  void menu_will_open() { rederive(RederiveReason::MenuOpened); }

  /// Пункт меню "Show Permissions Guide"
  void request_permission_guidance();

  /// Пункт меню "Show Welcome Guide"
  void show_welcome_guide();

  /// Подсказка о настройке закрыта, следующая может быть показана
  void acknowledge_configuration_hint();

  /// Включает/выключает автозапуск в фоне; результат придёт наблюдателю
  void set_launch_at_login(bool enabled);

  [[nodiscard]] StatusSnapshot snapshot() const;

  [[nodiscard]] OperationalState state() const noexcept { return state_; }
  [[nodiscard]] bool tap_active() const noexcept { return tap_ != nullptr; }
  [[nodiscard]] bool is_shut_down() const noexcept { return shut_down_; }

  [[nodiscard]] const PermissionFlag &permission_flag() const noexcept {
    return permission_;
  }
  [[nodiscard]] const SwitchGate &gate() const noexcept { return gate_; }
  [[nodiscard]] const RemapController &remap() const noexcept {
    return remap_;
  }
  [[nodiscard]] const SelectionManager &selection() const noexcept {
    return selection_;
  }

private:
  void rederive_once(RederiveReason reason);
  [[nodiscard]] bool create_tap(std::string &error);
  void destroy_tap();
  void publish_gate(OperationalState next, const SlotResolution &res);
  void maybe_show_welcome();
  void notify_status();

  /// Постит задачу в координирующий контекст, пока координатор жив
  void post_main(Task task);

  void handle_switch_failure(ErrorKind kind);
  void handle_remap_failure(RemapDirection direction,
                            const CommandOutcome &out);

  CoordinatorDeps deps_;
  StatusObserver *observer_ = nullptr;

  PermissionFlag permission_;
  SwitchGate gate_;
  SelectionManager selection_;
  RemapController remap_;
  PermissionMonitor monitor_;
  std::shared_ptr<EventFilter> filter_;
  std::unique_ptr<EventTap> tap_;

  OperationalState state_ = OperationalState::PermissionsRequired;
  bool launched_ = false;
  bool shut_down_ = false;
  bool launch_at_login_ = false;

  /// Ошибка регистрации перехвата уже показана (сбрасывается при успехе)
  bool tap_failure_reported_ = false;
  /// Ошибка ремапа уже показана (сбрасывается, когда ремап сошёлся)
  bool remap_failure_reported_ = false;

  bool in_rederive_ = false;
  bool rederive_again_ = false;
  RederiveReason again_reason_ = RederiveReason::Refresh;

  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace capswitch
