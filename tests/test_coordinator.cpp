#include "capswitch/coordinator.hpp"

#include "fakes.hpp"

#include <linux/input-event-codes.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

[[noreturn]] void test_fail(const char *expr, const char *file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr)                                                            \
  do {                                                                         \
    if (!(expr)) {                                                             \
      test_fail(#expr, __FILE__, __LINE__);                                    \
    }                                                                          \
  } while (0)

using capswitch::Config;
using capswitch::Coordinator;
using capswitch::CoordinatorDeps;
using capswitch::ErrorKind;
using capswitch::FilterVerdict;
using capswitch::kPrefHasShownWelcome;
using capswitch::kPrefSelectedSource1;
using capswitch::kPrefSelectedSource2;
using capswitch::MemoryPreferenceStore;
using capswitch::OperationalState;
using capswitch::QueueDispatcher;
using capswitch::RederiveReason;
using capswitch::RemapBelief;
using capswitch::SelectResult;
using capswitch::test::FakeDirectory;
using capswitch::test::FakeLoginItem;
using capswitch::test::FakeOracle;
using capswitch::test::FakeRunner;
using capswitch::test::FakeTapFactory;
using capswitch::test::make_source;
using capswitch::test::RecordingObserver;

constexpr const char *kApplyLast = "keycode 66 = F18";
constexpr const char *kRevertLast = "add lock = Caps_Lock";

Config quiet_config() {
  Config config;
  // Фоновый опрос в этих тестах не должен успеть сработать
  config.permission.poll_interval = std::chrono::hours(1);
  config.remap.retry_backoff = std::chrono::milliseconds{0};
  return config;
}

/// Координатор со всеми подставными зависимостями
struct Harness {
  FakeOracle oracle;
  FakeDirectory directory;
  FakeDirectory switch_directory;
  FakeTapFactory tap_factory;
  FakeRunner runner;
  MemoryPreferenceStore preferences;
  FakeLoginItem login_item;
  QueueDispatcher main;
  QueueDispatcher background;
  RecordingObserver observer;
  std::unique_ptr<Coordinator> coordinator;

  explicit Harness(Config config = quiet_config(), bool trusted = true) {
    oracle.trusted = trusted;
    directory.sources = {make_source("us", "English (US)", 0),
                         make_source("fr", "French", 1),
                         make_source("ru", "Russian", 2)};
    switch_directory.sources = directory.sources;

    coordinator = std::make_unique<Coordinator>(CoordinatorDeps{
        std::move(config), oracle, directory, switch_directory, tap_factory,
        runner, preferences, login_item, main, background});
    coordinator->set_observer(&observer);
  }

  ~Harness() {
    if (coordinator) {
      coordinator->shutdown();
      coordinator->set_observer(nullptr);
    }
  }

  Coordinator &c() { return *coordinator; }

  int live_taps() const { return tap_factory.counters->live; }

  /// Завершает команду ремапа и доставляет результат
  void finish_remap(capswitch::CommandOutcome out = FakeRunner::success()) {
    runner.complete_next(std::move(out));
    (void)main.run_pending();
  }

  /// Доводит до Active с применённым ремапом
  void make_active() {
    c().launch();
    (void)c().select_source("us");
    (void)c().select_source("fr");
    CHECK(c().state() == OperationalState::Active);
    finish_remap();
    CHECK(c().remap().belief() == RemapBelief::Applied);
  }
};

void test_scenario_launch_configuring() {
  Harness h;
  h.c().launch();

  CHECK(h.c().state() == OperationalState::Configuring);
  CHECK(h.c().snapshot().resolved_count == 0);
  CHECK(h.c().tap_active());
  CHECK(h.live_taps() == 1);
  CHECK(h.tap_factory.last_trigger == KEY_CAPSLOCK);
  CHECK(h.runner.calls.empty());
  CHECK(h.c().remap().belief() == RemapBelief::NotApplied);
  CHECK(h.observer.last.state == OperationalState::Configuring);
  CHECK(h.observer.guidance == 0);
}

void test_scenario_select_two_becomes_active() {
  Harness h;
  h.c().launch();

  CHECK(h.c().select_source("us") == SelectResult::AssignedFirst);
  CHECK(h.c().state() == OperationalState::Configuring);
  CHECK(h.runner.calls.empty());

  CHECK(h.c().select_source("fr") == SelectResult::AssignedSecond);
  CHECK(h.c().state() == OperationalState::Active);
  CHECK(h.c().snapshot().resolved_count == 2);
  CHECK(h.runner.calls.size() == 1);
  CHECK(h.runner.last_expr(0) == kApplyLast);

  // Повторные пересчёты не выдают новых команд
  h.c().refresh();
  h.c().menu_will_open();
  CHECK(h.runner.calls.size() == 1);
  CHECK(h.live_taps() == 1);

  CHECK(h.preferences.get(kPrefSelectedSource1) == "us");
  CHECK(h.preferences.get(kPrefSelectedSource2) == "fr");
}

void test_scenario_permission_revoked_while_active() {
  Config config = quiet_config();
  config.permission.poll_interval = std::chrono::milliseconds(10);
  Harness h{config};
  h.make_active();
  const int guidance_before = h.observer.guidance;

  // Следующий опрос монитора замечает потерю доступа
  h.oracle.trusted = false;
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (h.c().state() != OperationalState::PermissionsRequired &&
         std::chrono::steady_clock::now() < deadline) {
    (void)h.main.run_for(std::chrono::milliseconds(20));
  }

  CHECK(h.c().state() == OperationalState::PermissionsRequired);
  CHECK(!h.c().tap_active());
  CHECK(h.live_taps() == 0);
  CHECK(h.runner.calls.size() == 2);
  CHECK(h.runner.last_expr(1) == kRevertLast);
  CHECK(h.observer.guidance == guidance_before + 1);
  CHECK(h.c().gate().state() == OperationalState::PermissionsRequired);
}

void test_scenario_deselect_returns_to_configuring() {
  Harness h;
  h.make_active();

  CHECK(h.c().deselect_source("fr"));
  CHECK(h.c().state() == OperationalState::Configuring);
  CHECK(h.c().snapshot().resolved_count == 1);
  CHECK(h.runner.calls.size() == 2);
  CHECK(h.runner.last_expr(1) == kRevertLast);
  // Перехват остаётся: в Configuring он нужен для подсказки
  CHECK(h.live_taps() == 1);

  h.c().refresh();
  CHECK(h.runner.calls.size() == 2);
}

void test_launch_without_permission() {
  Harness h{quiet_config(), /*trusted=*/false};
  h.c().launch();

  CHECK(h.c().state() == OperationalState::PermissionsRequired);
  CHECK(!h.c().tap_active());
  CHECK(h.tap_factory.attempts == 0);
  CHECK(h.observer.guidance == 1);
  CHECK(h.observer.guidance_requested == 0);
  CHECK(h.oracle.prompts == 1);
  CHECK(h.runner.calls.empty());

  // Без изменений инструкция не повторяется
  h.c().refresh();
  CHECK(h.observer.guidance == 1);

  // Доступ выдан: перехват создаётся, показывается приветствие
  h.oracle.trusted = true;
  h.c().menu_will_open();
  CHECK(h.c().state() == OperationalState::Configuring);
  CHECK(h.live_taps() == 1);
  CHECK(h.observer.welcome == 1);
}

void test_user_requested_guidance() {
  Harness h{quiet_config(), /*trusted=*/false};
  h.c().launch();
  h.c().request_permission_guidance();
  CHECK(h.observer.guidance_requested == 1);
  CHECK(h.oracle.prompts == 2);
}

void test_tap_failure_demotes_to_permissions_required() {
  Harness h;
  h.tap_factory.fail = true;
  h.c().launch();

  CHECK(h.c().state() == OperationalState::PermissionsRequired);
  CHECK(!h.c().tap_active());
  CHECK(h.observer.guidance == 1);

  // Повторная неудача не показывает инструкцию снова
  h.c().refresh();
  CHECK(h.tap_factory.attempts == 2);
  CHECK(h.observer.guidance == 1);

  h.tap_factory.fail = false;
  h.c().refresh();
  CHECK(h.c().state() == OperationalState::Configuring);
  CHECK(h.live_taps() == 1);
}

void test_welcome_shown_once() {
  {
    Harness h;
    h.c().launch();
    CHECK(h.observer.welcome == 1);
    CHECK(h.preferences.get(kPrefHasShownWelcome) == "true");
    h.c().refresh();
    CHECK(h.observer.welcome == 1);

    h.c().show_welcome_guide();
    CHECK(h.observer.welcome == 2);
  }

  Harness again;
  (void)again.preferences.set(kPrefHasShownWelcome, "true");
  again.c().launch();
  CHECK(again.observer.welcome == 0);
}

void test_trigger_switches_layouts_when_active() {
  Harness h;
  h.make_active();

  h.switch_directory.current = "us";
  CHECK(h.tap_factory.press(KEY_CAPSLOCK) == FilterVerdict::Consume);
  CHECK(h.switch_directory.activations.back() == "fr");

  CHECK(h.tap_factory.press(KEY_CAPSLOCK) == FilterVerdict::Consume);
  CHECK(h.switch_directory.activations.back() == "us");

  CHECK(h.tap_factory.press(KEY_A) == FilterVerdict::PassThrough);
}

void test_configuration_hint_round_trip() {
  Harness h;
  h.c().launch();

  CHECK(h.tap_factory.press(KEY_CAPSLOCK) == FilterVerdict::PassThrough);
  CHECK(h.tap_factory.press(KEY_CAPSLOCK) == FilterVerdict::PassThrough);
  (void)h.main.run_pending();
  CHECK(h.observer.configuration_needed == 1);

  h.c().acknowledge_configuration_hint();
  (void)h.tap_factory.press(KEY_CAPSLOCK);
  (void)h.main.run_pending();
  CHECK(h.observer.configuration_needed == 2);
}

void test_switch_failure_rederives() {
  Harness h;
  h.make_active();

  // Раскладка исчезла из системы, переключение не удаётся
  h.directory.sources.pop_back();
  h.directory.sources.erase(h.directory.sources.begin() + 1);
  h.switch_directory.activate_ok = false;
  h.switch_directory.current = "us";

  CHECK(h.tap_factory.press(KEY_CAPSLOCK) == FilterVerdict::Consume);
  (void)h.main.run_pending();

  CHECK(h.c().state() == OperationalState::Configuring);
  CHECK(h.c().snapshot().resolved_count == 1);
  CHECK(h.runner.calls.size() == 2);
  CHECK(h.runner.last_expr(1) == kRevertLast);
}

void test_selection_rejected_and_menu_entries() {
  Harness h;
  h.make_active();

  CHECK(h.c().select_source("ru") == SelectResult::Rejected);
  CHECK(h.observer.rejected == 1);
  CHECK(h.c().state() == OperationalState::Active);

  const auto s = h.c().snapshot();
  CHECK(s.sources.size() == 3);
  CHECK(s.sources[0].selected && s.sources[0].enabled);
  CHECK(s.sources[1].selected && s.sources[1].enabled);
  CHECK(!s.sources[2].selected && !s.sources[2].enabled);
  CHECK(s.selected_names.size() == 2);
  CHECK(s.selected_names[0] == "English (US)");
  CHECK(capswitch::status_line(s) == "Switcher: Active");
}

void test_status_lines() {
  Harness h;
  h.c().launch();
  CHECK(capswitch::status_line(h.c().snapshot()) == "Select 2 layouts...");
  (void)h.c().select_source("ru");
  CHECK(capswitch::status_line(h.c().snapshot()) ==
        "Select 1 more layout...");

  Harness denied{quiet_config(), false};
  denied.c().launch();
  CHECK(capswitch::status_line(denied.c().snapshot()) ==
        "Permissions are required");
}

void test_remap_failure_reported_once() {
  Harness h;
  h.c().launch();
  (void)h.c().select_source("us");
  (void)h.c().select_source("fr");

  h.finish_remap(FakeRunner::failure(1));
  CHECK(h.observer.errors.size() == 1);
  CHECK(h.observer.errors[0].first == ErrorKind::RemapCommandFailed);

  // Следующий пересчёт повторяет apply, но ошибку не показывает снова
  h.c().refresh();
  CHECK(h.runner.calls.size() == 2);
  h.finish_remap(FakeRunner::failure(1));
  CHECK(h.observer.errors.size() == 1);

  h.c().refresh();
  h.finish_remap();
  CHECK(h.c().remap().belief() == RemapBelief::Applied);
}

void test_remap_failure_is_not_retried_on_every_refresh() {
  Config config = quiet_config();
  config.remap.retry_backoff = std::chrono::hours(1);
  Harness h{config};
  h.c().launch();
  (void)h.c().select_source("us");
  (void)h.c().select_source("fr");
  h.finish_remap(FakeRunner::failure(127));

  for (int i = 0; i < 5; ++i) {
    h.c().refresh();
  }
  CHECK(h.runner.calls.size() == 1);
  CHECK(h.observer.errors.size() == 1);
  CHECK(h.c().state() == OperationalState::Active);

  // Настоящая смена состояния повторяет команду сразу
  CHECK(h.c().deselect_source("fr"));
  CHECK(h.c().state() == OperationalState::Configuring);
  CHECK(h.runner.calls.size() == 1);
  (void)h.c().select_source("fr");
  CHECK(h.runner.calls.size() == 2);
  CHECK(h.runner.last_expr(1) == kApplyLast);
  h.finish_remap();
  CHECK(h.c().remap().belief() == RemapBelief::Applied);
}

void test_launch_at_login() {
  Harness h;
  h.c().launch();
  CHECK(!h.c().snapshot().launch_at_login);

  h.c().set_launch_at_login(true);
  CHECK(h.observer.login_results.empty());
  (void)h.background.run_pending();
  (void)h.main.run_pending();

  CHECK(h.observer.login_results.size() == 1);
  CHECK(h.observer.login_results[0].first);
  CHECK(h.observer.login_results[0].second.empty());
  CHECK(h.c().snapshot().launch_at_login);

  h.login_item.fail = true;
  h.c().set_launch_at_login(false);
  (void)h.background.run_pending();
  (void)h.main.run_pending();
  CHECK(h.observer.login_results.size() == 2);
  CHECK(h.observer.login_results[1].first);
  CHECK(!h.observer.login_results[1].second.empty());
  CHECK(h.c().snapshot().launch_at_login);
  // Наблюдатель видит реальное значение, а не запрошенное
  CHECK(h.observer.last.launch_at_login);
}

void test_shutdown_reverts_and_removes_tap() {
  Harness h;
  h.make_active();

  h.c().shutdown();
  CHECK(h.c().is_shut_down());
  CHECK(h.live_taps() == 0);
  CHECK(h.runner.sync_calls.size() == 1);
  CHECK(h.runner.sync_calls[0].back() == kRevertLast);
  CHECK(h.c().gate().state() == OperationalState::PermissionsRequired);

  // После остановки ничего не происходит
  h.c().refresh();
  h.c().request_rederive(RederiveReason::Refresh);
  (void)h.main.run_pending();
  CHECK(h.tap_factory.counters->created == 1);
  CHECK(h.runner.calls.size() == 1);

  h.c().shutdown();
  CHECK(h.runner.sync_calls.size() == 1);
}

void test_unavailable_directory() {
  Harness h;
  h.make_active();

  h.directory.unavailable = true;
  h.c().refresh();
  CHECK(h.c().state() == OperationalState::Configuring);
  CHECK(h.c().snapshot().sources.empty());

  h.directory.unavailable = false;
  h.c().refresh();
  CHECK(h.c().state() == OperationalState::Active);
}

} // namespace

#undef CHECK

int main() {
  test_scenario_launch_configuring();
  test_scenario_select_two_becomes_active();
  test_scenario_permission_revoked_while_active();
  test_scenario_deselect_returns_to_configuring();
  test_launch_without_permission();
  test_user_requested_guidance();
  test_tap_failure_demotes_to_permissions_required();
  test_welcome_shown_once();
  test_trigger_switches_layouts_when_active();
  test_configuration_hint_round_trip();
  test_switch_failure_rederives();
  test_selection_rejected_and_menu_entries();
  test_status_lines();
  test_remap_failure_reported_once();
  test_remap_failure_is_not_retried_on_every_refresh();
  test_launch_at_login();
  test_shutdown_reverts_and_removes_tap();
  test_unavailable_directory();

  std::cout << "OK\n";
  return 0;
}
