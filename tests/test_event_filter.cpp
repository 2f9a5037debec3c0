#include "capswitch/event_filter.hpp"

#include "fakes.hpp"

#include <linux/input-event-codes.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

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

using capswitch::ErrorKind;
using capswitch::EventFilter;
using capswitch::FilterVerdict;
using capswitch::KeyEvent;
using capswitch::KeyState;
using capswitch::OperationalState;
using capswitch::PermissionFlag;
using capswitch::ScanCode;
using capswitch::SwitchGate;
using capswitch::SwitchTargets;
using capswitch::test::FakeDirectory;
using capswitch::test::make_source;

constexpr ScanCode kTrigger = KEY_CAPSLOCK;

/// Фильтр со всем окружением
struct Harness {
  PermissionFlag permission;
  SwitchGate gate;
  FakeDirectory directory;
  int permission_lost = 0;
  int configuration_needed = 0;
  std::vector<ErrorKind> failures;
  std::unique_ptr<EventFilter> filter;

  Harness() {
    directory.sources = {make_source("A", "Alpha", 0),
                         make_source("B", "Beta", 1),
                         make_source("C", "Gamma", 2)};

    EventFilter::Hooks hooks;
    hooks.permission_lost = [this] { ++permission_lost; };
    hooks.configuration_needed = [this] { ++configuration_needed; };
    hooks.switch_failed = [this](ErrorKind kind) { failures.push_back(kind); };
    filter = std::make_unique<EventFilter>(kTrigger, permission, gate,
                                           directory, std::move(hooks));
  }

  void make_active() {
    permission.store(true);
    gate.publish(OperationalState::Active, SwitchTargets{0, 1});
  }

  FilterVerdict press(ScanCode code = kTrigger,
                      KeyState state = KeyState::Press) {
    return filter->on_key(KeyEvent{code, state});
  }
};

void test_other_keys_pass_through() {
  Harness h;
  h.make_active();

  CHECK(h.press(KEY_A) == FilterVerdict::PassThrough);
  CHECK(h.press(KEY_LEFTSHIFT) == FilterVerdict::PassThrough);
  CHECK(h.directory.activations.empty());
}

void test_release_and_repeat_pass_through() {
  Harness h;
  h.make_active();

  CHECK(h.press(kTrigger, KeyState::Release) == FilterVerdict::PassThrough);
  CHECK(h.press(kTrigger, KeyState::Repeat) == FilterVerdict::PassThrough);
  CHECK(h.directory.activations.empty());
}

void test_fail_open_without_permission() {
  Harness h;
  h.make_active();
  h.permission.store(false);

  // Сколько бы нажатий ни пришло, триггер не поглощается
  for (int i = 0; i < 5; ++i) {
    CHECK(h.press() == FilterVerdict::PassThrough);
  }
  CHECK(h.directory.activations.empty());

  // Запрос пересчёта уходит один раз до подтверждения
  CHECK(h.permission_lost == 1);
  h.filter->acknowledge_permission_lost();
  CHECK(h.press() == FilterVerdict::PassThrough);
  CHECK(h.permission_lost == 2);
}

void test_never_activates_outside_active() {
  Harness h;
  h.permission.store(true);

  h.gate.publish(OperationalState::Configuring, std::nullopt);
  CHECK(h.press() == FilterVerdict::PassThrough);
  CHECK(h.press() == FilterVerdict::PassThrough);

  h.gate.publish(OperationalState::PermissionsRequired, std::nullopt);
  CHECK(h.press() == FilterVerdict::PassThrough);

  CHECK(h.directory.activations.empty());
  CHECK(h.failures.empty());
}

void test_configuration_hint_is_throttled() {
  Harness h;
  h.permission.store(true);
  h.gate.publish(OperationalState::Configuring, std::nullopt);

  (void)h.press();
  (void)h.press();
  (void)h.press();
  CHECK(h.configuration_needed == 1);

  h.filter->acknowledge_configuration_needed();
  (void)h.press();
  CHECK(h.configuration_needed == 2);

  // Подсказку можно выключить совсем
  h.filter->acknowledge_configuration_needed();
  h.filter->set_configure_hint(false);
  (void)h.press();
  CHECK(h.configuration_needed == 2);
}

void test_switch_determinism() {
  Harness h;
  h.make_active();

  h.directory.current = "A";
  CHECK(h.press() == FilterVerdict::Consume);
  CHECK(h.directory.activations.back() == "B");

  h.directory.current = "B";
  CHECK(h.press() == FilterVerdict::Consume);
  CHECK(h.directory.activations.back() == "A");

  // Невыбранная раскладка ведёт на слот 1
  h.directory.current = "C";
  CHECK(h.press() == FilterVerdict::Consume);
  CHECK(h.directory.activations.back() == "A");

  CHECK(h.directory.activations.size() == 3);
  CHECK(h.failures.empty());
}

void test_unknown_current_layout_goes_to_first_and_reports() {
  Harness h;
  h.make_active();

  // Текущую узнать не удалось: переключаемся на слот 1 и сообщаем
  h.directory.current.reset();
  CHECK(h.press() == FilterVerdict::Consume);
  CHECK(h.directory.activations.back() == "A");
  CHECK(h.failures.size() == 1);
  CHECK(h.failures[0] == ErrorKind::SwitchFailed);

  // Следующее нажатие видит A и идёт на B без ошибок
  CHECK(h.press() == FilterVerdict::Consume);
  CHECK(h.directory.activations.back() == "B");
  CHECK(h.failures.size() == 1);
}

void test_repeated_presses_toggle() {
  Harness h;
  h.make_active();
  h.directory.current = "A";

  (void)h.press();
  (void)h.press();
  (void)h.press();
  CHECK(h.directory.activations.size() == 3);
  CHECK(h.directory.activations[0] == "B");
  CHECK(h.directory.activations[1] == "A");
  CHECK(h.directory.activations[2] == "B");
}

void test_consume_on_attempt() {
  Harness h;
  h.make_active();
  h.directory.current = "A";
  h.directory.activate_ok = false;

  CHECK(h.press() == FilterVerdict::Consume);
  CHECK(h.press() == FilterVerdict::Consume);
  CHECK(h.failures.size() == 2);
  CHECK(h.failures[0] == ErrorKind::SwitchFailed);
}

void test_active_without_targets_consumes() {
  Harness h;
  h.permission.store(true);
  h.gate.publish(OperationalState::Active, std::nullopt);

  CHECK(h.press() == FilterVerdict::Consume);
  CHECK(h.directory.activations.empty());
  CHECK(h.failures.size() == 1);
  CHECK(h.failures[0] == ErrorKind::SourceUnavailable);
}

void test_gate_replaces_targets_atomically() {
  Harness h;
  h.make_active();

  h.gate.publish(OperationalState::Active, SwitchTargets{2, 0});

  h.directory.current = "C";
  CHECK(h.press() == FilterVerdict::Consume);
  CHECK(h.directory.activations.back() == "A");

  const auto [state, seen] = h.gate.load();
  CHECK(state == OperationalState::Active);
  CHECK(seen.has_value());
  CHECK(seen->first_group == 2);
  CHECK(seen->second_group == 0);

  // Вне Active цели не публикуются
  h.gate.publish(OperationalState::Configuring, std::nullopt);
  CHECK(h.gate.state() == OperationalState::Configuring);
  CHECK(!h.gate.targets().has_value());
}

void test_gate_rejects_invalid_groups() {
  SwitchGate gate;
  CHECK(gate.state() == OperationalState::PermissionsRequired);
  CHECK(!gate.targets().has_value());

  gate.publish(OperationalState::Active, SwitchTargets{-1, 1});
  CHECK(gate.state() == OperationalState::Active);
  CHECK(!gate.targets().has_value());

  gate.publish(OperationalState::Active, SwitchTargets{3, 1});
  CHECK((gate.targets() == SwitchTargets{3, 1}));
}

} // namespace

#undef CHECK

int main() {
  test_other_keys_pass_through();
  test_release_and_repeat_pass_through();
  test_fail_open_without_permission();
  test_never_activates_outside_active();
  test_configuration_hint_is_throttled();
  test_switch_determinism();
  test_unknown_current_layout_goes_to_first_and_reports();
  test_repeated_presses_toggle();
  test_consume_on_attempt();
  test_active_without_targets_consumes();
  test_gate_replaces_targets_atomically();
  test_gate_rejects_invalid_groups();

  std::cout << "OK\n";
  return 0;
}
