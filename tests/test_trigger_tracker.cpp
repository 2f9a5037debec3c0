#include "capswitch/trigger_tracker.hpp"

#include <cstdlib>
#include <iostream>

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

using capswitch::FilterVerdict;
using capswitch::KeyState;
using capswitch::TriggerTracker;

/// Фильтр с заданным вердиктом, считающий вызовы
struct Verdict {
  FilterVerdict verdict;
  int calls = 0;

  FilterVerdict operator()() {
    ++calls;
    return verdict;
  }
};

bool feed(TriggerTracker &tracker, KeyState state, Verdict &filter) {
  return tracker.forward(state, [&filter] { return filter(); });
}

void test_consumed_press_swallows_repeats_and_release() {
  TriggerTracker tracker;
  Verdict consume{FilterVerdict::Consume};

  CHECK(!feed(tracker, KeyState::Press, consume));
  CHECK(tracker.holding_consumed());
  CHECK(!feed(tracker, KeyState::Repeat, consume));
  CHECK(!feed(tracker, KeyState::Repeat, consume));
  CHECK(!feed(tracker, KeyState::Release, consume));
  CHECK(!tracker.holding_consumed());

  // Фильтр спрашивают только про нажатие
  CHECK(consume.calls == 1);
}

void test_passed_press_forwards_repeats_and_release() {
  TriggerTracker tracker;
  Verdict pass{FilterVerdict::PassThrough};

  CHECK(feed(tracker, KeyState::Press, pass));
  CHECK(feed(tracker, KeyState::Repeat, pass));
  CHECK(feed(tracker, KeyState::Release, pass));
  CHECK(pass.calls == 1);
}

void test_press_after_missed_release() {
  TriggerTracker tracker;
  Verdict consume{FilterVerdict::Consume};
  Verdict pass{FilterVerdict::PassThrough};

  CHECK(!feed(tracker, KeyState::Press, consume));
  // Отпускание потерялось; новое нажатие фильтр уже пропускает
  CHECK(feed(tracker, KeyState::Press, pass));
  CHECK(!tracker.holding_consumed());
  CHECK(feed(tracker, KeyState::Repeat, pass));
  CHECK(feed(tracker, KeyState::Release, pass));

  // И наоборот: пропущенное нажатие, затем поглощённое
  CHECK(feed(tracker, KeyState::Press, pass));
  CHECK(!feed(tracker, KeyState::Press, consume));
  CHECK(!feed(tracker, KeyState::Release, consume));
  CHECK(pass.calls == 2);
  CHECK(consume.calls == 2);
}

void test_stray_release_is_forwarded() {
  TriggerTracker tracker;
  Verdict consume{FilterVerdict::Consume};

  // Отпускание клавиши, нажатой до захвата
  CHECK(feed(tracker, KeyState::Release, consume));
  CHECK(feed(tracker, KeyState::Repeat, consume));
  CHECK(consume.calls == 0);
}

void test_reset_forgets_consumed_press() {
  TriggerTracker tracker;
  Verdict consume{FilterVerdict::Consume};

  CHECK(!feed(tracker, KeyState::Press, consume));
  tracker.reset();
  CHECK(feed(tracker, KeyState::Release, consume));
}

} // namespace

#undef CHECK

int main() {
  test_consumed_press_swallows_repeats_and_release();
  test_passed_press_forwards_repeats_and_release();
  test_press_after_missed_release();
  test_stray_release_is_forwarded();
  test_reset_forgets_consumed_press();

  std::cout << "OK\n";
  return 0;
}
