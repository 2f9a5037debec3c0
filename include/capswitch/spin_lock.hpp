/**
 * @file spin_lock.hpp
 * @brief Спин-лок для коротких критических секций горячего пути
 *
 * Удерживается только на время чтения/записи одного значения, поэтому
 * поток перехвата никогда не уходит в системный вызов при чтении флага.
 */

#pragma once

#include <atomic>

#if defined(__x86_64__) && !defined(CAPSWITCH_NO_ASM)
#include <immintrin.h>
#endif

namespace capswitch {

/// Подсказка процессору внутри цикла ожидания
inline void cpu_relax() noexcept {
#if defined(__x86_64__) && !defined(CAPSWITCH_NO_ASM)
  _mm_pause();
#endif
}

/// BasicLockable спин-лок на std::atomic_flag
class SpinLock {
public:
  SpinLock() = default;

  SpinLock(const SpinLock &) = delete;
  SpinLock &operator=(const SpinLock &) = delete;

  void lock() noexcept {
    while (flag_.test_and_set(std::memory_order_acquire)) {
      while (flag_.test(std::memory_order_relaxed)) {
        cpu_relax();
      }
    }
  }

  [[nodiscard]] bool try_lock() noexcept {
    return !flag_.test_and_set(std::memory_order_acquire);
  }

  void unlock() noexcept { flag_.clear(std::memory_order_release); }

private:
  std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

} // namespace capswitch
