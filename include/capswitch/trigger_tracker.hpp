/**
 * @file trigger_tracker.hpp
 * @brief Судьба повторов и отпускания клавиши-триггера
 *
 * Фильтр решает только по нажатию. Повторы и отпускание идут туда же, куда
 * ушло их нажатие: поглощённое нажатие поглощает и их, пропущенное
 * пропускает. Иначе X сервер увидит отпускание без нажатия (или наоборот).
 */

#pragma once

#include "capswitch/types.hpp"

namespace capswitch {

class TriggerTracker {
public:
  /**
   * @brief Решение по событию триггера
   *
   * @param state Нажатие, повтор или отпускание
   * @param decide Вызывается только для нажатия, возвращает вердикт фильтра
   * @return true если событие нужно переслать дальше
   */
  template <class Decide>
  [[nodiscard]] bool forward(KeyState state, Decide &&decide) {
    switch (state) {
    case KeyState::Press:
      // Новое нажатие начинает новую историю, даже если отпускание
      // предыдущего потерялось
      consumed_ = decide() == FilterVerdict::Consume;
      return !consumed_;

    case KeyState::Repeat:
      return !consumed_;

    case KeyState::Release: {
      const bool was_consumed = consumed_;
      consumed_ = false;
      return !was_consumed;
    }
    }
    return true;
  }

  /// Нажатие поглощено и ещё не отпущено
  [[nodiscard]] bool holding_consumed() const noexcept { return consumed_; }

  void reset() noexcept { consumed_ = false; }

private:
  bool consumed_ = false;
};

} // namespace capswitch
