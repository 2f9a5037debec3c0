/**
 * @file event_tap.hpp
 * @brief Регистрация системного перехвата клавиатуры
 */

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "capswitch/types.hpp"

namespace capswitch {

/**
 * @brief Активный перехват
 *
 * Разрушение объекта снимает перехват и освобождает устройства.
 * Колбэк вызывается в собственном потоке перехвата.
 */
class EventTap {
public:
  virtual ~EventTap() = default;

  /// Выключенный перехват пропускает все события без вызова колбэка
  virtual void set_enabled(bool enabled) = 0;
  [[nodiscard]] virtual bool enabled() const noexcept = 0;
};

class EventTapFactory {
public:
  /// Получает только нажатия триггера (не повторы и не отпускания)
  using KeyCallback = std::function<FilterVerdict(const KeyEvent &)>;

  virtual ~EventTapFactory() = default;

  /**
   * @brief Создаёт перехват
   *
   * @param error Причина отказа
   * @return nullptr если зарегистрировать перехват не удалось
   */
  [[nodiscard]] virtual std::unique_ptr<EventTap>
  create(ScanCode trigger, KeyCallback callback, std::string &error) = 0;
};

} // namespace capswitch
