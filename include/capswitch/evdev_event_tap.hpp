/**
 * @file evdev_event_tap.hpp
 * @brief Перехват клавиатуры через эксклюзивный захват evdev
 *
 * Каждая клавиатура, умеющая генерировать триггер, захватывается
 * (EVIOCGRAB), а её события повторяются через клон на uinput. Нажатие
 * триггера отдаётся колбэку; поглощённое нажатие не доходит до клона
 * вместе со своими повторами и отпусканием.
 */

#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "capswitch/event_tap.hpp"
#include "capswitch/trigger_tracker.hpp"

struct libevdev;
struct libevdev_uinput;

namespace capswitch {

class EvdevEventTap final : public EventTap {
public:
  using KeyCallback = EventTapFactory::KeyCallback;

  EvdevEventTap(ScanCode trigger, KeyCallback callback);
  ~EvdevEventTap() override;

  EvdevEventTap(const EvdevEventTap &) = delete;
  EvdevEventTap &operator=(const EvdevEventTap &) = delete;

  /**
   * @brief Открывает и захватывает клавиатуры
   *
   * @return false если не удалось захватить ни одной клавиатуры
   */
  [[nodiscard]] bool open_devices(const std::filesystem::path &input_dir,
                                  const std::filesystem::path &uinput_path,
                                  std::string &error);

  /// Запускает поток чтения событий
  void start();

  void set_enabled(bool enabled) override {
    enabled_.store(enabled, std::memory_order_relaxed);
  }

  [[nodiscard]] bool enabled() const noexcept override {
    return enabled_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] std::size_t device_count() const noexcept {
    return devices_.size();
  }

private:
  struct Device {
    std::string path;
    std::string name;
    int fd = -1;
    int uinput_fd = -1;
    libevdev *dev = nullptr;
    libevdev_uinput *clone = nullptr;
    bool grabbed = false;
    /// Куда ушло последнее нажатие триггера на этой клавиатуре
    TriggerTracker trigger;

    Device() = default;
    ~Device();
    Device(const Device &) = delete;
    Device &operator=(const Device &) = delete;
  };

  [[nodiscard]] std::unique_ptr<Device>
  open_device(const std::filesystem::path &path,
              const std::filesystem::path &uinput_path, std::string &error);

  /// Захват откладывается, пока на клавиатуре зажата хоть одна клавиша,
  /// иначе её отпускание уйдёт в клон и X сервер залипнет на повторе
  void try_grab(Device &device);

  void run(std::stop_token st);
  void drain(Device &device);
  void process(Device &device, const input_event &ev);
  void drop(Device &device);

  const ScanCode trigger_;
  KeyCallback callback_;
  std::atomic<bool> enabled_{true};

  int epoll_fd_ = -1;
  std::vector<std::unique_ptr<Device>> devices_;
  std::jthread thread_;
};

/// Создаёт EvdevEventTap по путям из конфига
class EvdevEventTapFactory final : public EventTapFactory {
public:
  EvdevEventTapFactory(std::filesystem::path input_dir,
                       std::filesystem::path uinput_path);

  [[nodiscard]] std::unique_ptr<EventTap>
  create(ScanCode trigger, KeyCallback callback, std::string &error) override;

private:
  std::filesystem::path input_dir_;
  std::filesystem::path uinput_path_;
};

} // namespace capswitch
