/**
 * @file evdev_event_tap.cpp
 * @brief Реализация перехвата через libevdev + uinput
 */

#include "capswitch/evdev_event_tap.hpp"

#include <fcntl.h>
#include <sys/epoll.h>
#include <unistd.h>

#include <libevdev/libevdev-uinput.h>
#include <libevdev/libevdev.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <system_error>

namespace capswitch {

namespace {

/// Таймаут epoll_wait: как часто проверяем запрос остановки
constexpr int kPollTimeoutMs = 250;

[[nodiscard]] bool any_key_down(libevdev *dev) {
  for (unsigned int code = 0; code <= KEY_MAX; ++code) {
    if (libevdev_has_event_code(dev, EV_KEY, code) &&
        libevdev_get_event_value(dev, EV_KEY, code) != 0) {
      return true;
    }
  }
  return false;
}

} // namespace

EvdevEventTap::Device::~Device() {
  if (dev && grabbed) {
    (void)libevdev_grab(dev, LIBEVDEV_UNGRAB);
  }
  if (clone) {
    libevdev_uinput_destroy(clone);
  }
  if (uinput_fd >= 0) {
    ::close(uinput_fd);
  }
  if (dev) {
    libevdev_free(dev);
  }
  if (fd >= 0) {
    ::close(fd);
  }
}

EvdevEventTap::EvdevEventTap(ScanCode trigger, KeyCallback callback)
    : trigger_(trigger), callback_(std::move(callback)) {}

EvdevEventTap::~EvdevEventTap() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  devices_.clear();
  if (epoll_fd_ >= 0) {
    ::close(epoll_fd_);
  }
  std::cerr << "[capswitch-tap] Keyboards released\n";
}

std::unique_ptr<EvdevEventTap::Device>
EvdevEventTap::open_device(const std::filesystem::path &path,
                           const std::filesystem::path &uinput_path,
                           std::string &error) {
  auto device = std::make_unique<Device>();
  device->path = path.string();

  device->fd = ::open(device->path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
  if (device->fd < 0) {
    return nullptr;
  }

  if (libevdev_new_from_fd(device->fd, &device->dev) < 0) {
    return nullptr;
  }

  const char *name = libevdev_get_name(device->dev);
  device->name = name ? name : "";

  // Свои виртуальные клавиатуры не трогаем
  if (device->name.starts_with(kVirtualDevicePrefix)) {
    return nullptr;
  }
  if (!libevdev_has_event_code(device->dev, EV_KEY, trigger_)) {
    return nullptr;
  }

  device->uinput_fd = ::open(uinput_path.c_str(), O_RDWR | O_CLOEXEC);
  if (device->uinput_fd < 0) {
    error = "cannot open " + uinput_path.string() + ": " +
            std::strerror(errno);
    return nullptr;
  }

  const std::string clone_name =
      std::string{kVirtualDevicePrefix} + " " + device->name;
  libevdev_set_name(device->dev, clone_name.c_str());
  const int rc = libevdev_uinput_create_from_device(
      device->dev, device->uinput_fd, &device->clone);
  libevdev_set_name(device->dev, device->name.c_str());
  if (rc < 0) {
    error = "cannot create virtual keyboard for " + device->name + ": " +
            std::strerror(-rc);
    return nullptr;
  }

  return device;
}

bool EvdevEventTap::open_devices(const std::filesystem::path &input_dir,
                                 const std::filesystem::path &uinput_path,
                                 std::string &error) {
  epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
  if (epoll_fd_ < 0) {
    error = std::string("epoll_create1 failed: ") + std::strerror(errno);
    return false;
  }

  std::error_code ec;
  std::filesystem::directory_iterator it{input_dir, ec};
  if (ec) {
    error = "cannot list " + input_dir.string() + ": " + ec.message();
    return false;
  }

  std::vector<std::filesystem::path> nodes;
  for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
    if (ec) {
      break;
    }
    if (it->path().filename().string().starts_with("event")) {
      nodes.push_back(it->path());
    }
  }
  std::sort(nodes.begin(), nodes.end());

  std::string last_error;
  for (const auto &node : nodes) {
    auto device = open_device(node, uinput_path, last_error);
    if (!device) {
      continue;
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.ptr = device.get();
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, device->fd, &ev) < 0) {
      last_error = std::string("epoll_ctl failed: ") + std::strerror(errno);
      continue;
    }

    try_grab(*device);
    std::cerr << "[capswitch-tap] Using keyboard " << device->path << " ("
              << device->name << ")"
              << (device->grabbed ? "" : ", grab deferred") << "\n";
    devices_.push_back(std::move(device));
  }

  if (devices_.empty()) {
    error = last_error.empty()
                ? "no accessible keyboard with the trigger key in " +
                      input_dir.string()
                : last_error;
    return false;
  }
  return true;
}

void EvdevEventTap::try_grab(Device &device) {
  if (device.grabbed || any_key_down(device.dev)) {
    return;
  }
  const int rc = libevdev_grab(device.dev, LIBEVDEV_GRAB);
  if (rc < 0) {
    std::cerr << "[capswitch-tap] Cannot grab " << device.path << ": "
              << std::strerror(-rc) << "\n";
    return;
  }
  device.grabbed = true;
  device.trigger.reset();
}

void EvdevEventTap::start() {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::jthread([this](std::stop_token st) { run(st); });
}

void EvdevEventTap::run(std::stop_token st) {
  std::array<epoll_event, 8> events{};

  while (!st.stop_requested() && !devices_.empty()) {
    const int n = ::epoll_wait(epoll_fd_, events.data(),
                               static_cast<int>(events.size()), kPollTimeoutMs);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::cerr << "[capswitch-tap] epoll_wait failed: " << std::strerror(errno)
                << "\n";
      break;
    }

    for (int i = 0; i < n; ++i) {
      auto *device = static_cast<Device *>(events[i].data.ptr);
      if (events[i].events & (EPOLLHUP | EPOLLERR)) {
        drop(*device);
        continue;
      }
      if (events[i].events & EPOLLIN) {
        drain(*device);
      }
    }

    devices_.erase(std::remove_if(devices_.begin(), devices_.end(),
                                  [](const std::unique_ptr<Device> &d) {
                                    return d->fd < 0;
                                  }),
                   devices_.end());
  }
}

void EvdevEventTap::drain(Device &device) {
  input_event ev{};
  unsigned int flags = LIBEVDEV_READ_FLAG_NORMAL;

  while (true) {
    const int rc = libevdev_next_event(device.dev, flags, &ev);

    if (rc == -EAGAIN) {
      if (flags == LIBEVDEV_READ_FLAG_SYNC) {
        // Синхронизация после SYN_DROPPED закончена
        flags = LIBEVDEV_READ_FLAG_NORMAL;
        continue;
      }
      break;
    }
    if (rc == -ENODEV) {
      drop(device);
      return;
    }
    if (rc == LIBEVDEV_READ_STATUS_SYNC) {
      flags = LIBEVDEV_READ_FLAG_SYNC;
    } else if (rc != LIBEVDEV_READ_STATUS_SUCCESS) {
      break;
    }

    if (device.grabbed) {
      process(device, ev);
    }
  }

  if (!device.grabbed) {
    try_grab(device);
  }
}

void EvdevEventTap::process(Device &device, const input_event &ev) {
  if (ev.type == EV_KEY && ev.code == trigger_) {
    const auto state = static_cast<KeyState>(ev.value);
    const bool forward = device.trigger.forward(state, [this, state] {
      if (!enabled() || !callback_) {
        return FilterVerdict::PassThrough;
      }
      return callback_(KeyEvent{trigger_, state});
    });
    if (!forward) {
      return;
    }
  }

  const int rc = libevdev_uinput_write_event(device.clone, ev.type, ev.code,
                                             ev.value);
  if (rc < 0 && ev.type != EV_SYN) {
    std::cerr << "[capswitch-tap] Failed to forward event: "
              << std::strerror(-rc) << "\n";
  }
}

void EvdevEventTap::drop(Device &device) {
  if (device.fd < 0) {
    return;
  }
  std::cerr << "[capswitch-tap] Keyboard disconnected: " << device.path
            << "\n";
  (void)::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, device.fd, nullptr);
  device.grabbed = false;
  libevdev_free(device.dev);
  device.dev = nullptr;
  ::close(device.fd);
  device.fd = -1;
}

EvdevEventTapFactory::EvdevEventTapFactory(std::filesystem::path input_dir,
                                           std::filesystem::path uinput_path)
    : input_dir_(std::move(input_dir)), uinput_path_(std::move(uinput_path)) {}

std::unique_ptr<EventTap>
EvdevEventTapFactory::create(ScanCode trigger, KeyCallback callback,
                             std::string &error) {
  auto tap = std::make_unique<EvdevEventTap>(trigger, std::move(callback));
  if (!tap->open_devices(input_dir_, uinput_path_, error)) {
    return nullptr;
  }
  tap->start();
  return tap;
}

} // namespace capswitch
