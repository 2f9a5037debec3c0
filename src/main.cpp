/**
 * @file main.cpp
 * @brief Точка входа capswitch
 *
 * Агент сессии пользователя: Caps Lock переключает две выбранные раскладки.
 * По умолчанию работает с иконкой в трее (GTK), с --headless управляется
 * только через capswitchctl.
 */

#include "capswitch/background_worker.hpp"
#include "capswitch/config.hpp"
#include "capswitch/coordinator.hpp"
#include "capswitch/device_access_oracle.hpp"
#include "capswitch/evdev_event_tap.hpp"
#include "capswitch/glib_dispatcher.hpp"
#include "capswitch/ipc_commands.hpp"
#include "capswitch/ipc_server.hpp"
#include "capswitch/preference_store.hpp"
#include "capswitch/process_command_runner.hpp"
#include "capswitch/tray_app.hpp"
#include "capswitch/xkb_source_directory.hpp"

#include <glib-unix.h>
#include <signal.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

volatile sig_atomic_t g_running = 1;

/// Сколько IPC поток ждёт ответа главного цикла
constexpr std::chrono::milliseconds kIpcReplyTimeout{2000};

/// Период разбора очереди в headless режиме
constexpr std::chrono::milliseconds kHeadlessTick{250};

void signal_handler(int sig) {
  if (sig == SIGINT || sig == SIGTERM) {
    g_running = 0;
  }
}

gboolean on_unix_signal(gpointer user_data) {
  (void)user_data;
  gtk_main_quit();
  return G_SOURCE_CONTINUE;
}

void print_version() {
  std::cout << "capswitch 1.0.0 (C++20)\n"
            << "Caps Lock layout switcher for X11 sessions\n";
}

void print_usage(const char *argv0) {
  std::cout << "Usage: " << argv0 << " [options]\n"
            << "\n"
            << "Options:\n"
            << "  -c, --config <path>  Use this configuration file only\n"
            << "      --headless       Run without the tray icon\n"
            << "  -h, --help           Show this help\n"
            << "  -v, --version        Show version\n"
            << "\n"
            << "Configuration: " << capswitch::kConfigPath << " or ~/"
            << capswitch::kUserConfigRelPath << "\n"
            << "Control: capswitchctl status|sources|select|deselect|refresh\n";
}

/// Путь к собственному исполняемому файлу для записи автозапуска
std::filesystem::path executable_path(const char *argv0) {
  std::error_code ec;
  auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    return std::filesystem::absolute(argv0, ec);
  }
  return path;
}

/**
 * @brief Наблюдатель headless режима
 *
 * Диалогов нет: всё, что показал бы трей, уходит в лог.
 */
class ConsoleObserver final : public capswitch::StatusObserver {
public:
  explicit ConsoleObserver(capswitch::Coordinator &coordinator)
      : coordinator_(coordinator) {}

  void on_status_changed(const capswitch::StatusSnapshot &snapshot) override {
    const std::string line = capswitch::status_line(snapshot);
    if (line != last_line_) {
      std::cerr << "[capswitch] " << line << "\n";
      last_line_ = line;
    }
  }

  void on_permission_guidance(bool user_requested) override {
    (void)user_requested;
    std::cerr << "[capswitch] Permissions are required: add your user to the "
                 "'input' group and make /dev/uinput writable, then log in "
                 "again\n";
  }

  void on_welcome() override {
    std::cerr << "[capswitch] Setup complete. Select two layouts with "
                 "'capswitchctl select <id>' and press Caps Lock to switch\n";
  }

  void on_configuration_needed() override {
    std::cerr << "[capswitch] Select two layouts with 'capswitchctl select "
                 "<id>' to enable switching\n";
    coordinator_.acknowledge_configuration_hint();
  }

  void on_selection_rejected() override {
    std::cerr << "[capswitch] Two layouts are already selected\n";
  }

  void on_error(capswitch::ErrorKind kind,
                const std::string &detail) override {
    std::cerr << "[capswitch] Error (" << capswitch::to_string(kind)
              << "): " << detail << "\n";
  }

  void on_launch_at_login_changed(bool enabled,
                                  const std::string &error) override {
    if (!error.empty()) {
      std::cerr << "[capswitch] Failed to update launch at login: " << error
                << "\n";
      return;
    }
    std::cerr << "[capswitch] Launch at login: " << (enabled ? "on" : "off")
              << "\n";
  }

private:
  capswitch::Coordinator &coordinator_;
  std::string last_line_;
};

} // namespace

int main(int argc, char *argv[]) {
  bool headless = false;
  std::optional<std::string> config_path;

  // Обработка аргументов командной строки
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      print_version();
      return 0;
    }
    if (arg == "--headless") {
      headless = true;
      continue;
    }
    if (arg == "-c" || arg == "--config") {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << "\n";
        return 2;
      }
      config_path = argv[++i];
      continue;
    }
    std::cerr << "Unknown option: " << arg << "\n";
    print_usage(argv[0]);
    return 2;
  }

  // Загрузка конфигурации
  capswitch::Config config;
  if (config_path) {
    auto outcome = capswitch::load_config_checked(*config_path);
    if (outcome.result != capswitch::ConfigResult::Ok) {
      std::cerr << "[capswitch] Config error (" << *config_path
                << "): " << outcome.error << "\n";
      return 2;
    }
    config = std::move(outcome.config);
  } else {
    config = capswitch::load_config();
  }

  if (!headless && !gtk_init_check(&argc, &argv)) {
    std::cerr << "[capswitch] Cannot open the display; use --headless to run "
                 "without the tray\n";
    return 1;
  }

  // Порядок объявления важен: фоновые потоки должны завершиться раньше,
  // чем объекты, на которые ссылаются их задачи
  capswitch::GlibDispatcher glib_main;
  capswitch::QueueDispatcher queue_main;
  capswitch::Dispatcher &main_context =
      headless ? static_cast<capswitch::Dispatcher &>(queue_main)
               : static_cast<capswitch::Dispatcher &>(glib_main);

  capswitch::XdgAutostart login_item(capswitch::XdgAutostart::default_path(),
                                     executable_path(argv[0]));
  capswitch::FilePreferenceStore preferences(
      capswitch::FilePreferenceStore::default_path());
  capswitch::DeviceAccessOracle oracle(config.permission.input_dir,
                                       config.permission.uinput_path);
  capswitch::XkbSourceDirectory directory;
  capswitch::XkbSourceDirectory switch_directory;
  if (!switch_directory.open()) {
    std::cerr << "[capswitch] X display is not available yet, layout "
                 "switching will retry on the first trigger press\n";
  }
  capswitch::EvdevEventTapFactory tap_factory(config.permission.input_dir,
                                              config.permission.uinput_path);
  capswitch::ProcessCommandRunner runner;
  capswitch::BackgroundWorker background("background");

  capswitch::Coordinator coordinator(capswitch::CoordinatorDeps{
      config, oracle, directory, switch_directory, tap_factory, runner,
      preferences, login_item, main_context, background});

  capswitch::IpcServer ipc(
      capswitch::default_ipc_socket_path(),
      capswitch::make_ipc_handler(coordinator, main_context,
                                  kIpcReplyTimeout));

  int exit_code = 0;

  if (headless) {
    // Установка обработчиков сигналов
    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    ConsoleObserver observer(coordinator);
    coordinator.set_observer(&observer);
    coordinator.launch();
    if (!ipc.start()) {
      std::cerr << "[capswitch] Control socket unavailable, continuing "
                   "without capswitchctl support\n";
    }

    while (g_running) {
      (void)queue_main.run_for(kHeadlessTick);
    }

    // Сначала отпускаем клавиатуры и снимаем ремап: остановка IPC может
    // ждать клиента
    coordinator.shutdown();
    ipc.stop();
    coordinator.set_observer(nullptr);
    return exit_code;
  }

  g_unix_signal_add(SIGINT, on_unix_signal, nullptr);
  g_unix_signal_add(SIGTERM, on_unix_signal, nullptr);

  auto tray = std::make_unique<capswitch::TrayApp>(coordinator, config.tray);
  if (!tray->initialize()) {
    // Без иконки агентом нельзя управлять: откат и выход
    coordinator.shutdown();
    return 1;
  }

  coordinator.set_observer(tray.get());
  coordinator.launch();
  if (!ipc.start()) {
    std::cerr << "[capswitch] Control socket unavailable, continuing "
                 "without capswitchctl support\n";
  }

  exit_code = tray->run();

  coordinator.shutdown();
  ipc.stop();
  coordinator.set_observer(nullptr);
  return exit_code;
}
