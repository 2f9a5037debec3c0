/**
 * @file tray_app.cpp
 * @brief Реализация tray-приложения
 */

#include "capswitch/tray_app.hpp"

#include <glib.h>

#include <iostream>

namespace capswitch {

namespace {

/// Имена иконок (используем стандартные темы)
constexpr const char *kIconActive = "input-keyboard";
constexpr const char *kIconConfiguring = "input-keyboard-symbolic";
constexpr const char *kIconPermissions = "dialog-warning";

/// ID приложения для AppIndicator
constexpr const char *kAppIndicatorId = "capswitch";

/// Ключ идентификатора раскладки на пункте меню
constexpr const char *kSourceIdKey = "capswitch-source-id";

constexpr const char *kPermissionGuidanceText =
    "capswitch needs access to keyboard input devices to intercept the "
    "Caps Lock key.\n\n"
    "Add your user to the 'input' group (sudo usermod -aG input $USER), make "
    "sure /dev/uinput is writable for that group, then log out and back in.";

constexpr const char *kWelcomeText =
    "Setup complete!\n\n"
    "1. Click the capswitch tray icon.\n\n"
    "2. Select exactly two keyboard layouts you want to switch between using "
    "Caps Lock.\n\n"
    "3. Press Caps Lock to instantly toggle between them!";

constexpr const char *kConfigureText =
    "Please select two keyboard layouts from the capswitch tray icon to "
    "enable Caps Lock switching.";

/// Отложенное переключение раскладки из меню
struct SourceToggle {
  TrayApp *app = nullptr;
  std::string id;
  bool was_selected = false;
};

/// Меню нужно перестроить только при изменении этих полей
bool same_menu_structure(const StatusSnapshot &a, const StatusSnapshot &b) {
  if (a.state != b.state || a.launch_at_login != b.launch_at_login ||
      a.sources.size() != b.sources.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.sources.size(); ++i) {
    const auto &x = a.sources[i];
    const auto &y = b.sources[i];
    if (x.source != y.source || x.selected != y.selected ||
        x.enabled != y.enabled) {
      return false;
    }
  }
  return true;
}

void destroy_child(GtkWidget *widget, gpointer) { gtk_widget_destroy(widget); }

const char *error_title(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::RemapCommandFailed:
    return "Key Remapping Failed";
  case ErrorKind::TapRegistrationFailed:
    return "Key Interception Failed";
  case ErrorKind::SourceUnavailable:
  case ErrorKind::SwitchFailed:
    return "Layout Switching Failed";
  case ErrorKind::PermissionDenied:
    return "Permissions Required";
  }
  return "capswitch";
}

} // namespace

TrayApp::TrayApp(Coordinator &coordinator, const TrayConfig &config)
    : coordinator_(coordinator), config_(config) {}

TrayApp::~TrayApp() {
  if (refresh_timer_id_ != 0) {
    g_source_remove(refresh_timer_id_);
  }

  if (dialog_) {
    gtk_widget_destroy(dialog_);
  }

  if (menu_) {
    gtk_widget_destroy(menu_);
  }

  if (indicator_) {
    g_object_unref(indicator_);
  }
}

bool TrayApp::initialize() {
  // Создаём AppIndicator
  indicator_ = app_indicator_new(kAppIndicatorId, kIconPermissions,
                                 APP_INDICATOR_CATEGORY_APPLICATION_STATUS);

  if (!indicator_) {
    std::cerr << "[capswitch] Failed to create the tray indicator\n";
    return false;
  }

  // Устанавливаем статус (видимый)
  app_indicator_set_status(indicator_, APP_INDICATOR_STATUS_ACTIVE);
  app_indicator_set_title(indicator_, "capswitch");

  // Создаём меню
  menu_ = gtk_menu_new();
  g_signal_connect(menu_, "show", G_CALLBACK(on_menu_show), this);
  app_indicator_set_menu(indicator_, GTK_MENU(menu_));

  apply_snapshot(coordinator_.snapshot(), /*force=*/true);

  // Запускаем периодический пересчёт (меню AppIndicator не всегда
  // сообщает об открытии)
  const auto interval = config_.refresh_interval.count();
  if (interval > 0) {
    refresh_timer_id_ =
        g_timeout_add(static_cast<guint>(interval), on_refresh_timer, this);
  }

  return true;
}

int TrayApp::run() {
  gtk_main();
  return 0;
}

void TrayApp::on_status_changed(const StatusSnapshot &snapshot) {
  apply_snapshot(snapshot, /*force=*/false);
}

void TrayApp::apply_snapshot(const StatusSnapshot &snapshot, bool force) {
  const bool rebuild =
      force || !has_snapshot_ || !same_menu_structure(snapshot_, snapshot);
  snapshot_ = snapshot;
  has_snapshot_ = true;

  if (!menu_) {
    return;
  }

  if (rebuild) {
    rebuild_menu();
  } else if (status_item_) {
    gtk_menu_item_set_label(GTK_MENU_ITEM(status_item_),
                            status_line(snapshot_).c_str());
  }
  update_icon();
}

GtkWidget *TrayApp::append_item(const char *label, GCallback callback) {
  GtkWidget *item = gtk_menu_item_new_with_label(label);
  if (callback) {
    g_signal_connect(item, "activate", callback, this);
  } else {
    gtk_widget_set_sensitive(item, FALSE);
  }
  gtk_menu_shell_append(GTK_MENU_SHELL(menu_), item);
  return item;
}

void TrayApp::rebuild_menu() {
  updating_ = true;
  gtk_container_foreach(GTK_CONTAINER(menu_), destroy_child, nullptr);

  status_item_ = append_item(status_line(snapshot_).c_str(), nullptr);

  if (snapshot_.state == OperationalState::PermissionsRequired) {
    (void)append_item("Show Permissions Guide",
                      G_CALLBACK(on_permissions_guide_clicked));
  } else {
    gtk_menu_shell_append(GTK_MENU_SHELL(menu_),
                          gtk_separator_menu_item_new());

    if (snapshot_.sources.empty()) {
      (void)append_item("No keyboard layouts found", nullptr);
    }
    for (const auto &entry : snapshot_.sources) {
      GtkWidget *item = gtk_check_menu_item_new_with_label(
          entry.source.localized_name.c_str());
      gtk_check_menu_item_set_active(GTK_CHECK_MENU_ITEM(item),
                                     entry.selected ? TRUE : FALSE);
      gtk_widget_set_sensitive(item, entry.enabled ? TRUE : FALSE);
      g_object_set_data_full(G_OBJECT(item), kSourceIdKey,
                             g_strdup(entry.source.identifier.c_str()), g_free);
      g_signal_connect(item, "activate", G_CALLBACK(on_source_activated),
                       this);
      gtk_menu_shell_append(GTK_MENU_SHELL(menu_), item);
    }

    gtk_menu_shell_append(GTK_MENU_SHELL(menu_),
                          gtk_separator_menu_item_new());

    GtkWidget *login_item =
        gtk_check_menu_item_new_with_label("Launch on Startup");
    gtk_check_menu_item_set_active(GTK_CHECK_MENU_ITEM(login_item),
                                   snapshot_.launch_at_login ? TRUE : FALSE);
    g_signal_connect(login_item, "activate",
                     G_CALLBACK(on_launch_at_login_toggled), this);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu_), login_item);

    (void)append_item("Show Welcome Guide",
                      G_CALLBACK(on_welcome_guide_clicked));
  }

  gtk_menu_shell_append(GTK_MENU_SHELL(menu_), gtk_separator_menu_item_new());
  (void)append_item("Quit capswitch", G_CALLBACK(on_quit_clicked));

  gtk_widget_show_all(menu_);
  updating_ = false;
}

void TrayApp::update_icon() {
  if (!indicator_) {
    return;
  }

  const char *icon_name = kIconPermissions;
  switch (snapshot_.state) {
  case OperationalState::PermissionsRequired:
    icon_name = kIconPermissions;
    break;
  case OperationalState::Configuring:
    icon_name = kIconConfiguring;
    break;
  case OperationalState::Active:
    icon_name = kIconActive;
    break;
  }

  app_indicator_set_icon(indicator_, icon_name);
}

bool TrayApp::show_dialog(DialogKind kind, GtkMessageType type,
                          const char *title, const std::string &text) {
  if (dialog_) {
    std::cerr << "[capswitch] Dialog '" << title
              << "' skipped: another dialog is open\n";
    return false;
  }

  dialog_ = gtk_message_dialog_new(nullptr, GTK_DIALOG_MODAL, type,
                                   GTK_BUTTONS_OK, "%s", title);
  gtk_message_dialog_format_secondary_text(GTK_MESSAGE_DIALOG(dialog_), "%s",
                                           text.c_str());
  gtk_window_set_title(GTK_WINDOW(dialog_), "capswitch");
  gtk_window_set_keep_above(GTK_WINDOW(dialog_), TRUE);
  dialog_kind_ = kind;

  g_signal_connect(dialog_, "response", G_CALLBACK(on_dialog_response), this);
  gtk_widget_show(dialog_);
  return true;
}

void TrayApp::on_permission_guidance(bool user_requested) {
  std::string text = kPermissionGuidanceText;
  if (user_requested) {
    text += "\n\nIf access is already granted but switching does not work, "
            "log out and back in so the new group membership takes effect, "
            "then open the capswitch menu again.";
  } else {
    text += "\n\nAfter granting access, click the tray icon to activate.";
  }
  (void)show_dialog(DialogKind::PermissionGuidance, GTK_MESSAGE_WARNING,
                    "Permissions Required", text);
}

void TrayApp::on_welcome() {
  (void)show_dialog(DialogKind::Welcome, GTK_MESSAGE_INFO,
                    "Welcome to capswitch!", kWelcomeText);
}

void TrayApp::on_configuration_needed() {
  if (!show_dialog(DialogKind::ConfigurationNeeded, GTK_MESSAGE_INFO,
                   "Configure Layouts", kConfigureText)) {
    coordinator_.acknowledge_configuration_hint();
  }
}

void TrayApp::on_selection_rejected() {
  GdkDisplay *display = gdk_display_get_default();
  if (display) {
    gdk_display_beep(display);
  }
  // Флажок уже переключён GTK: возвращаем реальное состояние
  apply_snapshot(coordinator_.snapshot(), /*force=*/true);
}

void TrayApp::on_error(ErrorKind kind, const std::string &detail) {
  (void)show_dialog(DialogKind::Error, GTK_MESSAGE_WARNING, error_title(kind),
                    detail);
}

void TrayApp::on_launch_at_login_changed(bool enabled,
                                         const std::string &error) {
  (void)enabled;
  // GTK уже переключил флажок; при ошибке реальное значение не изменилось,
  // поэтому меню перестраивается принудительно
  apply_snapshot(coordinator_.snapshot(), /*force=*/true);
  if (error.empty()) {
    return;
  }
  (void)show_dialog(DialogKind::Error, GTK_MESSAGE_ERROR,
                    "Launch Setting Error",
                    "Failed to update the 'Launch on Startup' setting:\n" +
                        error);
}

void TrayApp::on_menu_show(GtkWidget *menu, gpointer user_data) {
  (void)menu;
  auto *app = static_cast<TrayApp *>(user_data);
  app->coordinator_.menu_will_open();
}

void TrayApp::on_source_activated(GtkMenuItem *item, gpointer user_data) {
  auto *app = static_cast<TrayApp *>(user_data);
  if (app->updating_) {
    return;
  }

  const auto *id = static_cast<const char *>(
      g_object_get_data(G_OBJECT(item), kSourceIdKey));
  if (!id) {
    return;
  }

  auto *toggle = new SourceToggle;
  toggle->app = app;
  toggle->id = id;
  toggle->was_selected = app->coordinator_.selection().is_selected(id);

  g_idle_add_full(
      G_PRIORITY_DEFAULT_IDLE, on_source_toggle_idle, toggle,
      [](gpointer data) { delete static_cast<SourceToggle *>(data); });
}

gboolean TrayApp::on_source_toggle_idle(gpointer user_data) {
  auto *toggle = static_cast<SourceToggle *>(user_data);
  TrayApp *app = toggle->app;

  if (toggle->was_selected) {
    (void)app->coordinator_.deselect_source(toggle->id);
  } else {
    (void)app->coordinator_.select_source(toggle->id);
  }

  // Выбор мог быть отклонён без пересчёта: синхронизируем флажки
  app->apply_snapshot(app->coordinator_.snapshot(), /*force=*/true);
  return G_SOURCE_REMOVE;
}

void TrayApp::on_launch_at_login_toggled(GtkMenuItem *item,
                                         gpointer user_data) {
  (void)item;
  auto *app = static_cast<TrayApp *>(user_data);
  if (app->updating_) {
    return;
  }

  // Флажок обновится, когда придёт фактический результат
  app->coordinator_.set_launch_at_login(!app->snapshot_.launch_at_login);
}

void TrayApp::on_permissions_guide_clicked(GtkMenuItem *item,
                                           gpointer user_data) {
  (void)item;
  auto *app = static_cast<TrayApp *>(user_data);
  app->coordinator_.request_permission_guidance();
}

void TrayApp::on_welcome_guide_clicked(GtkMenuItem *item,
                                       gpointer user_data) {
  (void)item;
  auto *app = static_cast<TrayApp *>(user_data);
  app->coordinator_.show_welcome_guide();
}

void TrayApp::on_quit_clicked(GtkMenuItem *item, gpointer user_data) {
  (void)item;
  (void)user_data;

  gtk_main_quit();
}

void TrayApp::on_dialog_response(GtkDialog *dialog, gint response_id,
                                 gpointer user_data) {
  (void)response_id;
  auto *app = static_cast<TrayApp *>(user_data);

  const DialogKind kind = app->dialog_kind_;
  app->dialog_ = nullptr;
  app->dialog_kind_ = DialogKind::None;
  gtk_widget_destroy(GTK_WIDGET(dialog));

  if (kind == DialogKind::ConfigurationNeeded) {
    app->coordinator_.acknowledge_configuration_hint();
  }
}

gboolean TrayApp::on_refresh_timer(gpointer user_data) {
  auto *app = static_cast<TrayApp *>(user_data);
  app->coordinator_.refresh();
  return G_SOURCE_CONTINUE;
}

} // namespace capswitch
