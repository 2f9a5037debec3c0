/**
 * @file tray_app.hpp
 * @brief Иконка в трее и меню capswitch
 *
 * Отображает состояние координатора, список раскладок и диалоги.
 * Всё выполняется в главном цикле GTK (координирующий контекст).
 */

#pragma once

#include <gtk/gtk.h>

// Поддержка как Ayatana (Ubuntu 22.04+), так и legacy AppIndicator
#ifdef CAPSWITCH_HAVE_AYATANA_APPINDICATOR
#include <libayatana-appindicator/app-indicator.h>
#else
#include <libappindicator/app-indicator.h>
#endif

#include <string>

#include "capswitch/config.hpp"
#include "capswitch/coordinator.hpp"

namespace capswitch {

/**
 * @brief Класс tray-приложения
 *
 * Управляет иконкой в трее, контекстным меню, модальными окнами и
 * периодическим пересчётом состояния.
 */
class TrayApp : public StatusObserver {
public:
  TrayApp(Coordinator &coordinator, const TrayConfig &config);
  ~TrayApp() override;

  // Запрет копирования
  TrayApp(const TrayApp &) = delete;
  TrayApp &operator=(const TrayApp &) = delete;

  /**
   * @brief Создаёт индикатор и меню
   * @return false, если индикатор создать не удалось
   */
  [[nodiscard]] bool initialize();

  /**
   * @brief Запускает главный цикл GTK
   * @return Код возврата
   */
  int run();

  // StatusObserver
  void on_status_changed(const StatusSnapshot &snapshot) override;
  void on_permission_guidance(bool user_requested) override;
  void on_welcome() override;
  void on_configuration_needed() override;
  void on_selection_rejected() override;
  void on_error(ErrorKind kind, const std::string &detail) override;
  void on_launch_at_login_changed(bool enabled,
                                  const std::string &error) override;

private:
  /// Что показывает открытое модальное окно
  enum class DialogKind {
    None,
    PermissionGuidance,
    Welcome,
    ConfigurationNeeded,
    Error
  };

  // Callbacks для пунктов меню
  static void on_menu_show(GtkWidget *menu, gpointer user_data);
  static void on_source_activated(GtkMenuItem *item, gpointer user_data);
  static void on_launch_at_login_toggled(GtkMenuItem *item,
                                         gpointer user_data);
  static void on_permissions_guide_clicked(GtkMenuItem *item,
                                           gpointer user_data);
  static void on_welcome_guide_clicked(GtkMenuItem *item, gpointer user_data);
  static void on_quit_clicked(GtkMenuItem *item, gpointer user_data);

  static void on_dialog_response(GtkDialog *dialog, gint response_id,
                                 gpointer user_data);

  // Callback для периодического пересчёта
  static gboolean on_refresh_timer(gpointer user_data);

  /// Переключение раскладки выполняется вне обработчика сигнала пункта,
  /// который при перестройке меню будет уничтожен
  static gboolean on_source_toggle_idle(gpointer user_data);

  /// Перестраивает меню, если изменилась его структура
  void apply_snapshot(const StatusSnapshot &snapshot, bool force);

  void rebuild_menu();
  void update_icon();

  [[nodiscard]] GtkWidget *append_item(const char *label, GCallback callback);

  /**
   * @brief Показывает немодальный диалог, если другой уже не открыт
   * @return false, если диалог не показан
   */
  bool show_dialog(DialogKind kind, GtkMessageType type, const char *title,
                   const std::string &text);

  Coordinator &coordinator_;
  TrayConfig config_;

  // GTK компоненты
  AppIndicator *indicator_ = nullptr;
  GtkWidget *menu_ = nullptr;
  GtkWidget *status_item_ = nullptr;
  GtkWidget *dialog_ = nullptr;
  DialogKind dialog_kind_ = DialogKind::None;

  StatusSnapshot snapshot_;
  bool has_snapshot_ = false;

  /// Программное изменение флажков не должно вызывать действия
  bool updating_ = false;

  // ID таймера пересчёта
  guint refresh_timer_id_ = 0;
};

} // namespace capswitch
