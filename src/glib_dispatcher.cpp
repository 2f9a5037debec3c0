/**
 * @file glib_dispatcher.cpp
 * @brief Реализация Dispatcher на GLib idle sources
 */

#include "capswitch/glib_dispatcher.hpp"

#include <glib.h>

namespace capswitch {

namespace {

gboolean run_task(gpointer data) {
  auto *task = static_cast<Task *>(data);
  if (*task) {
    (*task)();
  }
  return G_SOURCE_REMOVE;
}

void free_task(gpointer data) { delete static_cast<Task *>(data); }

} // namespace

void GlibDispatcher::post(Task task) {
  GSource *source = g_idle_source_new();
  g_source_set_priority(source, G_PRIORITY_DEFAULT);
  g_source_set_callback(source, run_task, new Task(std::move(task)),
                        free_task);
  g_source_attach(source, nullptr);
  g_source_unref(source);
}

} // namespace capswitch
