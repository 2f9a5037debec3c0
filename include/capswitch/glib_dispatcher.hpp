/**
 * @file glib_dispatcher.hpp
 * @brief Dispatcher поверх главного цикла GLib
 *
 * Задача оборачивается в idle source и прикрепляется к контексту по
 * умолчанию, поэтому исполняется в потоке, где крутится gtk_main().
 */

#pragma once

#include "capswitch/dispatcher.hpp"

namespace capswitch {

class GlibDispatcher final : public Dispatcher {
public:
  void post(Task task) override;
};

} // namespace capswitch
