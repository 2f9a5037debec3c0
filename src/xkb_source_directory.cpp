/**
 * @file xkb_source_directory.cpp
 * @brief Реализация каталога раскладок на XKB
 */

#include "capswitch/xkb_rules.hpp"
#include "capswitch/xkb_source_directory.hpp"

#include <X11/XKBlib.h>
#include <X11/Xatom.h>
#include <X11/Xlib.h>

#include <iostream>

namespace capswitch {

XkbSourceDirectory::~XkbSourceDirectory() { close(); }

bool XkbSourceDirectory::open() {
  if (display_) {
    return true;
  }

  int major = XkbMajorVersion;
  int minor = XkbMinorVersion;
  int reason = 0;
  display_ = XkbOpenDisplay(nullptr, nullptr, nullptr, &major, &minor, &reason);
  if (!display_) {
    std::cerr << "[capswitch] Cannot open X display with XKB (reason "
              << reason << ")\n";
    return false;
  }
  return true;
}

void XkbSourceDirectory::close() {
  if (display_) {
    XCloseDisplay(display_);
    display_ = nullptr;
  }
}

std::optional<std::vector<std::string>>
XkbSourceDirectory::layout_identifiers() {
  if (!open()) {
    return std::nullopt;
  }

  Atom rules_atom = XInternAtom(display_, "_XKB_RULES_NAMES", True);
  if (rules_atom == None) {
    return std::nullopt;
  }

  Atom actual_type = None;
  int actual_format = 0;
  unsigned long nitems = 0;
  unsigned long bytes_after = 0;
  unsigned char *data = nullptr;

  const int status = XGetWindowProperty(
      display_, DefaultRootWindow(display_), rules_atom, 0, 1024, False,
      XA_STRING, &actual_type, &actual_format, &nitems, &bytes_after, &data);
  if (status != Success || actual_type != XA_STRING || actual_format != 8 ||
      !data) {
    if (data) {
      XFree(data);
    }
    return std::nullopt;
  }

  std::string raw(reinterpret_cast<const char *>(data), nitems);
  XFree(data);
  return parse_xkb_rules_names(raw);
}

std::optional<std::vector<InputSourceDescriptor>>
XkbSourceDirectory::list_sources() {
  auto ids = layout_identifiers();
  if (!ids) {
    return std::nullopt;
  }

  XkbDescPtr desc = XkbAllocKeyboard();
  if (!desc) {
    return std::nullopt;
  }
  desc->dpy = display_;

  std::vector<InputSourceDescriptor> sources;
  if (XkbGetControls(display_, XkbGroupsWrapMask, desc) != Success ||
      XkbGetNames(display_, XkbGroupNamesMask, desc) != Success ||
      !desc->ctrls || !desc->names) {
    XkbFreeKeyboard(desc, 0, True);
    std::cerr << "[capswitch] XKB group names are unavailable\n";
    return std::nullopt;
  }

  const int groups = desc->ctrls->num_groups;
  for (int i = 0; i < groups && i < XkbNumKbdGroups; ++i) {
    InputSourceDescriptor source;
    source.group = i;
    source.identifier = static_cast<std::size_t>(i) < ids->size()
                            ? (*ids)[static_cast<std::size_t>(i)]
                            : "group" + std::to_string(i + 1);

    const Atom name_atom = desc->names->groups[i];
    if (name_atom != None) {
      char *name = XGetAtomName(display_, name_atom);
      if (name) {
        source.localized_name = name;
        XFree(name);
      }
    }
    if (source.localized_name.empty()) {
      source.localized_name = source.identifier;
    }
    sources.push_back(std::move(source));
  }

  XkbFreeKeyboard(desc, 0, True);
  return sources;
}

std::optional<int> XkbSourceDirectory::current_group() {
  if (!open()) {
    return std::nullopt;
  }

  XkbStateRec state;
  if (XkbGetState(display_, XkbUseCoreKbd, &state) != Success) {
    return std::nullopt;
  }
  return static_cast<int>(state.group);
}

bool XkbSourceDirectory::activate_group(int group) {
  if (!open()) {
    return false;
  }
  if (group < 0 || group >= XkbNumKbdGroups) {
    return false;
  }

  if (!XkbLockGroup(display_, XkbUseCoreKbd, static_cast<unsigned int>(group))) {
    return false;
  }
  XSync(display_, False);
  return true;
}

} // namespace capswitch
