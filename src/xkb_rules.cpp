/**
 * @file xkb_rules.cpp
 * @brief Разбор _XKB_RULES_NAMES
 */

#include "capswitch/xkb_rules.hpp"

#include <cctype>

namespace capswitch {

namespace {

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

std::vector<std::string> split_csv(std::string_view sv) {
  std::vector<std::string> out;
  while (true) {
    auto pos = sv.find(',');
    out.emplace_back(trim(sv.substr(0, pos)));
    if (pos == std::string_view::npos) {
      break;
    }
    sv.remove_prefix(pos + 1);
  }
  return out;
}

} // namespace

std::vector<std::string> parse_xkb_rules_names(std::string_view raw) {
  // rules \0 model \0 layout \0 variant \0 options
  std::vector<std::string_view> fields;
  while (fields.size() < 5) {
    auto pos = raw.find('\0');
    fields.push_back(raw.substr(0, pos));
    if (pos == std::string_view::npos) {
      break;
    }
    raw.remove_prefix(pos + 1);
  }

  std::vector<std::string> ids;
  if (fields.size() < 3 || trim(fields[2]).empty()) {
    return ids;
  }

  const std::vector<std::string> layouts = split_csv(fields[2]);
  const std::vector<std::string> variants =
      fields.size() > 3 ? split_csv(fields[3]) : std::vector<std::string>{};

  for (std::size_t i = 0; i < layouts.size(); ++i) {
    std::string id = layouts[i];
    if (i < variants.size() && !variants[i].empty()) {
      id += "(" + variants[i] + ")";
    }
    ids.push_back(std::move(id));
  }
  return ids;
}

} // namespace capswitch
