/**
 * @file xkb_rules.hpp
 * @brief Разбор свойства _XKB_RULES_NAMES
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace capswitch {

/**
 * @brief Идентификаторы раскладок из _XKB_RULES_NAMES
 *
 * Вход — строки rules, model, layout, variant, options, разделённые '\0'.
 * Выход — по идентификатору на раскладку: "layout" или "layout(variant)",
 * в порядке XKB групп.
 */
[[nodiscard]] std::vector<std::string>
parse_xkb_rules_names(std::string_view raw);

} // namespace capswitch
