/**
 * @file file_util.hpp
 * @brief Атомарная запись небольших файлов настроек
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace capswitch {

/**
 * @brief Пишет content в path через временный файл и rename
 *
 * Родительский каталог создаётся при необходимости.
 * @param error Сюда пишется описание ошибки
 * @return true при успехе
 */
[[nodiscard]] bool write_file_atomic(const std::filesystem::path &path,
                                     std::string_view content,
                                     std::string *error = nullptr);

/// Путь относительно $HOME. Пустой, если HOME не задан.
[[nodiscard]] std::filesystem::path home_relative(std::string_view rel);

} // namespace capswitch
