/**
 * @file file_util.cpp
 * @brief Реализация атомарной записи файлов
 */

#include "capswitch/file_util.hpp"

#include <cstdlib>
#include <fstream>

namespace capswitch {

bool write_file_atomic(const std::filesystem::path &path,
                       std::string_view content, std::string *error) {
  auto fail = [error](std::string msg) {
    if (error) {
      *error = std::move(msg);
    }
    return false;
  };

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return fail("cannot create " + path.parent_path().string() + ": " +
                  ec.message());
    }
  }

  std::filesystem::path tmp_path = path;
  tmp_path += ".tmp";

  {
    std::ofstream file{tmp_path, std::ios::trunc};
    if (!file.is_open()) {
      return fail("cannot open " + tmp_path.string());
    }
    file << content;
    file.flush();
    if (!file.good()) {
      return fail("cannot write " + tmp_path.string());
    }
  }

  // Атомарно заменяем файл (rename в пределах одной ФС атомарен).
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code rm_ec;
    std::filesystem::remove(tmp_path, rm_ec);
    return fail("cannot replace " + path.string() + ": " + ec.message());
  }

  return true;
}

std::filesystem::path home_relative(std::string_view rel) {
  const char *home = std::getenv("HOME");
  if (!home || *home == '\0') {
    return {};
  }
  return std::filesystem::path{home} / std::string{rel};
}

} // namespace capswitch
