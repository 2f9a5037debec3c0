/**
 * @file file_preference_store.cpp
 * @brief Хранилище настроек в файле "key: value"
 */

#include "capswitch/file_util.hpp"
#include "capswitch/preference_store.hpp"
#include "capswitch/types.hpp"

#include <cctype>
#include <fstream>
#include <iostream>

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

} // namespace

FilePreferenceStore::FilePreferenceStore(std::filesystem::path path)
    : path_(std::move(path)) {
  load();
}

std::filesystem::path FilePreferenceStore::default_path() {
  return home_relative(kStateRelPath);
}

void FilePreferenceStore::load() {
  values_.clear();

  std::ifstream file{path_};
  if (!file.is_open()) {
    // Первый запуск: файла ещё нет
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string_view sv = trim(line);
    if (sv.empty() || sv.front() == '#') {
      continue;
    }
    auto colon_pos = sv.find(':');
    if (colon_pos == std::string_view::npos) {
      continue;
    }
    std::string_view key = trim(sv.substr(0, colon_pos));
    std::string_view value = trim(sv.substr(colon_pos + 1));
    if (!key.empty()) {
      values_.insert_or_assign(std::string{key}, std::string{value});
    }
  }
}

bool FilePreferenceStore::save() const {
  if (path_.empty()) {
    return false;
  }

  std::string content = "# capswitch state, written automatically\n";
  for (const auto &[key, value] : values_) {
    content += key;
    content += ": ";
    content += value;
    content += '\n';
  }

  std::string error;
  if (!write_file_atomic(path_, content, &error)) {
    std::cerr << "[capswitch] Failed to save preferences: " << error << "\n";
    return false;
  }
  return true;
}

std::optional<std::string>
FilePreferenceStore::get(std::string_view key) const {
  auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool FilePreferenceStore::set(std::string_view key, std::string_view value) {
  values_.insert_or_assign(std::string{key}, std::string{trim(value)});
  return save();
}

bool FilePreferenceStore::remove(std::string_view key) {
  auto it = values_.find(key);
  if (it == values_.end()) {
    return true;
  }
  values_.erase(it);
  return save();
}

} // namespace capswitch
