/**
 * @file preference_store.hpp
 * @brief Хранилище пользовательских настроек ключ-значение
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace capswitch {

/// Ключи хранилища
inline constexpr std::string_view kPrefSelectedSource1 = "selected_source_id_1";
inline constexpr std::string_view kPrefSelectedSource2 = "selected_source_id_2";
inline constexpr std::string_view kPrefHasShownWelcome = "has_shown_welcome";

class PreferenceStore {
public:
  virtual ~PreferenceStore() = default;

  [[nodiscard]] virtual std::optional<std::string>
  get(std::string_view key) const = 0;

  /// @return false если значение не удалось сохранить
  virtual bool set(std::string_view key, std::string_view value) = 0;

  virtual bool remove(std::string_view key) = 0;
};

/**
 * @brief Файл вида "key: value" в ~/.config/capswitch/state
 *
 * Каждое изменение сразу записывается на диск атомарно (tmp + rename).
 */
class FilePreferenceStore final : public PreferenceStore {
public:
  explicit FilePreferenceStore(std::filesystem::path path);

  /// Путь по умолчанию от $HOME. Пустой, если HOME не задан.
  [[nodiscard]] static std::filesystem::path default_path();

  [[nodiscard]] std::optional<std::string>
  get(std::string_view key) const override;

  bool set(std::string_view key, std::string_view value) override;
  bool remove(std::string_view key) override;

  [[nodiscard]] const std::filesystem::path &path() const noexcept {
    return path_;
  }

private:
  void load();
  [[nodiscard]] bool save() const;

  std::filesystem::path path_;
  std::map<std::string, std::string, std::less<>> values_;
};

/// Хранилище в памяти
class MemoryPreferenceStore final : public PreferenceStore {
public:
  [[nodiscard]] std::optional<std::string>
  get(std::string_view key) const override {
    auto it = values_.find(key);
    if (it == values_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool set(std::string_view key, std::string_view value) override {
    values_.insert_or_assign(std::string{key}, std::string{value});
    return true;
  }

  bool remove(std::string_view key) override {
    auto it = values_.find(key);
    if (it != values_.end()) {
      values_.erase(it);
    }
    return true;
  }

private:
  std::map<std::string, std::string, std::less<>> values_;
};

} // namespace capswitch
