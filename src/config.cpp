/**
 * @file config.cpp
 * @brief Реализация загрузчика конфигурации
 */

#include "capswitch/config.hpp"
#include "capswitch/scancode_map.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace capswitch {

namespace {

/// Минимальный и максимальный период опроса прав
constexpr std::chrono::milliseconds kMinPollInterval{100};
constexpr std::chrono::milliseconds kMaxPollInterval{60000};

/// Удаляет пробелы с начала и конца строки
std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

/// Отрезает комментарий в конце строки ("3000  # ms")
std::string_view strip_comment(std::string_view sv) {
  auto pos = sv.find(" #");
  if (pos != std::string_view::npos) {
    sv = sv.substr(0, pos);
  }
  return trim(sv);
}

/// Парсит целое число из строки
std::optional<int> parse_int(std::string_view sv) {
  sv = trim(sv);
  int value = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec == std::errc{} && ptr == sv.data() + sv.size()) {
    return value;
  }
  return std::nullopt;
}

/// Парсит булево значение из строки
std::optional<bool> parse_bool(std::string_view sv) {
  sv = trim(sv);
  if (sv == "true" || sv == "yes" || sv == "1" || sv == "on") {
    return true;
  }
  if (sv == "false" || sv == "no" || sv == "0" || sv == "off") {
    return false;
  }
  return std::nullopt;
}

/// Снимает необязательные кавычки вокруг строкового значения
std::string_view unquote(std::string_view sv) {
  if (sv.size() >= 2 && (sv.front() == '"' || sv.front() == '\'') &&
      sv.back() == sv.front()) {
    sv.remove_prefix(1);
    sv.remove_suffix(1);
  }
  return sv;
}

} // namespace

std::optional<std::chrono::milliseconds>
parse_interval_ms(std::string_view value) {
  auto ms = parse_int(value);
  if (ms && *ms >= 0) {
    return std::chrono::milliseconds{*ms};
  }
  return std::nullopt;
}

bool validate_config(const Config &config) {
  if (find_trigger_key(config.trigger.key) == nullptr) {
    return false;
  }

  if (config.permission.poll_interval < kMinPollInterval ||
      config.permission.poll_interval > kMaxPollInterval) {
    return false;
  }

  if (config.permission.input_dir.empty() ||
      config.permission.uinput_path.empty()) {
    return false;
  }

  if (config.remap.enabled) {
    // Утилита запускается через execv, без поиска по PATH
    if (!config.remap.utility.is_absolute()) {
      return false;
    }
    if (config.remap.placeholder.empty()) {
      return false;
    }
  }

  if (config.remap.timeout.count() <= 0) {
    return false;
  }
  if (config.remap.retry_backoff.count() < 0) {
    return false;
  }

  if (config.tray.refresh_interval.count() < 0) {
    return false;
  }

  return true;
}

namespace {

/// Получает путь к user config (~/.config/capswitch/config.yaml)
std::string get_user_config_path() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::string(home) + "/" + std::string(kUserConfigRelPath);
  }
  return "";
}

/// Разбирает поток. Возвращает false, если встретилось значение, которое не
/// удалось распознать (неизвестное имя клавиши, не число и т.п.).
bool parse_config_stream(std::istream &file, Config &config,
                         std::string &error) {
  std::string line;
  std::string current_section;
  int line_no = 0;

  auto fail = [&](std::string_view what) {
    error = "line " + std::to_string(line_no) + ": " + std::string{what};
    return false;
  };

  while (std::getline(file, line)) {
    ++line_no;
    std::string_view sv = trim(line);

    // Пропуск пустых строк и комментариев
    if (sv.empty() || sv.front() == '#') {
      continue;
    }

    // Секция верхнего уровня: строка без отступа, заканчивается на ':'
    const bool top_level = !line.empty() &&
                           !std::isspace(static_cast<unsigned char>(line[0]));
    sv = strip_comment(sv);
    if (top_level && sv.ends_with(':')) {
      current_section = std::string{sv.substr(0, sv.size() - 1)};
      continue;
    }

    // Парсинг key: value
    auto colon_pos = sv.find(':');
    if (colon_pos == std::string_view::npos) {
      return fail("expected 'key: value'");
    }

    std::string_view key = trim(sv.substr(0, colon_pos));
    std::string_view value = unquote(trim(sv.substr(colon_pos + 1)));

    if (current_section == "trigger") {
      if (key == "key") {
        auto code = key_name_to_code(value);
        if (!code) {
          return fail("unknown trigger key");
        }
        config.trigger.key = *code;
      }
    } else if (current_section == "permission") {
      if (key == "poll_interval") {
        auto val = parse_interval_ms(value);
        if (!val) {
          return fail("poll_interval must be a number of milliseconds");
        }
        config.permission.poll_interval = *val;
      } else if (key == "input_dir") {
        config.permission.input_dir = std::string{value};
      } else if (key == "uinput_path") {
        config.permission.uinput_path = std::string{value};
      }
    } else if (current_section == "remap") {
      if (key == "enabled") {
        auto val = parse_bool(value);
        if (!val) {
          return fail("remap.enabled must be a boolean");
        }
        config.remap.enabled = *val;
      } else if (key == "utility") {
        config.remap.utility = std::string{value};
      } else if (key == "placeholder") {
        config.remap.placeholder = std::string{value};
      } else if (key == "timeout") {
        auto val = parse_interval_ms(value);
        if (!val) {
          return fail("remap.timeout must be a number of milliseconds");
        }
        config.remap.timeout = *val;
      } else if (key == "retry_backoff") {
        auto val = parse_interval_ms(value);
        if (!val) {
          return fail("remap.retry_backoff must be a number of milliseconds");
        }
        config.remap.retry_backoff = *val;
      }
    } else if (current_section == "tray") {
      if (key == "refresh_interval") {
        auto val = parse_interval_ms(value);
        if (!val) {
          return fail("tray.refresh_interval must be a number of milliseconds");
        }
        config.tray.refresh_interval = *val;
      } else if (key == "configure_hint") {
        auto val = parse_bool(value);
        if (!val) {
          return fail("tray.configure_hint must be a boolean");
        }
        config.tray.configure_hint = *val;
      }
    }
  }

  return true;
}

} // namespace

ConfigLoadOutcome load_config_checked(std::filesystem::path path) {
  ConfigLoadOutcome out;
  out.used_path = std::move(path);

  if (out.used_path.empty()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Empty config path";
    return out;
  }

  std::ifstream file{out.used_path};
  if (!file.is_open()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Config file not found: " + out.used_path.string();
    return out;
  }

  std::string parse_error;
  if (!parse_config_stream(file, out.config, parse_error)) {
    out.result = ConfigResult::ParseError;
    out.error = "Parse error in " + out.used_path.string() + ", " + parse_error;
    out.config = Config{};
    return out;
  }
  out.config.config_path = out.used_path;

  if (!validate_config(out.config)) {
    out.result = ConfigResult::InvalidValue;
    out.error = "Invalid configuration in: " + out.used_path.string();
    out.config = Config{};
    return out;
  }

  out.result = ConfigResult::Ok;
  return out;
}

Config load_config(std::string_view path) {
  // Best-effort логика: если запрошен дефолтный путь, пробуем user-config
  // первым.
  std::filesystem::path effective_path{std::string{path}};

  if (path == kConfigPath) {
    std::string user_path = get_user_config_path();
    if (!user_path.empty()) {
      std::error_code ec;
      bool exists = std::filesystem::exists(user_path, ec);
      if (!ec && exists) {
        effective_path = user_path;
        std::cerr << "[capswitch] Using user config: " << user_path << "\n";
      }
    }
  }

  ConfigLoadOutcome out = load_config_checked(effective_path);
  if (out.result != ConfigResult::Ok) {
    // Отсутствие системного конфига — нормальная ситуация, молчим
    if (out.result != ConfigResult::FileNotFound || path != kConfigPath) {
      std::cerr << "[capswitch] Warning: " << out.error << "\n";
    }
    return Config{};
  }

  return out.config;
}

} // namespace capswitch
