#include "capswitch/autostart.hpp"
#include "capswitch/preference_store.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

[[noreturn]] void test_fail(const char *expr, const char *file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr)                                                            \
  do {                                                                         \
    if (!(expr)) {                                                             \
      test_fail(#expr, __FILE__, __LINE__);                                    \
    }                                                                          \
  } while (0)

using capswitch::FilePreferenceStore;
using capswitch::kPrefHasShownWelcome;
using capswitch::kPrefSelectedSource1;
using capswitch::kPrefSelectedSource2;
using capswitch::XdgAutostart;

/// Временный каталог, удаляется в деструкторе
struct TempDir {
  std::filesystem::path path;

  TempDir() {
    char tmpl[] = "/tmp/capswitch-store-XXXXXX";
    const char *dir = mkdtemp(tmpl);
    if (dir == nullptr) {
      test_fail("mkdtemp", __FILE__, __LINE__);
    }
    path = dir;
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
};

std::string read_file(const std::filesystem::path &path) {
  std::ifstream in{path};
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

void test_missing_file_is_empty_store() {
  TempDir dir;
  FilePreferenceStore store{dir.path / "state"};
  CHECK(!store.get(kPrefSelectedSource1));
  CHECK(!std::filesystem::exists(dir.path / "state"));
}

void test_values_survive_reload() {
  TempDir dir;
  // Каталог создаётся при первой записи
  const auto path = dir.path / "nested" / "state";
  {
    FilePreferenceStore store{path};
    CHECK(store.set(kPrefSelectedSource1, "us"));
    CHECK(store.set(kPrefSelectedSource2, "de(nodeadkeys)"));
    CHECK(store.set(kPrefHasShownWelcome, "true"));
  }
  CHECK(std::filesystem::exists(path));

  FilePreferenceStore reloaded{path};
  CHECK(reloaded.get(kPrefSelectedSource1) == "us");
  CHECK(reloaded.get(kPrefSelectedSource2) == "de(nodeadkeys)");
  CHECK(reloaded.get(kPrefHasShownWelcome) == "true");
}

void test_remove_and_overwrite() {
  TempDir dir;
  const auto path = dir.path / "state";
  FilePreferenceStore store{path};
  CHECK(store.set(kPrefSelectedSource1, "us"));
  CHECK(store.set(kPrefSelectedSource1, "fr"));
  CHECK(store.get(kPrefSelectedSource1) == "fr");

  CHECK(store.remove(kPrefSelectedSource1));
  CHECK(!store.get(kPrefSelectedSource1));
  CHECK(store.remove(kPrefSelectedSource1));

  FilePreferenceStore reloaded{path};
  CHECK(!reloaded.get(kPrefSelectedSource1));
  CHECK(read_file(path).find("selected_source_id_1") == std::string::npos);
}

void test_hand_edited_file() {
  TempDir dir;
  const auto path = dir.path / "state";
  {
    std::ofstream out{path};
    out << "# comment\n"
        << "\n"
        << "selected_source_id_1:   ru  \n"
        << "garbage line\n"
        << "selected_source_id_2: us\n";
  }

  FilePreferenceStore store{path};
  CHECK(store.get(kPrefSelectedSource1) == "ru");
  CHECK(store.get(kPrefSelectedSource2) == "us");
}

void test_empty_path_cannot_save() {
  FilePreferenceStore store{std::filesystem::path{}};
  CHECK(!store.set(kPrefSelectedSource1, "us"));
  // В памяти значение всё равно есть
  CHECK(store.get(kPrefSelectedSource1) == "us");
}

void test_autostart_entry() {
  TempDir dir;
  const auto desktop = dir.path / "autostart" / "capswitch.desktop";
  XdgAutostart autostart{desktop, "/usr/local/bin/capswitch"};
  CHECK(!autostart.is_enabled());

  auto res = autostart.set_enabled(true);
  CHECK(res.ok);
  CHECK(res.enabled);
  CHECK(autostart.is_enabled());
  CHECK(read_file(desktop).find("Exec=/usr/local/bin/capswitch\n") !=
        std::string::npos);

  res = autostart.set_enabled(false);
  CHECK(res.ok);
  CHECK(!res.enabled);
  CHECK(!std::filesystem::exists(desktop));

  // Выключенная пользователем запись не считается включённой
  {
    std::filesystem::create_directories(desktop.parent_path());
    std::ofstream out{desktop};
    out << "[Desktop Entry]\nExec=capswitch\nHidden=true\n";
  }
  CHECK(!autostart.is_enabled());
}

void test_autostart_without_home() {
  XdgAutostart autostart{std::filesystem::path{}, "/usr/bin/capswitch"};
  auto res = autostart.set_enabled(true);
  CHECK(!res.ok);
  CHECK(!res.enabled);
  CHECK(!res.error.empty());
}

} // namespace

#undef CHECK

int main() {
  test_missing_file_is_empty_store();
  test_values_survive_reload();
  test_remove_and_overwrite();
  test_hand_edited_file();
  test_empty_path_cannot_save();
  test_autostart_entry();
  test_autostart_without_home();

  std::cout << "OK\n";
  return 0;
}
