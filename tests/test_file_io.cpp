#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "resflow/util/file_io.h"

#define RF_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_file_io() {
  namespace fs = std::filesystem;

  struct CwdGuard {
    fs::path saved;
    explicit CwdGuard(fs::path p) : saved(std::move(p)) {}
    ~CwdGuard() {
      std::error_code ec_restore;
      fs::current_path(saved, ec_restore);
    }
  };

  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");

  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "resflow_test_file_io";
  dir /= std::to_string(static_cast<long long>(nonce));

  fs::create_directories(dir, ec);
  RF_ASSERT(!ec);

  const fs::path target = dir / "nested" / "events.jsonl";

  // Parent directories are created on demand.
  resflow::write_text_file(target.string(), "{\"event\":\"CHAIN_COMPLETED\"}\n");
  RF_ASSERT(resflow::read_text_file(target.string()) == "{\"event\":\"CHAIN_COMPLETED\"}\n");

  resflow::write_text_file(target.string(), "\n");
  RF_ASSERT(resflow::read_text_file(target.string()) == "\n");

  // Missing files throw.
  bool threw = false;
  try {
    (void)resflow::read_text_file((dir / "missing.json").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  RF_ASSERT(threw);

  // Relative content paths resolve from non-repo working directories too.
  const fs::path old_cwd = fs::current_path(ec);
  RF_ASSERT(!ec);
  {
    CwdGuard cwd_guard(old_cwd);
    fs::current_path(dir, ec);
    RF_ASSERT(!ec);

    const std::string content = resflow::read_text_file("data/content/example_economy.json");
    RF_ASSERT(content.find("\"recipes\"") != std::string::npos);
    RF_ASSERT(content.find("\"basic_manufacturing\"") != std::string::npos);
  }

  // No temp siblings are left behind.
  const std::string tmp_prefix = target.filename().string() + ".tmp";
  for (const auto& entry : fs::directory_iterator(target.parent_path())) {
    const std::string name = entry.path().filename().string();
    RF_ASSERT(name.rfind(tmp_prefix, 0) != 0);
  }

  fs::remove_all(dir, ec);
  return 0;
}
