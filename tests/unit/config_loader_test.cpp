#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using mountsync::config::ConfigLoader;
using mountsync::runtime::config::RuntimeConfig;
using mountsync::util::ConfigurationError;

std::filesystem::path BaseDir() {
  const auto base_dir = std::filesystem::temp_directory_path() / "mountsync_config_loader_tests";
  std::filesystem::create_directories(base_dir);
  return base_dir;
}

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto    file_path = BaseDir() / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsConfigurationError(Fn&& fn) {
  try {
    fn();
  } catch (const ConfigurationError&) {
    return true;
  }
  return false;
}

void ClearEnvironment() {
  unsetenv("ZURGINFODIR");
  unsetenv("RCLONE_REMOTE_PATH");
  unsetenv("DB_FILE");
}

void TestLoadsEverySection() {
  const auto yaml_path = WriteYaml("full",
                                   R"(paths:
  info_dir: "/data/zurg/info"
  mount_root: "/mnt/zurg"
  db_file: "/data/torrents.db"
mount:
  content_dir: "__all__"
  scan_timeout_ms: 30000
  scan_retries: 5
  name_match_threshold: -1
reconcile:
  missing_debounce_scans: 4
  outage_pause_threshold_ms: 120000
scheduler:
  interval_ms: 3600000
store:
  disable_wal: true
logging:
  level: "debug"
  file: "/data/process_log.txt"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.paths().info_dir() == "/data/zurg/info");
  assert(config.paths().mount_root() == "/mnt/zurg");
  assert(config.paths().db_file() == "/data/torrents.db");
  assert(config.mount().scan_timeout_ms() == 30000);
  assert(config.mount().scan_retries() == 5);
  assert(config.mount().name_match_threshold() == -1);
  assert(config.reconcile().missing_debounce_scans() == 4);
  assert(config.scheduler().interval_ms() == 3600000);
  assert(config.store().disable_wal());
  assert(config.logging().file() == "/data/process_log.txt");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(paths:
  db_file: "C:\\zurg\\\"quoted\"\\torrents.db"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.paths().db_file() == "C:\\zurg\\\"quoted\"\\torrents.db");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(paths:
  info_dir: "/data"
api_key: "secret"
)");

  const bool threw = ThrowsConfigurationError([&] { (void)ConfigLoader::LoadFromYaml(yaml_path.string()); });
  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsConfigurationError() {
  assert(ThrowsConfigurationError([] { (void)ConfigLoader::LoadFromYaml("/nonexistent/mountsync.yaml"); }));
}

void TestDefaultsFillZeroValues() {
  ClearEnvironment();
  auto config = ConfigLoader::Load(std::nullopt);

  assert(config.paths().db_file() == "torrents.db");
  assert(config.mount().content_dir() == "__all__");
  assert(config.mount().scan_timeout_ms() == 120000);
  assert(config.mount().name_match_threshold() == 85);
  assert(config.reconcile().missing_debounce_scans() == 3);
  assert(config.reconcile().resume_after_healthy_scans() == 2);
  assert(config.scheduler().interval_ms() == 86400000);
  assert(!config.scheduler().run_once());
  assert(config.store().busy_timeout_ms() == 5000);
  assert(config.store().removed_retention_days() == 30);
}

void TestZeroNameMatchThresholdIsKept() {
  ClearEnvironment();
  const auto yaml_path = WriteYaml("fuzzy_off",
                                   R"(mount:
  name_match_threshold: 0
)");

  auto config = ConfigLoader::Load(yaml_path.string());
  assert(config.mount().has_name_match_threshold());
  assert(config.mount().name_match_threshold() == 0);
}

void TestEnvironmentOverridesYaml() {
  const auto yaml_path = WriteYaml("env_override",
                                   R"(paths:
  info_dir: "/from/yaml"
  mount_root: "/from/yaml/mount"
)");

  setenv("ZURGINFODIR", "/from/env/info", 1);
  setenv("DB_FILE", "/from/env/torrents.db", 1);

  auto config = ConfigLoader::Load(yaml_path.string());
  assert(config.paths().info_dir() == "/from/env/info");
  assert(config.paths().mount_root() == "/from/yaml/mount");
  assert(config.paths().db_file() == "/from/env/torrents.db");

  ClearEnvironment();
}

void TestValidateChecksPaths() {
  ClearEnvironment();
  const auto info  = BaseDir() / "info";
  const auto mount = BaseDir() / "mount";
  std::filesystem::create_directories(info);
  std::filesystem::create_directories(mount);

  RuntimeConfig config;
  ConfigLoader::ApplyDefaults(&config);
  assert(ThrowsConfigurationError([&] { ConfigLoader::Validate(config); }));

  config.mutable_paths()->set_info_dir(info.string());
  config.mutable_paths()->set_mount_root((BaseDir() / "not-mounted").string());
  assert(ThrowsConfigurationError([&] { ConfigLoader::Validate(config); }));

  config.mutable_paths()->set_mount_root(mount.string());
  config.mutable_paths()->set_db_file((BaseDir() / "torrents.db").string());
  ConfigLoader::Validate(config);

  config.mutable_paths()->set_db_file((BaseDir() / "missing-dir" / "torrents.db").string());
  assert(ThrowsConfigurationError([&] { ConfigLoader::Validate(config); }));

  config.mutable_paths()->set_db_file((BaseDir() / "torrents.db").string());
  config.mutable_mount()->set_name_match_threshold(101);
  assert(ThrowsConfigurationError([&] { ConfigLoader::Validate(config); }));

  config.mutable_mount()->set_name_match_threshold(0);
  config.mutable_store()->set_removed_retention_days(5000);
  assert(ThrowsConfigurationError([&] { ConfigLoader::Validate(config); }));
}

} // namespace

int main() {
  TestLoadsEverySection();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsConfigurationError();
  TestDefaultsFillZeroValues();
  TestZeroNameMatchThresholdIsKept();
  TestEnvironmentOverridesYaml();
  TestValidateChecksPaths();

  std::cout << "mountsync_unit_config_loader: pass\n";
  return 0;
}
