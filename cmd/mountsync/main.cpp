#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using mountsync::config::ConfigLoader;
using mountsync::observability::IntField;
using mountsync::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage: mountsync [--config <config.yaml>] [--once]" << std::endl;
}

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  bool                       once = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--once") {
      once = true;
    } else {
      Usage();
      return 1;
    }
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = ConfigLoader::Load(config_path);
    if (once) {
      config.mutable_scheduler()->set_run_once(true);
    }

    mountsync::observability::InitializeLogging(config);
    ConfigLoader::Validate(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = mountsync::factory::Build(config);

    MOUNTSYNC_LOG_INFO("mountsync starting", {StringField("info_dir", config.paths().info_dir()), StringField("mount_root", config.paths().mount_root()),
                                              StringField("db_file", config.paths().db_file()),
                                              IntField("items", static_cast<int64_t>(app.store->Count()))});

    if (config.scheduler().run_once()) {
      auto report = app.driver->RunOnce();
      mountsync::observability::ShutdownLogging();
      return report && report->store_errors == 0 ? 0 : 2;
    }

    // Register signal handlers before starting the driver to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.driver->Start();

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    MOUNTSYNC_LOG_INFO("shutting down mountsync");

    app.driver->Stop();
    mountsync::observability::ShutdownLogging();
  } catch (const mountsync::util::ConfigurationError& e) {
    MOUNTSYNC_LOG_ERROR("invalid configuration", {StringField("error", e.what())});
    mountsync::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    MOUNTSYNC_LOG_ERROR("fatal error", {StringField("error", e.what())});
    mountsync::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
