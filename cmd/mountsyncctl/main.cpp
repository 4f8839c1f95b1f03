#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/retention.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using mountsync::model::ItemStatus;
using mountsync::util::FormatTimestamp;

static void Usage() {
  std::cout << "Usage:\n"
            << "  mountsyncctl [--config path] <db> list [PENDING|AVAILABLE|PARTIAL|MISSING|REMOVED]\n"
            << "  mountsyncctl [--config path] <db> show <id>\n"
            << "  mountsyncctl [--config path] <db> purge [retention_days]\n"
            << "  mountsyncctl [--config path] <db> stats\n"
            << "purge defaults to store.removed_retention_days (1-" << mountsync::store::kMaxRetentionDays << ").\n";
}

static uint64_t TotalBytes(const mountsync::model::Item& item) {
  uint64_t total = 0;
  for (const auto& file : item.files) total += file.size_bytes;
  return total;
}

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  int                        arg = 1;
  if (argc > 2 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    arg         = 3;
  }
  if (argc - arg < 2) {
    Usage();
    return 1;
  }

  const std::string db  = argv[arg];
  const std::string cmd = argv[arg + 1];
  const int         rest = arg + 2;

  const bool known = cmd == "list" || cmd == "show" || cmd == "purge" || cmd == "stats";
  if (!known || (cmd == "show" && argc <= rest)) {
    Usage();
    return 1;
  }

  mountsync::runtime::config::RuntimeConfig config;
  try {
    if (config_path) {
      config = mountsync::config::ConfigLoader::LoadFromYaml(*config_path);
    }
  } catch (const mountsync::util::ConfigurationError& e) {
    std::cerr << "configuration error: " << e.what() << "\n";
    return 2;
  }
  config.mutable_paths()->set_db_file(db);
  if (config.logging().level().empty()) {
    config.mutable_logging()->set_level("warn");
  }
  mountsync::config::ConfigLoader::ApplyDefaults(&config);
  mountsync::observability::InitializeLogging(config);

  try {
    // an existing database only; a mistyped path must not create one
    auto store = mountsync::factory::BuildStore(config, false);

    // ------------------------------------------------------------

    if (cmd == "list") {
      mountsync::db::ItemFilter filter;
      if (argc > rest) {
        auto status = mountsync::model::ParseItemStatus(argv[rest]);
        if (!status) {
          std::cerr << "unknown status: " << argv[rest] << "\n";
          return 1;
        }
        filter.status = *status;
      }

      for (const auto& item : store->List(filter)) {
        std::cout << item.id << "\t" << mountsync::model::ToString(item.status) << "\t" << item.name << "\t" << item.files.size() << " files\t"
                  << FormatTimestamp(item.last_seen_at) << (item.needs_inspection ? "\tINSPECT" : "") << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "show") {
      auto item = store->Get(argv[rest]);
      if (!item) {
        std::cerr << "not found: " << argv[rest] << "\n";
        return 2;
      }

      std::cout << "id=" << item->id << "\n"
                << "name=" << item->name << "\n"
                << "status=" << mountsync::model::ToString(item->status) << "\n"
                << "missing_streak=" << item->missing_streak << "\n"
                << "source=" << item->source_path << "\n"
                << "created=" << FormatTimestamp(item->created_at) << "\n"
                << "last_seen=" << FormatTimestamp(item->last_seen_at) << "\n"
                << "last_checked=" << FormatTimestamp(item->last_checked_at) << "\n"
                << "status_changed=" << FormatTimestamp(item->status_changed_at) << "\n"
                << "bytes=" << TotalBytes(*item) << "\n";
      if (item->needs_inspection) {
        std::cout << "inspection=" << item->inspection_note << "\n";
      }
      for (const auto& file : item->files) {
        std::cout << "  " << file.path << " " << file.size_bytes << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "purge") {
      std::optional<uint32_t> days;
      if (argc > rest) {
        days = mountsync::store::ParseRetentionDays(argv[rest]);
      } else {
        days = mountsync::store::ParseRetentionDays(std::to_string(config.store().removed_retention_days()));
      }
      if (!days) {
        std::cerr << "retention_days must be between 1 and " << mountsync::store::kMaxRetentionDays << "\n";
        Usage();
        return 1;
      }

      const auto cutoff = mountsync::store::RetentionCutoff(mountsync::util::Now(), *days);
      std::cout << "purged=" << store->PurgeRemoved(cutoff) << " retention_days=" << *days << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      uint64_t total = 0;
      for (const auto& [status, count] : store->CountByStatus()) {
        std::cout << mountsync::model::ToString(status) << "=" << count << "\n";
        total += count;
      }
      std::cout << "total=" << total << "\n";
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
