#include "factory.hpp"

#include <chrono>
#include <memory>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"

namespace mountsync::factory {

using mountsync::runtime::config::RuntimeConfig;
using std::chrono::milliseconds;

std::shared_ptr<store::StateStore> BuildStore(const RuntimeConfig& config, bool create_if_missing) {
  db::sqlite::SqliteOptions options;
  options.wal_mode          = !config.store().disable_wal();
  options.busy_timeout_ms   = config.store().busy_timeout_ms();
  options.create_if_missing = create_if_missing;

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(config.paths().db_file(), options);
  sqlite_db->Migrate(db::sql::ItemStoreMigrations());

  MOUNTSYNC_LOG_DEBUG("state database ready", {observability::StringField("path", sqlite_db->Path()), observability::BoolField("wal", options.wal_mode)});

  auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  return std::make_shared<store::StateStore>(std::move(repository));
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // State store
  // ------------------------------------------------------------------
  app.store = BuildStore(config);

  // ------------------------------------------------------------------
  // Inputs: descriptors and the mount
  // ------------------------------------------------------------------
  metadata::MetadataReader::Options reader_options;
  reader_options.progress_log_interval = milliseconds(config.metadata().progress_log_interval_ms());
  app.reader = std::make_shared<metadata::MetadataReader>(config.paths().info_dir(), reader_options);

  mount::MountScanner::Options scanner_options;
  scanner_options.content_dir         = config.mount().content_dir();
  scanner_options.timeout             = milliseconds(config.mount().scan_timeout_ms());
  scanner_options.allow_empty_listing = config.mount().allow_empty_listing();
  app.scanner = std::make_shared<mount::MountScanner>(config.paths().mount_root(), scanner_options);

  // ------------------------------------------------------------------
  // Reconciliation
  // ------------------------------------------------------------------
  reconcile::ReconcilePolicy policy;
  policy.missing_debounce_scans = config.reconcile().missing_debounce_scans();
  policy.name_match_threshold   = config.mount().name_match_threshold();
  app.reconciler = std::make_shared<reconcile::Reconciler>(app.store, policy);

  runtime::ReconcileDriver::Options driver_options;
  driver_options.interval                          = milliseconds(config.scheduler().interval_ms());
  driver_options.scan_retries                      = config.mount().scan_retries();
  driver_options.retry_backoff_initial             = milliseconds(config.mount().retry_backoff_initial_ms());
  driver_options.retry_backoff_max                 = milliseconds(config.mount().retry_backoff_max_ms());
  driver_options.outage.pause_threshold            = milliseconds(config.reconcile().outage_pause_threshold_ms());
  driver_options.outage.resume_after_healthy_scans = config.reconcile().resume_after_healthy_scans();
  app.driver = std::make_shared<runtime::ReconcileDriver>(app.reader, app.scanner, app.reconciler, driver_options);

  return app;
}

} // namespace mountsync::factory
