#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/metadata/metadata_reader.hpp"
#include "internal/mount/mount_scanner.hpp"
#include "internal/reconcile/reconciler.hpp"
#include "internal/runtime/reconcile_driver.hpp"
#include "internal/store/state_store.hpp"

namespace mountsync::factory {

/*
  Application

  Owns all long-lived components of the daemon.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<store::StateStore>        store;
  std::shared_ptr<metadata::MetadataReader> reader;
  std::shared_ptr<mount::MountScanner>      scanner;
  std::shared_ptr<reconcile::Reconciler>    reconciler;
  std::shared_ptr<runtime::ReconcileDriver> driver;
};

/*
  Opens the SQLite database at paths.db_file and migrates it. With
  create_if_missing=false a missing file is an error, not a new database.

  NOTE:
  This and Build are the only places that know the concrete repository.
*/
std::shared_ptr<store::StateStore> BuildStore(const mountsync::runtime::config::RuntimeConfig& config, bool create_if_missing = true);

// Wires the full daemon from an already validated config. The driver is not started.
Application Build(const mountsync::runtime::config::RuntimeConfig& config);

} // namespace mountsync::factory
