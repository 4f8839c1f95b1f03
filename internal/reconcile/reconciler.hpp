#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "internal/metadata/metadata_reader.hpp"
#include "internal/model/item.hpp"
#include "internal/mount/mount_scanner.hpp"
#include "internal/store/state_store.hpp"
#include "internal/util/time.hpp"

namespace mountsync::reconcile {

struct ReconcilePolicy {
  // Healthy scans in a row that must miss a visible item before MISSING.
  uint32_t missing_debounce_scans = 3;
  // Fuzzy fallback for the item directory; <= 0 disables it.
  int name_match_threshold = 85;
};

// Everything a pass needs from the driver.
struct PassContext {
  util::TimePoint          now{};
  bool                     downgrades_paused = false;
  const std::atomic<bool>* stop              = nullptr;
};

struct PassReport {
  bool        mount_healthy          = false;
  std::string mount_reason;
  bool        metadata_authoritative = false;
  bool        downgrades_paused      = false;
  bool        aborted                = false;

  uint64_t descriptors           = 0;
  uint64_t malformed_descriptors = 0;
  uint64_t unchanged_descriptors = 0;

  uint64_t inserted             = 0;
  uint64_t updated              = 0;
  uint64_t unchanged            = 0;
  uint64_t removed              = 0;
  uint64_t transitions          = 0;
  uint64_t skipped_unknown      = 0;
  uint64_t store_errors         = 0;
  uint64_t placeholders_created = 0;
  uint64_t placeholders_dropped = 0;

  uint64_t items_before = 0;
  uint64_t items_after  = 0;
};

// Placeholder ids for descriptors that never parsed.
inline constexpr std::string_view kPlaceholderPrefix = "unparsed:";

bool IsPlaceholderId(const std::string& id);

/*
  Diffs descriptors and the mount against the store and writes the
  minimal set of changes, one transaction per item.

  Mount decides status, metadata decides name and files. An unknown
  mount freezes every status; REMOVED needs a missing descriptor AND a
  healthy scan that still misses the files.
*/
class Reconciler {
 public:
  Reconciler(std::shared_ptr<store::StateStore> store, ReconcilePolicy policy);

  // source_path -> (id, digest) for the reader's unchanged shortcut.
  metadata::KnownDigests KnownDigests();

  PassReport Reconcile(const metadata::MetadataBatch& batch, const mount::MountSnapshot& snapshot, const PassContext& context);

  struct Visibility {
    size_t      declared     = 0;
    size_t      visible      = 0;
    bool        root_present = false;
    std::string root;
  };

  Visibility Evaluate(const mountsync::model::Item& item, const mount::MountSnapshot& snapshot) const;

 private:
  struct PassState;

  void ProcessDescriptor(PassState& pass, const metadata::Descriptor& descriptor);
  void ProcessRetained(PassState& pass, const mountsync::model::Item& item);
  void RecordPlaceholder(PassState& pass, const metadata::MalformedDescriptor& malformed);

  // Applies the state machine to `next`; true when the item must be retired.
  bool Advance(PassState& pass, mountsync::model::Item& next, bool descriptor_present);

  void Persist(PassState& pass, const mountsync::model::Item* previous, const mountsync::model::Item& next, bool retire);

  std::shared_ptr<store::StateStore> store_;
  ReconcilePolicy                    policy_;
};

} // namespace mountsync::reconcile
