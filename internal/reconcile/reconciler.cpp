#include "reconciler.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/reconcile/name_matcher.hpp"
#include "internal/util/errors.hpp"

namespace mountsync::reconcile {

using mountsync::model::Item;
using mountsync::model::ItemStatus;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

std::string JoinRelative(const std::string& root, const std::string& path) {
  if (root.empty()) return path;
  return root + "/" + path;
}

std::string Basename(const std::string& path) {
  const auto slash = path.rfind('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool StopRequested(const PassContext& context) {
  return context.stop != nullptr && context.stop->load();
}

} // namespace

bool IsPlaceholderId(const std::string& id) {
  return id.compare(0, kPlaceholderPrefix.size(), kPlaceholderPrefix) == 0;
}

struct Reconciler::PassState {
  const metadata::MetadataBatch& batch;
  const mount::MountSnapshot&    snapshot;
  const PassContext&             context;
  PassReport                     report;

  std::unordered_map<std::string, Item>        stored;
  std::unordered_map<std::string, std::string> malformed_by_path;
  std::unordered_set<std::string>              parsed_paths;
  std::unordered_set<std::string>              descriptor_ids;
  std::unordered_set<std::string>              tracked_paths;
};

Reconciler::Reconciler(std::shared_ptr<store::StateStore> store, ReconcilePolicy policy) : store_(std::move(store)), policy_(policy) {
}

metadata::KnownDigests Reconciler::KnownDigests() {
  metadata::KnownDigests known;
  for (const auto& item : store_->List()) {
    if (item.source_path.empty() || item.source_metadata_hash.empty() || IsPlaceholderId(item.id)) {
      continue;
    }
    known[item.source_path] = metadata::KnownDescriptor{item.id, item.source_metadata_hash};
  }
  return known;
}

Reconciler::Visibility Reconciler::Evaluate(const Item& item, const mount::MountSnapshot& snapshot) const {
  Visibility visibility;
  visibility.declared = item.files.size();

  if (!item.name.empty()) {
    if (const auto* entry = snapshot.Find(item.name); entry != nullptr && entry->is_dir) {
      visibility.root_present = true;
      visibility.root         = item.name;
    } else if (policy_.name_match_threshold > 0) {
      if (auto match = BestNameMatch(item.name, snapshot.top_level_dirs, policy_.name_match_threshold)) {
        visibility.root_present = true;
        visibility.root         = std::move(*match);
      }
    }
  }

  if (item.files.empty()) {
    visibility.visible = visibility.root_present ? 1 : 0;
    visibility.declared = 1;
    return visibility;
  }

  for (const auto& file : item.files) {
    const mount::MountEntry* entry = nullptr;
    if (visibility.root_present) {
      entry = snapshot.Find(JoinRelative(visibility.root, file.path));
      if (entry == nullptr || entry->is_dir) {
        entry = snapshot.Find(JoinRelative(visibility.root, Basename(file.path)));
      }
    } else {
      // single-file items may sit directly under the content root
      entry = snapshot.Find(file.path);
    }

    if (entry != nullptr && !entry->is_dir && entry->size_bytes == file.size_bytes) {
      ++visibility.visible;
    }
  }
  return visibility;
}

bool Reconciler::Advance(PassState& pass, Item& next, bool descriptor_present) {
  if (!pass.snapshot.Healthy()) {
    ++pass.report.skipped_unknown;
    return false;
  }

  next.last_checked_at = pass.context.now;

  const auto visibility = Evaluate(next, pass.snapshot);
  if (visibility.visible > 0) {
    next.status         = visibility.visible == visibility.declared ? ItemStatus::kAvailable : ItemStatus::kPartial;
    next.missing_streak = 0;
    next.last_seen_at   = pass.context.now;
    return false;
  }

  if (pass.context.downgrades_paused) {
    return false;
  }

  switch (next.status) {
    case ItemStatus::kAvailable:
    case ItemStatus::kPartial:
      ++next.missing_streak;
      if (next.missing_streak >= policy_.missing_debounce_scans) {
        next.status = ItemStatus::kMissing;
      }
      return false;
    case ItemStatus::kMissing:
      return !descriptor_present;
    case ItemStatus::kPending:
    case ItemStatus::kRemoved:
      return false;
  }
  return false;
}

void Reconciler::Persist(PassState& pass, const Item* previous, const Item& next, bool retire) {
  if (retire) {
    store_->MarkRemoved(next.id, pass.context.now);
    ++pass.report.removed;
    ++pass.report.transitions;
    MOUNTSYNC_LOG_INFO("item removed", {StringField("id", next.id), StringField("name", next.name)});
    return;
  }

  switch (store_->Upsert(next)) {
    case store::UpsertOutcome::kInserted:
      ++pass.report.inserted;
      break;
    case store::UpsertOutcome::kUpdated:
      ++pass.report.updated;
      break;
    case store::UpsertOutcome::kUnchanged:
      ++pass.report.unchanged;
      break;
  }

  if (previous == nullptr) {
    MOUNTSYNC_LOG_INFO("item discovered", {StringField("id", next.id), StringField("name", next.name),
                                            StringField("status", mountsync::model::ToString(next.status))});
  } else if (previous->status != next.status) {
    ++pass.report.transitions;
    MOUNTSYNC_LOG_INFO("item status changed", {StringField("id", next.id), StringField("name", next.name),
                                                StringField("from", mountsync::model::ToString(previous->status)),
                                                StringField("to", mountsync::model::ToString(next.status))});
  }
}

void Reconciler::ProcessDescriptor(PassState& pass, const metadata::Descriptor& descriptor) {
  const auto  found    = pass.stored.find(descriptor.id);
  const Item* previous = found == pass.stored.end() ? nullptr : &found->second;

  Item next;
  if (previous != nullptr) {
    next = *previous;
  } else if (descriptor.unchanged) {
    // the digest came from a row that has since disappeared; next pass re-reads it
    MOUNTSYNC_LOG_WARN("descriptor digest known but item gone", {StringField("id", descriptor.id), StringField("file", descriptor.source_path)});
    return;
  } else {
    next.id         = descriptor.id;
    next.status     = ItemStatus::kPending;
    next.created_at        = pass.context.now;
    next.status_changed_at = pass.context.now;
  }

  if (!descriptor.unchanged) {
    next.name  = descriptor.name;
    next.files = descriptor.files;
  }
  next.source_path          = descriptor.source_path;
  next.source_metadata_hash = descriptor.raw_hash;
  next.needs_inspection     = false;
  next.inspection_note.clear();

  const bool retire = Advance(pass, next, true);
  if (previous != nullptr && previous->status != next.status) {
    next.status_changed_at = pass.context.now;
  }
  Persist(pass, previous, next, retire);
}

void Reconciler::ProcessRetained(PassState& pass, const Item& item) {
  const auto malformed = pass.malformed_by_path.find(item.source_path);
  const bool still_malformed = !item.source_path.empty() && malformed != pass.malformed_by_path.end();

  if (IsPlaceholderId(item.id)) {
    if (still_malformed) {
      Item next            = item;
      next.inspection_note = malformed->second;
      Persist(pass, &item, next, false);
      return;
    }
    if (pass.batch.authoritative || pass.parsed_paths.contains(item.source_path)) {
      store_->DeletePlaceholder(item.id);
      ++pass.report.placeholders_dropped;
      MOUNTSYNC_LOG_INFO("inspection placeholder cleared", {StringField("file", item.source_path)});
    }
    return;
  }

  // Absence only counts when the whole info directory was read.
  const bool descriptor_present = !pass.batch.authoritative || still_malformed;

  Item next = item;
  if (still_malformed) {
    next.needs_inspection = true;
    next.inspection_note  = malformed->second;
  }

  const bool retire = Advance(pass, next, descriptor_present);
  if (item.status != next.status) {
    next.status_changed_at = pass.context.now;
  }
  Persist(pass, &item, next, retire);
}

void Reconciler::RecordPlaceholder(PassState& pass, const metadata::MalformedDescriptor& malformed) {
  if (pass.tracked_paths.contains(malformed.source_path)) {
    return;
  }

  Item placeholder;
  placeholder.id               = std::string(kPlaceholderPrefix) + malformed.source_path;
  placeholder.name             = Basename(malformed.source_path);
  placeholder.status           = ItemStatus::kPending;
  placeholder.source_path      = malformed.source_path;
  placeholder.needs_inspection = true;
  placeholder.inspection_note  = malformed.error;
  placeholder.created_at       = pass.context.now;

  Persist(pass, nullptr, placeholder, false);
  ++pass.report.placeholders_created;
}

PassReport Reconciler::Reconcile(const metadata::MetadataBatch& batch, const mount::MountSnapshot& snapshot, const PassContext& context) {
  PassState pass{batch, snapshot, context, {}, {}, {}, {}, {}, {}};

  pass.report.mount_healthy          = snapshot.Healthy();
  pass.report.mount_reason           = snapshot.reason;
  pass.report.metadata_authoritative = batch.authoritative;
  pass.report.downgrades_paused      = context.downgrades_paused;
  pass.report.descriptors            = batch.descriptors.size();
  pass.report.malformed_descriptors  = batch.malformed.size();
  pass.report.unchanged_descriptors  = batch.unchanged;

  std::vector<std::string> retained_order;
  for (auto& item : store_->List()) {
    if (!item.source_path.empty()) {
      pass.tracked_paths.insert(item.source_path);
    }
    retained_order.push_back(item.id);
    pass.stored.emplace(item.id, std::move(item));
  }
  pass.report.items_before = pass.stored.size();

  for (const auto& malformed : batch.malformed) {
    pass.malformed_by_path.emplace(malformed.source_path, malformed.error);
  }
  for (const auto& descriptor : batch.descriptors) {
    pass.parsed_paths.insert(descriptor.source_path);
    pass.descriptor_ids.insert(descriptor.id);
  }

  if (!snapshot.Healthy()) {
    MOUNTSYNC_LOG_WARN("mount state unknown; statuses frozen this pass", {StringField("reason", snapshot.reason)});
  }

  // Each unit below is its own transaction; a failure is logged and the pass moves on.
  auto guarded = [&](const std::string& id, auto&& work) {
    try {
      work();
    } catch (const util::InvalidState& e) {
      ++pass.report.store_errors;
      MOUNTSYNC_LOG_ERROR("rejected item change", {StringField("id", id), StringField("error", e.what())});
    } catch (const std::exception& e) {
      ++pass.report.store_errors;
      MOUNTSYNC_LOG_ERROR("item write failed", {StringField("id", id), StringField("error", e.what())});
    }
  };

  for (const auto& descriptor : batch.descriptors) {
    if (StopRequested(context)) {
      pass.report.aborted = true;
      break;
    }
    guarded(descriptor.id, [&] { ProcessDescriptor(pass, descriptor); });
  }

  for (const auto& id : retained_order) {
    if (pass.report.aborted || StopRequested(context)) {
      pass.report.aborted = true;
      break;
    }
    if (pass.descriptor_ids.contains(id)) {
      continue;
    }
    guarded(id, [&] { ProcessRetained(pass, pass.stored.at(id)); });
  }

  for (const auto& malformed : batch.malformed) {
    if (pass.report.aborted || StopRequested(context)) {
      pass.report.aborted = true;
      break;
    }
    const auto id = std::string(kPlaceholderPrefix) + malformed.source_path;
    if (pass.stored.contains(id)) {
      continue;
    }
    guarded(id, [&] { RecordPlaceholder(pass, malformed); });
  }

  try {
    pass.report.items_after = store_->Count();
  } catch (const std::exception& e) {
    MOUNTSYNC_LOG_WARN("item count unavailable", {StringField("error", e.what())});
    pass.report.items_after = pass.report.items_before + pass.report.inserted;
  }

  MOUNTSYNC_LOG_INFO("reconcile pass finished",
                     {BoolField("mount_healthy", pass.report.mount_healthy), BoolField("authoritative", pass.report.metadata_authoritative),
                      BoolField("downgrades_paused", pass.report.downgrades_paused), IntField("descriptors", static_cast<int64_t>(pass.report.descriptors)),
                      IntField("malformed", static_cast<int64_t>(pass.report.malformed_descriptors)),
                      IntField("inserted", static_cast<int64_t>(pass.report.inserted)), IntField("updated", static_cast<int64_t>(pass.report.updated)),
                      IntField("removed", static_cast<int64_t>(pass.report.removed)), IntField("transitions", static_cast<int64_t>(pass.report.transitions)),
                      IntField("store_errors", static_cast<int64_t>(pass.report.store_errors)), BoolField("aborted", pass.report.aborted),
                      IntField("items", static_cast<int64_t>(pass.report.items_after))});

  return pass.report;
}

} // namespace mountsync::reconcile
