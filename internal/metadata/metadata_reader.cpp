#include "metadata_reader.hpp"

#include <google/protobuf/util/json_util.h>
#include <libtorrent/error_code.hpp>
#include <libtorrent/file_storage.hpp>
#include <libtorrent/info_hash.hpp>
#include <libtorrent/sha1_hash.hpp>
#include <libtorrent/span.hpp>
#include <libtorrent/torrent_info.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "mountsync/v1/zurginfo.pb.h"

namespace mountsync::metadata {

namespace fs = std::filesystem;
using mountsync::model::FileEntry;
using observability::IntField;
using observability::StringField;

namespace {

constexpr std::string_view kZurgInfoExtension    = ".zurginfo";
constexpr std::string_view kZurgTorrentExtension = ".zurgtorrent";

std::string ToUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

std::string StripLeadingSlashes(std::string path) {
  const auto first = path.find_first_not_of('/');
  return first == std::string::npos ? std::string() : path.substr(first);
}

std::string ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::MalformedMetadataError("cannot open descriptor");
  }
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw util::MalformedMetadataError("read error");
  }
  return content;
}

} // namespace

MetadataReader::MetadataReader(fs::path info_dir, Options options) : info_dir_(std::move(info_dir)), options_(options) {
}

bool MetadataReader::IsDescriptorFile(const fs::path& path) {
  const auto ext = path.extension().string();
  return ext == kZurgInfoExtension || ext == kZurgTorrentExtension;
}

Descriptor MetadataReader::ParseZurgInfo(std::string_view content) {
  mountsync::v1::ZurgInfo info;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(content), &info, options);
  if (!status.ok()) {
    throw util::MalformedMetadataError("invalid zurginfo JSON: " + std::string(status.message()));
  }
  if (info.hash().empty()) {
    throw util::MalformedMetadataError("zurginfo has no 'hash'");
  }

  Descriptor descriptor;
  descriptor.id   = ToUpper(info.hash());
  descriptor.name = !info.filename().empty() ? info.filename() : info.original_filename();
  if (descriptor.name.empty()) {
    throw util::MalformedMetadataError("zurginfo has no 'filename'");
  }

  // Only selected files are exposed on the mount. Descriptors that never
  // set the flag list everything.
  const bool any_selected =
      std::any_of(info.files().begin(), info.files().end(), [](const auto& file) { return file.selected() != 0; });

  for (const auto& file : info.files()) {
    if (any_selected && file.selected() == 0) {
      continue;
    }
    auto path = StripLeadingSlashes(file.path());
    if (path.empty()) {
      throw util::MalformedMetadataError("zurginfo file entry without path");
    }
    if (file.bytes() < 0) {
      throw util::MalformedMetadataError("zurginfo file with negative size: " + path);
    }
    descriptor.files.push_back({std::move(path), static_cast<uint64_t>(file.bytes())});
  }

  return descriptor;
}

Descriptor MetadataReader::ParseZurgTorrent(std::string_view content) {
  lt::error_code   ec;
  lt::torrent_info info(lt::span<char const>(content.data(), static_cast<std::ptrdiff_t>(content.size())), ec, lt::from_span);
  if (ec) {
    throw util::MalformedMetadataError("invalid zurgtorrent: " + ec.message());
  }

  // Items are keyed by the v1 infohash; v2-only torrents fall back to the
  // truncated v2 hash.
  const auto& hashes = info.info_hashes();
  const auto  hash   = hashes.has_v1() ? hashes.v1 : hashes.get_best();

  std::ostringstream hex;
  hex << hash;

  Descriptor descriptor;
  descriptor.id   = ToUpper(hex.str());
  descriptor.name = info.name();
  if (descriptor.name.empty()) {
    throw util::MalformedMetadataError("zurgtorrent has no name");
  }

  // Multi-file paths carry the torrent name as their first component; the
  // mount exposes them relative to the item directory.
  const auto& files  = info.files();
  const auto  prefix = descriptor.name + "/";
  for (const lt::file_index_t index : files.file_range()) {
    if (files.pad_file_at(index)) {
      continue;
    }
    auto path = files.file_path(index);
    if (files.num_files() > 1 && path.compare(0, prefix.size(), prefix) == 0) {
      path.erase(0, prefix.size());
    }
    descriptor.files.push_back({std::move(path), static_cast<uint64_t>(files.file_size(index))});
  }

  return descriptor;
}

DescriptorResult MetadataReader::ReadOne(const fs::path& path, const std::string& source_path, const KnownDigests& known) const {
  try {
    const auto content = ReadFile(path);
    if (content.empty()) {
      throw util::MalformedMetadataError("empty descriptor");
    }

    const auto raw_hash = util::Sha256Hex(content);

    if (auto it = known.find(source_path); it != known.end() && it->second.raw_hash == raw_hash) {
      Descriptor descriptor;
      descriptor.id          = it->second.id;
      descriptor.raw_hash    = raw_hash;
      descriptor.source_path = source_path;
      descriptor.unchanged   = true;
      return descriptor;
    }

    auto descriptor        = path.extension() == kZurgInfoExtension ? ParseZurgInfo(content) : ParseZurgTorrent(content);
    descriptor.raw_hash    = raw_hash;
    descriptor.source_path = source_path;
    return descriptor;
  } catch (const util::MalformedMetadataError& e) {
    return MalformedDescriptor{source_path, e.what()};
  } catch (const std::exception& e) {
    return MalformedDescriptor{source_path, std::string("unexpected error: ") + e.what()};
  }
}

bool MetadataReader::Walk(const KnownDigests& known, const std::function<void(DescriptorResult&&)>& visit,
                          const std::atomic<bool>* cancel) const {
  std::error_code ec;
  if (!fs::is_directory(info_dir_, ec)) {
    return false;
  }

  // Collect first so the visit order is stable across passes.
  std::vector<fs::path> paths;
  bool                  complete = true;

  fs::recursive_directory_iterator it(info_dir_, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    MOUNTSYNC_LOG_WARN("info directory unreadable", {StringField("path", info_dir_.string()), StringField("error", ec.message())});
    return false;
  }
  const fs::recursive_directory_iterator end;
  while (it != end) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec)) {
      paths.push_back(it->path());
    }
    it.increment(ec);
    if (ec) {
      MOUNTSYNC_LOG_WARN("info directory walk interrupted", {StringField("path", info_dir_.string()), StringField("error", ec.message())});
      complete = false;
      break;
    }
  }
  std::sort(paths.begin(), paths.end());

  auto     last_progress = std::chrono::steady_clock::now();
  uint64_t visited       = 0;

  for (const auto& path : paths) {
    if (cancel && cancel->load()) {
      return false;
    }

    const auto source_path = path.lexically_relative(info_dir_).generic_string();
    if (!IsDescriptorFile(path)) {
      continue;
    }

    visit(ReadOne(path, source_path, known));
    ++visited;

    const auto now = std::chrono::steady_clock::now();
    if (now - last_progress >= options_.progress_log_interval) {
      MOUNTSYNC_LOG_INFO("descriptors parsed so far", {IntField("count", static_cast<int64_t>(visited)),
                                                        IntField("total", static_cast<int64_t>(paths.size()))});
      last_progress = now;
    }
  }

  return complete;
}

MetadataBatch MetadataReader::Read(const KnownDigests& known, const std::atomic<bool>* cancel) const {
  MetadataBatch batch;

  std::error_code ec;
  batch.directory_present = fs::is_directory(info_dir_, ec);
  if (!batch.directory_present) {
    MOUNTSYNC_LOG_WARN("info directory missing; no descriptors read", {StringField("path", info_dir_.string())});
    return batch;
  }

  std::unordered_set<std::string> seen_ids;

  const bool complete = Walk(
      known,
      [&](DescriptorResult&& result) {
        ++batch.files_seen;

        if (auto* malformed = std::get_if<MalformedDescriptor>(&result)) {
          MOUNTSYNC_LOG_WARN("skipping malformed descriptor", {StringField("file", malformed->source_path), StringField("error", malformed->error)});
          batch.malformed.push_back(std::move(*malformed));
          return;
        }

        auto& descriptor = std::get<Descriptor>(result);
        if (!seen_ids.insert(descriptor.id).second) {
          ++batch.duplicate_ids;
          MOUNTSYNC_LOG_WARN("duplicate descriptor id ignored", {StringField("id", descriptor.id), StringField("file", descriptor.source_path)});
          return;
        }
        if (descriptor.unchanged) {
          ++batch.unchanged;
        }
        batch.descriptors.push_back(std::move(descriptor));
      },
      cancel);

  batch.authoritative = complete;

  return batch;
}

} // namespace mountsync::metadata
