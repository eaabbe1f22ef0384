#include "trackdb.hpp"

#include <algorithm>
#include <fstream>
#include <mutex>
#include <system_error>
#include <unordered_set>
#include <utility>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "log.hpp"

namespace cuedeck {

namespace {

using nlohmann::json;
using std::filesystem::path;
using std::string;
using std::vector;

[[nodiscard]] bool contains_id(const vector<track>& snapshot, const string& id)
{
  return std::any_of(snapshot.begin(), snapshot.end(),
    [&](const track& t) { return t.id == id; }
  );
}

[[nodiscard]] result<track> find_track(const vector<track>& snapshot, const string& id)
{
  auto it = std::find_if(snapshot.begin(), snapshot.end(),
    [&](const track& t) { return t.id == id; }
  );
  if (it == snapshot.end()) return fail(error_kind::track_not_found, "No track with id " + id);
  return *it;
}

} // namespace

string generate_track_id()
{
  // random_generator is not thread-safe; one per thread.
  thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

result<track> insert_track(vector<track>& snapshot, track t)
{
  if (t.id.empty()) {
    do {
      t.id = generate_track_id();
    } while (contains_id(snapshot, t.id));
  } else if (contains_id(snapshot, t.id)) {
    return fail(error_kind::duplicate_id, "Track id already exists: " + t.id);
  }

  if (auto valid = validate(t); !valid) return std::unexpected(std::move(valid.error()));

  snapshot.push_back(t);
  return t;
}

result<track> patch_track(vector<track>& snapshot, const string& id, const track_patch& patch)
{
  auto it = std::find_if(snapshot.begin(), snapshot.end(),
    [&](const track& t) { return t.id == id; }
  );
  if (it == snapshot.end()) return fail(error_kind::track_not_found, "No track with id " + id);

  track updated = *it;
  apply(updated, patch);
  if (auto valid = validate(updated); !valid) return std::unexpected(std::move(valid.error()));

  *it = updated;
  return updated;
}

bool erase_track(vector<track>& snapshot, const string& id)
{
  return std::erase_if(snapshot, [&](const track& t) { return t.id == id; }) > 0;
}

// track_store

track_store::track_store(path file)
: file_(std::move(file))
{}

result<vector<track>> track_store::load() const
{
  std::error_code ec;
  if (!std::filesystem::exists(file_, ec)) {
    if (ec) {
      return fail(error_kind::catalog_unreadable,
        file_.generic_string() + ": " + ec.message()
      );
    }
    return vector<track>{};
  }

  std::ifstream in(file_);
  if (!in) {
    return fail(error_kind::catalog_unreadable,
      "Cannot open catalog " + file_.generic_string()
    );
  }

  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    return fail(error_kind::catalog_unreadable, file_.generic_string() + ": " + e.what());
  }

  if (!j.is_array()) {
    return fail(error_kind::catalog_unreadable,
      file_.generic_string() + ": root is not an array"
    );
  }

  vector<track> tracks;
  tracks.reserve(j.size());
  std::unordered_set<string> seen;
  for (std::size_t i = 0; i < j.size(); ++i) {
    auto t = parse_track(j[i]);
    if (!t) {
      return fail(error_kind::invalid_record,
        file_.generic_string() + ": record " + std::to_string(i) + ": " + t.error().message
      );
    }
    if (!seen.insert(t->id).second) {
      return fail(error_kind::invalid_record,
        file_.generic_string() + ": record " + std::to_string(i) + ": duplicate id " + t->id
      );
    }
    tracks.push_back(std::move(*t));
  }
  return tracks;
}

result<void> track_store::commit(const vector<track>& snapshot) const
{
  path tmp = file_;
  tmp += ".tmp";

  try {
    const string text = json(snapshot).dump(2);

    if (file_.has_parent_path()) std::filesystem::create_directories(file_.parent_path());

    std::ofstream out;
    out.exceptions(std::ofstream::failbit | std::ofstream::badbit);
    out.open(tmp, std::ios::trunc);
    out << text << '\n';
    out.close();

    std::filesystem::rename(tmp, file_);
  } catch (const std::exception& e) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(tmp, ec)) std::filesystem::remove(tmp, ec);
    return fail(error_kind::storage_write_failure,
      "Writing " + file_.generic_string() + " failed: " + e.what()
    );
  }

  log_info("Committed {} tracks to {}", snapshot.size(), file_.generic_string());
  return {};
}

result<track> track_store::create(track t)
{
  auto snapshot = load();
  if (!snapshot) return std::unexpected(std::move(snapshot.error()));

  auto created = insert_track(*snapshot, std::move(t));
  if (!created) return created;

  if (auto committed = commit(*snapshot); !committed)
    return std::unexpected(std::move(committed.error()));
  return created;
}

result<track> track_store::get(const string& id) const
{
  auto snapshot = load();
  if (!snapshot) return std::unexpected(std::move(snapshot.error()));
  return find_track(*snapshot, id);
}

result<vector<track>> track_store::list() const
{ return load(); }

result<track> track_store::update(const string& id, const track_patch& patch)
{
  auto snapshot = load();
  if (!snapshot) return std::unexpected(std::move(snapshot.error()));

  auto updated = patch_track(*snapshot, id, patch);
  if (!updated) return updated;

  if (auto committed = commit(*snapshot); !committed)
    return std::unexpected(std::move(committed.error()));
  return updated;
}

result<bool> track_store::remove(const string& id)
{
  auto snapshot = load();
  if (!snapshot) return std::unexpected(std::move(snapshot.error()));

  if (!erase_track(*snapshot, id)) return false;

  if (auto committed = commit(*snapshot); !committed)
    return std::unexpected(std::move(committed.error()));
  return true;
}

// track_cache

void track_cache::rebuild(vector<track> snapshot)
{
  ordered_ = std::move(snapshot);
  index_.clear();
  index_.reserve(ordered_.size());
  for (std::size_t i = 0; i < ordered_.size(); ++i) index_.emplace(ordered_[i].id, i);
  valid_ = true;
}

void track_cache::invalidate() noexcept
{
  ordered_.clear();
  index_.clear();
  valid_ = false;
}

const track* track_cache::find(const string& id) const
{
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &ordered_[it->second];
}

// track_library

track_library::track_library(path catalog)
: store_(std::move(catalog))
{}

track_library::~track_library()
{
  std::unique_lock lock(mutex_);
  cache_.invalidate();
}

result<void> track_library::refresh_cache() const
{
  if (cache_.valid()) return {};

  auto snapshot = store_.load();
  if (!snapshot) return std::unexpected(std::move(snapshot.error()));

  log_debug("Track cache rebuilt: {} tracks", snapshot->size());
  cache_.rebuild(std::move(*snapshot));
  return {};
}

result<track> track_library::lookup(const string& id) const
{
  const track* t = cache_.find(id);
  if (!t) return fail(error_kind::track_not_found, "No track with id " + id);
  return *t;
}

template<typename R, typename Edit>
result<R> track_library::mutate(Edit&& edit)
{
  std::unique_lock lock(mutex_);

  auto snapshot = store_.load();
  if (!snapshot) {
    cache_.invalidate();
    return std::unexpected(std::move(snapshot.error()));
  }

  bool changed = false;
  result<R> outcome = edit(*snapshot, changed);
  if (!outcome || !changed) return outcome;

  if (auto committed = store_.commit(*snapshot); !committed) {
    // The file still holds the old snapshot; reload it on the next read.
    cache_.invalidate();
    return std::unexpected(std::move(committed.error()));
  }

  cache_.rebuild(std::move(*snapshot));
  return outcome;
}

result<track> track_library::create(track t)
{
  return mutate<track>([&](vector<track>& snapshot, bool& changed) {
    auto created = insert_track(snapshot, std::move(t));
    changed = created.has_value();
    return created;
  });
}

result<track> track_library::get(const string& id) const
{
  {
    std::shared_lock lock(mutex_);
    if (cache_.valid()) return lookup(id);
  }

  std::unique_lock lock(mutex_);
  if (auto refreshed = refresh_cache(); !refreshed)
    return std::unexpected(std::move(refreshed.error()));
  return lookup(id);
}

result<vector<track>> track_library::list() const
{
  {
    std::shared_lock lock(mutex_);
    if (cache_.valid()) return cache_.items();
  }

  std::unique_lock lock(mutex_);
  if (auto refreshed = refresh_cache(); !refreshed)
    return std::unexpected(std::move(refreshed.error()));
  return cache_.items();
}

result<track> track_library::update(const string& id, const track_patch& patch)
{
  return mutate<track>([&](vector<track>& snapshot, bool& changed) {
    auto updated = patch_track(snapshot, id, patch);
    changed = updated.has_value();
    return updated;
  });
}

result<bool> track_library::remove(const string& id)
{
  return mutate<bool>([&](vector<track>& snapshot, bool& changed) -> result<bool> {
    changed = erase_track(snapshot, id);
    return changed;
  });
}

void track_library::invalidate()
{
  std::unique_lock lock(mutex_);
  cache_.invalidate();
}

} // namespace cuedeck
