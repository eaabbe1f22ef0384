#pragma once

#include <cstddef>
#include <filesystem>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "error.hpp"
#include "track.hpp"

namespace cuedeck {

// Fresh random (v4) UUID string.
[[nodiscard]] std::string generate_track_id();

// Snapshot edits shared by track_store and track_library. They only touch the
// vector; persisting it is the caller's job.
[[nodiscard]] result<track> insert_track(std::vector<track>& snapshot, track t);
[[nodiscard]] result<track> patch_track(std::vector<track>& snapshot,
  const std::string& id, const track_patch& patch);
[[nodiscard]] bool erase_track(std::vector<track>& snapshot, const std::string& id);

// The catalog file: a JSON array of track records. Every mutation rewrites
// the whole file through a temporary and a rename, so the file always holds
// either the previous or the new snapshot. Not synchronised; see
// track_library.
class track_store {
public:
  explicit track_store(std::filesystem::path file);

  [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }

  // Missing file reads as an empty catalog.
  [[nodiscard]] result<std::vector<track>> load() const;
  [[nodiscard]] result<void> commit(const std::vector<track>& snapshot) const;

  // An empty id gets a generated one.
  [[nodiscard]] result<track> create(track t);
  [[nodiscard]] result<track> get(const std::string& id) const;
  [[nodiscard]] result<std::vector<track>> list() const;
  [[nodiscard]] result<track> update(const std::string& id, const track_patch& patch);
  [[nodiscard]] result<bool> remove(const std::string& id);

private:
  std::filesystem::path file_;
};

// Id index over one catalog snapshot, in catalog order.
class track_cache {
public:
  [[nodiscard]] bool valid() const noexcept { return valid_; }

  void rebuild(std::vector<track> snapshot);
  void invalidate() noexcept;

  // nullptr when absent. Only meaningful while valid().
  [[nodiscard]] const track* find(const std::string& id) const;
  [[nodiscard]] const std::vector<track>& items() const noexcept { return ordered_; }

private:
  std::vector<track> ordered_;
  std::unordered_map<std::string, std::size_t> index_;
  bool valid_ = false;
};

// Owns the store and its cache. Each mutation runs "load, apply, commit,
// refresh cache" under one exclusive lock, so no reader sees the file and the
// cache disagree. Reads share the lock.
class track_library {
public:
  explicit track_library(std::filesystem::path catalog);
  ~track_library();

  track_library(const track_library&) = delete;
  track_library& operator=(const track_library&) = delete;

  [[nodiscard]] const std::filesystem::path& catalog() const noexcept { return store_.file(); }

  [[nodiscard]] result<track> create(track t);
  [[nodiscard]] result<track> get(const std::string& id) const;
  [[nodiscard]] result<std::vector<track>> list() const;
  [[nodiscard]] result<track> update(const std::string& id, const track_patch& patch);
  [[nodiscard]] result<bool> remove(const std::string& id);

  // Drop the cache; the next read reloads the catalog.
  void invalidate();

private:
  // Requires the exclusive lock.
  [[nodiscard]] result<void> refresh_cache() const;
  [[nodiscard]] result<track> lookup(const std::string& id) const;

  // Runs edit(snapshot, changed) on a fresh snapshot; commits and refreshes
  // the cache when it succeeded and set `changed`.
  template<typename R, typename Edit>
  [[nodiscard]] result<R> mutate(Edit&& edit);

  track_store store_;
  mutable track_cache cache_;
  mutable std::shared_mutex mutex_;
};

} // namespace cuedeck
