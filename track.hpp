#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cues.hpp"
#include "error.hpp"

namespace cuedeck {

// Catalog record.
struct track {
  std::string id;
  std::string title;
  std::string artist;
  std::optional<double> bpm;      // > 0
  std::optional<double> duration; // seconds, >= 0
  std::set<std::string> genres;
  std::vector<cue> cues;          // sorted, disjoint
  std::string notes;
  std::map<std::string, std::string> sources; // service -> URL/identifier

  bool operator==(const track&) const = default;
};

// Field-wise replacement; unset members are left alone.
struct track_patch {
  std::optional<std::string> title;
  std::optional<std::string> artist;
  std::optional<double> bpm;
  bool clear_bpm = false;  // drop the stored bpm; wins over bpm
  std::optional<double> duration;
  std::optional<std::set<std::string>> genres;
  std::optional<std::vector<cue>> cues;
  std::optional<std::string> notes;
  std::optional<std::map<std::string, std::string>> sources;

  [[nodiscard]] bool empty() const noexcept;
};

void apply(track& t, const track_patch& patch);

// Value constraints of a record: positive bpm, non-negative duration,
// well-formed cues. The id is not checked here.
[[nodiscard]] result<void> validate(const track& t);

void to_json(nlohmann::json& j, const cue& c);
void to_json(nlohmann::json& j, const track& t);

// Strict schema check of one persisted record; invalid_record names the
// offending field.
[[nodiscard]] result<track> parse_track(const nlohmann::json& j);

[[nodiscard]] result<cue> parse_cue(const nlohmann::json& j);

} // namespace cuedeck
