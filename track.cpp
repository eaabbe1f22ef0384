#include "track.hpp"

#include <cmath>
#include <string_view>
#include <utility>

namespace cuedeck {

namespace {

using nlohmann::json;
using std::optional, std::nullopt;
using std::string;
using std::string_view;

[[nodiscard]] std::unexpected<error> bad_field(string_view field, string_view what)
{
  return fail(error_kind::invalid_record,
    "field '" + string(field) + "' " + string(what)
  );
}

[[nodiscard]] result<string> required_string(const json& j, const char* key)
{
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return bad_field(key, "must be a string");
  return it->get<string>();
}

// Absent and null both read as "no value".
[[nodiscard]] result<optional<double>> optional_number(const json& j, const char* key)
{
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return optional<double>{};
  if (!it->is_number()) return bad_field(key, "must be a number");
  return optional<double>{it->get<double>()};
}

[[nodiscard]] result<std::set<string>> string_set(const json& j, const char* key)
{
  std::set<string> out;
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return out;
  if (!it->is_array()) return bad_field(key, "must be an array of strings");
  for (const auto& v: *it) {
    if (!v.is_string()) return bad_field(key, "must be an array of strings");
    out.insert(v.get<string>());
  }
  return out;
}

[[nodiscard]] result<std::map<string, string>> string_map(const json& j, const char* key)
{
  std::map<string, string> out;
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return out;
  if (!it->is_object()) return bad_field(key, "must be an object of strings");
  for (const auto& [name, value]: it->items()) {
    if (!value.is_string()) return bad_field(key, "entry '" + name + "' must be a string");
    out.emplace(name, value.get<string>());
  }
  return out;
}

} // namespace

bool track_patch::empty() const noexcept
{
  return !title && !artist && !bpm && !clear_bpm && !duration && !genres && !cues
      && !notes && !sources;
}

void apply(track& t, const track_patch& patch)
{
  if (patch.title)    t.title = *patch.title;
  if (patch.artist)   t.artist = *patch.artist;
  if (patch.clear_bpm) t.bpm.reset();
  else if (patch.bpm) t.bpm = *patch.bpm;
  if (patch.duration) t.duration = *patch.duration;
  if (patch.genres)   t.genres = *patch.genres;
  if (patch.cues)     t.cues = *patch.cues;
  if (patch.notes)    t.notes = *patch.notes;
  if (patch.sources)  t.sources = *patch.sources;
}

result<void> validate(const track& t)
{
  if (t.bpm && !(std::isfinite(*t.bpm) && *t.bpm > 0.0))
    return bad_field("bpm", "must be a positive number");
  if (t.duration && !(std::isfinite(*t.duration) && *t.duration >= 0.0))
    return bad_field("duracion", "must be a non-negative number");
  if (!well_formed(t.cues))
    return bad_field("cues", "must be sorted, disjoint, with end > start >= 0 and waveform in [0, 1]");
  return {};
}

void to_json(json& j, const cue& c)
{
  j = json{
    {"nombre", c.name},
    {"start", c.start},
    {"end", c.end},
    {"waveform", c.waveform}
  };
}

void to_json(json& j, const track& t)
{
  j = json{
    {"id", t.id},
    {"titulo", t.title},
    {"artista", t.artist},
    {"generos", t.genres},
    {"cues", t.cues},
    {"notas", t.notes},
    {"fuentes", t.sources}
  };
  if (t.bpm) j["bpm"] = *t.bpm;
  if (t.duration) j["duracion"] = *t.duration;
}

result<cue> parse_cue(const json& j)
{
  if (!j.is_object()) return bad_field("cues", "entries must be objects");

  auto start = j.find("start");
  auto end = j.find("end");
  if (start == j.end() || !start->is_number()) return bad_field("cues.start", "must be a number");
  if (end == j.end() || !end->is_number()) return bad_field("cues.end", "must be a number");

  cue c;
  c.start = start->get<double>();
  c.end = end->get<double>();

  if (auto name = j.find("nombre"); name != j.end() && !name->is_null()) {
    if (!name->is_string()) return bad_field("cues.nombre", "must be a string");
    c.name = name->get<std::string>();
  }

  if (auto waveform = j.find("waveform"); waveform != j.end() && !waveform->is_null()) {
    if (!waveform->is_array()) return bad_field("cues.waveform", "must be an array of numbers");
    c.waveform.reserve(waveform->size());
    for (const auto& v: *waveform) {
      if (!v.is_number()) return bad_field("cues.waveform", "must be an array of numbers");
      c.waveform.push_back(v.get<float>());
    }
  }
  return c;
}

result<track> parse_track(const json& j)
{
  if (!j.is_object()) return fail(error_kind::invalid_record, "record is not an object");

  track t;

  auto id = j.find("id");
  if (id == j.end() || !id->is_string() || id->get_ref<const string&>().empty())
    return bad_field("id", "must be a non-empty string");
  t.id = id->get<string>();

  auto title = required_string(j, "titulo");
  if (!title) return std::unexpected(std::move(title.error()));
  t.title = std::move(*title);

  auto artist = required_string(j, "artista");
  if (!artist) return std::unexpected(std::move(artist.error()));
  t.artist = std::move(*artist);

  auto bpm = optional_number(j, "bpm");
  if (!bpm) return std::unexpected(std::move(bpm.error()));
  t.bpm = *bpm;

  auto duration = optional_number(j, "duracion");
  if (!duration) return std::unexpected(std::move(duration.error()));
  t.duration = *duration;

  auto genres = string_set(j, "generos");
  if (!genres) return std::unexpected(std::move(genres.error()));
  t.genres = std::move(*genres);

  if (auto cues = j.find("cues"); cues != j.end() && !cues->is_null()) {
    if (!cues->is_array()) return bad_field("cues", "must be an array");
    for (const auto& jc: *cues) {
      auto c = parse_cue(jc);
      if (!c) return std::unexpected(std::move(c.error()));
      t.cues.push_back(std::move(*c));
    }
  }

  if (auto notes = j.find("notas"); notes != j.end() && !notes->is_null()) {
    if (!notes->is_string()) return bad_field("notas", "must be a string");
    t.notes = notes->get<string>();
  }

  auto sources = string_map(j, "fuentes");
  if (!sources) return std::unexpected(std::move(sources.error()));
  t.sources = std::move(*sources);

  if (auto valid = validate(t); !valid) return std::unexpected(std::move(valid.error()));
  return t;
}

} // namespace cuedeck
