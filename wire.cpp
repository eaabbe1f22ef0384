#include "wire.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace cuedeck {

namespace {

using nlohmann::json;
using std::optional;
using std::string;
using std::string_view;
using std::vector;

[[nodiscard]] std::unexpected<error> bad_key(string_view key, string_view what)
{
  return fail(error_kind::invalid_request,
    "'" + string(key) + "' " + string(what)
  );
}

// Members that are absent or null are "not given".
[[nodiscard]] const json* member(const json& j, const char* key)
{
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return nullptr;
  return &*it;
}

[[nodiscard]] result<optional<string>> optional_string(const json& j, const char* key)
{
  const json* v = member(j, key);
  if (!v) return optional<string>{};
  if (!v->is_string()) return bad_key(key, "must be a string");
  return optional<string>{v->get<string>()};
}

[[nodiscard]] result<string> required_string(const json& j, const char* key)
{
  const json* v = member(j, key);
  if (!v || !v->is_string()) return bad_key(key, "is required and must be a string");
  return v->get<string>();
}

[[nodiscard]] result<bool> flag(const json& j, const char* key, bool fallback)
{
  const json* v = member(j, key);
  if (!v) return fallback;
  if (!v->is_boolean()) return bad_key(key, "must be true or false");
  return v->get<bool>();
}

[[nodiscard]] result<std::size_t>
bounded_integer(const json& j, const char* key, std::size_t fallback,
  std::size_t lo, std::size_t hi)
{
  const json* v = member(j, key);
  if (!v) return fallback;
  if (!v->is_number_integer()) return bad_key(key, "must be an integer");
  const auto n = v->get<long long>();
  if (n < 0 || std::size_t(n) < lo || std::size_t(n) > hi) {
    return bad_key(key, "must be between " + std::to_string(lo) + " and " + std::to_string(hi));
  }
  return std::size_t(n);
}

[[nodiscard]] result<optional<double>> optional_bpm(const json& j, const char* key)
{
  const json* v = member(j, key);
  if (!v) return optional<double>{};
  if (!v->is_number()) return bad_key(key, "must be a number");
  const double bpm = v->get<double>();
  if (!std::isfinite(bpm) || bpm <= 0.0) return bad_key(key, "must be greater than 0");
  return optional<double>{bpm};
}

[[nodiscard]] result<optional<std::set<string>>> optional_strings(const json& j, const char* key)
{
  const json* v = member(j, key);
  if (!v) return optional<std::set<string>>{};
  if (!v->is_array()) return bad_key(key, "must be an array of strings");
  std::set<string> out;
  for (const auto& item: *v) {
    if (!item.is_string()) return bad_key(key, "must be an array of strings");
    out.insert(item.get<string>());
  }
  return optional<std::set<string>>{std::move(out)};
}

[[nodiscard]] result<optional<std::map<string, string>>>
optional_sources(const json& j, const char* key)
{
  const json* v = member(j, key);
  if (!v) return optional<std::map<string, string>>{};
  if (!v->is_object()) return bad_key(key, "must be an object of strings");
  std::map<string, string> out;
  for (const auto& [name, value]: v->items()) {
    if (!value.is_string()) return bad_key(key, "entry '" + name + "' must be a string");
    out.emplace(name, value.get<string>());
  }
  return optional<std::map<string, string>>{std::move(out)};
}

[[nodiscard]] result<optional<vector<cue>>> optional_cues(const json& j, const char* key)
{
  const json* v = member(j, key);
  if (!v) return optional<vector<cue>>{};
  if (!v->is_array()) return bad_key(key, "must be an array");
  vector<cue> out;
  out.reserve(v->size());
  for (const auto& item: *v) {
    auto c = parse_cue(item);
    if (!c) return fail(error_kind::invalid_request, c.error().message);
    out.push_back(std::move(*c));
  }
  return optional<vector<cue>>{std::move(out)};
}

// "intervalos_manual": [[start, end], ...] or "intervalos": [{inicio, fin}, ...]
[[nodiscard]] result<vector<interval>> intervals(const json& j)
{
  const json* pairs = member(j, "intervalos_manual");
  const json* objects = member(j, "intervalos");
  if (pairs && objects) {
    return fail(error_kind::invalid_request,
      "give either 'intervalos_manual' or 'intervalos', not both"
    );
  }

  vector<interval> out;
  if (pairs) {
    if (!pairs->is_array()) return bad_key("intervalos_manual", "must be an array of [start, end] pairs");
    for (const auto& p: *pairs) {
      if (!p.is_array() || p.size() != 2 || !p[0].is_number() || !p[1].is_number())
        return bad_key("intervalos_manual", "must be an array of [start, end] pairs");
      out.push_back({p[0].get<double>(), p[1].get<double>()});
    }
  } else if (objects) {
    if (!objects->is_array()) return bad_key("intervalos", "must be an array of {inicio, fin} objects");
    for (const auto& o: *objects) {
      const json* start = o.is_object() ? member(o, "inicio") : nullptr;
      const json* end = o.is_object() ? member(o, "fin") : nullptr;
      if (!start || !end || !start->is_number() || !end->is_number())
        return bad_key("intervalos", "must be an array of {inicio, fin} objects");
      out.push_back({start->get<double>(), end->get<double>()});
    }
  }
  return out;
}

[[nodiscard]] result<analysis_options> options_from(const json& j)
{
  analysis_options options;

  auto auto_cues = flag(j, "auto_cues", true);
  if (!auto_cues) return std::unexpected(std::move(auto_cues.error()));
  options.auto_cues = *auto_cues;

  auto beats_per_cue = bounded_integer(j, "beats_por_cue", 4, 1,
    std::numeric_limits<unsigned>::max());
  if (!beats_per_cue) return std::unexpected(std::move(beats_per_cue.error()));
  options.beats_per_cue = static_cast<unsigned>(*beats_per_cue);

  auto points = bounded_integer(j, "max_muestras_cue", default_request_envelope_points,
    min_request_envelope_points, max_request_envelope_points);
  if (!points) return std::unexpected(std::move(points.error()));
  options.envelope_points = *points;

  auto manual = intervals(j);
  if (!manual) return std::unexpected(std::move(manual.error()));
  options.manual_intervals = std::move(*manual);

  return options;
}

} // namespace

result<analysis_request> parse_analysis_request(const json& j)
{
  if (!j.is_object()) return fail(error_kind::invalid_request, "request must be a JSON object");

  auto file = required_string(j, "ruta");
  if (!file) return std::unexpected(std::move(file.error()));

  auto options = options_from(j);
  if (!options) return std::unexpected(std::move(options.error()));

  return analysis_request{std::filesystem::path(*file), std::move(*options)};
}

result<track_request> parse_track_request(const json& j)
{
  if (!j.is_object()) return fail(error_kind::invalid_request, "request must be a JSON object");

  track_request request;

  auto title = required_string(j, "titulo");
  if (!title) return std::unexpected(std::move(title.error()));
  request.title = std::move(*title);

  auto artist = required_string(j, "artista");
  if (!artist) return std::unexpected(std::move(artist.error()));
  request.artist = std::move(*artist);

  auto audio = optional_string(j, "ruta_audio");
  if (!audio) return std::unexpected(std::move(audio.error()));
  if (*audio && !(*audio)->empty()) request.audio_path = std::filesystem::path(**audio);

  auto options = options_from(j);
  if (!options) return std::unexpected(std::move(options.error()));
  request.auto_cues = options->auto_cues;
  request.beats_per_cue = options->beats_per_cue;
  request.envelope_points = options->envelope_points;
  request.intervals = std::move(options->manual_intervals);

  auto genres = optional_strings(j, "generos");
  if (!genres) return std::unexpected(std::move(genres.error()));
  if (*genres) request.genres = std::move(**genres);

  auto sources = optional_sources(j, "fuentes");
  if (!sources) return std::unexpected(std::move(sources.error()));
  if (*sources) request.sources = std::move(**sources);

  auto notes = optional_string(j, "notas");
  if (!notes) return std::unexpected(std::move(notes.error()));
  if (*notes) request.notes = std::move(**notes);

  auto bpm = optional_bpm(j, "bpm");
  if (!bpm) return std::unexpected(std::move(bpm.error()));
  request.bpm = *bpm;

  auto cues = optional_cues(j, "cues");
  if (!cues) return std::unexpected(std::move(cues.error()));
  if (*cues) request.cues = std::move(**cues);

  return request;
}

result<track_patch> parse_track_patch(const json& j)
{
  if (!j.is_object()) return fail(error_kind::invalid_request, "patch must be a JSON object");

  track_patch patch;

  auto title = optional_string(j, "titulo");
  if (!title) return std::unexpected(std::move(title.error()));
  patch.title = std::move(*title);

  auto artist = optional_string(j, "artista");
  if (!artist) return std::unexpected(std::move(artist.error()));
  patch.artist = std::move(*artist);

  auto bpm = optional_bpm(j, "bpm");
  if (!bpm) return std::unexpected(std::move(bpm.error()));
  patch.bpm = *bpm;
  if (auto it = j.find("bpm"); it != j.end() && it->is_null()) patch.clear_bpm = true;

  if (const json* duration = member(j, "duracion")) {
    if (!duration->is_number() || !(duration->get<double>() >= 0.0))
      return bad_key("duracion", "must be a non-negative number");
    patch.duration = duration->get<double>();
  }

  auto genres = optional_strings(j, "generos");
  if (!genres) return std::unexpected(std::move(genres.error()));
  patch.genres = std::move(*genres);

  auto sources = optional_sources(j, "fuentes");
  if (!sources) return std::unexpected(std::move(sources.error()));
  patch.sources = std::move(*sources);

  auto notes = optional_string(j, "notas");
  if (!notes) return std::unexpected(std::move(notes.error()));
  patch.notes = std::move(*notes);

  auto cues = optional_cues(j, "cues");
  if (!cues) return std::unexpected(std::move(cues.error()));
  patch.cues = std::move(*cues);

  return patch;
}

void to_json(json& j, const analysis_result& r)
{
  j = json{
    {"bpm", nullptr},
    {"duracion", r.duration},
    {"sample_rate", r.sample_rate},
    {"cues", r.cues}
  };
  if (r.bpm) j["bpm"] = *r.bpm;
}

result<json> read_json(std::istream& in, const string& origin)
{
  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    return fail(error_kind::invalid_request, origin + ": " + e.what());
  }
}

result<json> read_json_document(const string& source)
{
  if (source == "-") return read_json(std::cin, "<stdin>");

  std::ifstream in(source);
  if (!in) return fail(error_kind::file_not_found, "Cannot open " + source);
  return read_json(in, source);
}

} // namespace cuedeck
