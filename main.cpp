#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <getopt.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "analysis.hpp"
#include "error.hpp"
#include "ingest.hpp"
#include "log.hpp"
#include "repl.hpp"
#include "track.hpp"
#include "trackdb.hpp"
#include "wire.hpp"

namespace {

using namespace cuedeck;
using nlohmann::json;
using std::filesystem::path;
using std::optional, std::nullopt;
using std::string;
using std::string_view;
using std::vector;

constexpr const char* default_catalog_file = "data/playlist.json";

const char* const usage =
  "Usage: cuedeck [--catalog <file>] [--verbose] [--quiet] [<command> [args]]\n"
  "Without a command an interactive shell is started.\n"
  "\n"
  "Global options:\n"
  "  --catalog <file>      Track catalog (default: $CUEDECK_CATALOG or data/playlist.json)\n"
  "  --verbose             More log output (repeat for debug)\n"
  "  --quiet               Only log errors\n"
  "\n"
  "Analysis options (analyze, reanalyze, add):\n"
  "  --no-cues             Tempo only, no automatic cues\n"
  "  --beats-per-cue <n>   Beats grouped into each automatic cue (default 4)\n"
  "  --interval <s>:<e>    Manual cue in seconds (repeatable)\n"
  "  --points <n>          Waveform points per cue (default 100)\n"
  "\n"
  "Track options (add):\n"
  "  --title <s> --artist <s> --audio <file> --genre <s> --source <name>=<url>\n"
  "  --notes <s> --bpm <n>\n";

[[nodiscard]] path default_catalog()
{
  if (const char* env = std::getenv("CUEDECK_CATALOG"); env && *env) return path(env);
  return path(default_catalog_file);
}

bool report(const error& e)
{
  fmt::print(stderr, "Error: {}\n", describe(e));
  return false;
}

void print_json(const json& j)
{ fmt::print("{}\n", j.dump(2)); }

// Run getopt_long over a command's arguments. Returns the positional
// arguments, or nullopt after a usage error has been printed.
template<typename Handler>
[[nodiscard]] optional<vector<string>>
getopt_args(const string& cmd, command_args args, const option* long_options,
  Handler&& on_option)
{
  vector<string> storage;
  storage.reserve(args.size() + 1);
  storage.push_back(cmd);
  storage.insert(storage.end(), args.begin(), args.end());

  vector<char*> argv;
  argv.reserve(storage.size() + 1);
  for (auto& s: storage) argv.push_back(s.data());
  argv.push_back(nullptr);

  optind = 0; // full rescan
  int opt;
  while ((opt = getopt_long(int(storage.size()), argv.data(), "", long_options, nullptr)) != -1) {
    if (opt == '?' || opt == ':') return nullopt;
    if (!on_option(opt, optarg)) return nullopt;
  }
  return vector<string>(argv.begin() + optind, argv.end() - 1);
}

[[nodiscard]] optional<interval> parse_interval(string_view s)
{
  const auto colon = s.find(':');
  if (colon == string_view::npos) return nullopt;
  auto start = parse_number<double>(s.substr(0, colon));
  auto end = parse_number<double>(s.substr(colon + 1));
  if (!start || !end) return nullopt;
  return interval{*start, *end};
}

bool apply_analysis_flag(analysis_options& options, int opt, const char* arg)
{
  switch (opt) {
    case 'n':
      options.auto_cues = false;
      return true;
    case 'k': {
      auto v = parse_number<unsigned>(arg);
      if (!v || *v == 0) {
        fmt::print(stderr, "Invalid --beats-per-cue value: {}\n", v ? string("must be > 0") : v.error());
        return false;
      }
      options.beats_per_cue = *v;
      return true;
    }
    case 'i': {
      auto v = parse_interval(arg);
      if (!v) {
        fmt::print(stderr, "Invalid --interval '{}': expected <start>:<end> in seconds\n", arg);
        return false;
      }
      options.manual_intervals.push_back(*v);
      return true;
    }
    case 'p': {
      auto v = parse_number<std::size_t>(arg);
      if (!v || *v == 0) {
        fmt::print(stderr, "Invalid --points value: {}\n", v ? string("must be > 0") : v.error());
        return false;
      }
      options.envelope_points = *v;
      return true;
    }
    default:
      return false;
  }
}

const option analysis_long_options[] = {
  {"no-cues",       no_argument,       nullptr, 'n'},
  {"beats-per-cue", required_argument, nullptr, 'k'},
  {"interval",      required_argument, nullptr, 'i'},
  {"points",        required_argument, nullptr, 'p'},
  {nullptr,         0,                 nullptr,  0 }
};

// add takes the analysis options plus the track fields.
const option add_long_options[] = {
  {"no-cues",       no_argument,       nullptr, 'n'},
  {"beats-per-cue", required_argument, nullptr, 'k'},
  {"interval",      required_argument, nullptr, 'i'},
  {"points",        required_argument, nullptr, 'p'},
  {"title",         required_argument, nullptr, 't'},
  {"artist",        required_argument, nullptr, 'a'},
  {"audio",         required_argument, nullptr, 'f'},
  {"genre",         required_argument, nullptr, 'g'},
  {"source",        required_argument, nullptr, 's'},
  {"notes",         required_argument, nullptr, 'N'},
  {"bpm",           required_argument, nullptr, 'b'},
  {nullptr,         0,                 nullptr,  0 }
};

[[nodiscard]] optional<vector<string>>
parse_analysis_args(const string& cmd, command_args args, analysis_options& options)
{
  return getopt_args(cmd, args, analysis_long_options,
    [&](int opt, const char* arg) { return apply_analysis_flag(options, opt, arg); }
  );
}

bool apply_add_flag(track_request& request, analysis_options& options, int opt, const char* arg)
{
  switch (opt) {
    case 't': request.title = arg; return true;
    case 'a': request.artist = arg; return true;
    case 'f': request.audio_path = path(arg); return true;
    case 'g': request.genres.insert(arg); return true;
    case 'N': request.notes = arg; return true;
    case 's': {
      const string_view s(arg);
      const auto eq = s.find('=');
      if (eq == string_view::npos || eq == 0) {
        fmt::print(stderr, "Invalid --source '{}': expected <name>=<url>\n", s);
        return false;
      }
      request.sources.insert_or_assign(string(s.substr(0, eq)), string(s.substr(eq + 1)));
      return true;
    }
    case 'b': {
      auto v = parse_number<double>(arg);
      if (!v || *v <= 0.0) {
        fmt::print(stderr, "Invalid --bpm value: {}\n", v ? string("must be > 0") : v.error());
        return false;
      }
      request.bpm = *v;
      return true;
    }
    default:
      return apply_analysis_flag(options, opt, arg);
  }
}

void print_track_table(const vector<track>& tracks)
{
  if (tracks.empty()) {
    fmt::print("Catalog is empty.\n");
    return;
  }
  for (const auto& t: tracks) {
    const string bpm = t.bpm ? fmt::format("{:6.1f}", *t.bpm) : fmt::format("{:>6}", "-");
    if (t.cues.empty()) fmt::print("{}  {}  {} - {}\n", t.id, bpm, t.artist, t.title);
    else fmt::print("{}  {}  {} - {}  [{} cues]\n", t.id, bpm, t.artist, t.title, t.cues.size());
  }
}

bool cmd_analyze(command_args a)
{
  analysis_options options;
  auto files = parse_analysis_args("analyze", a, options);
  if (!files) return false;
  if (files->empty()) {
    fmt::print(stderr, "Usage: analyze [options] <file>...\n");
    return false;
  }

  if (files->size() == 1) {
    auto analysis = analyze(files->front(), options);
    if (!analysis) return report(analysis.error());
    print_json(*analysis);
    return true;
  }

  const vector<path> paths(files->begin(), files->end());
  auto results = analyze_batch(paths, options);

  bool ok = true;
  json out = json::array();
  for (std::size_t i = 0; i < paths.size(); ++i) {
    json entry;
    if (results[i]) {
      entry = *results[i];
    } else {
      ok = false;
      entry = json{{"error", describe(results[i].error())}};
    }
    entry["ruta"] = paths[i].generic_string();
    out.push_back(std::move(entry));
  }
  print_json(out);
  return ok;
}

bool cmd_request(command_args a)
{
  if (a.size() != 1) {
    fmt::print(stderr, "Usage: request <json-file|->\n");
    return false;
  }
  auto doc = read_json_document(a[0]);
  if (!doc) return report(doc.error());

  auto request = parse_analysis_request(*doc);
  if (!request) return report(request.error());

  auto analysis = analyze(request->file, request->options);
  if (!analysis) return report(analysis.error());
  print_json(*analysis);
  return true;
}

bool cmd_add(track_library& library, command_args a)
{
  track_request request;
  analysis_options options;
  auto rest = getopt_args("add", a, add_long_options,
    [&](int opt, const char* arg) { return apply_add_flag(request, options, opt, arg); }
  );
  if (!rest) return false;

  if (rest->size() == 1) {
    // add <json-file|->: a complete creation request
    auto doc = read_json_document(rest->front());
    if (!doc) return report(doc.error());
    auto parsed = parse_track_request(*doc);
    if (!parsed) return report(parsed.error());
    request = std::move(*parsed);
  } else if (!rest->empty() || request.title.empty() || request.artist.empty()) {
    fmt::print(stderr, "Usage: add --title <s> --artist <s> [options] | add <json-file|->\n");
    return false;
  } else {
    request.auto_cues = options.auto_cues;
    request.beats_per_cue = options.beats_per_cue;
    request.intervals = std::move(options.manual_intervals);
    request.envelope_points = options.envelope_points;
  }

  auto created = add_track(library, request);
  if (!created) return report(created.error());
  print_json(*created);
  return true;
}

bool cmd_list(const track_library& library, command_args a)
{
  bool as_json = false;
  for (const auto& arg: a) {
    if (arg == "--json") {
      as_json = true;
    } else {
      fmt::print(stderr, "Usage: list [--json]\n");
      return false;
    }
  }

  auto tracks = library.list();
  if (!tracks) return report(tracks.error());
  if (as_json) print_json(*tracks);
  else print_track_table(*tracks);
  return true;
}

bool cmd_show(const track_library& library, command_args a)
{
  if (a.size() != 1) {
    fmt::print(stderr, "Usage: show <id>\n");
    return false;
  }
  auto t = library.get(a[0]);
  if (!t) return report(t.error());
  print_json(*t);
  return true;
}

bool cmd_update(track_library& library, command_args a)
{
  if (a.size() != 2) {
    fmt::print(stderr, "Usage: update <id> <json-file|->\n");
    return false;
  }
  auto doc = read_json_document(a[1]);
  if (!doc) return report(doc.error());

  auto patch = parse_track_patch(*doc);
  if (!patch) return report(patch.error());
  if (patch->empty()) log_warn("Patch for {} changes nothing", a[0]);

  auto updated = library.update(a[0], *patch);
  if (!updated) return report(updated.error());
  print_json(*updated);
  return true;
}

bool cmd_reanalyze(track_library& library, command_args a)
{
  analysis_options options;
  auto rest = parse_analysis_args("reanalyze", a, options);
  if (!rest) return false;
  if (rest->size() != 2) {
    fmt::print(stderr, "Usage: reanalyze [options] <id> <file>\n");
    return false;
  }

  auto updated = reanalyze_track(library, (*rest)[0], (*rest)[1], options);
  if (!updated) return report(updated.error());
  print_json(*updated);
  return true;
}

bool cmd_remove(track_library& library, command_args a)
{
  if (a.size() != 1) {
    fmt::print(stderr, "Usage: remove <id>\n");
    return false;
  }
  auto removed = library.remove(a[0]);
  if (!removed) return report(removed.error());
  if (!*removed) return report(error{error_kind::track_not_found, "No track with id " + a[0]});
  fmt::print("Removed {}\n", a[0]);
  return true;
}

void register_commands(REPL& repl, track_library& library)
{
  repl.register_command("help",
    "List commands",
    [&repl](command_args) {
      fmt::print("{}\n", usage);
      repl.print_help();
      return true;
    }
  );
  repl.register_command("analyze",
    "analyze [options] <file>... - print tempo, duration and cues as JSON",
    cmd_analyze
  );
  repl.register_command("request",
    "request <json-file|-> - run an analysis request document",
    cmd_request
  );
  repl.register_command("add",
    "add --title <s> --artist <s> [options] | add <json-file|-> - create a track",
    [&library](command_args a) { return cmd_add(library, a); }
  );
  repl.register_command("list",
    "list [--json] - show the catalog",
    [&library](command_args a) { return cmd_list(library, a); }
  );
  repl.register_command("show",
    "show <id> - print one track as JSON",
    [&library](command_args a) { return cmd_show(library, a); }
  );
  repl.register_command("update",
    "update <id> <json-file|-> - apply a patch document",
    [&library](command_args a) { return cmd_update(library, a); }
  );
  repl.register_command("reanalyze",
    "reanalyze [options] <id> <file> - analyse audio into an existing track",
    [&library](command_args a) { return cmd_reanalyze(library, a); }
  );
  repl.register_command("remove",
    "remove <id> - delete a track",
    [&library](command_args a) { return cmd_remove(library, a); }
  );
}

}

int main(int argc, char** argv)
{
  optional<path> catalog;
  int verbosity = 0;
  bool quiet = false;

  int opt;
  int option_index = 0;
  static struct option long_options[] = {
    {"catalog", required_argument, nullptr, 'c'},
    {"verbose", no_argument,       nullptr, 'v'},
    {"quiet",   no_argument,       nullptr, 'q'},
    {"help",    no_argument,       nullptr, 'h'},
    {nullptr,   0,                 nullptr,  0 }
  };

  // '+': stop at the command name, its options are parsed per command.
  while ((opt = getopt_long(argc, argv, "+", long_options, &option_index)) != -1) {
    switch (opt) {
      case 'c':
        catalog = path(optarg);
        break;
      case 'v':
        ++verbosity;
        break;
      case 'q':
        quiet = true;
        break;
      case 'h':
        fmt::print("{}", usage);
        return EXIT_SUCCESS;
      default:
        fmt::print(stderr, "{}", usage);
        return EXIT_FAILURE;
    }
  }

  if (quiet) set_log_level(log_level::error);
  else if (verbosity == 1) set_log_level(log_level::info);
  else if (verbosity > 1) set_log_level(log_level::debug);

  track_library library(catalog ? *catalog : default_catalog());
  log_debug("Using catalog {}", library.catalog().generic_string());

  REPL repl;
  register_commands(repl, library);

  if (optind < argc) {
    const vector<string> args(argv + optind, argv + argc);
    return repl.dispatch(args) ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  repl.register_command("exit",
    "Exit program",
    [&repl](command_args) {
      repl.stop();
      return true;
    }
  );
  repl.register_command("quit",
    "Alias for exit",
    [&repl](command_args) {
      repl.stop();
      return true;
    }
  );

  // Track ids for the commands that take one.
  repl.complete_with({"show", "update", "reanalyze", "remove"},
    [&library] {
      vector<string> ids;
      if (auto tracks = library.list()) {
        for (const auto& t: *tracks) ids.push_back(t.id);
      }
      return ids;
    }
  );

  repl.run();
  return EXIT_SUCCESS;
}
