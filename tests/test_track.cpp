#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include "synthetic.hpp"
#include "track.hpp"

using namespace cuedeck;
using nlohmann::json;

TEST_CASE("records use the catalog field names", "[track]")
{
  auto t = test::sample_track();
  t.id = "abc";
  t.bpm = 124.0;
  t.cues = {{0.0, 8.0, {0.5f, 1.0f}, "cue_0"}};

  const json j = t;
  CHECK(j.at("id") == "abc");
  CHECK(j.at("titulo") == "Intro");
  CHECK(j.at("artista") == "Nadie");
  CHECK(j.at("bpm") == 124.0);
  CHECK_FALSE(j.contains("duracion"));
  CHECK(j.at("generos") == json::array({"minimal", "techno"}));
  CHECK(j.at("notas") == "abre el set");
  CHECK(j.at("fuentes").at("soundcloud") == "https://soundcloud.com/nadie/intro");
  CHECK(j.at("cues").at(0).at("end") == 8.0);
  CHECK(j.at("cues").at(0).at("nombre") == "cue_0");

  auto parsed = parse_track(j);
  REQUIRE(parsed);
  CHECK(*parsed == t);
}

TEST_CASE("missing optional fields take defaults", "[track]")
{
  const json j = {
    {"id", "x1"},
    {"titulo", "Solo"},
    {"artista", "Alguien"},
    {"notas", nullptr}
  };
  auto parsed = parse_track(j);
  REQUIRE(parsed);
  CHECK_FALSE(parsed->bpm);
  CHECK_FALSE(parsed->duration);
  CHECK(parsed->genres.empty());
  CHECK(parsed->cues.empty());
  CHECK(parsed->notes.empty());
  CHECK(parsed->sources.empty());
}

TEST_CASE("cue names are optional in stored records", "[track]")
{
  json j = {{"id", "x1"}, {"titulo", "Solo"}, {"artista", "Alguien"}};
  j["cues"] = json::array({
    {{"start", 0.0}, {"end", 4.0}, {"waveform", json::array()}},
    {{"nombre", "drop"}, {"start", 4.0}, {"end", 6.0}, {"waveform", json::array()}}
  });
  auto parsed = parse_track(j);
  REQUIRE(parsed);
  REQUIRE(parsed->cues.size() == 2);
  CHECK(parsed->cues[0].name.empty());
  CHECK(parsed->cues[1].name == "drop");

  j["cues"][1]["nombre"] = 7;
  auto rejected = parse_track(j);
  REQUIRE_FALSE(rejected);
  CHECK_THAT(rejected.error().message, Catch::Contains("cues.nombre"));
}

TEST_CASE("malformed records name the field", "[track]")
{
  json j = {
    {"id", "x1"},
    {"titulo", "Solo"},
    {"artista", "Alguien"}
  };

  SECTION("wrong type") {
    j["generos"] = "techno";
    auto parsed = parse_track(j);
    REQUIRE_FALSE(parsed);
    CHECK(parsed.error().kind == error_kind::invalid_record);
    CHECK_THAT(parsed.error().message, Catch::Contains("generos"));
  }

  SECTION("missing title") {
    j.erase("titulo");
    auto parsed = parse_track(j);
    REQUIRE_FALSE(parsed);
    CHECK_THAT(parsed.error().message, Catch::Contains("titulo"));
  }

  SECTION("non-positive bpm") {
    j["bpm"] = 0;
    auto parsed = parse_track(j);
    REQUIRE_FALSE(parsed);
    CHECK_THAT(parsed.error().message, Catch::Contains("bpm"));
  }

  SECTION("overlapping cues") {
    j["cues"] = json::array({
      {{"start", 0.0}, {"end", 4.0}, {"waveform", json::array()}},
      {{"start", 2.0}, {"end", 6.0}, {"waveform", json::array()}}
    });
    auto parsed = parse_track(j);
    REQUIRE_FALSE(parsed);
    CHECK_THAT(parsed.error().message, Catch::Contains("cues"));
  }

  SECTION("empty id") {
    j["id"] = "";
    CHECK_FALSE(parse_track(j));
  }
}

TEST_CASE("patches replace only the given fields", "[track]")
{
  auto t = test::sample_track();
  t.bpm = 120.0;

  track_patch patch;
  CHECK(patch.empty());
  patch.title = "Outro";
  patch.genres = std::set<std::string>{"house"};
  CHECK_FALSE(patch.empty());

  apply(t, patch);
  CHECK(t.title == "Outro");
  CHECK(t.artist == "Nadie");
  CHECK(t.genres == std::set<std::string>{"house"});
  CHECK(t.bpm == 120.0);
}

TEST_CASE("a patch can clear the bpm", "[track]")
{
  auto t = test::sample_track();
  t.bpm = 120.0;

  track_patch patch;
  patch.clear_bpm = true;
  CHECK_FALSE(patch.empty());

  apply(t, patch);
  CHECK_FALSE(t.bpm);
  CHECK(t.title == "Intro");
}
