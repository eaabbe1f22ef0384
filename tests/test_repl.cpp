#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "repl.hpp"

using namespace cuedeck;
using strings = std::vector<std::string>;

TEST_CASE("command lines split on whitespace", "[repl]")
{
  CHECK(parse_command_line("show  abc ") == strings{"show", "abc"});
  CHECK(parse_command_line("   ").empty());
  CHECK(parse_command_line("").empty());
}

TEST_CASE("quotes and escapes", "[repl]")
{
  CHECK(parse_command_line(R"(add --title 'Mi tema' --artist "Los \"Otros\"")")
        == strings{"add", "--title", "Mi tema", "--artist", "Los \"Otros\""});
  CHECK(parse_command_line(R"(analyze my\ track.wav)") == strings{"analyze", "my track.wav"});
  CHECK(parse_command_line(R"(x '' "")") == strings{"x", "", ""});
  CHECK(parse_command_line(R"(x \)") == strings{"x", "\\"});
}

TEST_CASE("numbers parse strictly", "[repl]")
{
  CHECK(parse_number<unsigned>("8") == 8u);
  CHECK(parse_number<double>("124.5") == 124.5);

  auto trailing = parse_number<double>("12abc");
  REQUIRE_FALSE(trailing);
  CHECK(trailing.error() == "trailing characters");

  auto nan = parse_number<int>("abc");
  REQUIRE_FALSE(nan);
  CHECK(nan.error() == "not a number");

  auto big = parse_number<unsigned char>("300");
  REQUIRE_FALSE(big);
  CHECK(big.error() == "out of range");
}

TEST_CASE("dispatch runs registered commands", "[repl]")
{
  REPL repl;
  strings seen;
  repl.register_command("echo", "echo args", [&](command_args a) {
    seen.assign(a.begin(), a.end());
    return true;
  });
  repl.register_command("fail", "always fails", [](command_args) { return false; });
  repl.register_command("throw", "throws", [](command_args) -> bool {
    throw std::runtime_error("boom");
  });

  CHECK(repl.contains("echo"));
  CHECK(repl.dispatch(strings{"echo", "a", "b"}));
  CHECK(seen == strings{"a", "b"});

  CHECK_FALSE(repl.dispatch(strings{"fail"}));
  CHECK_FALSE(repl.dispatch(strings{"throw"}));
  CHECK_FALSE(repl.dispatch(strings{"nope"}));
  CHECK(repl.dispatch(strings{}));
}
