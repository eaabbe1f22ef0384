#pragma once

#include <charconv>
#include <expected>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace cuedeck {

template<typename T>
requires (std::is_integral_v<T> || std::is_floating_point_v<T>)
[[nodiscard]] std::expected<T, std::string> parse_number(std::string_view s)
{
  static_assert(!std::is_same_v<T, bool>, "parse_number<bool> is not supported");
  T v{};
  const char* b = s.data();
  const char* e = b + s.size();

  auto to_msg = [](std::errc ec) -> std::string {
    if (ec == std::errc::invalid_argument) return "not a number";
    if (ec == std::errc::result_out_of_range) return "out of range";
    return "parse error";
  };

  std::from_chars_result r = [&]{
    if constexpr (std::is_floating_point_v<T>)
      return std::from_chars(b, e, v, std::chars_format::general);
    return std::from_chars(b, e, v);
  }();

  constexpr std::errc ok{};
  if (r.ec == ok) {
    if (r.ptr != e) return std::unexpected(std::string("trailing characters"));
    return v;
  }
  return std::unexpected(to_msg(r.ec));
}

// Shell-style tokenizer supporting quotes and backslashes.
// - Whitespace splits args when not inside quotes.
// - Single quotes: literals (no escapes inside).
// - Double quotes: backslash escapes the next character.
[[nodiscard]] std::vector<std::string> parse_command_line(const std::string& s);

using command_args = std::span<const std::string>;
// Returns false when the command failed; the message is already printed.
using command = std::move_only_function<bool(command_args)>;

struct command_entry {
  std::string help;
  command fn;
};

// Command registry shared by one-shot invocations and the interactive shell.
class REPL {
public:
  void register_command(std::string name, std::string help, command fn);

  [[nodiscard]] bool contains(const std::string& name) const
  { return commands_.contains(name); }

  // Run args[0] with the remaining args.
  bool dispatch(command_args args);

  void run(const char* prompt = "cuedeck> ");
  void stop() noexcept { running_ = false; }

  void print_help() const;

  // Words offered by tab completion for the first argument of `commands`.
  void complete_with(std::vector<std::string> commands,
    std::function<std::vector<std::string>()> candidates);

private:
  std::map<std::string, command_entry> commands_;
  bool running_ = true;
};

} // namespace cuedeck
