#include "repl.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <cstdio>
#include <exception>
#include <memory>
#include <utility>

#include <fmt/format.h>

#include <readline/history.h>
#include <readline/readline.h>

namespace cuedeck {

using std::string;
using std::string_view;
using std::vector;

namespace {

// readline's completion hooks are plain function pointers.
vector<string> g_completing_commands;
std::function<vector<string>()> g_completion_source;

[[nodiscard]] char* copy_for_readline(const string& s)
{
  char* out = static_cast<char*>(std::malloc(s.size() + 1));
  if (!out) return nullptr;
  std::memcpy(out, s.c_str(), s.size() + 1);
  return out;
}

char* candidate_generator(const char* text, int state)
{
  static vector<string> matches;
  static std::size_t index;

  if (state == 0) {
    matches.clear();
    index = 0;

    if (!g_completion_source) return nullptr;

    const string prefix(text);
    for (auto& word: g_completion_source()) {
      if (word.starts_with(prefix)) matches.push_back(std::move(word));
    }
  }

  if (index >= matches.size()) return nullptr;
  return copy_for_readline(matches[index++]);
}

char** cuedeck_completion(const char* text, int start, int)
{
  // Extract the first word (command) from the line up to 'start'
  string_view sv(rl_line_buffer, static_cast<std::size_t>(start));
  auto it = std::find_if_not(sv.begin(), sv.end(),
                             [](unsigned char c){ return std::isspace(c); });
  if (it == sv.end()) return nullptr;

  auto cmd_end = std::find_if(it, sv.end(),
                              [](unsigned char c){ return std::isspace(c); });
  const string cmd(it, cmd_end);

  // Only the first argument is completed.
  auto rest = string_view(cmd_end, sv.end());
  if (rest.find_first_not_of(" \t") != string_view::npos) return nullptr;

  if (std::find(g_completing_commands.begin(), g_completing_commands.end(), cmd)
      == g_completing_commands.end()) {
    return nullptr;
  }
  return rl_completion_matches(text, candidate_generator);
}

} // namespace

vector<string> parse_command_line(const string& s)
{
  vector<string> out;
  string cur;
  bool in_single = false, in_double = false, escape = false;
  // Distinguishes "" (an empty argument) from no argument at all.
  bool have_token = false;

  auto push = [&](){
    out.push_back(cur);
    cur.clear();
    have_token = false;
  };

  for (char ch: s) {
    if (in_single) {
      if (ch == '\'') {
        in_single = false;
      } else {
        cur.push_back(ch);
      }
      continue;
    }

    if (escape) {
      cur.push_back(ch);
      escape = false;
      continue;
    }

    if (in_double) {
      if (ch == '\\') {
        escape = true;
      } else if (ch == '"') {
        in_double = false;
      } else {
        cur.push_back(ch);
      }
      continue;
    }

    if (std::isspace(static_cast<unsigned char>(ch))) {
      if (have_token) push();
      continue;
    }
    have_token = true;
    if (ch == '\'') { in_single = true; continue; }
    if (ch == '"')  { in_double = true; continue; }
    if (ch == '\\') { escape = true; continue; }

    cur.push_back(ch);
  }

  if (escape) cur.push_back('\\'); // trailing backslash literal
  if (have_token) push();

  return out;
}

void REPL::register_command(string name, string help, command fn)
{
  commands_.insert_or_assign(std::move(name), command_entry{std::move(help), std::move(fn)});
}

bool REPL::dispatch(command_args args)
{
  if (args.empty()) return true;

  auto it = commands_.find(args[0]);
  if (it == commands_.end()) {
    fmt::print(stderr, "Unknown command: {} (try 'help')\n", args[0]);
    return false;
  }
  try {
    return it->second.fn(args.subspan(1));
  } catch (const std::exception& e) {
    fmt::print(stderr, "Error: {}\n", e.what());
    return false;
  }
}

void REPL::run(const char* prompt)
{
  rl_attempted_completion_function = cuedeck_completion;
  // Reasonable shell-like word breaks; Readline will respect quotes when completing.
  rl_basic_word_break_characters = const_cast<char*>(" \t\n\"'`@$><=;|&{(");

  running_ = true;
  while (running_) {
    char* line = readline(prompt);
    if (!line) break; // EOF (Ctrl-D)
    std::unique_ptr<char, decltype(&std::free)> guard(line, &std::free);

    string input(line);
    if (input.empty()) continue;

    add_history(line);
    auto args = parse_command_line(input);
    if (args.empty()) continue;

    (void)dispatch(args);
  }
}

void REPL::print_help() const
{
  fmt::print("Commands:\n");
  for (const auto& [name, entry] : commands_) {
    if (entry.help.empty()) fmt::print("  {}\n", name);
    else fmt::print("  {} - {}\n", name, entry.help);
  }
}

void REPL::complete_with(vector<string> commands, std::function<vector<string>()> candidates)
{
  g_completing_commands = std::move(commands);
  g_completion_source = std::move(candidates);
}

} // namespace cuedeck
