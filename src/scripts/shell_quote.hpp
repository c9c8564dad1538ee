#pragma once

#include <string>
#include <string_view>

namespace sweval::scripts {

// POSIX shell quoting for one argument.
//
// Arguments made only of characters the shell never interprets are returned
// unchanged so generated scripts stay readable. Everything else is wrapped in
// single quotes, inside which the shell interprets nothing; embedded single
// quotes become '"'"' (close, double-quoted quote, reopen). Newlines,
// backslashes, `$` and double quotes therefore pass through byte for byte.
inline std::string QuoteShellArg(std::string_view raw) {
  if (raw.empty()) {
    return "''";
  }

  bool safe = true;
  for (const char c : raw) {
    const bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                         (c >= '0' && c <= '9') || c == '@' || c == '%' || c == '+' ||
                         c == '=' || c == ':' || c == ',' || c == '.' || c == '/' ||
                         c == '-' || c == '_';
    if (!allowed) {
      safe = false;
      break;
    }
  }
  if (safe) {
    return std::string(raw);
  }

  std::string quoted;
  quoted.reserve(raw.size() + 2);
  quoted.push_back('\'');
  for (const char c : raw) {
    if (c == '\'') {
      quoted += "'\"'\"'";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

} // namespace sweval::scripts
