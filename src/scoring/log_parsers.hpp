#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sweval::scoring {

enum class TestStatus {
  kPassed,
  kFailed,
  kSkipped,
  kError,
  kXfail,
};

const char* ToString(TestStatus status);
bool ParseTestStatus(std::string_view text, TestStatus& status);

// Test id -> verdict as reported by one run. Ordered by id so explanations
// built from it are deterministic.
using TestOutcomes = std::map<std::string, TestStatus>;

// Capability: turn raw test-runner stdout into per-test verdicts.
// One subclass per runner output format; stateless and thread-safe.
class LogParser {
public:
  virtual ~LogParser() = default;

  // Stable identifier used by repo spec overrides ("pytest", "django", ...).
  virtual std::string_view Name() const = 0;

  // Lines that do not look like a result line are ignored. An empty result
  // is returned as-is; the caller decides whether that is malformed output.
  virtual TestOutcomes Parse(std::string_view log) const = 0;
};

// Parser lookup table keyed by repository identifier.
//
// Built-in parser kinds are always available by name; repositories are bound
// to a kind either by the default table (the repositories of the public
// benchmark) or explicitly through Bind().
class LogParserRegistry {
public:
  // Registry preloaded with every built-in kind and the default repository
  // bindings.
  static LogParserRegistry WithDefaults();

  // Binds `repo` to the parser kind `parser_name`. Returns false when no kind
  // has that name.
  bool Bind(std::string_view repo, std::string_view parser_name, std::string& error);

  // Returns nullptr when the repo is unbound.
  const LogParser* ForRepo(std::string_view repo) const;

  // Returns nullptr when no kind has that name.
  const LogParser* ByName(std::string_view parser_name) const;

  std::vector<std::string> KindNames() const;

private:
  std::map<std::string, std::shared_ptr<const LogParser>, std::less<>> kinds_;
  std::map<std::string, std::shared_ptr<const LogParser>, std::less<>> by_repo_;
};

} // namespace sweval::scoring
