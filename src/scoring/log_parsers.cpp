#include "scoring/log_parsers.hpp"

#include <array>
#include <cctype>

namespace sweval::scoring {

namespace {

constexpr std::array<std::string_view, 5> kStatusWords = {
    "FAILED", "PASSED", "SKIPPED", "ERROR", "XFAIL",
};

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

std::vector<std::string_view> SplitWhitespace(std::string_view text) {
  std::vector<std::string_view> tokens;
  std::size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
      ++pos;
    }
    const std::size_t start = pos;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) == 0) {
      ++pos;
    }
    if (pos > start) {
      tokens.push_back(text.substr(start, pos - start));
    }
  }
  return tokens;
}

std::vector<std::string_view> SplitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

std::string ReplaceAll(std::string text, std::string_view needle, std::string_view replacement) {
  std::size_t pos = 0;
  while ((pos = text.find(needle, pos)) != std::string::npos) {
    text.replace(pos, needle.size(), replacement);
    pos += replacement.size();
  }
  return text;
}

bool StartsWithStatusWord(std::string_view line) {
  for (const auto word : kStatusWords) {
    if (StartsWith(line, word)) {
      return true;
    }
  }
  return false;
}

bool EndsWithStatusWord(std::string_view line) {
  for (const auto word : kStatusWords) {
    if (EndsWith(line, word)) {
      return true;
    }
  }
  return false;
}

void Record(TestOutcomes& outcomes, std::string_view test, std::string_view status_text) {
  TestStatus status = TestStatus::kFailed;
  if (test.empty() || !ParseTestStatus(status_text, status)) {
    return;
  }
  outcomes[std::string(test)] = status;
}

// Shared "<STATUS> <test id> [- reason]" line handling of the pytest -rA
// short summary. Returns true when the line was a summary line.
bool ParsePytestSummaryLine(std::string line, TestOutcomes& outcomes,
                            std::string (*rename)(std::string_view) = nullptr) {
  if (!StartsWithStatusWord(line)) {
    return false;
  }
  if (StartsWith(line, "FAILED")) {
    line = ReplaceAll(std::move(line), " - ", " ");
  }
  const std::vector<std::string_view> tokens = SplitWhitespace(line);
  if (tokens.size() <= 1U) {
    return true;
  }
  if (rename != nullptr) {
    Record(outcomes, rename(tokens[1]), tokens[0]);
  } else {
    Record(outcomes, tokens[1], tokens[0]);
  }
  return true;
}

class PytestLogParser final : public LogParser {
public:
  std::string_view Name() const override {
    return "pytest";
  }

  TestOutcomes Parse(std::string_view log) const override {
    TestOutcomes outcomes;
    for (const auto line : SplitLines(log)) {
      ParsePytestSummaryLine(std::string(line), outcomes);
    }
    return outcomes;
  }
};

// Parametrized ids whose option is an absolute path keep only the last path
// component, so ids do not depend on where the checkout lives.
std::string NormalizeOptionTestName(std::string_view raw) {
  const std::size_t open = raw.find('[');
  const std::size_t close = raw.rfind(']');
  if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
    return std::string(raw);
  }
  const std::string_view main = raw.substr(0, open);
  std::string_view option = raw.substr(open + 1, close - open - 1);
  if (StartsWith(option, "/") && !StartsWith(option, "//") &&
      option.find('*') == std::string_view::npos) {
    option = option.substr(option.rfind('/'));
  }
  return std::string(main) + "[" + std::string(option) + "]";
}

class PytestOptionsLogParser final : public LogParser {
public:
  std::string_view Name() const override {
    return "pytest_options";
  }

  TestOutcomes Parse(std::string_view log) const override {
    TestOutcomes outcomes;
    for (const auto line : SplitLines(log)) {
      ParsePytestSummaryLine(std::string(line), outcomes, &RenameOption);
    }
    return outcomes;
  }

private:
  static std::string RenameOption(std::string_view test) {
    return NormalizeOptionTestName(test);
  }
};

// Strips "[<digits>m" color codes and control characters from one line.
std::string StripTerminalNoise(std::string_view line) {
  std::string cleaned;
  cleaned.reserve(line.size());
  std::size_t i = 0;
  while (i < line.size()) {
    if (line[i] == '[') {
      std::size_t j = i + 1;
      while (j < line.size() && std::isdigit(static_cast<unsigned char>(line[j])) != 0) {
        ++j;
      }
      if (j > i + 1 && j < line.size() && line[j] == 'm') {
        i = j + 1;
        continue;
      }
    }
    const auto as_unsigned = static_cast<unsigned char>(line[i]);
    if (as_unsigned >= 32U && as_unsigned != 127U) {
      cleaned.push_back(line[i]);
    }
    ++i;
  }
  return cleaned;
}

class PytestV2LogParser final : public LogParser {
public:
  std::string_view Name() const override {
    return "pytest_v2";
  }

  TestOutcomes Parse(std::string_view log) const override {
    TestOutcomes outcomes;
    for (const auto raw_line : SplitLines(log)) {
      const std::string line = StripTerminalNoise(raw_line);
      if (ParsePytestSummaryLine(line, outcomes)) {
        continue;
      }
      // Older pytest prints "<test id> <STATUS>" in verbose mode.
      if (EndsWithStatusWord(line)) {
        const std::vector<std::string_view> tokens = SplitWhitespace(line);
        if (tokens.size() >= 2U) {
          Record(outcomes, tokens[0], tokens[1]);
        }
      }
    }
    return outcomes;
  }
};

class DjangoLogParser final : public LogParser {
public:
  std::string_view Name() const override {
    return "django";
  }

  TestOutcomes Parse(std::string_view log) const override {
    constexpr std::string_view kSeparator = " ... ";
    constexpr std::array<std::string_view, 3> kPassSuffixes = {
        " ... ok", " ... OK", " ...  OK",
    };

    TestOutcomes outcomes;
    std::string previous_test;
    for (const auto raw_line : SplitLines(log)) {
      const std::string_view line = Trim(raw_line);

      // This test's output spans several lines and never gets a " ... ok".
      if (line.find("--version is equivalent to version") != std::string_view::npos) {
        outcomes["--version is equivalent to version"] = TestStatus::kPassed;
      }

      const std::size_t separator = line.find(kSeparator);
      if (separator != std::string_view::npos) {
        previous_test = std::string(line.substr(0, separator));
      }

      for (const auto suffix : kPassSuffixes) {
        if (EndsWith(line, suffix)) {
          const std::string_view test = line.substr(0, line.rfind(suffix));
          outcomes[std::string(test)] = TestStatus::kPassed;
          break;
        }
      }
      if (const std::size_t pos = line.find(" ... skipped"); pos != std::string_view::npos) {
        outcomes[std::string(line.substr(0, pos))] = TestStatus::kSkipped;
      }
      if (EndsWith(line, " ... FAIL")) {
        outcomes[std::string(line.substr(0, line.find(" ... FAIL")))] = TestStatus::kFailed;
      }
      if (StartsWith(line, "FAIL:")) {
        const std::vector<std::string_view> tokens = SplitWhitespace(line);
        if (tokens.size() >= 2U) {
          outcomes[std::string(tokens[1])] = TestStatus::kFailed;
        }
      }
      if (EndsWith(line, " ... ERROR")) {
        outcomes[std::string(line.substr(0, line.find(" ... ERROR")))] = TestStatus::kError;
      }
      if (StartsWith(line, "ERROR:")) {
        const std::vector<std::string_view> tokens = SplitWhitespace(line);
        if (tokens.size() >= 2U) {
          outcomes[std::string(tokens[1])] = TestStatus::kError;
        }
      }
      // A bare "ok" after captured output closes the previous test.
      if (StartsWith(line, "ok") && !previous_test.empty()) {
        outcomes[previous_test] = TestStatus::kPassed;
      }
    }
    return outcomes;
  }
};

class SympyLogParser final : public LogParser {
public:
  std::string_view Name() const override {
    return "sympy";
  }

  TestOutcomes Parse(std::string_view log) const override {
    TestOutcomes outcomes;
    for (const auto raw_line : SplitLines(log)) {
      RecordFailureBanner(raw_line, outcomes);
    }
    for (const auto raw_line : SplitLines(log)) {
      const std::string_view line = Trim(raw_line);
      if (!StartsWith(line, "test_")) {
        continue;
      }
      const std::vector<std::string_view> tokens = SplitWhitespace(line);
      if (EndsWith(line, " E")) {
        outcomes[std::string(tokens[0])] = TestStatus::kError;
      }
      if (EndsWith(line, " F")) {
        outcomes[std::string(tokens[0])] = TestStatus::kFailed;
      }
      if (EndsWith(line, " ok")) {
        outcomes[std::string(tokens[0])] = TestStatus::kPassed;
      }
    }
    return outcomes;
  }

private:
  // "____ sympy/core/tests/test_basic.py:test_equality ____" names a failure.
  static void RecordFailureBanner(std::string_view line, TestOutcomes& outcomes) {
    line = Trim(line);
    if (!StartsWith(line, "_") || !EndsWith(line, "_")) {
      return;
    }
    const std::size_t first_space = line.find(' ');
    const std::size_t last_space = line.rfind(' ');
    if (first_space == std::string_view::npos || last_space <= first_space) {
      return;
    }
    const std::string_view name = line.substr(first_space + 1, last_space - first_space - 1);
    if (name.find(".py:") == std::string_view::npos) {
      return;
    }
    outcomes[std::string(name)] = TestStatus::kFailed;
  }
};

class SeabornLogParser final : public LogParser {
public:
  std::string_view Name() const override {
    return "seaborn";
  }

  TestOutcomes Parse(std::string_view log) const override {
    TestOutcomes outcomes;
    for (const auto line : SplitLines(log)) {
      const std::vector<std::string_view> tokens = SplitWhitespace(line);
      if (StartsWith(line, "FAILED")) {
        if (tokens.size() >= 2U) {
          outcomes[std::string(tokens[1])] = TestStatus::kFailed;
        }
      } else if (line.find(" PASSED ") != std::string_view::npos) {
        if (tokens.size() >= 2U && tokens[1] == "PASSED") {
          outcomes[std::string(tokens[0])] = TestStatus::kPassed;
        }
      } else if (StartsWith(line, "PASSED")) {
        if (tokens.size() >= 2U) {
          outcomes[std::string(tokens[1])] = TestStatus::kPassed;
        }
      }
    }
    return outcomes;
  }
};

class MatplotlibLogParser final : public LogParser {
public:
  std::string_view Name() const override {
    return "matplotlib";
  }

  TestOutcomes Parse(std::string_view log) const override {
    TestOutcomes outcomes;
    for (const auto raw_line : SplitLines(log)) {
      // Enum reprs differ between matplotlib versions; ids use the values.
      std::string line = ReplaceAll(std::string(raw_line), "MouseButton.LEFT", "1");
      line = ReplaceAll(std::move(line), "MouseButton.RIGHT", "3");
      ParsePytestSummaryLine(std::move(line), outcomes);
    }
    return outcomes;
  }
};

struct DefaultBinding {
  std::string_view repo;
  std::string_view parser;
};

constexpr std::array<DefaultBinding, 18> kDefaultBindings = {{
    {"astropy/astropy", "pytest"},
    {"django/django", "django"},
    {"marshmallow-code/marshmallow", "pytest"},
    {"matplotlib/matplotlib", "matplotlib"},
    {"mwaskom/seaborn", "seaborn"},
    {"pallets/flask", "pytest"},
    {"psf/requests", "pytest_options"},
    {"pvlib/pvlib-python", "pytest"},
    {"pydata/xarray", "pytest"},
    {"pydicom/pydicom", "pytest_options"},
    {"pylint-dev/astroid", "pytest"},
    {"pylint-dev/pylint", "pytest_options"},
    {"pytest-dev/pytest", "pytest"},
    {"pyvista/pyvista", "pytest"},
    {"scikit-learn/scikit-learn", "pytest_v2"},
    {"sqlfluff/sqlfluff", "pytest"},
    {"sphinx-doc/sphinx", "pytest_v2"},
    {"sympy/sympy", "sympy"},
}};

} // namespace

const char* ToString(TestStatus status) {
  switch (status) {
  case TestStatus::kPassed:
    return "PASSED";
  case TestStatus::kFailed:
    return "FAILED";
  case TestStatus::kSkipped:
    return "SKIPPED";
  case TestStatus::kError:
    return "ERROR";
  case TestStatus::kXfail:
    return "XFAIL";
  }
  return "FAILED";
}

bool ParseTestStatus(std::string_view text, TestStatus& status) {
  if (text == "PASSED") {
    status = TestStatus::kPassed;
    return true;
  }
  if (text == "FAILED") {
    status = TestStatus::kFailed;
    return true;
  }
  if (text == "SKIPPED") {
    status = TestStatus::kSkipped;
    return true;
  }
  if (text == "ERROR") {
    status = TestStatus::kError;
    return true;
  }
  if (text == "XFAIL") {
    status = TestStatus::kXfail;
    return true;
  }
  return false;
}

LogParserRegistry LogParserRegistry::WithDefaults() {
  LogParserRegistry registry;
  const std::array<std::shared_ptr<const LogParser>, 7> kinds = {
      std::make_shared<PytestLogParser>(),     std::make_shared<PytestOptionsLogParser>(),
      std::make_shared<PytestV2LogParser>(),   std::make_shared<DjangoLogParser>(),
      std::make_shared<SympyLogParser>(),      std::make_shared<SeabornLogParser>(),
      std::make_shared<MatplotlibLogParser>(),
  };
  for (const auto& kind : kinds) {
    registry.kinds_.emplace(std::string(kind->Name()), kind);
  }

  std::string error;
  for (const auto& binding : kDefaultBindings) {
    // Every default binding names a built-in kind registered above.
    (void)registry.Bind(binding.repo, binding.parser, error);
  }
  return registry;
}

bool LogParserRegistry::Bind(std::string_view repo, std::string_view parser_name,
                             std::string& error) {
  const auto it = kinds_.find(parser_name);
  if (it == kinds_.end()) {
    error = "unknown log parser '" + std::string(parser_name) + "' for repo '" +
            std::string(repo) + "'";
    return false;
  }
  by_repo_[std::string(repo)] = it->second;
  return true;
}

const LogParser* LogParserRegistry::ForRepo(std::string_view repo) const {
  const auto it = by_repo_.find(repo);
  return it == by_repo_.end() ? nullptr : it->second.get();
}

const LogParser* LogParserRegistry::ByName(std::string_view parser_name) const {
  const auto it = kinds_.find(parser_name);
  return it == kinds_.end() ? nullptr : it->second.get();
}

std::vector<std::string> LogParserRegistry::KindNames() const {
  std::vector<std::string> names;
  names.reserve(kinds_.size());
  for (const auto& [name, kind] : kinds_) {
    names.push_back(name);
  }
  return names;
}

} // namespace sweval::scoring
