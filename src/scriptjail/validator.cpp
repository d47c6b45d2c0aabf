#include "validator.h"

#include <cctype>
#include <cstring>
#include <regex>
#include <sstream>
#include <algorithm>

#include <spdlog/spdlog.h>

namespace {

const char kMissingEntryPoint[] = "script must define a main() function";

// std::regex recurses per matched character; only ever hand it a bounded prefix
constexpr size_t kRegexWindow = 256;

const std::regex kDefMain(R"(^(async\s+)?def\s+main\s*\()");
const std::regex kClassMain(R"(^class\s+main\b)");

std::string Trim(const std::string& str) {
  size_t l = str.find_first_not_of(" \t\r\f");
  if (l == std::string::npos) return "";
  size_t r = str.find_last_not_of(" \t\r\f");
  return str.substr(l, r - l + 1);
}

std::string Head(const std::string& str) {
  return str.substr(0, kRegexWindow);
}

bool IsWordChar(char c) {
  return isalnum((unsigned char)c) || c == '_';
}

bool IsIdentifier(const std::string& str) {
  if (str.empty() || isdigit((unsigned char)str[0])) return false;
  return std::all_of(str.begin(), str.end(), IsWordChar);
}

// pos just past keyword kw (and the blanks after it) if stmt has kw as a whole word at pos
size_t SkipKeyword(const std::string& stmt, size_t pos, const std::string& kw) {
  if (pos >= stmt.size() || stmt.compare(pos, kw.size(), kw) != 0) return std::string::npos;
  pos += kw.size();
  if (pos < stmt.size() && IsWordChar(stmt[pos])) return std::string::npos;
  pos = stmt.find_first_not_of(" \t", pos);
  return pos == std::string::npos ? stmt.size() : pos;
}

std::vector<std::string> SplitNames(const std::string& list) {
  std::vector<std::string> ret;
  std::string str;
  for (char c : list) {
    if (c == '(' || c == ')') continue;
    if (c == ',') {
      ret.push_back(Trim(str));
      str.clear();
    } else {
      str.push_back(c);
    }
  }
  ret.push_back(Trim(str));
  ret.erase(std::remove(ret.begin(), ret.end(), std::string()), ret.end());
  return ret;
}

// "x as y" -> ("x", "y"); "x" -> ("x", "x")
std::pair<std::string, std::string> SplitAlias(const std::string& item) {
  std::istringstream in(item);
  std::string name, kw, alias, extra;
  in >> name >> kw >> alias;
  if (kw == "as" && IsIdentifier(alias) && !(in >> extra)) return {name, alias};
  return {item, item};
}

std::string RootModule(const std::string& name) {
  return name.substr(0, name.find('.'));
}

// import statement split into its module (empty for "import a, b") and name list
struct ImportStmt {
  bool from;
  std::string module;
  std::string names;
};

std::optional<ImportStmt> ParseImport(const std::string& stmt) {
  size_t pos = SkipKeyword(stmt, 0, "import");
  if (pos != std::string::npos) return ImportStmt{false, "", stmt.substr(pos)};
  pos = SkipKeyword(stmt, 0, "from");
  if (pos == std::string::npos) return std::nullopt;
  size_t end = pos;
  while (end < stmt.size() && (IsWordChar(stmt[end]) || stmt[end] == '.')) end++;
  if (end == pos) return std::nullopt;
  size_t names = SkipKeyword(stmt, stmt.find_first_not_of(" \t", end), "import");
  if (names == std::string::npos) return std::nullopt;
  return ImportStmt{true, stmt.substr(pos, end - pos), stmt.substr(names)};
}

// "a, main = ...", "main: T = ..."; augmented assignments and comparisons do not bind
bool AssignsMain(const std::string& stmt) {
  size_t eq = stmt.find('=');
  if (eq == std::string::npos || eq == 0) return false;
  if (eq + 1 < stmt.size() && stmt[eq + 1] == '=') return false;
  if (strchr("!<>:+-*/%&|^@", stmt[eq - 1])) return false;
  std::string targets = stmt.substr(0, eq);
  targets = targets.substr(0, targets.find(':'));
  bool found = false;
  std::istringstream in(targets);
  for (std::string item; std::getline(in, item, ',');) {
    item = Trim(item);
    if (!IsIdentifier(item)) return false;
    if (item == "main") found = true;
  }
  return found;
}

bool BindsMain(const std::string& stmt) {
  if (std::regex_search(Head(stmt), kClassMain) || AssignsMain(stmt)) return true;
  auto import = ParseImport(stmt);
  if (!import) return false;
  for (auto& item : SplitNames(import->names)) {
    auto [name, alias] = SplitAlias(item);
    if (import->from && (item == "*" || alias == "main")) return true;
    if (!import->from && alias == "main" && name != alias) return true;
  }
  return false;
}

// root modules imported by one statement; relative imports are skipped
std::vector<std::string> ImportedModules(const std::string& stmt) {
  std::vector<std::string> ret;
  auto import = ParseImport(stmt);
  if (!import) return ret;
  if (import->from) {
    if (import->module[0] != '.') ret.push_back(RootModule(import->module));
  } else {
    for (auto& item : SplitNames(import->names)) ret.push_back(RootModule(SplitAlias(item).first));
  }
  return ret;
}

// blanks dropped except a single one between two word characters,
// so "os . system (" reads "os.system(" and "return eval" keeps its space
std::string Squeeze(const std::string& str) {
  std::string ret;
  for (size_t i = 0; i < str.size(); i++) {
    if (str[i] != ' ' && str[i] != '\t') {
      ret.push_back(str[i]);
      continue;
    }
    while (i + 1 < str.size() && (str[i + 1] == ' ' || str[i + 1] == '\t')) i++;
    if (!ret.empty() && IsWordChar(ret.back()) && i + 1 < str.size() && IsWordChar(str[i + 1])) {
      ret.push_back(' ');
    }
  }
  return ret;
}

// "eval(" matches "x = eval(" and "obj.eval(" but not "retrieval("
bool ContainsFragment(const std::string& line, const std::string& frag) {
  if (frag.empty()) return false;
  for (size_t pos = line.find(frag); pos != std::string::npos; pos = line.find(frag, pos + 1)) {
    if (pos == 0 || !IsWordChar(frag[0]) || !IsWordChar(line[pos - 1])) return true;
  }
  return false;
}

} // namespace

std::vector<std::string> LogicalLines(const std::string& source) {
  std::vector<std::string> ret;
  std::string cur;
  int depth = 0;
  char quote = 0;
  bool triple = false;
  auto Flush = [&]() {
    if (cur.find_first_not_of(" \t\r\f") != std::string::npos) ret.push_back(cur);
    cur.clear();
  };
  for (size_t i = 0; i < source.size(); i++) {
    char c = source[i];
    if (quote) {
      if (c == '\\') {
        i++;
      } else if (triple) {
        if (source.compare(i, 3, std::string(3, quote)) == 0) quote = 0, i += 2;
      } else if (c == quote) {
        quote = 0;
      } else if (c == '\n') {
        // unterminated single-quoted string; let the interpreter complain
        quote = 0;
        if (depth) cur.push_back(' ');
        else Flush();
      }
      continue;
    }
    switch (c) {
      case '#':
        while (i + 1 < source.size() && source[i + 1] != '\n') i++;
        break;
      case '\'': case '"':
        quote = c;
        triple = source.compare(i, 3, std::string(3, c)) == 0;
        if (triple) i += 2;
        cur += "\"\"";
        break;
      case '(': case '[': case '{':
        depth++;
        cur.push_back(c);
        break;
      case ')': case ']': case '}':
        if (depth) depth--;
        cur.push_back(c);
        break;
      case '\\':
        if (i + 1 < source.size() && source[i + 1] == '\n') {
          cur.push_back(' ');
          i++;
        } else {
          cur.push_back(c);
        }
        break;
      case ';':
        if (!depth) {
          std::string indent = cur.substr(0, cur.find_first_not_of(" \t"));
          Flush();
          cur = indent;
          while (i + 1 < source.size() && (source[i + 1] == ' ' || source[i + 1] == '\t')) i++;
        } else {
          cur.push_back(c);
        }
        break;
      case '\n':
        if (depth) cur.push_back(' ');
        else Flush();
        break;
      default:
        cur.push_back(c);
    }
  }
  Flush();
  return ret;
}

std::optional<std::string> ValidateScript(const std::string& script, const SandboxPolicy& policy) {
  auto lines = LogicalLines(script);
  bool has_main = false;
  for (auto& line : lines) {
    bool top_level = line[0] != ' ' && line[0] != '\t';
    std::string stmt = Trim(line);
    if (std::regex_search(Head(stmt), kDefMain) || (top_level && BindsMain(stmt))) {
      has_main = true;
      break;
    }
  }
  if (!has_main) {
    spdlog::debug("Validator: no entry point among {} statements", lines.size());
    return kMissingEntryPoint;
  }
  for (auto& line : lines) {
    if (policy.allowed_modules.empty()) break;
    for (auto& module : ImportedModules(Trim(line))) {
      if (std::find(policy.allowed_modules.begin(), policy.allowed_modules.end(), module) ==
          policy.allowed_modules.end()) {
        spdlog::debug("Validator: rejected import {}", module);
        return "import of module '" + module + "' is not permitted";
      }
    }
  }
  if (policy.denied_patterns.empty()) return std::nullopt;
  std::vector<std::string> denied;
  for (auto& pattern : policy.denied_patterns) denied.push_back(Squeeze(Trim(pattern)));
  for (auto& line : lines) {
    std::string squeezed = Squeeze(line);
    for (size_t i = 0; i < denied.size(); i++) {
      if (ContainsFragment(squeezed, denied[i])) {
        spdlog::debug("Validator: rejected use of {}", denied[i]);
        return "use of '" + policy.denied_patterns[i] + "' is not permitted";
      }
    }
  }
  return std::nullopt;
}
