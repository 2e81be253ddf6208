// category_detectors.cpp
// Prompt Guard: Attack Family Detectors Implementation

#include "category_detectors.h"

#include <algorithm>
#include <cctype>

namespace prompt_guard {

// =========================================================================
// PHRASE TABLES
// =========================================================================

static const char *SYSTEM_OVERRIDE_PATTERNS[] = {
    "ignore\\s+((all|the)\\s+)?(previous|all|above|prior|earlier)\\s+"
    "(instructions?|prompts?|commands?|rules?)",
    "disregard\\s+(previous|all|above|prior|earlier)",
    "forget\\s+(previous|all|everything|above|prior)",
    "new\\s+(instructions?|rules?|system\\s+prompt)",
    "override\\s+(system|instructions?|rules?)",
    "reset\\s+(instructions?|context|system)",
    nullptr};

static const char *ROLE_CONFUSION_PATTERNS[] = {
    "(you\\s+are\\s+now|act\\s+as|pretend\\s+(you're|you\\s+are|to\\s+be))"
    "\\s+\\S",
    "(your\\s+new\\s+role|you\\s+have\\s+become|you\\s+must\\s+be)",
    "from\\s+now\\s+on\\s*,?\\s+(you\\s+are|act\\s+as|pretend)",
    "(assistant|ai|system|model)\\s*:\\s*\\[?(system|override|new\\s+role)",
    nullptr};

static const char *SECRET_EXTRACTION_PATTERNS[] = {
    "(list|show|print|display|reveal|tell\\s+me)\\s+(all\\s+)?"
    "((the|your)\\s+)?(secrets?|credentials?|passwords?|tokens?|keys?)\\b",
    "(what|show)\\s+(are|is|me)\\s+(your|the)\\s+(api\\s+)?"
    "(keys?|secrets?|credentials?)",
    "contents?\\s+of\\s+(the\\s+)?(vault|secrets?|credentials?)",
    "(dump|export)\\s+(the\\s+)?(vault|secrets?|credentials?)",
    nullptr};

static const char *JAILBREAK_PATTERNS[] = {
    "\\bdan\\s+mode",
    "(developer|admin|root)\\s+mode",
    "bypass\\s+((the|all|your)\\s+)?(restrictions?|limitations?|rules?)",
    "unlock\\s+(all|full)\\s+(capabilities|features)",
    "(disable|remove|turn\\s+off)\\s+((the|your|all)\\s+)?"
    "(safety|guardrails|filters?)",
    nullptr};

static const char *TOOL_PAYLOAD_OPENER = "\\{\\s*\"(type|name)\"\\s*:";

// Tool-call marker tokens (lowercase)
static const char *TOOL_CALL_MARKERS[] = {"tool_calls", "function_call",
                                          nullptr};

// Sequences that close a string and a JSON object
static const char *JSON_ESCAPE_SEQUENCES[] = {"}\"}\"", "}'", nullptr};

struct CommandSequence {
  const char *sequence;
  const char *name;
};

static const CommandSequence COMMAND_SEQUENCES[] = {
    {"`", "backtick_execution"},   {"$(", "command_substitution"},
    {"&&", "command_chaining"},    {"||", "command_chaining"},
    {";", "command_separator"},    {"|", "pipe_operator"},
    {">/dev/", "dev_redirect"},    {"2>&1", "stderr_redirect"},
    {nullptr, nullptr}};

// Legitimate shell discussion
static const char *COMMAND_ALLOWLIST[] = {"example", "how to", "explain",
                                          nullptr};

// =========================================================================
// PATTERN ARENA
// =========================================================================

static void compile_table(const char *name, const char *const *sources,
                          std::vector<std::regex> &out) {
  for (int i = 0; sources[i]; i++) {
    try {
      out.emplace_back(sources[i], std::regex::ECMAScript | std::regex::icase |
                                       std::regex::optimize);
    } catch (const std::regex_error &e) {
      throw PatternTableError(std::string("malformed ") + name +
                              " pattern #" + std::to_string(i) + " '" +
                              sources[i] + "': " + e.what());
    }
  }
}

static PatternTables build_tables() {
  PatternTables t;
  compile_table("system_override", SYSTEM_OVERRIDE_PATTERNS,
                t.system_override);
  compile_table("role_confusion", ROLE_CONFUSION_PATTERNS, t.role_confusion);
  compile_table("secret_extraction", SECRET_EXTRACTION_PATTERNS,
                t.secret_extraction);
  compile_table("jailbreak", JAILBREAK_PATTERNS, t.jailbreak);
  try {
    t.tool_payload_opener = std::regex(TOOL_PAYLOAD_OPENER);
  } catch (const std::regex_error &e) {
    throw PatternTableError(std::string("malformed tool payload opener: ") +
                            e.what());
  }
  return t;
}

const PatternTables &pattern_tables() {
  // A throwing build leaves the static uninitialized; the next call retries
  static const PatternTables tables = build_tables();
  return tables;
}

bool pattern_tables_ok(std::string *error) {
  try {
    pattern_tables();
  } catch (const std::exception &e) {
    if (error)
      *error = e.what();
    return false;
  }
  return true;
}

double CategoryScores::raw_total() const {
  double total = 0.0;
  for (int i = 0; i < CATEGORY_COUNT; i++)
    total += weight[i];
  return total;
}

// =========================================================================
// DETECTORS
// =========================================================================

namespace {

// Whitespace runs are collapsed for the regex phase so that \s+ never
// recurses deeper than one character
struct ScanText {
  std::string lower;     // Substring checks
  std::string collapsed; // Regex checks

  explicit ScanText(const std::string &content) {
    lower.reserve(content.size());
    collapsed.reserve(content.size());
    bool last_space = false;
    for (char ch : content) {
      unsigned char c = static_cast<unsigned char>(ch);
      lower.push_back((char)std::tolower(c));
      bool is_space = std::isspace(c) != 0;
      if (!is_space || !last_space)
        collapsed.push_back(is_space ? ' ' : (char)std::tolower(c));
      last_space = is_space;
    }
  }

  bool contains(const char *needle) const {
    return lower.find(needle) != std::string::npos;
  }
};

bool any_search(const std::vector<std::regex> &table, const std::string &s) {
  for (const auto &re : table) {
    if (std::regex_search(s, re))
      return true;
  }
  return false;
}

double first_match(const std::vector<std::regex> &table, const ScanText &text,
                   Category category, double weight,
                   std::vector<std::string> &patterns) {
  if (!any_search(table, text.collapsed))
    return 0.0;
  patterns.push_back(category_name(category));
  return weight;
}

double detect_system_override(const ScanText &text,
                              std::vector<std::string> &patterns) {
  return first_match(pattern_tables().system_override, text,
                     Category::SYSTEM_PROMPT_OVERRIDE, WEIGHT_SYSTEM_OVERRIDE,
                     patterns);
}

double detect_role_confusion(const ScanText &text,
                             std::vector<std::string> &patterns) {
  return first_match(pattern_tables().role_confusion, text,
                     Category::ROLE_CONFUSION, WEIGHT_ROLE_CONFUSION,
                     patterns);
}

double detect_tool_injection(const ScanText &text,
                             std::vector<std::string> &patterns) {
  bool has_marker = false;
  for (int i = 0; TOOL_CALL_MARKERS[i]; i++) {
    if (text.contains(TOOL_CALL_MARKERS[i])) {
      has_marker = true;
      break;
    }
  }

  // Marker plus payload takes priority over the escape check
  if (has_marker &&
      std::regex_search(text.collapsed,
                        pattern_tables().tool_payload_opener)) {
    patterns.push_back("tool_call_injection");
    return WEIGHT_TOOL_PAYLOAD;
  }

  for (int i = 0; JSON_ESCAPE_SEQUENCES[i]; i++) {
    if (text.contains(JSON_ESCAPE_SEQUENCES[i])) {
      patterns.push_back("json_escape_attempt");
      return WEIGHT_JSON_ESCAPE;
    }
  }

  return 0.0;
}

double detect_secret_extraction(const ScanText &text,
                                std::vector<std::string> &patterns) {
  return first_match(pattern_tables().secret_extraction, text,
                     Category::SECRET_EXTRACTION, WEIGHT_SECRET_EXTRACTION,
                     patterns);
}

double detect_command_injection(const ScanText &text,
                                std::vector<std::string> &patterns) {
  for (int i = 0; COMMAND_ALLOWLIST[i]; i++) {
    if (text.contains(COMMAND_ALLOWLIST[i]))
      return 0.0;
  }

  double score = 0.0;
  for (int i = 0; COMMAND_SEQUENCES[i].sequence; i++) {
    if (!text.contains(COMMAND_SEQUENCES[i].sequence))
      continue;

    score += WEIGHT_COMMAND_SEQUENCE;
    std::string label =
        std::string("command_injection_") + COMMAND_SEQUENCES[i].name;
    if (std::find(patterns.begin(), patterns.end(), label) == patterns.end())
      patterns.push_back(label);
  }

  return std::min(score, WEIGHT_COMMAND_CAP);
}

double detect_jailbreak(const ScanText &text,
                        std::vector<std::string> &patterns) {
  return first_match(pattern_tables().jailbreak, text,
                     Category::JAILBREAK_ATTEMPT, WEIGHT_JAILBREAK, patterns);
}

// Evidence table: one entry per category, evaluated in this order
struct DetectorRule {
  Category category;
  double (*detect)(const ScanText &, std::vector<std::string> &);
};

const DetectorRule DETECTOR_RULES[CATEGORY_COUNT] = {
    {Category::SYSTEM_PROMPT_OVERRIDE, detect_system_override},
    {Category::ROLE_CONFUSION, detect_role_confusion},
    {Category::TOOL_CALL_INJECTION, detect_tool_injection},
    {Category::SECRET_EXTRACTION, detect_secret_extraction},
    {Category::COMMAND_INJECTION, detect_command_injection},
    {Category::JAILBREAK_ATTEMPT, detect_jailbreak},
};

} // namespace

CategoryScores run_detectors(const std::string &content,
                             std::vector<std::string> *patterns) {
  CategoryScores scores;
  std::vector<std::string> local;
  std::vector<std::string> &out = patterns ? *patterns : local;

  ScanText text(content);
  for (const auto &rule : DETECTOR_RULES) {
    scores.weight[static_cast<int>(rule.category)] = rule.detect(text, out);
  }
  return scores;
}

double run_category(Category category, const std::string &content,
                    std::vector<std::string> *patterns) {
  std::vector<std::string> local;
  std::vector<std::string> &out = patterns ? *patterns : local;

  ScanText text(content);
  for (const auto &rule : DETECTOR_RULES) {
    if (rule.category == category)
      return rule.detect(text, out);
  }
  return 0.0;
}

} // namespace prompt_guard
