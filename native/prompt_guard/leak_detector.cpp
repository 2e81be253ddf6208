// leak_detector.cpp
// Prompt Guard: Credential Leak Detection Implementation

#include "leak_detector.h"

#include <regex>

#include "category_detectors.h"

namespace prompt_guard {

static bool is_alnum_char(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9');
}

static bool is_key_char(unsigned char c) {
  return is_alnum_char(c) || c == '_' || c == '-';
}

struct LeakPattern {
  const char *name;
  const char *source;
  bool (*tail)(unsigned char); // Rest of the token, consumed on redaction
};

// Token patterns match a fixed-length prefix; redaction extends the match
// over the remaining token characters without the regex engine
static const LeakPattern LEAK_PATTERNS[] = {
    {"openai_api_key", "\\bsk-(proj-)?[A-Za-z0-9]{20}", is_alnum_char},
    {"anthropic_api_key", "\\bsk-ant-[A-Za-z0-9_-]{20}", is_key_char},
    {"github_token", "\\bgh[pousr]_[A-Za-z0-9]{20}", is_alnum_char},
    {"aws_access_key", "\\bAKIA[0-9A-Z]{16}\\b", nullptr},
    {"private_key_block", "-----BEGIN (RSA |EC |OPENSSH )?PRIVATE KEY-----",
     nullptr},
    {nullptr, nullptr, nullptr}};

struct CompiledLeak {
  std::string name;
  std::regex re;
  bool (*tail)(unsigned char);
};

static std::vector<CompiledLeak> build_leak_table() {
  std::vector<CompiledLeak> table;
  for (int i = 0; LEAK_PATTERNS[i].name; i++) {
    try {
      table.push_back({LEAK_PATTERNS[i].name,
                       std::regex(LEAK_PATTERNS[i].source,
                                  std::regex::ECMAScript |
                                      std::regex::optimize),
                       LEAK_PATTERNS[i].tail});
    } catch (const std::regex_error &e) {
      throw PatternTableError(std::string("malformed leak pattern '") +
                              LEAK_PATTERNS[i].name + "': " + e.what());
    }
  }
  return table;
}

static const std::vector<CompiledLeak> &leak_table() {
  static const std::vector<CompiledLeak> table = build_leak_table();
  return table;
}

static std::string redact_one(const std::string &in,
                              const CompiledLeak &leak) {
  const std::string token = "[REDACTED:" + leak.name + "]";
  std::string out;
  out.reserve(in.size());

  std::string::const_iterator pos = in.cbegin();
  std::smatch m;
  auto flags = std::regex_constants::match_default;
  while (std::regex_search(pos, in.cend(), m, leak.re, flags)) {
    out.append(pos, m[0].first);
    std::string::const_iterator end = m[0].second;
    if (leak.tail) {
      while (end != in.cend() && leak.tail(static_cast<unsigned char>(*end)))
        ++end;
    }
    out += token;
    pos = end;
    // \b at the resume point must see the character before it
    flags = std::regex_constants::match_prev_avail;
  }
  out.append(pos, in.cend());
  return out;
}

LeakDetector::LeakDetector(size_t max_input_length)
    : max_input_length_(max_input_length > 0 ? max_input_length
                                             : DEFAULT_MAX_INPUT_LENGTH) {
  leak_table();
}

std::vector<std::string> LeakDetector::detect(const std::string &text) const {
  std::string bounded = bound_input(text, max_input_length_, nullptr);

  std::vector<std::string> hits;
  for (const auto &leak : leak_table()) {
    if (std::regex_search(bounded, leak.re))
      hits.push_back(leak.name);
  }
  return hits;
}

std::string LeakDetector::redact(const std::string &text) const {
  std::string out = text;
  for (const auto &leak : leak_table())
    out = redact_one(out, leak);
  return out;
}

} // namespace prompt_guard
