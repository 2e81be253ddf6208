// prompt_sanitizer.cpp
// Prompt Guard: Literal Substring Rewriter Implementation

#include "prompt_sanitizer.h"

#include <cstring>

namespace prompt_guard {

// Tool-call key prefixes replaced wholesale
static const char *TOOL_KEY_PREFIXES[] = {"{\"tool_calls\":",
                                          "{\"function_call\":", nullptr};

// Prefix every occurrence of token not already preceded by the marker
static int escape_unescaped(std::string &s, const char *token) {
  const size_t tlen = std::strlen(token);
  int count = 0;
  size_t pos = s.find(token);
  while (pos != std::string::npos) {
    if (pos > 0 && s[pos - 1] == ESCAPE_MARKER) {
      pos = s.find(token, pos + tlen);
      continue;
    }
    s.insert(pos, 1, ESCAPE_MARKER);
    count++;
    pos = s.find(token, pos + 1 + tlen);
  }
  return count;
}

static int replace_all(std::string &s, const char *from, const char *to) {
  const size_t flen = std::strlen(from);
  const size_t tlen = std::strlen(to);
  int count = 0;
  size_t pos = s.find(from);
  while (pos != std::string::npos) {
    s.replace(pos, flen, to);
    count++;
    pos = s.find(from, pos + tlen);
  }
  return count;
}

std::string PromptSanitizer::sanitize(const std::string &content,
                                      SanitizeStats *stats) const {
  SanitizeStats local;
  std::memset(&local, 0, sizeof(local));

  if (!active()) {
    if (stats)
      *stats = local;
    return content;
  }

  std::string out = content;

  local.substitutions_escaped = escape_unescaped(out, "$(");
  local.backticks_escaped = escape_unescaped(out, "`");

  for (int i = 0; TOOL_KEY_PREFIXES[i]; i++) {
    local.tool_keys_redacted +=
        replace_all(out, TOOL_KEY_PREFIXES[i], REDACTION_TOKEN);
  }

  local.total = local.substitutions_escaped + local.backticks_escaped +
                local.tool_keys_redacted;
  if (stats)
    *stats = local;
  return out;
}

} // namespace prompt_guard
