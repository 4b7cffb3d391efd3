#include "docuchat_core/store/lexical_scoring.hpp"

#include <algorithm>
#include <cctype>

namespace docuchat_core {

namespace {

bool is_word_byte(unsigned char c) {
  return c >= 0x80 || std::isalnum(c);
}

}  // namespace

std::string to_lower_ascii(const std::string &text) {
  std::string out = text;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
  });
  return out;
}

std::vector<std::string> extract_query_terms(const std::string &query_text) {
  const std::string lowered = to_lower_ascii(query_text);
  std::vector<std::string> terms;
  std::string current;
  auto flush = [&]() {
    if (!current.empty() && std::find(terms.begin(), terms.end(), current) == terms.end()) {
      terms.push_back(current);
    }
    current.clear();
  };

  for (unsigned char c : lowered) {
    if (is_word_byte(c)) {
      current.push_back(static_cast<char>(c));
    } else {
      flush();
    }
  }
  flush();

  if (terms.empty()) {
    const auto first = lowered.find_first_not_of(" \t\n\r\f\v");
    if (first != std::string::npos) {
      const auto last = lowered.find_last_not_of(" \t\n\r\f\v");
      terms.push_back(lowered.substr(first, last - first + 1));
    }
  }
  return terms;
}

float lexical_score(const std::vector<std::string> &terms, const std::string &content) {
  if (terms.empty())
    return 0.0f;
  const std::string lowered = to_lower_ascii(content);
  size_t matched = 0;
  for (const auto &term : terms) {
    if (lowered.find(term) != std::string::npos)
      ++matched;
  }
  return static_cast<float>(matched) / static_cast<float>(terms.size());
}

}  // namespace docuchat_core
