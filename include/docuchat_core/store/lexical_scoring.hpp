#pragma once

#include <string>
#include <vector>

namespace docuchat_core {

/**
 * Lower-cased query terms: runs of ASCII letters and digits, with non-ASCII bytes
 * kept as word characters, de-duplicated in order of first occurrence. A query with
 * no such run yields its trimmed, lower-cased self as the only term.
 */
std::vector<std::string> extract_query_terms(const std::string &query_text);

// Fraction of terms found as substrings of the lower-cased content, in [0, 1]
float lexical_score(const std::vector<std::string> &terms, const std::string &content);

std::string to_lower_ascii(const std::string &text);

}  // namespace docuchat_core
