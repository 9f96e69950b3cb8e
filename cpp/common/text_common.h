// faraid/cpp/common/text_common.h
#pragma once
#include <string>
#include <string_view>
#include <vector>

// Label normalization for free-form relationship / gender / group text:
// - ASCII: lower, keep [a-z0-9]
// - apostrophes are dropped without a break ("Son's" -> "sons")
// - everything else (punctuation, '_', '-', non-ASCII sequences) -> space
// - spaces are collapsed, leading/trailing space removed
std::string normalize_label(std::string_view s);

// Same, writes into out (reuses capacity)
void normalize_label_to(std::string_view s, std::string& out);

// Split a normalized label on single spaces
std::vector<std::string_view> label_tokens(std::string_view normalized);

bool has_token(const std::vector<std::string_view>& tokens, std::string_view t);

bool starts_with(std::string_view s, std::string_view prefix);
