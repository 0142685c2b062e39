#pragma once

#include "minipg/parser/token.hpp"

#include <string_view>

namespace minipg::parser {

// Splits a statement into typed tokens. Never fails: text that matches no other
// token kind is emitted one character at a time as Punctuation.
[[nodiscard]] TokenStream tokenize(std::string_view statement);

}  // namespace minipg::parser
