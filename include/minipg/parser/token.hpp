#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace minipg::parser {

enum class TokenKind : std::uint8_t {
    Keyword = 0,
    Identifier,
    IdentifierList,
    WhereClause,
    FunctionCall,
    ValueList,
    Comparison,
    IntegerLiteral,
    Wildcard,
    Whitespace,
    StringLiteral,
    Punctuation
};

enum class CommandKind : std::uint8_t {
    Unsupported = 0,
    Select,
    Insert,
    Create
};

struct Token final {
    TokenKind kind = TokenKind::Punctuation;
    std::string text{};
    // Keywords only: upper-cased with single spaces ("ORDER BY").
    std::string keyword{};

    // IdentifierList members, comma separated at the top level.
    std::vector<std::string> members{};

    // FunctionCall parts: "users (name, age)" -> "users", "name, age".
    std::string function_name{};
    std::string arguments{};

    // Comparison parts; "<>" is kept as written.
    std::string left{};
    std::string op{};
    std::string right{};

    [[nodiscard]] bool is_keyword(std::string_view name) const noexcept
    {
        return kind == TokenKind::Keyword && keyword == name;
    }
};

struct TokenStream final {
    CommandKind command = CommandKind::Unsupported;
    std::vector<Token> tokens{};
};

[[nodiscard]] std::string_view token_kind_to_string(TokenKind kind) noexcept;
[[nodiscard]] std::string_view command_kind_to_string(CommandKind kind) noexcept;

}  // namespace minipg::parser
