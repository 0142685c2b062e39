#include "minipg/parser/token.hpp"

namespace minipg::parser {

std::string_view token_kind_to_string(TokenKind kind) noexcept
{
    switch (kind) {
    case TokenKind::Keyword:
        return "Keyword";
    case TokenKind::Identifier:
        return "Identifier";
    case TokenKind::IdentifierList:
        return "IdentifierList";
    case TokenKind::WhereClause:
        return "WhereClause";
    case TokenKind::FunctionCall:
        return "FunctionCall";
    case TokenKind::ValueList:
        return "ValueList";
    case TokenKind::Comparison:
        return "Comparison";
    case TokenKind::IntegerLiteral:
        return "IntegerLiteral";
    case TokenKind::Wildcard:
        return "Wildcard";
    case TokenKind::Whitespace:
        return "Whitespace";
    case TokenKind::StringLiteral:
        return "StringLiteral";
    case TokenKind::Punctuation:
        return "Punctuation";
    }
    return "Unknown";
}

std::string_view command_kind_to_string(CommandKind kind) noexcept
{
    switch (kind) {
    case CommandKind::Select:
        return "SELECT";
    case CommandKind::Insert:
        return "INSERT";
    case CommandKind::Create:
        return "CREATE";
    case CommandKind::Unsupported:
        return "UNSUPPORTED";
    }
    return "UNSUPPORTED";
}

}  // namespace minipg::parser
