#include "minipg/executor/predicate.hpp"

#include "minipg/common/errors.hpp"
#include "minipg/executor/column_resolver.hpp"

#include <cctype>
#include <charconv>
#include <string>
#include <vector>

namespace minipg::executor {

namespace {

constexpr std::string_view kAnd = " AND ";
constexpr std::string_view kOr = " OR ";
constexpr std::string_view kNot = "NOT ";

std::string_view trim_view(std::string_view text) noexcept
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1U);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1U);
    }
    return text;
}

std::vector<std::string_view> split(std::string_view text, std::string_view separator)
{
    std::vector<std::string_view> parts;
    std::size_t start = 0U;
    while (true) {
        const auto position = text.find(separator, start);
        if (position == std::string_view::npos) {
            parts.push_back(trim_view(text.substr(start)));
            return parts;
        }
        parts.push_back(trim_view(text.substr(start, position - start)));
        start = position + separator.size();
    }
}

storage::Value parse_literal(std::string_view text)
{
    if (text.size() >= 2U && text.front() == '\'' && text.back() == '\'') {
        return storage::Value{std::string{text.substr(1U, text.size() - 2U)}};
    }
    auto digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1U);
    }
    double number = 0.0;
    const auto* end = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), end, number);
    if (!digits.empty() && ec == std::errc{} && ptr == end) {
        return storage::Value{number};
    }
    return storage::Value{std::string{text}};
}

}  // namespace

ComparisonTerm parse_comparison(std::string_view expression)
{
    const auto text = trim_view(expression);
    for (std::size_t position = 1U; position < text.size(); ++position) {
        const auto ch = text[position];
        const auto following = position + 1U < text.size() ? text[position + 1U] : '\0';

        ComparisonTerm term{};
        std::size_t length = 1U;
        if (ch == '=') {
            term.op = ComparisonOperator::Equal;
        } else if (ch == '!' && following == '=') {
            term.op = ComparisonOperator::NotEqual;
            length = 2U;
        } else if (ch == '<' && following == '>') {
            term.op = ComparisonOperator::NotEqual;
            length = 2U;
        } else if (ch == '<') {
            term.op = following == '=' ? ComparisonOperator::LessEqual : ComparisonOperator::Less;
            length = following == '=' ? 2U : 1U;
        } else if (ch == '>') {
            term.op = following == '=' ? ComparisonOperator::GreaterEqual : ComparisonOperator::Greater;
            length = following == '=' ? 2U : 1U;
        } else {
            continue;
        }

        const auto left = trim_view(text.substr(0U, position));
        const auto right = trim_view(text.substr(position + length));
        if (left.empty() || right.empty()) {
            break;
        }
        term.column = std::string{left};
        term.literal = parse_literal(right);
        return term;
    }
    throw std::system_error{make_error_code(EngineErrc::MalformedPredicate),
                            "Invalid expression: " + std::string{text}};
}

bool evaluate_comparison(const storage::Row& row, const ComparisonTerm& term)
{
    const auto* found = resolve_column(row, term.column);
    const storage::Value left = found != nullptr ? *found : storage::Value{};

    switch (term.op) {
    case ComparisonOperator::Equal:
        return left == term.literal;
    case ComparisonOperator::NotEqual:
        return !(left == term.literal);
    default:
        break;
    }

    const auto order = storage::compare_for_predicate(left, term.literal);
    if (!order) {
        return false;
    }
    switch (term.op) {
    case ComparisonOperator::Less:
        return *order < 0;
    case ComparisonOperator::Greater:
        return *order > 0;
    case ComparisonOperator::LessEqual:
        return *order <= 0;
    case ComparisonOperator::GreaterEqual:
        return *order >= 0;
    default:
        return false;
    }
}

bool evaluate_where(const storage::Row& row, std::string_view expression)
{
    const auto text = trim_view(expression);
    if (text.find(kAnd) != std::string_view::npos) {
        for (const auto part : split(text, kAnd)) {
            if (!evaluate_where(row, part)) {
                return false;
            }
        }
        return true;
    }
    if (text.find(kOr) != std::string_view::npos) {
        for (const auto part : split(text, kOr)) {
            if (evaluate_where(row, part)) {
                return true;
            }
        }
        return false;
    }
    if (text.starts_with(kNot)) {
        return !evaluate_where(row, text.substr(kNot.size()));
    }
    return evaluate_comparison(row, parse_comparison(text));
}

}  // namespace minipg::executor
