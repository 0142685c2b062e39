#include "minipg/parser/tokenizer.hpp"

#include <tao/pegtl.hpp>

#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>

namespace minipg::parser {

namespace {

namespace pegtl = tao::pegtl;

template <char... Cs>
struct keyword : pegtl::seq<pegtl::istring<Cs...>, pegtl::not_at<pegtl::identifier_other>> {
};

struct required_space : pegtl::plus<pegtl::space> {
};

struct optional_space : pegtl::star<pegtl::space> {
};

struct kw_select : keyword<'S', 'E', 'L', 'E', 'C', 'T'> {
};

struct kw_insert : keyword<'I', 'N', 'S', 'E', 'R', 'T'> {
};

struct kw_create : keyword<'C', 'R', 'E', 'A', 'T', 'E'> {
};

struct kw_table : keyword<'T', 'A', 'B', 'L', 'E'> {
};

struct kw_from : keyword<'F', 'R', 'O', 'M'> {
};

struct kw_into : keyword<'I', 'N', 'T', 'O'> {
};

struct kw_values : keyword<'V', 'A', 'L', 'U', 'E', 'S'> {
};

struct kw_on : keyword<'O', 'N'> {
};

struct kw_and : keyword<'A', 'N', 'D'> {
};

struct kw_or : keyword<'O', 'R'> {
};

struct kw_not : keyword<'N', 'O', 'T'> {
};

struct kw_join : keyword<'J', 'O', 'I', 'N'> {
};

struct kw_inner : keyword<'I', 'N', 'N', 'E', 'R'> {
};

struct kw_left : keyword<'L', 'E', 'F', 'T'> {
};

struct kw_right : keyword<'R', 'I', 'G', 'H', 'T'> {
};

struct kw_full : keyword<'F', 'U', 'L', 'L'> {
};

struct kw_outer : keyword<'O', 'U', 'T', 'E', 'R'> {
};

struct kw_order : keyword<'O', 'R', 'D', 'E', 'R'> {
};

struct kw_group : keyword<'G', 'R', 'O', 'U', 'P'> {
};

struct kw_by : keyword<'B', 'Y'> {
};

struct kw_limit : keyword<'L', 'I', 'M', 'I', 'T'> {
};

struct kw_where : keyword<'W', 'H', 'E', 'R', 'E'> {
};

struct kw_asc : keyword<'A', 'S', 'C'> {
};

struct kw_desc : keyword<'D', 'E', 'S', 'C'> {
};

struct join_keyword
    : pegtl::sor<pegtl::seq<kw_inner, required_space, kw_join>,
                 pegtl::seq<pegtl::sor<kw_left, kw_right, kw_full>,
                            required_space,
                            pegtl::opt<kw_outer, required_space>,
                            kw_join>,
                 kw_join> {
};

struct order_by_keyword : pegtl::seq<kw_order, required_space, kw_by> {
};

struct group_by_keyword : pegtl::seq<kw_group, required_space, kw_by> {
};

struct keyword_rule : pegtl::sor<join_keyword,
                                 order_by_keyword,
                                 group_by_keyword,
                                 kw_select,
                                 kw_insert,
                                 kw_create,
                                 kw_table,
                                 kw_from,
                                 kw_into,
                                 kw_values,
                                 kw_on,
                                 kw_and,
                                 kw_or,
                                 kw_not,
                                 kw_limit> {
};

struct quoted_char : pegtl::sor<pegtl::two<'\''>, pegtl::not_one<'\''>> {
};

struct quoted_string : pegtl::seq<pegtl::one<'\''>, pegtl::star<quoted_char>, pegtl::one<'\''>> {
};

struct paren_group;

struct paren_body : pegtl::star<pegtl::sor<quoted_string, paren_group, pegtl::not_one<'(', ')', '\''>>> {
};

struct paren_group : pegtl::seq<pegtl::one<'('>, paren_body, pegtl::one<')'>> {
};

struct qualified_name
    : pegtl::seq<pegtl::identifier, pegtl::star<pegtl::one<'.'>, pegtl::sor<pegtl::identifier, pegtl::one<'*'>>>> {
};

struct sort_direction : pegtl::sor<kw_asc, kw_desc> {
};

struct identifier_rule : pegtl::seq<qualified_name, pegtl::opt<required_space, sort_direction>> {
};

struct function_call_rule : pegtl::seq<pegtl::identifier, optional_space, paren_group> {
};

struct list_item : pegtl::sor<function_call_rule, identifier_rule, pegtl::one<'*'>> {
};

struct identifier_list_rule
    : pegtl::seq<list_item, pegtl::plus<optional_space, pegtl::one<','>, optional_space, list_item>> {
};

struct numeric_literal
    : pegtl::seq<pegtl::opt<pegtl::one<'+', '-'>>,
                 pegtl::plus<pegtl::digit>,
                 pegtl::opt<pegtl::one<'.'>, pegtl::plus<pegtl::digit>>> {
};

struct comparison_operand : pegtl::sor<quoted_string, numeric_literal, qualified_name> {
};

struct comparison_operator : pegtl::sor<pegtl::string<'<', '='>,
                                        pegtl::string<'>', '='>,
                                        pegtl::string<'<', '>'>,
                                        pegtl::string<'!', '='>,
                                        pegtl::one<'=', '<', '>'>> {
};

struct comparison_rule
    : pegtl::seq<comparison_operand, optional_space, comparison_operator, optional_space, comparison_operand> {
};

struct value_list_rule : pegtl::seq<paren_group, pegtl::star<optional_space, pegtl::one<','>, optional_space, paren_group>> {
};

struct where_terminator
    : pegtl::sor<pegtl::seq<optional_space, pegtl::one<';'>>,
                 pegtl::seq<required_space, pegtl::sor<group_by_keyword, order_by_keyword, kw_limit>>> {
};

struct where_body : pegtl::star<pegtl::sor<quoted_string, pegtl::seq<pegtl::not_at<where_terminator>, pegtl::any>>> {
};

// Top-level token rules. Only these carry actions; the shared sub-rules above
// also match inside lists and failed alternatives.
struct where_token : pegtl::seq<kw_where, where_body> {
};

struct keyword_token : keyword_rule {
};

struct comparison_token : comparison_rule {
};

struct identifier_list_token : identifier_list_rule {
};

struct function_call_token : function_call_rule {
};

struct value_list_token : value_list_rule {
};

struct identifier_token : identifier_rule {
};

struct integer_token : pegtl::seq<pegtl::plus<pegtl::digit>, pegtl::not_at<pegtl::identifier_other>> {
};

struct string_token : quoted_string {
};

struct wildcard_token : pegtl::one<'*'> {
};

struct whitespace_token : pegtl::plus<pegtl::space> {
};

struct punctuation_token : pegtl::any {
};

struct token_rule : pegtl::sor<where_token,
                               keyword_token,
                               comparison_token,
                               identifier_list_token,
                               function_call_token,
                               value_list_token,
                               identifier_token,
                               integer_token,
                               string_token,
                               wildcard_token,
                               whitespace_token,
                               punctuation_token> {
};

struct statement_grammar : pegtl::seq<pegtl::star<token_rule>, pegtl::eof> {
};

std::string trim_copy(std::string_view text)
{
    std::size_t begin = 0U;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    auto end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1U]))) {
        --end;
    }
    return std::string{text.substr(begin, end - begin)};
}

std::string normalize_keyword(std::string_view text)
{
    std::string normalized;
    normalized.reserve(text.size());
    bool pending_space = false;
    for (const auto ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            pending_space = true;
            continue;
        }
        if (pending_space && !normalized.empty()) {
            normalized.push_back(' ');
        }
        pending_space = false;
        normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    return normalized;
}

// Commas nested in parentheses or quotes do not separate members.
std::vector<std::string> split_top_level(std::string_view text)
{
    std::vector<std::string> members;
    std::size_t depth = 0U;
    bool quoted = false;
    std::size_t start = 0U;
    for (std::size_t index = 0U; index < text.size(); ++index) {
        const auto ch = text[index];
        if (ch == '\'') {
            quoted = !quoted;
        } else if (!quoted && ch == '(') {
            ++depth;
        } else if (!quoted && ch == ')' && depth > 0U) {
            --depth;
        } else if (!quoted && depth == 0U && ch == ',') {
            members.push_back(trim_copy(text.substr(start, index - start)));
            start = index + 1U;
        }
    }
    members.push_back(trim_copy(text.substr(start)));
    return members;
}

Token make_token(TokenKind kind, std::string text)
{
    Token token{};
    token.kind = kind;
    token.text = std::move(text);
    return token;
}

template <typename Rule>
struct token_action : pegtl::nothing<Rule> {
};

template <>
struct token_action<where_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(make_token(TokenKind::WhereClause, in.string()));
    }
};

template <>
struct token_action<keyword_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        auto token = make_token(TokenKind::Keyword, in.string());
        token.keyword = normalize_keyword(token.text);
        tokens.push_back(std::move(token));
    }
};

template <>
struct token_action<comparison_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        auto token = make_token(TokenKind::Comparison, in.string());
        const std::string_view text = token.text;

        bool quoted = false;
        std::size_t position = 0U;
        for (; position < text.size(); ++position) {
            const auto ch = text[position];
            if (ch == '\'') {
                quoted = !quoted;
            } else if (!quoted && (ch == '=' || ch == '<' || ch == '>' || ch == '!')) {
                break;
            }
        }
        std::size_t length = 1U;
        if (position + 1U < text.size()) {
            const auto second = text[position + 1U];
            if (second == '=' || (text[position] == '<' && second == '>')) {
                length = 2U;
            }
        }
        token.left = trim_copy(text.substr(0U, position));
        token.op = std::string{text.substr(position, length)};
        token.right = trim_copy(text.substr(position + length));
        tokens.push_back(std::move(token));
    }
};

template <>
struct token_action<identifier_list_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        auto token = make_token(TokenKind::IdentifierList, in.string());
        token.members = split_top_level(token.text);
        tokens.push_back(std::move(token));
    }
};

template <>
struct token_action<function_call_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        auto token = make_token(TokenKind::FunctionCall, in.string());
        const auto open = token.text.find('(');
        const auto close = token.text.rfind(')');
        token.function_name = trim_copy(std::string_view{token.text}.substr(0U, open));
        token.arguments = trim_copy(std::string_view{token.text}.substr(open + 1U, close - open - 1U));
        tokens.push_back(std::move(token));
    }
};

template <>
struct token_action<value_list_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(make_token(TokenKind::ValueList, in.string()));
    }
};

template <>
struct token_action<identifier_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(make_token(TokenKind::Identifier, in.string()));
    }
};

template <>
struct token_action<integer_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(make_token(TokenKind::IntegerLiteral, in.string()));
    }
};

template <>
struct token_action<string_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(make_token(TokenKind::StringLiteral, in.string()));
    }
};

template <>
struct token_action<wildcard_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(make_token(TokenKind::Wildcard, in.string()));
    }
};

template <>
struct token_action<whitespace_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(make_token(TokenKind::Whitespace, in.string()));
    }
};

template <>
struct token_action<punctuation_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(make_token(TokenKind::Punctuation, in.string()));
    }
};

CommandKind classify(const std::vector<Token>& tokens) noexcept
{
    for (const auto& token : tokens) {
        if (token.kind == TokenKind::Whitespace) {
            continue;
        }
        if (token.is_keyword("SELECT")) {
            return CommandKind::Select;
        }
        if (token.is_keyword("INSERT")) {
            return CommandKind::Insert;
        }
        if (token.is_keyword("CREATE")) {
            return CommandKind::Create;
        }
        return CommandKind::Unsupported;
    }
    return CommandKind::Unsupported;
}

}  // namespace

TokenStream tokenize(std::string_view statement)
{
    TokenStream stream{};
    pegtl::memory_input in(statement.data(), statement.size(), "statement");
    if (!pegtl::parse<statement_grammar, token_action>(in, stream.tokens)) {
        throw std::logic_error{"tokenizer stopped before the end of the statement"};
    }
    stream.command = classify(stream.tokens);
    return stream;
}

}  // namespace minipg::parser
