#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace minipg::storage {

class Value;
using ValueList = std::vector<Value>;

enum class ValueKind : std::uint8_t {
    Null = 0,
    Bool,
    Int,
    Float,
    String,
    List
};

class Value final {
public:
    Value() = default;
    Value(std::nullptr_t) noexcept;
    Value(bool value) noexcept;
    Value(int value) noexcept;
    Value(std::int64_t value) noexcept;
    Value(double value) noexcept;
    Value(std::string value);
    Value(const char* value);
    Value(ValueList value);

    [[nodiscard]] ValueKind kind() const noexcept;
    [[nodiscard]] bool is_null() const noexcept;
    [[nodiscard]] bool is_numeric() const noexcept;

    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] std::int64_t as_int() const;
    [[nodiscard]] double as_float() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const ValueList& as_list() const;

    // Numeric view of Bool/Int/Float values.
    [[nodiscard]] double to_double() const;

    friend bool operator==(const Value& lhs, const Value& rhs);

private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string, ValueList> data_{};
};

[[nodiscard]] std::string_view value_kind_to_string(ValueKind kind) noexcept;

// Total order used by sorting and min/max: Null < numeric < String < List.
[[nodiscard]] int compare_values(const Value& lhs, const Value& rhs);

// Ordering for predicates; empty when either side is Null or the kinds are not comparable.
[[nodiscard]] std::optional<int> compare_for_predicate(const Value& lhs, const Value& rhs);

class Row final {
public:
    using Field = std::pair<std::string, Value>;
    using const_iterator = std::vector<Field>::const_iterator;

    Row() = default;
    Row(std::initializer_list<Field> fields);

    void set(std::string column, Value value);
    [[nodiscard]] const Value* find(std::string_view column) const noexcept;
    [[nodiscard]] Value get(std::string_view column) const;
    [[nodiscard]] bool contains(std::string_view column) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] const std::vector<Field>& fields() const noexcept;
    [[nodiscard]] const_iterator begin() const noexcept;
    [[nodiscard]] const_iterator end() const noexcept;

    friend bool operator==(const Row& lhs, const Row& rhs);

private:
    std::vector<Field> fields_{};
};

}  // namespace minipg::storage
