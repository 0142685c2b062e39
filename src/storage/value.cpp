#include "minipg/storage/value.hpp"

#include <algorithm>
#include <stdexcept>

namespace minipg::storage {

namespace {

[[nodiscard]] int family_rank(ValueKind kind) noexcept
{
    switch (kind) {
    case ValueKind::Null:
        return 0;
    case ValueKind::Bool:
    case ValueKind::Int:
    case ValueKind::Float:
        return 1;
    case ValueKind::String:
        return 2;
    case ValueKind::List:
    default:
        return 3;
    }
}

[[nodiscard]] int compare_numeric(const Value& lhs, const Value& rhs)
{
    if (lhs.kind() != ValueKind::Float && rhs.kind() != ValueKind::Float) {
        const auto left = lhs.kind() == ValueKind::Bool ? static_cast<std::int64_t>(lhs.as_bool()) : lhs.as_int();
        const auto right = rhs.kind() == ValueKind::Bool ? static_cast<std::int64_t>(rhs.as_bool()) : rhs.as_int();
        return left < right ? -1 : (left > right ? 1 : 0);
    }
    const auto left = lhs.to_double();
    const auto right = rhs.to_double();
    if (left < right) {
        return -1;
    }
    if (left > right) {
        return 1;
    }
    return 0;
}

}  // namespace

Value::Value(std::nullptr_t) noexcept
{
}

Value::Value(bool value) noexcept
    : data_{value}
{
}

Value::Value(int value) noexcept
    : data_{static_cast<std::int64_t>(value)}
{
}

Value::Value(std::int64_t value) noexcept
    : data_{value}
{
}

Value::Value(double value) noexcept
    : data_{value}
{
}

Value::Value(std::string value)
    : data_{std::move(value)}
{
}

Value::Value(const char* value)
    : data_{std::string{value}}
{
}

Value::Value(ValueList value)
    : data_{std::move(value)}
{
}

ValueKind Value::kind() const noexcept
{
    return static_cast<ValueKind>(data_.index());
}

bool Value::is_null() const noexcept
{
    return kind() == ValueKind::Null;
}

bool Value::is_numeric() const noexcept
{
    const auto current = kind();
    return current == ValueKind::Bool || current == ValueKind::Int || current == ValueKind::Float;
}

bool Value::as_bool() const
{
    return std::get<bool>(data_);
}

std::int64_t Value::as_int() const
{
    return std::get<std::int64_t>(data_);
}

double Value::as_float() const
{
    return std::get<double>(data_);
}

const std::string& Value::as_string() const
{
    return std::get<std::string>(data_);
}

const ValueList& Value::as_list() const
{
    return std::get<ValueList>(data_);
}

double Value::to_double() const
{
    switch (kind()) {
    case ValueKind::Bool:
        return as_bool() ? 1.0 : 0.0;
    case ValueKind::Int:
        return static_cast<double>(as_int());
    case ValueKind::Float:
        return as_float();
    default:
        throw std::logic_error{"value is not numeric"};
    }
}

bool operator==(const Value& lhs, const Value& rhs)
{
    if (lhs.is_numeric() && rhs.is_numeric()) {
        return compare_numeric(lhs, rhs) == 0;
    }
    if (lhs.kind() != rhs.kind()) {
        return false;
    }
    return lhs.data_ == rhs.data_;
}

std::string_view value_kind_to_string(ValueKind kind) noexcept
{
    switch (kind) {
    case ValueKind::Null:
        return "null";
    case ValueKind::Bool:
        return "bool";
    case ValueKind::Int:
        return "int";
    case ValueKind::Float:
        return "float";
    case ValueKind::String:
        return "string";
    case ValueKind::List:
    default:
        return "list";
    }
}

int compare_values(const Value& lhs, const Value& rhs)
{
    const auto left_rank = family_rank(lhs.kind());
    const auto right_rank = family_rank(rhs.kind());
    if (left_rank != right_rank) {
        return left_rank < right_rank ? -1 : 1;
    }

    switch (left_rank) {
    case 0:
        return 0;
    case 1:
        return compare_numeric(lhs, rhs);
    case 2: {
        const auto result = lhs.as_string().compare(rhs.as_string());
        return result < 0 ? -1 : (result > 0 ? 1 : 0);
    }
    default: {
        const auto& left = lhs.as_list();
        const auto& right = rhs.as_list();
        const auto common = std::min(left.size(), right.size());
        for (std::size_t index = 0U; index < common; ++index) {
            const auto result = compare_values(left[index], right[index]);
            if (result != 0) {
                return result;
            }
        }
        if (left.size() == right.size()) {
            return 0;
        }
        return left.size() < right.size() ? -1 : 1;
    }
    }
}

std::optional<int> compare_for_predicate(const Value& lhs, const Value& rhs)
{
    if (lhs.is_null() || rhs.is_null()) {
        return std::nullopt;
    }
    if (family_rank(lhs.kind()) != family_rank(rhs.kind())) {
        return std::nullopt;
    }
    return compare_values(lhs, rhs);
}

Row::Row(std::initializer_list<Field> fields)
{
    for (const auto& field : fields) {
        set(field.first, field.second);
    }
}

void Row::set(std::string column, Value value)
{
    for (auto& field : fields_) {
        if (field.first == column) {
            field.second = std::move(value);
            return;
        }
    }
    fields_.emplace_back(std::move(column), std::move(value));
}

const Value* Row::find(std::string_view column) const noexcept
{
    for (const auto& field : fields_) {
        if (field.first == column) {
            return &field.second;
        }
    }
    return nullptr;
}

Value Row::get(std::string_view column) const
{
    const auto* value = find(column);
    if (value == nullptr) {
        return Value{};
    }
    return *value;
}

bool Row::contains(std::string_view column) const noexcept
{
    return find(column) != nullptr;
}

std::size_t Row::size() const noexcept
{
    return fields_.size();
}

bool Row::empty() const noexcept
{
    return fields_.empty();
}

const std::vector<Row::Field>& Row::fields() const noexcept
{
    return fields_;
}

Row::const_iterator Row::begin() const noexcept
{
    return fields_.begin();
}

Row::const_iterator Row::end() const noexcept
{
    return fields_.end();
}

bool operator==(const Row& lhs, const Row& rhs)
{
    return lhs.fields_ == rhs.fields_;
}

}  // namespace minipg::storage
