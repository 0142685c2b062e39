#include "minipg/storage/json_codec.hpp"

#include "minipg/common/errors.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <system_error>

namespace minipg::storage {

Json value_to_json(const Value& value)
{
    switch (value.kind()) {
    case ValueKind::Null:
        return Json(nullptr);
    case ValueKind::Bool:
        return Json(value.as_bool());
    case ValueKind::Int:
        return Json(value.as_int());
    case ValueKind::Float:
        return Json(value.as_float());
    case ValueKind::String:
        return Json(value.as_string());
    case ValueKind::List:
    default: {
        auto array = Json::array();
        for (const auto& element : value.as_list()) {
            array.push_back(value_to_json(element));
        }
        return array;
    }
    }
}

Value value_from_json(const Json& json)
{
    switch (json.type()) {
    case Json::value_t::null:
        return Value{};
    case Json::value_t::boolean:
        return Value{json.get<bool>()};
    case Json::value_t::number_integer:
        return Value{json.get<std::int64_t>()};
    case Json::value_t::number_unsigned: {
        const auto unsigned_value = json.get<std::uint64_t>();
        if (unsigned_value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return Value{static_cast<double>(unsigned_value)};
        }
        return Value{static_cast<std::int64_t>(unsigned_value)};
    }
    case Json::value_t::number_float:
        return Value{json.get<double>()};
    case Json::value_t::string:
        return Value{json.get<std::string>()};
    case Json::value_t::array: {
        ValueList list;
        list.reserve(json.size());
        for (const auto& element : json) {
            list.push_back(value_from_json(element));
        }
        return Value{std::move(list)};
    }
    default:
        // Nested objects travel as their serialized text.
        return Value{json.dump()};
    }
}

Json row_to_json(const Row& row)
{
    auto object = Json::object();
    for (const auto& [column, value] : row) {
        object[column] = value_to_json(value);
    }
    return object;
}

Row row_from_json(const Json& json)
{
    if (!json.is_object()) {
        throw_engine_error(EngineErrc::StorageFailure, "table record is not a JSON object");
    }
    Row row;
    for (const auto& [column, value] : json.items()) {
        row.set(column, value_from_json(value));
    }
    return row;
}

std::string row_to_json_line(const Row& row)
{
    return row_to_json(row).dump();
}

Row row_from_json_line(std::string_view line)
{
    Json json;
    try {
        json = Json::parse(line.begin(), line.end());
    } catch (const Json::parse_error& error) {
        throw_engine_error(EngineErrc::StorageFailure, std::string{"malformed table record: "} + error.what());
    }
    return row_from_json(json);
}

std::string value_to_json_text(const Value& value)
{
    return value_to_json(value).dump();
}

Json read_json_document(const std::filesystem::path& path)
{
    std::ifstream stream{path};
    if (!stream.is_open()) {
        throw std::system_error{make_error_code(EngineErrc::StorageFailure),
                                "failed to open document '" + path.string() + "'"};
    }
    try {
        return Json::parse(stream);
    } catch (const Json::parse_error& error) {
        throw std::system_error{make_error_code(EngineErrc::StorageFailure),
                                "malformed document '" + path.string() + "': " + error.what()};
    }
}

void write_json_document(const std::filesystem::path& path, const Json& document)
{
    std::ofstream stream{path, std::ios::out | std::ios::trunc};
    if (!stream.is_open()) {
        throw std::system_error{make_error_code(EngineErrc::StorageFailure),
                                "failed to write document '" + path.string() + "'"};
    }
    stream << document.dump();
    stream.flush();
    if (!stream) {
        throw std::system_error{make_error_code(EngineErrc::StorageFailure),
                                "failed to flush document '" + path.string() + "'"};
    }
}

}  // namespace minipg::storage
