#pragma once

#include "minipg/storage/value.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace minipg::storage {

using Json = nlohmann::ordered_json;

[[nodiscard]] Json value_to_json(const Value& value);
// Unsigned integers beyond the int64 range read as Float.
[[nodiscard]] Value value_from_json(const Json& json);

[[nodiscard]] Json row_to_json(const Row& row);
[[nodiscard]] Row row_from_json(const Json& json);

// One record per line, compact, keys in row order.
[[nodiscard]] std::string row_to_json_line(const Row& row);
[[nodiscard]] Row row_from_json_line(std::string_view line);

// Compact JSON text of a value; used for group keys and histogram keys.
[[nodiscard]] std::string value_to_json_text(const Value& value);

// Whole-document helpers for the catalog, sequence and statistics files.
[[nodiscard]] Json read_json_document(const std::filesystem::path& path);
void write_json_document(const std::filesystem::path& path, const Json& document);

}  // namespace minipg::storage
