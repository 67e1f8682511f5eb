#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

namespace ldg::common::json {

// Accepts int64, uint64, double and numeric strings. Throws std::runtime_error otherwise.
std::int64_t json_to_int64(const boost::json::value& value);

const boost::json::value* find(const boost::json::object& object, std::string_view key);
const boost::json::object* find_object(const boost::json::object& object, std::string_view key);

// std::nullopt when the key is missing, null, or not a string.
std::optional<std::string> get_string(const boost::json::object& object, std::string_view key);
std::optional<std::int64_t> get_int64(const boost::json::object& object, std::string_view key);
std::optional<bool> get_bool(const boost::json::object& object, std::string_view key);

// Accepts either an epoch-ms number or an ISO-8601 string.
std::optional<std::int64_t> get_time_ms(const boost::json::object& object, std::string_view key);

std::string serialize_json(const boost::json::value& value);

}  // namespace ldg::common::json
