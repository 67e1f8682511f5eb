#include "common/JsonUtils.hpp"

#include <array>
#include <cmath>
#include <stdexcept>

#include <boost/json/serializer.hpp>

#include "core/TimeUtils.h"

namespace ldg::common::json {

std::int64_t json_to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse integer value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for integer conversion");
}

const boost::json::value* find(const boost::json::object& object, std::string_view key) {
    const auto it = object.find(boost::json::string_view{key.data(), key.size()});
    if (it == object.end() || it->value().is_null()) {
        return nullptr;
    }
    return &it->value();
}

const boost::json::object* find_object(const boost::json::object& object, std::string_view key) {
    const auto* value = find(object, key);
    return value != nullptr ? value->if_object() : nullptr;
}

std::optional<std::string> get_string(const boost::json::object& object, std::string_view key) {
    const auto* value = find(object, key);
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    return std::string{value->as_string().c_str()};
}

std::optional<std::int64_t> get_int64(const boost::json::object& object, std::string_view key) {
    const auto* value = find(object, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    return json_to_int64(*value);
}

std::optional<bool> get_bool(const boost::json::object& object, std::string_view key) {
    const auto* value = find(object, key);
    if (value == nullptr || !value->is_bool()) {
        return std::nullopt;
    }
    return value->as_bool();
}

std::optional<std::int64_t> get_time_ms(const boost::json::object& object, std::string_view key) {
    const auto* value = find(object, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_string()) {
        const auto& text = value->as_string();
        return core::time::parseIso8601Ms(std::string_view{text.data(), text.size()});
    }
    if (value->is_number()) {
        return json_to_int64(*value);
    }
    return std::nullopt;
}

std::string serialize_json(const boost::json::value& value) {
    boost::json::serializer sr;
    sr.reset(&value);

    std::string result;
    std::array<char, 4096> buffer{};

    while (!sr.done()) {
        boost::json::string_view chunk = sr.read(buffer.data(), buffer.size());
        result.append(chunk.data(), chunk.size());
    }

    return result;
}

}  // namespace ldg::common::json
