#include "binjson/utils/json.hpp"

#include "binjson/utils/base64.hpp"

#include "core/log_internal.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace binjson::utils {
namespace {

[[nodiscard]] Json float_to_json_(double v) {
    if (std::isnan(v)) {
        return "NaN";
    }
    if (std::isinf(v)) {
        return v > 0 ? "inf" : "-inf";
    }
    return v;
}

[[nodiscard]] core::Error from_json_(const Json &json, Value &out, std::size_t depth, std::size_t max_depth) {
    if (depth > max_depth) {
        core::detail::logger()->debug("from_json: nesting depth {} exceeds limit {}", depth, max_depth);
        return core::Error::depth_exceeded(max_depth);
    }
    switch (json.type()) {
    case Json::value_t::null:
    case Json::value_t::discarded:
        out = Value::null();
        return {};
    case Json::value_t::boolean:
        out = Value(json.get<bool>());
        return {};
    case Json::value_t::number_integer:
        out = Value(json.get<std::int64_t>());
        return {};
    case Json::value_t::number_unsigned:
        out = Value(static_cast<std::int64_t>(json.get<std::uint64_t>()));
        return {};
    case Json::value_t::number_float:
        out = Value(json.get<double>());
        return {};
    case Json::value_t::string:
        out = Value(json.get<std::string>());
        return {};
    case Json::value_t::binary:
        out = Value::blob(std::vector<byte>(json.get_binary().begin(), json.get_binary().end()));
        return {};
    case Json::value_t::array: {
        Array items;
        items.reserve(json.size());
        for (const auto &item : json) {
            Value child;
            if (auto err = from_json_(item, child, depth + 1, max_depth)) {
                return err;
            }
            items.push_back(std::move(child));
        }
        out = Value(std::move(items));
        return {};
    }
    case Json::value_t::object: {
        Object entries;
        for (auto it = json.begin(); it != json.end(); ++it) {
            Value child;
            if (auto err = from_json_(it.value(), child, depth + 1, max_depth)) {
                return err;
            }
            entries.insert_or_assign(it.key(), std::move(child));
        }
        out = Value(std::move(entries));
        return {};
    }
    }
    out = Value::null();
    return {};
}

} // namespace

Json to_json(const Value &value) {
    switch (value.kind()) {
    case ValueKind::null:
        return nullptr;
    case ValueKind::boolean:
        return *value.as_bool();
    case ValueKind::blob:
        return encode_base64(value.as_blob()->value);
    case ValueKind::array: {
        Json out = Json::array();
        for (const auto &item : *value.as_array()) {
            out.push_back(to_json(item));
        }
        return out;
    }
    case ValueKind::integer:
        return *value.as_integer();
    case ValueKind::floating:
        return float_to_json_(*value.as_float());
    case ValueKind::object: {
        Json out = Json::object();
        for (const auto &[key, item] : *value.as_object()) {
            out[key] = to_json(item);
        }
        return out;
    }
    case ValueKind::string:
        return *value.as_string();
    }
    return nullptr;
}

core::Error from_json(const Json &json, Value &out, std::size_t max_depth) {
    Value tmp;
    if (auto err = from_json_(json, tmp, 0, max_depth)) {
        return err;
    }
    out = std::move(tmp);
    return {};
}

core::Error to_json_text(const Value &value, std::string &out, int indent) {
    try {
        out = to_json(value).dump(indent);
    } catch (const Json::type_error &e) {
        core::detail::logger()->debug("to_json_text failed: {}", e.what());
        return core::Error::custom(e.what());
    }
    return {};
}

core::Error from_json_text(std::string_view text, Value &out, std::size_t max_depth) {
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const Json::parse_error &e) {
        core::detail::logger()->debug("from_json_text failed: {}", e.what());
        return core::Error::custom(e.what());
    }
    return from_json(parsed, out, max_depth);
}

} // namespace binjson::utils
