#include "common/JsonUtils.h"
#include "common/Logger.h"

namespace TEB {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    // Whitespace-only output counts as empty
    if (jsonString.find_first_not_of(" \t\r\n") == std::string::npos) {
        if (errorOut) {
            *errorOut = "Empty JSON string";
        }
        return std::nullopt;
    }

    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        if (errorOut) {
            *errorOut = e.what();
        }
        LOG_DEBUG("JsonUtils: Failed to parse JSON ({} bytes): {}", jsonString.size(), e.what());
        return std::nullopt;
    }
}

std::string JsonUtils::toCompactString(const json &value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

const json *JsonUtils::member(const json &object, const std::string &key) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(key);
    return it == object.end() ? nullptr : &*it;
}

std::string JsonUtils::getString(const json &object, const std::string &key, const std::string &defaultValue) {
    const json *value = member(object, key);
    return value && value->is_string() ? value->get<std::string>() : defaultValue;
}

int JsonUtils::getInt(const json &object, const std::string &key, int defaultValue) {
    const json *value = member(object, key);
    return value && value->is_number_integer() ? value->get<int>() : defaultValue;
}

double JsonUtils::getNumber(const json &object, const std::string &key, double defaultValue) {
    const json *value = member(object, key);
    return value && value->is_number() ? value->get<double>() : defaultValue;
}

std::vector<std::string> JsonUtils::getStringArray(const json &object, const std::string &key) {
    std::vector<std::string> result;
    const json *value = member(object, key);
    if (!value || !value->is_array()) {
        return result;
    }
    for (const auto &item : *value) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        }
    }
    return result;
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    const json *value = member(object, key);
    return value && !value->is_null();
}

}  // namespace TEB
