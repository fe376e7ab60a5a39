#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace TEB {

using json = nlohmann::json;

/**
 * @brief Centralized JSON processing utilities using nlohmann/json
 *
 * Shared by the transports (frame decoding), the reporter protocol (parameter
 * extraction) and the process bridge (stdout reports).
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON string into json object with error handling
     * @param jsonString Input JSON string
     * @param errorOut Optional error message output
     * @return Parsed json object or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    static std::string toCompactString(const json &value);

    /**
     * @brief Safely get string value from JSON object
     * @return String value or default when the key is missing or not a string
     */
    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");

    /**
     * @brief Safely get integer value from JSON object
     * @return Integer value or default when the key is missing or not an integer
     */
    static int getInt(const json &object, const std::string &key, int defaultValue = 0);

    static double getNumber(const json &object, const std::string &key, double defaultValue = 0.0);

    /**
     * @brief Collect the string elements of an array member, skipping non-strings
     */
    static std::vector<std::string> getStringArray(const json &object, const std::string &key);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const json &object, const std::string &key);

private:
    // Member @p key of @p object, or nullptr when absent (or @p object is not an object)
    static const json *member(const json &object, const std::string &key);
};

}  // namespace TEB
