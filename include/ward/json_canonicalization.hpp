#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ward::json
{

    /**
     * RFC 8785 JSON Canonicalization Scheme (JCS), restricted to the value
     * space ward signs: objects, arrays, strings, booleans, null and integers.
     *
     * - Lexicographic key sorting (UTF-8 byte order)
     * - No insignificant whitespace
     * - Minimal escaping; control characters as \u00XX
     *
     * Floating point values are rejected rather than serialized, so issuer
     * and verifier cannot disagree on number formatting.
     */
    class RFC8785Canonicalizer
    {
    public:
        /**
         * Canonicalize a JSON value
         * @return Canonical JSON string, or InvalidInput for floats
         */
        static Result<std::string> canonicalize(const nlohmann::json &value);

        /**
         * Parse JSON string and canonicalize
         */
        static Result<std::string> canonicalize_string(const std::string &json_str);

    private:
        static Result<void> serialize_value(const nlohmann::json &value, std::string &output);

        static void serialize_string(const std::string &str, std::string &output);

        static Result<void> serialize_object(const nlohmann::json &obj, std::string &output);

        static Result<void> serialize_array(const nlohmann::json &arr, std::string &output);

        static std::string escape_string(const std::string &str);
    };

} // namespace ward::json
