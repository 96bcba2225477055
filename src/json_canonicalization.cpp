#include "ward/json_canonicalization.hpp"
#include <format>
#include <map>

namespace ward::json
{

    Result<std::string> RFC8785Canonicalizer::canonicalize(const nlohmann::json &value)
    {
        std::string output;
        if (auto ok = serialize_value(value, output); !ok)
            return std::unexpected(ok.error());
        return output;
    }

    Result<std::string> RFC8785Canonicalizer::canonicalize_string(const std::string &json_str)
    {
        try
        {
            auto parsed = nlohmann::json::parse(json_str);
            return canonicalize(parsed);
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(WardError::invalid_input(
                std::format("JSON parse error: {}", e.what())));
        }
    }

    Result<void> RFC8785Canonicalizer::serialize_value(const nlohmann::json &value, std::string &output)
    {
        switch (value.type())
        {
        case nlohmann::json::value_t::null:
            output += "null";
            return {};

        case nlohmann::json::value_t::boolean:
            output += value.get<bool>() ? "true" : "false";
            return {};

        case nlohmann::json::value_t::number_integer:
            output += std::to_string(value.get<int64_t>());
            return {};

        case nlohmann::json::value_t::number_unsigned:
            output += std::to_string(value.get<uint64_t>());
            return {};

        case nlohmann::json::value_t::number_float:
            return std::unexpected(WardError::invalid_input(
                "Floating point values are not allowed in canonical payloads"));

        case nlohmann::json::value_t::string:
            serialize_string(value.get<std::string>(), output);
            return {};

        case nlohmann::json::value_t::array:
            return serialize_array(value, output);

        case nlohmann::json::value_t::object:
            return serialize_object(value, output);

        default:
            return std::unexpected(WardError::invalid_input("Unsupported JSON value type"));
        }
    }

    void RFC8785Canonicalizer::serialize_string(const std::string &str, std::string &output)
    {
        output += '"';
        output += escape_string(str);
        output += '"';
    }

    Result<void> RFC8785Canonicalizer::serialize_object(const nlohmann::json &obj, std::string &output)
    {
        output += '{';

        // Sort keys lexicographically (UTF-8 byte order)
        std::map<std::string, const nlohmann::json *> sorted_items;
        for (auto it = obj.begin(); it != obj.end(); ++it)
        {
            sorted_items[it.key()] = &it.value();
        }

        bool first = true;
        for (const auto &[key, value] : sorted_items)
        {
            if (!first)
            {
                output += ',';
            }
            first = false;

            serialize_string(key, output);
            output += ':';
            if (auto ok = serialize_value(*value, output); !ok)
                return ok;
        }

        output += '}';
        return {};
    }

    Result<void> RFC8785Canonicalizer::serialize_array(const nlohmann::json &arr, std::string &output)
    {
        output += '[';

        bool first = true;
        for (const auto &item : arr)
        {
            if (!first)
            {
                output += ',';
            }
            first = false;
            if (auto ok = serialize_value(item, output); !ok)
                return ok;
        }

        output += ']';
        return {};
    }

    std::string RFC8785Canonicalizer::escape_string(const std::string &str)
    {
        std::string escaped;
        escaped.reserve(str.size());

        for (unsigned char ch : str)
        {
            // Must escape: " (0x22), \ (0x5C), and control characters (0x00-0x1F)
            switch (ch)
            {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\b':
                escaped += "\\b";
                break;
            case '\f':
                escaped += "\\f";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (ch < 0x20)
                {
                    escaped += std::format("\\u{:04x}", static_cast<int>(ch));
                }
                else
                {
                    escaped += static_cast<char>(ch);
                }
                break;
            }
        }

        return escaped;
    }

} // namespace ward::json
