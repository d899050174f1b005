#pragma once

#include <string>
#include <string_view>
#include <cctype>
#include <algorithm>
#include <boost/json.hpp>

namespace tether {

// Structural checks applied to everything arriving from the network.
class InputValidator {
public:
    // Validates that a string is a correctly formatted hexadecimal sequence.
    static bool is_valid_hex(std::string_view str, size_t expected_length = 0) {
        if (str.empty()) return false;
        if (expected_length > 0 && str.length() != expected_length) return false;

        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c));
        });
    }

    // Canonical 8-4-4-4-12 UUID text (any version).
    static bool is_valid_uuid(std::string_view str) {
        if (str.size() != 36) return false;
        for (size_t i = 0; i < str.size(); ++i) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (str[i] != '-') return false;
            } else if (!std::isxdigit(static_cast<unsigned char>(str[i]))) {
                return false;
            }
        }
        return true;
    }

    // Identifiers for devices/users: UUIDs or short safe tokens.
    static bool is_valid_id(std::string_view str, size_t max_length = 128) {
        if (str.empty() || str.size() > max_length) return false;
        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
        });
    }

    // Standard base64 with padding.
    static bool is_valid_base64(std::string_view str) {
        if (str.empty() || str.size() % 4 != 0) return false;
        size_t pad = 0;
        for (size_t i = 0; i < str.size(); ++i) {
            char c = str[i];
            if (c == '=') {
                ++pad;
                if (pad > 2) return false;
                continue;
            }
            if (pad > 0) return false;
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/')) return false;
        }
        return true;
    }

    static bool is_within_size_limit(size_t size, size_t max_size) {
        return size <= max_size;
    }

    // Filters and limits string input to alphanumeric/underscores to prevent injection.
    static std::string sanitize_field(std::string_view input, size_t max_length = 256) {
        std::string result;
        result.reserve(std::min(input.size(), max_length));

        for (size_t i = 0; i < input.size() && result.size() < max_length; ++i) {
            char c = input[i];
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == ' ') {
                result += c;
            } else {
                result += ' ';
            }
        }
        return result;
    }

    /**
     * JSON parsing with a recursion depth limit to prevent stack exhaustion.
     * Throws boost::system::system_error on malformed input.
     */
    static boost::json::value safe_parse_json(std::string_view input, size_t max_depth = 16) {
        boost::json::parse_options opt;
        opt.max_depth = max_depth;
        return boost::json::parse(boost::json::string_view(input.data(), input.size()), {}, opt);
    }

    // Returns the string member or an empty view when missing or of another type.
    static std::string_view string_field(const boost::json::object& obj, const char* key) {
        auto it = obj.find(key);
        if (it == obj.end() || !it->value().is_string()) return {};
        const auto& s = it->value().get_string();
        return std::string_view(s.data(), s.size());
    }
};

}
