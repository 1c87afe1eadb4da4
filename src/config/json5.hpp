#ifndef TESSERA_CONFIG_JSON5_HPP
#define TESSERA_CONFIG_JSON5_HPP

#include <cctype>
#include <string>

#include "exception/exception.hpp"

namespace tessera::config {
namespace internal {

/**
 * @brief Strip // and block comments outside of string literals.
 * @throws InvalidConfiguration on an unterminated string or comment
 */
inline auto removeComments(const std::string &json5) -> std::string {
    std::string result;
    result.reserve(json5.size());
    bool inSingleLineComment = false;
    bool inMultiLineComment = false;
    bool inString = false;

    for (size_t i = 0; i < json5.size(); ++i) {
        if (inString) {
            result += json5[i];
            if (json5[i] == '\\' && i + 1 < json5.size()) {
                result += json5[++i];
            } else if (json5[i] == '"') {
                inString = false;
            }
            continue;
        }

        if (inSingleLineComment) {
            if (json5[i] == '\n') {
                inSingleLineComment = false;
                result += '\n';
            }
            continue;
        }

        if (inMultiLineComment) {
            if (i + 1 < json5.size() && json5[i] == '*' && json5[i + 1] == '/') {
                inMultiLineComment = false;
                ++i;
            }
            continue;
        }

        if (json5[i] == '"') {
            inString = true;
            result += json5[i];
            continue;
        }

        if (i + 1 < json5.size() && json5[i] == '/') {
            if (json5[i + 1] == '/') {
                inSingleLineComment = true;
                ++i;
                continue;
            }
            if (json5[i + 1] == '*') {
                inMultiLineComment = true;
                ++i;
                continue;
            }
        }

        result += json5[i];
    }

    if (inString) {
        THROW_INVALID_CONFIGURATION("Unterminated string");
    }
    if (inMultiLineComment) {
        THROW_INVALID_CONFIGURATION("Unterminated multi-line comment");
    }
    return result;
}

/**
 * @brief Drop commas directly followed by a closing bracket or brace.
 */
inline auto removeTrailingCommas(const std::string &json) -> std::string {
    std::string result;
    result.reserve(json.size());
    bool inString = false;

    for (size_t i = 0; i < json.size(); ++i) {
        const char c = json[i];
        if (inString) {
            result += c;
            if (c == '\\' && i + 1 < json.size()) {
                result += json[++i];
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }
        if (c == '"') {
            inString = true;
        } else if (c == ',') {
            size_t next = i + 1;
            while (next < json.size() &&
                   (json[next] == ' ' || json[next] == '\t' ||
                    json[next] == '\r' || json[next] == '\n')) {
                ++next;
            }
            if (next < json.size() && (json[next] == '}' || json[next] == ']')) {
                continue;
            }
        }
        result += c;
    }
    return result;
}

/**
 * @brief Quote bare identifiers used as object keys.
 *
 * Only identifiers directly followed by a colon are quoted, so literals
 * such as true and null are left alone.
 */
inline auto quoteUnquotedKeys(const std::string &json) -> std::string {
    std::string result;
    result.reserve(json.size() + json.size() / 8);
    bool inString = false;

    for (size_t i = 0; i < json.size(); ++i) {
        const char c = json[i];
        if (inString) {
            result += c;
            if (c == '\\' && i + 1 < json.size()) {
                result += json[++i];
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }
        if (c == '"') {
            inString = true;
            result += c;
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$') {
            size_t end = i;
            while (end < json.size() &&
                   (std::isalnum(static_cast<unsigned char>(json[end])) ||
                    json[end] == '_' || json[end] == '$')) {
                ++end;
            }
            size_t next = end;
            while (next < json.size() &&
                   std::isspace(static_cast<unsigned char>(json[next]))) {
                ++next;
            }
            const auto word = json.substr(i, end - i);
            if (next < json.size() && json[next] == ':') {
                result += '"' + word + '"';
            } else {
                result += word;
            }
            i = end - 1;
            continue;
        }
        result += c;
    }
    return result;
}

/**
 * @brief Reduce the JSON5 subset used by plan files to strict JSON.
 */
inline auto convertJSON5toJSON(const std::string &json5) -> std::string {
    return quoteUnquotedKeys(removeTrailingCommas(removeComments(json5)));
}

}  // namespace internal
}  // namespace tessera::config

#endif  // TESSERA_CONFIG_JSON5_HPP
