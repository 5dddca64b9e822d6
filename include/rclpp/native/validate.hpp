/**
 * @file validate.hpp
 * @brief Validation of node names, namespaces and topic names, and
 *        expansion of relative topic names.
 *
 * The validators never fail because of the *content* of the name: they
 * return `RET_OK` and report the verdict through @p result together with
 * the index of the first offending character.  A non‑OK return only
 * means an argument was null.
 */

#pragma once

#include <rclpp/native/types.hpp>

#include <cctype>
#include <cstring>
#include <string>

namespace rclpp::native {

enum validation_result_t {
    NAME_VALID = 0,
    NAME_INVALID_IS_EMPTY_STRING,
    NAME_INVALID_NOT_ABSOLUTE,
    NAME_INVALID_ENDS_WITH_FORWARD_SLASH,
    NAME_INVALID_CONTAINS_UNALLOWED_CHARACTERS,
    NAME_INVALID_CONTAINS_REPEATED_FORWARD_SLASH,
    NAME_INVALID_TOKEN_STARTS_WITH_NUMBER,
    NAME_INVALID_MISPLACED_TILDE,
    NAME_INVALID_UNMATCHED_CURLY_BRACE,
    NAME_INVALID_TOO_LONG,
};

inline constexpr size_t NODE_NAME_MAX_LENGTH = 255;
inline constexpr size_t NAMESPACE_MAX_LENGTH = 245;
inline constexpr size_t TOPIC_NAME_MAX_LENGTH = 255;

inline const char* validation_result_string(int result) {
    switch (result) {
    case NAME_VALID:
        return "name is valid";
    case NAME_INVALID_IS_EMPTY_STRING:
        return "name must not be empty";
    case NAME_INVALID_NOT_ABSOLUTE:
        return "name must be absolute, it must lead with a '/'";
    case NAME_INVALID_ENDS_WITH_FORWARD_SLASH:
        return "name must not end with a '/'";
    case NAME_INVALID_CONTAINS_UNALLOWED_CHARACTERS:
        return "name contains characters outside of alphanumerics, '_', '/', "
               "'~', '{' and '}'";
    case NAME_INVALID_CONTAINS_REPEATED_FORWARD_SLASH:
        return "name must not contain repeated '/'";
    case NAME_INVALID_TOKEN_STARTS_WITH_NUMBER:
        return "name tokens must not start with a number";
    case NAME_INVALID_MISPLACED_TILDE:
        return "'~' must be the first character and be followed by a '/'";
    case NAME_INVALID_UNMATCHED_CURLY_BRACE:
        return "substitution braces must be balanced";
    case NAME_INVALID_TOO_LONG:
        return "name is too long";
    default:
        return "unknown validation result";
    }
}

namespace detail {

inline bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

inline bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

inline ret_t set_verdict(int* result, size_t* invalid_index, int verdict,
                         size_t index) {
    *result = verdict;
    if (invalid_index) {
        *invalid_index = index;
    }
    return RET_OK;
}

} // namespace detail

/// `[A-Za-z0-9_]+`, not starting with a digit.
inline ret_t validate_node_name(const char* name, int* result,
                                size_t* invalid_index) {
    if (!name || !result) {
        return fail(RET_INVALID_ARGUMENT, "name and result must not be null");
    }
    const size_t length = std::strlen(name);
    if (length == 0) {
        return detail::set_verdict(result, invalid_index,
                                   NAME_INVALID_IS_EMPTY_STRING, 0);
    }
    for (size_t i = 0; i < length; ++i) {
        if (!detail::is_alnum(name[i]) && name[i] != '_') {
            return detail::set_verdict(
                result, invalid_index,
                NAME_INVALID_CONTAINS_UNALLOWED_CHARACTERS, i);
        }
    }
    if (detail::is_digit(name[0])) {
        return detail::set_verdict(result, invalid_index,
                                   NAME_INVALID_TOKEN_STARTS_WITH_NUMBER, 0);
    }
    if (length > NODE_NAME_MAX_LENGTH) {
        return detail::set_verdict(result, invalid_index, NAME_INVALID_TOO_LONG,
                                   NODE_NAME_MAX_LENGTH);
    }
    return detail::set_verdict(result, invalid_index, NAME_VALID, 0);
}

/**
 * @brief Validate an absolute, already expanded topic name such as
 *        "/foo/bar".  The root "/" alone is rejected.
 */
inline ret_t validate_full_topic_name(const char* topic, int* result,
                                      size_t* invalid_index) {
    if (!topic || !result) {
        return fail(RET_INVALID_ARGUMENT, "topic and result must not be null");
    }
    const size_t length = std::strlen(topic);
    if (length == 0) {
        return detail::set_verdict(result, invalid_index,
                                   NAME_INVALID_IS_EMPTY_STRING, 0);
    }
    if (topic[0] != '/') {
        return detail::set_verdict(result, invalid_index,
                                   NAME_INVALID_NOT_ABSOLUTE, 0);
    }
    if (topic[length - 1] == '/') {
        return detail::set_verdict(result, invalid_index,
                                   NAME_INVALID_ENDS_WITH_FORWARD_SLASH,
                                   length - 1);
    }
    for (size_t i = 0; i < length; ++i) {
        const char c = topic[i];
        if (!detail::is_alnum(c) && c != '_' && c != '/') {
            return detail::set_verdict(
                result, invalid_index,
                NAME_INVALID_CONTAINS_UNALLOWED_CHARACTERS, i);
        }
        if (c == '/' && i + 1 < length) {
            if (topic[i + 1] == '/') {
                return detail::set_verdict(
                    result, invalid_index,
                    NAME_INVALID_CONTAINS_REPEATED_FORWARD_SLASH, i + 1);
            }
            if (detail::is_digit(topic[i + 1])) {
                return detail::set_verdict(
                    result, invalid_index,
                    NAME_INVALID_TOKEN_STARTS_WITH_NUMBER, i + 1);
            }
        }
    }
    if (length > TOPIC_NAME_MAX_LENGTH) {
        return detail::set_verdict(result, invalid_index, NAME_INVALID_TOO_LONG,
                                   TOPIC_NAME_MAX_LENGTH);
    }
    return detail::set_verdict(result, invalid_index, NAME_VALID, 0);
}

/// Same rules as a full topic name, except that the root "/" is valid.
inline ret_t validate_namespace(const char* ns, int* result,
                                size_t* invalid_index) {
    if (!ns || !result) {
        return fail(RET_INVALID_ARGUMENT,
                    "namespace and result must not be null");
    }
    if (std::strcmp(ns, "/") == 0) {
        return detail::set_verdict(result, invalid_index, NAME_VALID, 0);
    }
    ret_t ret = validate_full_topic_name(ns, result, invalid_index);
    if (ret != RET_OK || *result != NAME_VALID) {
        return ret;
    }
    if (std::strlen(ns) > NAMESPACE_MAX_LENGTH) {
        return detail::set_verdict(result, invalid_index, NAME_INVALID_TOO_LONG,
                                   NAMESPACE_MAX_LENGTH);
    }
    return RET_OK;
}

/**
 * @brief Validate a topic name as written by the user, before expansion.
 *
 * Relative names, a leading '~' and `{substitution}` tokens are allowed.
 */
inline ret_t validate_topic_name(const char* topic, int* result,
                                 size_t* invalid_index) {
    if (!topic || !result) {
        return fail(RET_INVALID_ARGUMENT, "topic and result must not be null");
    }
    const size_t length = std::strlen(topic);
    if (length == 0) {
        return detail::set_verdict(result, invalid_index,
                                   NAME_INVALID_IS_EMPTY_STRING, 0);
    }
    if (topic[length - 1] == '/') {
        return detail::set_verdict(result, invalid_index,
                                   NAME_INVALID_ENDS_WITH_FORWARD_SLASH,
                                   length - 1);
    }
    bool in_substitution = false;
    for (size_t i = 0; i < length; ++i) {
        const char c = topic[i];
        if (in_substitution) {
            if (c == '}') {
                in_substitution = false;
            } else if (!detail::is_alnum(c) && c != '_') {
                return detail::set_verdict(
                    result, invalid_index,
                    NAME_INVALID_CONTAINS_UNALLOWED_CHARACTERS, i);
            }
            continue;
        }
        switch (c) {
        case '{':
            in_substitution = true;
            break;
        case '}':
            return detail::set_verdict(result, invalid_index,
                                       NAME_INVALID_UNMATCHED_CURLY_BRACE, i);
        case '~':
            if (i != 0 || (length > 1 && topic[1] != '/')) {
                return detail::set_verdict(result, invalid_index,
                                           NAME_INVALID_MISPLACED_TILDE, i);
            }
            break;
        case '/':
            if (i + 1 < length && topic[i + 1] == '/') {
                return detail::set_verdict(
                    result, invalid_index,
                    NAME_INVALID_CONTAINS_REPEATED_FORWARD_SLASH, i + 1);
            }
            if (i + 1 < length && detail::is_digit(topic[i + 1])) {
                return detail::set_verdict(
                    result, invalid_index,
                    NAME_INVALID_TOKEN_STARTS_WITH_NUMBER, i + 1);
            }
            break;
        default:
            if (!detail::is_alnum(c) && c != '_') {
                return detail::set_verdict(
                    result, invalid_index,
                    NAME_INVALID_CONTAINS_UNALLOWED_CHARACTERS, i);
            }
        }
    }
    if (in_substitution) {
        return detail::set_verdict(result, invalid_index,
                                   NAME_INVALID_UNMATCHED_CURLY_BRACE, length);
    }
    if (detail::is_digit(topic[0])) {
        return detail::set_verdict(result, invalid_index,
                                   NAME_INVALID_TOKEN_STARTS_WITH_NUMBER, 0);
    }
    if (length > TOPIC_NAME_MAX_LENGTH) {
        return detail::set_verdict(result, invalid_index, NAME_INVALID_TOO_LONG,
                                   TOPIC_NAME_MAX_LENGTH);
    }
    return detail::set_verdict(result, invalid_index, NAME_VALID, 0);
}

/**
 * @brief Expand @p topic against a node into a fully qualified name.
 *
 *   * "~" and "~/x" resolve to the node's fully qualified name (+ "/x").
 *   * `{node}`, `{ns}` and `{namespace}` are substituted.
 *   * Whatever is still relative is prefixed with @p node_ns.
 *
 * The result is validated; `RET_TOPIC_NAME_INVALID` is returned for a
 * name that fails validation before or after expansion, and for an
 * unknown substitution.
 */
inline ret_t expand_topic_name(const char* topic, const char* node_name,
                               const char* node_ns, std::string* expanded) {
    if (!topic || !node_name || !node_ns || !expanded) {
        return fail(RET_INVALID_ARGUMENT,
                    "topic, node name, namespace and output must not be null");
    }
    int result = NAME_VALID;
    size_t index = 0;
    validate_topic_name(topic, &result, &index);
    if (result != NAME_VALID) {
        return fail(RET_TOPIC_NAME_INVALID,
                    std::string("topic name '") + topic +
                        "' is invalid: " + validation_result_string(result) +
                        " (index " + std::to_string(index) + ")");
    }

    const std::string ns(node_ns);
    const std::string name(node_name);
    const std::string fully_qualified =
        (ns == "/" ? "" : ns) + "/" + name;

    std::string input(topic);
    if (input[0] == '~') {
        input = fully_qualified + input.substr(1);
    }

    std::string output;
    output.reserve(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '{') {
            output.push_back(input[i]);
            continue;
        }
        const size_t close = input.find('}', i);
        const std::string key = input.substr(i + 1, close - i - 1);
        if (key == "node") {
            output += name;
        } else if (key == "ns" || key == "namespace") {
            // The root namespace must not double the following '/'.
            const bool slash_follows =
                close + 1 < input.size() && input[close + 1] == '/';
            if (ns != "/" || !slash_follows) {
                output += ns;
            }
        } else {
            return fail(RET_TOPIC_NAME_INVALID,
                        "unknown substitution '{" + key + "}' in topic '" +
                            topic + "'");
        }
        i = close;
    }

    if (output.empty() || output[0] != '/') {
        output = (ns == "/" ? std::string("/") : ns + "/") + output;
    }

    validate_full_topic_name(output.c_str(), &result, &index);
    if (result != NAME_VALID) {
        return fail(RET_TOPIC_NAME_INVALID,
                    "expanded topic name '" + output + "' is invalid: " +
                        validation_result_string(result));
    }
    *expanded = std::move(output);
    return RET_OK;
}

} // namespace rclpp::native
