/**
 * @file types.hpp
 * @brief Status codes, resource structs and policy types of the native
 *        middleware API.
 *
 * The native API is deliberately C‑shaped: every resource is a small
 * struct holding one opaque `impl` pointer, every operation takes raw
 * pointers and reports a `ret_t`.  A resource whose `impl` is null is
 * *zero‑initialized* and must be passed to the matching `*_init` call
 * before anything else.
 */

#pragma once

#include <cstddef>
#include <string>

namespace rclpp::native {

// ==========================================================================
// Return codes
// ==========================================================================

using ret_t = int;

inline constexpr ret_t RET_OK = 0;
inline constexpr ret_t RET_ERROR = 1;
inline constexpr ret_t RET_BAD_ALLOC = 10;
inline constexpr ret_t RET_INVALID_ARGUMENT = 11;
inline constexpr ret_t RET_ALREADY_INIT = 100;
inline constexpr ret_t RET_NOT_INIT = 101;
inline constexpr ret_t RET_TOPIC_NAME_INVALID = 103;
inline constexpr ret_t RET_ALREADY_SHUTDOWN = 106;
inline constexpr ret_t RET_NODE_INVALID = 200;
inline constexpr ret_t RET_NODE_INVALID_NAME = 201;
inline constexpr ret_t RET_NODE_INVALID_NAMESPACE = 202;
inline constexpr ret_t RET_PUBLISHER_INVALID = 300;
inline constexpr ret_t RET_SUBSCRIPTION_INVALID = 400;
inline constexpr ret_t RET_SUBSCRIPTION_TAKE_FAILED = 401;

// ==========================================================================
// Error state – one human readable reason per thread
// ==========================================================================

namespace detail {
inline thread_local std::string error_string;
} // namespace detail

/// Record the reason for the `ret_t` about to be returned.
inline void set_error(const std::string& message) {
    detail::error_string = message;
}

/// @return Reason recorded by the last failing call on this thread.
inline const std::string& get_error_string() { return detail::error_string; }

inline void reset_error() { detail::error_string.clear(); }

inline ret_t fail(ret_t ret, const std::string& message) {
    set_error(message);
    return ret;
}

// ==========================================================================
// QoS
// ==========================================================================

enum history_policy_t {
    HISTORY_SYSTEM_DEFAULT = 0,
    HISTORY_KEEP_LAST = 1,
    HISTORY_KEEP_ALL = 2,
};

enum reliability_policy_t {
    RELIABILITY_SYSTEM_DEFAULT = 0,
    RELIABILITY_RELIABLE = 1,
    RELIABILITY_BEST_EFFORT = 2,
};

enum durability_policy_t {
    DURABILITY_SYSTEM_DEFAULT = 0,
    DURABILITY_TRANSIENT_LOCAL = 1,
    DURABILITY_VOLATILE = 2,
};

struct qos_profile_t {
    history_policy_t history;
    size_t depth;
    reliability_policy_t reliability;
    durability_policy_t durability;
    bool avoid_ros_namespace_conventions;
};

/// Depth used when a keep‑last profile asks for the system default (0).
inline constexpr size_t DEFAULT_HISTORY_DEPTH = 10;

inline qos_profile_t qos_profile_default() {
    return {HISTORY_KEEP_LAST, DEFAULT_HISTORY_DEPTH, RELIABILITY_RELIABLE,
            DURABILITY_VOLATILE, false};
}

// ==========================================================================
// Type support
// ==========================================================================

/**
 * @brief Describes the in‑memory layout of one native message type.
 *
 * `init` must leave the buffer in a default valued state that `fini` and
 * `copy` accept; `copy` assigns into an already initialized destination.
 */
struct message_type_support_t {
    const char* type_name;
    size_t size;
    void (*init)(void* message);
    void (*fini)(void* message);
    bool (*copy)(const void* source, void* destination);
};

// ==========================================================================
// Resources
// ==========================================================================

struct context_impl_t;
struct node_impl_t;
struct publisher_impl_t;
struct subscription_impl_t;

struct context_t {
    context_impl_t* impl;
};

struct node_t {
    node_impl_t* impl;
};

struct node_options_t {
    /// Apply `__node`, `__ns` and topic remaps from the context arguments.
    bool use_global_arguments;
};

struct publisher_t {
    publisher_impl_t* impl;
};

struct publisher_options_t {
    qos_profile_t qos;
};

struct subscription_t {
    subscription_impl_t* impl;
};

struct subscription_options_t {
    qos_profile_t qos;
};

inline context_t get_zero_initialized_context() { return {nullptr}; }
inline node_t get_zero_initialized_node() { return {nullptr}; }
inline publisher_t get_zero_initialized_publisher() { return {nullptr}; }
inline subscription_t get_zero_initialized_subscription() { return {nullptr}; }

inline node_options_t node_get_default_options() { return {true}; }

inline publisher_options_t publisher_get_default_options() {
    return {qos_profile_default()};
}

inline subscription_options_t subscription_get_default_options() {
    return {qos_profile_default()};
}

} // namespace rclpp::native
