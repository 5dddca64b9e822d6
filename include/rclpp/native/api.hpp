/**
 * @file api.hpp
 * @brief The native middleware API: init / fini / publish / take on
 *        opaque resources, every call reporting a `ret_t`.
 *
 * None of these functions are safe to call concurrently on the *same*
 * resource; callers serialize access per resource.  Calls on different
 * resources may run concurrently.
 */

#pragma once

#include <rclpp/native/arguments.hpp>
#include <rclpp/native/loopback.hpp>
#include <rclpp/native/types.hpp>
#include <rclpp/native/validate.hpp>

#include <memory>
#include <new>
#include <string>

namespace rclpp::native {

struct context_impl_t {
    std::shared_ptr<detail::ContextState> state;
};

struct node_impl_t {
    std::string name;
    std::string ns;
    std::string fully_qualified_name;
    bool use_global_arguments;
    std::shared_ptr<detail::ContextState> context;
};

struct publisher_impl_t {
    std::string topic_name;
    const message_type_support_t* type_support;
    std::shared_ptr<detail::TopicEntry> topic;
    std::shared_ptr<detail::PublisherEndpoint> endpoint;
};

struct subscription_impl_t {
    std::string topic_name;
    const message_type_support_t* type_support;
    std::shared_ptr<detail::TopicEntry> topic;
    std::shared_ptr<detail::SubscriberEndpoint> endpoint;
};

// ==========================================================================
// Context
// ==========================================================================

/**
 * @brief Initialize @p context from the process arguments.
 *
 * @return `RET_INVALID_ARGUMENT` for null pointers or malformed runtime
 *         arguments, `RET_ALREADY_INIT` if @p context is not
 *         zero‑initialized, `RET_BAD_ALLOC` on allocation failure.
 */
inline ret_t init(int argc, const char* const* argv, context_t* context) {
    if (!context) {
        return fail(RET_INVALID_ARGUMENT, "context must not be null");
    }
    if (context->impl) {
        return fail(RET_ALREADY_INIT, "context is already initialized");
    }
    try {
        auto state = std::make_shared<detail::ContextState>();
        ret_t ret = parse_arguments(argc, argv, &state->arguments);
        if (ret != RET_OK) {
            return ret;
        }
        context->impl =
            std::make_unique<context_impl_t>(context_impl_t{std::move(state)})
                .release();
    } catch (const std::bad_alloc&) {
        return fail(RET_BAD_ALLOC, "failed to allocate context");
    }
    return RET_OK;
}

/// @return `false` for null, zero‑initialized or shut down contexts.
inline bool context_is_valid(const context_t* context) {
    return context && context->impl &&
           context->impl->state->valid.load(std::memory_order_acquire);
}

/**
 * @brief Invalidate @p context and everything created from it.
 * @return `RET_ALREADY_SHUTDOWN` on the second call.
 */
inline ret_t shutdown(context_t* context) {
    if (!context || !context->impl) {
        return fail(RET_NOT_INIT, "context is not initialized");
    }
    if (!context->impl->state->valid.exchange(false,
                                              std::memory_order_acq_rel)) {
        return fail(RET_ALREADY_SHUTDOWN, "context is already shut down");
    }
    return RET_OK;
}

/// Shut down (if still valid) and release @p context.
inline ret_t context_fini(context_t* context) {
    if (!context) {
        return fail(RET_INVALID_ARGUMENT, "context must not be null");
    }
    if (!context->impl) {
        return RET_OK;
    }
    std::unique_ptr<context_impl_t> impl(context->impl);
    context->impl = nullptr;
    impl->state->valid.store(false, std::memory_order_release);
    return RET_OK;
}

// ==========================================================================
// Node
// ==========================================================================

/**
 * @brief Initialize @p node under @p context.
 *
 * An empty namespace becomes "/" and a namespace without a leading '/'
 * gets one.  With `use_global_arguments` the `__node` and `__ns` remaps
 * of the context replace @p name and @p ns.
 */
inline ret_t node_init(node_t* node, const char* name, const char* ns,
                       context_t* context, const node_options_t* options) {
    if (!node || !name || !ns || !context || !options) {
        return fail(RET_INVALID_ARGUMENT,
                    "node, name, namespace, context and options must not be "
                    "null");
    }
    if (node->impl) {
        return fail(RET_ALREADY_INIT, "node is already initialized");
    }
    if (!context_is_valid(context)) {
        return fail(RET_NOT_INIT, "context is not valid");
    }
    try {
        const Arguments& arguments = context->impl->state->arguments;
        std::string node_name(name);
        std::string node_ns(ns);
        if (options->use_global_arguments) {
            if (arguments.node_name) {
                node_name = *arguments.node_name;
            }
            if (arguments.node_namespace) {
                node_ns = *arguments.node_namespace;
            }
        }
        if (node_ns.empty() || node_ns[0] != '/') {
            node_ns.insert(node_ns.begin(), '/');
        }

        int result = NAME_VALID;
        size_t index = 0;
        validate_node_name(node_name.c_str(), &result, &index);
        if (result != NAME_VALID) {
            return fail(RET_NODE_INVALID_NAME,
                        "node name '" + node_name +
                            "' is invalid: " + validation_result_string(result) +
                            " (index " + std::to_string(index) + ")");
        }
        validate_namespace(node_ns.c_str(), &result, &index);
        if (result != NAME_VALID) {
            return fail(RET_NODE_INVALID_NAMESPACE,
                        "namespace '" + node_ns +
                            "' is invalid: " + validation_result_string(result) +
                            " (index " + std::to_string(index) + ")");
        }

        std::string fully_qualified_name =
            (node_ns == "/" ? "" : node_ns) + "/" + node_name;
        node->impl = std::make_unique<node_impl_t>(
                         node_impl_t{std::move(node_name), std::move(node_ns),
                                     std::move(fully_qualified_name),
                                     options->use_global_arguments,
                                     context->impl->state})
                         .release();
    } catch (const std::bad_alloc&) {
        return fail(RET_BAD_ALLOC, "failed to allocate node");
    }
    return RET_OK;
}

inline ret_t node_fini(node_t* node) {
    if (!node) {
        return fail(RET_NODE_INVALID, "node must not be null");
    }
    std::unique_ptr<node_impl_t> impl(node->impl);
    node->impl = nullptr;
    return RET_OK;
}

/// @return `false` for null or zero‑initialized nodes, or a dead context.
inline bool node_is_valid(const node_t* node) {
    return node && node->impl &&
           node->impl->context->valid.load(std::memory_order_acquire);
}

inline const char* node_get_name(const node_t* node) {
    return (node && node->impl) ? node->impl->name.c_str() : nullptr;
}

inline const char* node_get_namespace(const node_t* node) {
    return (node && node->impl) ? node->impl->ns.c_str() : nullptr;
}

inline const char* node_get_fully_qualified_name(const node_t* node) {
    return (node && node->impl) ? node->impl->fully_qualified_name.c_str()
                                : nullptr;
}

// ==========================================================================
// Topic resolution shared by publishers and subscriptions
// ==========================================================================

namespace detail {

inline bool valid_type_support(const message_type_support_t* type_support) {
    return type_support && type_support->type_name && type_support->init &&
           type_support->fini && type_support->copy;
}

/**
 * @brief Expand @p topic against @p node and apply the context's topic
 *        remaps.  The first matching rule wins.
 */
inline ret_t resolve_topic_name(const node_t* node, const char* topic,
                                std::string* resolved) {
    const node_impl_t& impl = *node->impl;
    ret_t ret = expand_topic_name(topic, impl.name.c_str(), impl.ns.c_str(),
                                  resolved);
    if (ret != RET_OK || !impl.use_global_arguments) {
        return ret;
    }
    for (const auto& rule : impl.context->arguments.topic_remaps) {
        std::string from;
        if (expand_topic_name(rule.from.c_str(), impl.name.c_str(),
                              impl.ns.c_str(), &from) != RET_OK) {
            reset_error();
            continue;
        }
        if (from == *resolved) {
            return expand_topic_name(rule.to.c_str(), impl.name.c_str(),
                                     impl.ns.c_str(), resolved);
        }
    }
    return RET_OK;
}

/// Endpoints only match when their topic keys are equal.
inline std::string topic_key(const std::string& topic_name,
                             const qos_profile_t& qos) {
    return qos.avoid_ros_namespace_conventions ? topic_name
                                               : "rt" + topic_name;
}

} // namespace detail

// ==========================================================================
// Publisher
// ==========================================================================

inline ret_t publisher_init(publisher_t* publisher, const node_t* node,
                            const message_type_support_t* type_support,
                            const char* topic,
                            const publisher_options_t* options) {
    if (!publisher || !topic || !options) {
        return fail(RET_INVALID_ARGUMENT,
                    "publisher, topic and options must not be null");
    }
    if (!detail::valid_type_support(type_support)) {
        return fail(RET_INVALID_ARGUMENT, "type support is incomplete");
    }
    if (publisher->impl) {
        return fail(RET_ALREADY_INIT, "publisher is already initialized");
    }
    if (!node_is_valid(node)) {
        return fail(RET_NODE_INVALID, "node is not valid");
    }
    try {
        std::string topic_name;
        ret_t ret = detail::resolve_topic_name(node, topic, &topic_name);
        if (ret != RET_OK) {
            return ret;
        }
        const qos_profile_t qos = detail::resolve_qos(options->qos);
        auto entry = detail::graph().find_or_create(
            detail::topic_key(topic_name, qos), type_support->type_name);
        auto endpoint = std::make_shared<detail::PublisherEndpoint>(
            qos, node->impl->context);
        entry->add_publisher(endpoint);
        publisher->impl =
            std::make_unique<publisher_impl_t>(
                publisher_impl_t{std::move(topic_name), type_support,
                                 std::move(entry), std::move(endpoint)})
                .release();
    } catch (const std::bad_alloc&) {
        return fail(RET_BAD_ALLOC, "failed to allocate publisher");
    }
    return RET_OK;
}

inline ret_t publisher_fini(publisher_t* publisher, node_t* node) {
    if (!publisher) {
        return fail(RET_PUBLISHER_INVALID, "publisher must not be null");
    }
    if (!node || !node->impl) {
        return fail(RET_NODE_INVALID, "node is not valid");
    }
    std::unique_ptr<publisher_impl_t> impl(publisher->impl);
    publisher->impl = nullptr;
    return RET_OK;
}

/// @return `false` for zero‑initialized publishers or a dead context.
inline bool publisher_is_valid(const publisher_t* publisher) {
    return publisher && publisher->impl &&
           publisher->impl->endpoint->context->valid.load(
               std::memory_order_acquire);
}

/**
 * @brief Send @p native_message to every matched subscription.
 * @return `RET_PUBLISHER_INVALID` if the publisher is unusable,
 *         `RET_BAD_ALLOC` / `RET_ERROR` if the message could not be
 *         copied or queued.
 */
inline ret_t publish(const publisher_t* publisher,
                     const void* native_message) {
    if (!publisher_is_valid(publisher)) {
        return fail(RET_PUBLISHER_INVALID, "publisher is not valid");
    }
    if (!native_message) {
        return fail(RET_INVALID_ARGUMENT, "message must not be null");
    }
    const publisher_impl_t& impl = *publisher->impl;
    detail::SharedSample sample(
        detail::Sample::create(impl.type_support, native_message));
    if (!sample) {
        return fail(RET_ERROR, "failed to copy message of type '" +
                                   std::string(impl.type_support->type_name) +
                                   "'");
    }
    return impl.topic->publish(*impl.endpoint, sample);
}

inline const char* publisher_get_topic_name(const publisher_t* publisher) {
    return (publisher && publisher->impl)
               ? publisher->impl->topic_name.c_str()
               : nullptr;
}

inline ret_t publisher_get_subscription_count(const publisher_t* publisher,
                                              size_t* count) {
    if (!publisher_is_valid(publisher)) {
        return fail(RET_PUBLISHER_INVALID, "publisher is not valid");
    }
    if (!count) {
        return fail(RET_INVALID_ARGUMENT, "count must not be null");
    }
    *count = publisher->impl->topic->matched_subscriptions(
        *publisher->impl->endpoint);
    return RET_OK;
}

// ==========================================================================
// Subscription
// ==========================================================================

inline ret_t subscription_init(subscription_t* subscription,
                               const node_t* node,
                               const message_type_support_t* type_support,
                               const char* topic,
                               const subscription_options_t* options) {
    if (!subscription || !topic || !options) {
        return fail(RET_INVALID_ARGUMENT,
                    "subscription, topic and options must not be null");
    }
    if (!detail::valid_type_support(type_support)) {
        return fail(RET_INVALID_ARGUMENT, "type support is incomplete");
    }
    if (subscription->impl) {
        return fail(RET_ALREADY_INIT, "subscription is already initialized");
    }
    if (!node_is_valid(node)) {
        return fail(RET_NODE_INVALID, "node is not valid");
    }
    try {
        std::string topic_name;
        ret_t ret = detail::resolve_topic_name(node, topic, &topic_name);
        if (ret != RET_OK) {
            return ret;
        }
        const qos_profile_t qos = detail::resolve_qos(options->qos);
        auto entry = detail::graph().find_or_create(
            detail::topic_key(topic_name, qos), type_support->type_name);
        auto endpoint = std::make_shared<detail::SubscriberEndpoint>(
            qos, node->impl->context);
        ret = entry->add_subscriber(endpoint);
        if (ret != RET_OK) {
            return ret;
        }
        subscription->impl =
            std::make_unique<subscription_impl_t>(
                subscription_impl_t{std::move(topic_name), type_support,
                                    std::move(entry), std::move(endpoint)})
                .release();
    } catch (const std::bad_alloc&) {
        return fail(RET_BAD_ALLOC, "failed to allocate subscription");
    }
    return RET_OK;
}

inline ret_t subscription_fini(subscription_t* subscription, node_t* node) {
    if (!subscription) {
        return fail(RET_SUBSCRIPTION_INVALID, "subscription must not be null");
    }
    if (!node || !node->impl) {
        return fail(RET_NODE_INVALID, "node is not valid");
    }
    std::unique_ptr<subscription_impl_t> impl(subscription->impl);
    subscription->impl = nullptr;
    return RET_OK;
}

/// @return `false` for zero‑initialized subscriptions or a dead context.
inline bool subscription_is_valid(const subscription_t* subscription) {
    return subscription && subscription->impl &&
           subscription->impl->endpoint->context->valid.load(
               std::memory_order_acquire);
}

/**
 * @brief Move the oldest pending message into @p native_message.
 *
 * Never blocks.  `RET_SUBSCRIPTION_TAKE_FAILED` means nothing was
 * pending and is not recorded as an error.
 */
inline ret_t take(const subscription_t* subscription, void* native_message) {
    if (!subscription_is_valid(subscription)) {
        return fail(RET_SUBSCRIPTION_INVALID, "subscription is not valid");
    }
    if (!native_message) {
        return fail(RET_INVALID_ARGUMENT, "message must not be null");
    }
    const subscription_impl_t& impl = *subscription->impl;
    auto sample = impl.endpoint->queue.pop();
    if (!sample) {
        return RET_SUBSCRIPTION_TAKE_FAILED;
    }
    if (!impl.type_support->copy((*sample)->data(), native_message)) {
        return fail(RET_ERROR, "failed to copy message of type '" +
                                   std::string(impl.type_support->type_name) +
                                   "'");
    }
    return RET_OK;
}

inline const char*
subscription_get_topic_name(const subscription_t* subscription) {
    return (subscription && subscription->impl)
               ? subscription->impl->topic_name.c_str()
               : nullptr;
}

inline ret_t subscription_get_publisher_count(const subscription_t* subscription,
                                              size_t* count) {
    if (!subscription_is_valid(subscription)) {
        return fail(RET_SUBSCRIPTION_INVALID, "subscription is not valid");
    }
    if (!count) {
        return fail(RET_INVALID_ARGUMENT, "count must not be null");
    }
    *count = subscription->impl->topic->matched_publishers(
        *subscription->impl->endpoint);
    return RET_OK;
}

} // namespace rclpp::native
