/**
 * @file subscription.hpp
 * @brief Typed receive endpoint and the type‑erased interface executors
 *        drive it through.
 */

#pragma once

#include <rclpp/error.hpp>
#include <rclpp/message.hpp>
#include <rclpp/native/api.hpp>
#include <rclpp/qos.hpp>
#include <rclpp/resource_handle.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace rclpp {

// ==========================================================================
// Dispatch interface
// ==========================================================================

/**
 * @brief What an executor needs from a subscription without knowing its
 *        message type.
 *
 * A dispatch pass over any mix of subscriptions is
 *
 * @code
 * MessageBuffer buffer = sub->create_message();
 * if (take_type_erased(*sub->handle(), buffer)) {
 *     sub->handle_message(buffer);
 * }
 * @endcode
 */
class SubscriptionBase {
  public:
    virtual ~SubscriptionBase() = default;

    /// The native resource, for polling and identification.
    virtual const std::shared_ptr<SubscriptionHandle>& handle() const = 0;

    /// A fresh buffer that `take` on this subscription can fill.
    virtual MessageBuffer create_message() const = 0;

    /// Decode a buffer filled by a successful take and run the callback.
    virtual void handle_message(const MessageBuffer& message) = 0;
};

/**
 * @brief Take one pending message into @p message.
 *
 * @return `false` when nothing was pending: the expected, quiet outcome
 *         of polling.
 * @throws TakeError for a real fault, e.g. `SubscriptionInvalid`.
 */
inline bool take_type_erased(SubscriptionHandle& subscription,
                             MessageBuffer& message) {
    const native::ret_t ret = subscription.with_exclusive_access(
        [&](native::subscription_t& handle) {
            return native::take(&handle, message.get());
        });
    if (ret == native::RET_SUBSCRIPTION_TAKE_FAILED) {
        return false;
    }
    throw_on_error<TakeError>(ret, "failed to take from " + subscription.kind());
    return true;
}

// ==========================================================================
// Subscription<T>
// ==========================================================================

/**
 * @tparam T Message type received.
 *
 * Created through Node::create_subscription, which hands the only strong
 * reference to the caller.  At most one invocation of the callback runs
 * at a time; different subscriptions may run concurrently.
 */
template <Message T> class Subscription : public SubscriptionBase {
  public:
    using Callback = std::function<void(const T&)>;

  private:
    std::shared_ptr<SubscriptionHandle> m_handle;
    std::mutex m_callback_mutex;
    Callback m_callback;

    static std::shared_ptr<SubscriptionHandle>
    init(const std::shared_ptr<NodeHandle>& node, const std::string& topic,
         const QoSProfile& qos) {
        require_c_string<SubscriptionCreationError>(
            topic, ReturnCode::TopicNameInvalid, "failed to create subscription");
        const std::string kind = "subscription '" + topic + "'";

        native::subscription_t subscription =
            native::get_zero_initialized_subscription();
        native::subscription_options_t options =
            native::subscription_get_default_options();
        options.qos = qos.to_native();

        const native::ret_t ret =
            node->with_exclusive_access([&](native::node_t& handle) {
                return native::subscription_init(
                    &subscription, &handle, message_traits<T>::type_support(),
                    topic.c_str(), &options);
            });
        throw_on_error<SubscriptionCreationError>(
            ret, "failed to create subscription on '" + topic + "'");

        // The finalizer owns the node handle: the node outlives us.
        return make_resource_handle(
            kind, subscription,
            [node](native::subscription_t& handle) {
                return node->with_exclusive_access(
                    [&](native::node_t& node_handle) {
                        return native::subscription_fini(&handle,
                                                         &node_handle);
                    });
            });
    }

  public:
    /**
     * @throws SubscriptionCreationError with `TopicNameInvalid`,
     *         `NodeInvalid`, `AlreadyInit`, `BadAlloc`, `InvalidArgument`
     *         or `Error`.
     */
    Subscription(const std::shared_ptr<NodeHandle>& node,
                 const std::string& topic, const QoSProfile& qos,
                 Callback callback)
        : m_handle(init(node, topic, qos)), m_callback(std::move(callback)) {}

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    /// Not registered with any node; executors will not see it.
    static std::shared_ptr<Subscription>
    create(const std::shared_ptr<NodeHandle>& node, const std::string& topic,
           const QoSProfile& qos, Callback callback) {
        return std::make_shared<Subscription>(node, topic, qos,
                                              std::move(callback));
    }

    /**
     * @brief Take the oldest pending message without running the callback.
     * @return `std::nullopt` when nothing is pending.
     * @throws TakeError for a real fault.
     */
    std::optional<T> take() {
        MessageBuffer buffer = create_message();
        if (!take_type_erased(*m_handle, buffer)) {
            return std::nullopt;
        }
        return message_traits<T>::from_native_message(buffer.as<T>());
    }

    const std::shared_ptr<SubscriptionHandle>& handle() const override {
        return m_handle;
    }

    MessageBuffer create_message() const override {
        return MessageBuffer(message_traits<T>::type_support());
    }

    void handle_message(const MessageBuffer& message) override {
        const T decoded = message_traits<T>::from_native_message(message.as<T>());
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        m_callback(decoded);
    }

    /// Fully qualified topic name after expansion and remapping.
    std::string topic_name() const {
        return m_handle->with_exclusive_access(
            [](const native::subscription_t& handle) {
                return std::string(
                    native::subscription_get_topic_name(&handle));
            });
    }

    /// @return Number of publishers currently matched.
    size_t publisher_count() const {
        size_t count = 0;
        const native::ret_t ret = m_handle->with_exclusive_access(
            [&](const native::subscription_t& handle) {
                return native::subscription_get_publisher_count(&handle,
                                                                &count);
            });
        throw_on_error<Error>(ret, "failed to count publishers");
        return count;
    }
};

template <Message T> using SharedSubscription = std::shared_ptr<Subscription<T>>;

} // namespace rclpp
