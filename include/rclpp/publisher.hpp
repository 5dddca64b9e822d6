/**
 * @file publisher.hpp
 * @brief Typed send endpoint attached to a node.
 */

#pragma once

#include <rclpp/error.hpp>
#include <rclpp/message.hpp>
#include <rclpp/native/api.hpp>
#include <rclpp/qos.hpp>
#include <rclpp/resource_handle.hpp>

#include <memory>
#include <string>

namespace rclpp {

/**
 * @tparam T Message type the publisher is statically bound to.
 *
 * Stateless apart from its native resource; copies share it.  The
 * publisher keeps its node (and thus its context) alive.
 */
template <Message T> class Publisher {
  private:
    std::shared_ptr<PublisherHandle> m_handle;

    static std::shared_ptr<PublisherHandle>
    init(const std::shared_ptr<NodeHandle>& node, const std::string& topic,
         const QoSProfile& qos) {
        require_c_string<PublisherCreationError>(
            topic, ReturnCode::TopicNameInvalid, "failed to create publisher");
        const std::string kind = "publisher '" + topic + "'";

        native::publisher_t publisher = native::get_zero_initialized_publisher();
        native::publisher_options_t options =
            native::publisher_get_default_options();
        options.qos = qos.to_native();

        const native::ret_t ret =
            node->with_exclusive_access([&](native::node_t& handle) {
                return native::publisher_init(&publisher, &handle,
                                              message_traits<T>::type_support(),
                                              topic.c_str(), &options);
            });
        throw_on_error<PublisherCreationError>(
            ret, "failed to create publisher on '" + topic + "'");

        // The finalizer owns the node handle: the node outlives us.
        return make_resource_handle(
            kind, publisher,
            [node](native::publisher_t& handle) {
                return node->with_exclusive_access(
                    [&](native::node_t& node_handle) {
                        return native::publisher_fini(&handle, &node_handle);
                    });
            });
    }

  public:
    /**
     * @throws PublisherCreationError with `TopicNameInvalid`,
     *         `NodeInvalid`, `AlreadyInit`, `BadAlloc`, `InvalidArgument`
     *         or `Error`.
     */
    Publisher(const std::shared_ptr<NodeHandle>& node, const std::string& topic,
              const QoSProfile& qos)
        : m_handle(init(node, topic, qos)) {}

    static Publisher create(const std::shared_ptr<NodeHandle>& node,
                            const std::string& topic, const QoSProfile& qos) {
        return Publisher(node, topic, qos);
    }

    /**
     * @brief Publish @p message.
     *
     * The native representation of @p message is released exactly once,
     * whether or not the send succeeded.  Nothing is retried.
     *
     * @throws PublishError with `PublisherInvalid` (e.g. after the context
     *         was shut down) or another native failure.
     */
    void publish(const T& message) const {
        NativeMessagePtr<T> native(
            message_traits<T>::get_native_message(message));
        const native::ret_t ret = m_handle->with_exclusive_access(
            [&](native::publisher_t& handle) {
                return native::publish(&handle, native.get());
            });
        native.reset();
        throw_on_error<PublishError>(ret, "failed to publish");
    }

    /// Fully qualified topic name after expansion and remapping.
    std::string topic_name() const {
        return m_handle->with_exclusive_access(
            [](const native::publisher_t& handle) {
                return std::string(native::publisher_get_topic_name(&handle));
            });
    }

    /// @return Number of subscriptions currently matched.
    size_t subscription_count() const {
        size_t count = 0;
        const native::ret_t ret = m_handle->with_exclusive_access(
            [&](const native::publisher_t& handle) {
                return native::publisher_get_subscription_count(&handle,
                                                                &count);
            });
        throw_on_error<Error>(ret, "failed to count subscriptions");
        return count;
    }

    const std::shared_ptr<PublisherHandle>& handle() const { return m_handle; }
};

} // namespace rclpp
