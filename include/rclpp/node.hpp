/**
 * @file node.hpp
 * @brief Named participant owning publishers and subscriptions.
 */

#pragma once

#include <rclpp/context.hpp>
#include <rclpp/error.hpp>
#include <rclpp/logging.hpp>
#include <rclpp/message.hpp>
#include <rclpp/native/api.hpp>
#include <rclpp/publisher.hpp>
#include <rclpp/qos.hpp>
#include <rclpp/resource_handle.hpp>
#include <rclpp/subscription.hpp>

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace rclpp {

/**
 * @brief A node.  Always handled through `std::shared_ptr<Node>`.
 *
 * The node keeps its context alive.  Publishers and subscriptions keep
 * the node's native resource alive, not the Node object itself: a node
 * may be dropped while its endpoints are still in use.
 *
 * The node tracks its subscriptions weakly; executors ask it for the
 * ones still alive on every pass.
 */
class Node {
  private:
    Context m_context;
    std::shared_ptr<NodeHandle> m_handle;
    logging::Logger m_logger;

    mutable std::mutex m_subscriptions_mutex;
    mutable std::vector<std::weak_ptr<SubscriptionBase>> m_subscriptions;

    static std::shared_ptr<NodeHandle> init(const Context& context,
                                            const std::string& name,
                                            const std::string& ns) {
        require_c_string<NodeCreationError>(
            name, ReturnCode::NodeInvalidName, "failed to create node");
        require_c_string<NodeCreationError>(
            ns, ReturnCode::NodeInvalidNamespace, "failed to create node");
        const std::string kind = "node '" + name + "'";

        native::node_t node = native::get_zero_initialized_node();
        const native::node_options_t options =
            native::node_get_default_options();
        const std::shared_ptr<ContextHandle>& context_handle =
            context.handle();

        const native::ret_t ret = context_handle->with_exclusive_access(
            [&](native::context_t& handle) {
                return native::node_init(&node, name.c_str(), ns.c_str(),
                                         &handle, &options);
            });
        throw_on_error<NodeCreationError>(ret, "failed to create node '" +
                                                   name + "'");

        return make_resource_handle(
            kind, node,
            [context_handle](native::node_t& handle) {
                // Hold the context lock so fini never races a shutdown.
                return context_handle->with_exclusive_access(
                    [&](native::context_t&) {
                        return native::node_fini(&handle);
                    });
            });
    }

    std::string query(const char* (*getter)(const native::node_t*)) const {
        return m_handle->with_exclusive_access(
            [getter](const native::node_t& handle) {
                const char* value = getter(&handle);
                return std::string(value ? value : "");
            });
    }

  public:
    /**
     * @param ns Empty or without a leading '/' is normalized.
     * @throws NodeCreationError with `NodeInvalidName`,
     *         `NodeInvalidNamespace`, `NotInit` (shut down context),
     *         `BadAlloc` or `Error`.
     */
    Node(const Context& context, const std::string& name,
         const std::string& ns = "")
        : m_context(context), m_handle(init(context, name, ns)),
          m_logger(logging::create_logger(query(
              native::node_get_fully_qualified_name))) {
        RCLPP_LOG_DEBUG(m_logger, "node created");
    }

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    static std::shared_ptr<Node> create(const Context& context,
                                        const std::string& name,
                                        const std::string& ns = "") {
        return std::make_shared<Node>(context, name, ns);
    }

    /// Name after remapping, e.g. "talker".
    std::string name() const { return query(native::node_get_name); }

    /// Namespace after remapping and normalization, e.g. "/" or "/robot".
    std::string get_namespace() const {
        return query(native::node_get_namespace);
    }

    /// e.g. "/robot/talker" or "/talker".
    std::string fully_qualified_name() const {
        return query(native::node_get_fully_qualified_name);
    }

    /**
     * @brief Create a publisher on @p topic.
     *
     * Relative topic names are resolved against the node namespace, "~"
     * against the node's fully qualified name.
     *
     * @throws PublisherCreationError
     */
    template <Message T>
    Publisher<T> create_publisher(const std::string& topic,
                                  const QoSProfile& qos = QOS_PROFILE_DEFAULT) {
        Publisher<T> publisher(m_handle, topic, qos);
        RCLPP_LOG_DEBUG(m_logger, "publisher created on {}",
                        publisher.topic_name());
        return publisher;
    }

    /**
     * @brief Create a subscription on @p topic that runs @p callback for
     *        every message an executor takes for it.
     *
     * The caller holds the only strong reference.  Dropping it stops
     * delivery; the node itself never extends its lifetime.
     *
     * @throws SubscriptionCreationError
     */
    template <Message T, typename Callback>
    std::shared_ptr<Subscription<T>>
    create_subscription(const std::string& topic, const QoSProfile& qos,
                        Callback&& callback) {
        auto subscription = std::make_shared<Subscription<T>>(
            m_handle, topic, qos,
            typename Subscription<T>::Callback(std::forward<Callback>(callback)));
        {
            std::lock_guard<std::mutex> lock(m_subscriptions_mutex);
            m_subscriptions.push_back(subscription);
        }
        RCLPP_LOG_DEBUG(m_logger, "subscription created on {}",
                        subscription->topic_name());
        return subscription;
    }

    /// Subscriptions still held by someone, in creation order.
    std::vector<std::shared_ptr<SubscriptionBase>> live_subscriptions() const {
        std::vector<std::shared_ptr<SubscriptionBase>> live;
        std::lock_guard<std::mutex> lock(m_subscriptions_mutex);
        live.reserve(m_subscriptions.size());
        for (const auto& weak : m_subscriptions) {
            if (auto subscription = weak.lock()) {
                live.push_back(std::move(subscription));
            }
        }
        m_subscriptions.erase(
            std::remove_if(m_subscriptions.begin(), m_subscriptions.end(),
                           [](const auto& weak) { return weak.expired(); }),
            m_subscriptions.end());
        return live;
    }

    size_t subscription_count() const { return live_subscriptions().size(); }

    const Context& context() const { return m_context; }
    const std::shared_ptr<NodeHandle>& handle() const { return m_handle; }
    logging::Logger logger() const { return m_logger; }
};

inline std::shared_ptr<Node> Context::create_node(const std::string& name,
                                                  const std::string& ns) const {
    return Node::create(*this, name, ns);
}

} // namespace rclpp
