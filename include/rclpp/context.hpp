/**
 * @file context.hpp
 * @brief Process level middleware initialization, root of the ownership
 *        graph.
 */

#pragma once

#include <rclpp/error.hpp>
#include <rclpp/logging.hpp>
#include <rclpp/native/api.hpp>
#include <rclpp/resource_handle.hpp>

#include <memory>
#include <string>
#include <vector>

namespace rclpp {

class Node;

/**
 * @brief Shared state between nodes and everything created from them.
 *
 * Copies of a Context share one native context.  Every node keeps the
 * native context alive, so it is finalized only once the last Context
 * copy *and* the last node (and, transitively, publisher and
 * subscription) are gone.  Several independent contexts may coexist.
 */
class Context {
  private:
    std::shared_ptr<ContextHandle> m_handle;
    logging::Logger m_logger;

    static std::shared_ptr<ContextHandle>
    init(const std::vector<std::string>& args) {
        std::vector<const char*> c_args;
        c_args.reserve(args.size());
        for (const auto& arg : args) {
            require_c_string<InitializationError>(
                arg, ReturnCode::InvalidArgument,
                "failed to initialize context");
            c_args.push_back(arg.c_str());
        }

        native::context_t context = native::get_zero_initialized_context();
        throw_on_error<InitializationError>(
            native::init(static_cast<int>(c_args.size()), c_args.data(),
                         &context),
            "failed to initialize context");

        return make_resource_handle(
            "context", context, [](native::context_t& handle) {
                return native::context_fini(&handle);
            });
    }

  public:
    /**
     * @param args Process arguments; the runtime section (after
     *             `--ros-args`) may carry remap rules.
     * @throws InitializationError Callers should treat this as fatal.
     */
    explicit Context(const std::vector<std::string>& args = {})
        : m_handle(init(args)), m_logger(logging::create_logger("context")) {
        RCLPP_LOG_DEBUG(m_logger, "context initialized with {} argument(s)",
                        args.size());
    }

    /// Same as the constructor; kept for symmetry with Node::create.
    static Context create(const std::vector<std::string>& args = {}) {
        return Context(args);
    }

    /**
     * @return `true` while the native context is usable.  Safe to call
     *         concurrently with any other context operation.
     */
    bool is_valid() const {
        return m_handle->with_exclusive_access(
            [](const native::context_t& context) {
                return native::context_is_valid(&context);
            });
    }

    /**
     * @brief Invalidate the context.  Publishers and subscriptions created
     *        under it stop working; resources are still finalized only by
     *        their owners.
     * @throws Error with `ReturnCode::AlreadyShutdown` on the second call.
     */
    void shutdown() {
        const native::ret_t ret = m_handle->with_exclusive_access(
            [](native::context_t& context) {
                return native::shutdown(&context);
            });
        throw_on_error<Error>(ret, "failed to shut down context");
        RCLPP_LOG_INFO(m_logger, "context shut down");
    }

    /// Defined in node.hpp.
    std::shared_ptr<Node> create_node(const std::string& name,
                                      const std::string& ns = "") const;

    const std::shared_ptr<ContextHandle>& handle() const { return m_handle; }
};

} // namespace rclpp
