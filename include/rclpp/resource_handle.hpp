/**
 * @file resource_handle.hpp
 * @brief Exclusive‑access wrapper around one native resource.
 *
 * A ResourceHandle owns exactly one native resource (`context_t`,
 * `node_t`, ...), serializes every native call made against it and
 * finalizes it when the last shared owner lets go.  Finalization order
 * across the ownership graph follows from who holds a
 * `std::shared_ptr` to whom: a child's finalizer captures its parent's
 * handle, so a parent is never finalized before its children.
 */

#pragma once

#include <rclpp/logging.hpp>
#include <rclpp/native/api.hpp>
#include <rclpp/native/types.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace rclpp {

namespace diagnostics {

namespace detail {
inline std::atomic<uint64_t>& finalization_faults() {
    static std::atomic<uint64_t> counter{0};
    return counter;
}
} // namespace detail

/// @return Number of native finalizations that reported a failure.
inline uint64_t finalization_fault_count() {
    return detail::finalization_faults().load(std::memory_order_relaxed);
}

/**
 * @brief Report a failed finalization.  Never throws: there is nobody
 *        left to receive an error.
 */
inline void report_finalization_fault(const std::string& resource,
                                      native::ret_t ret) noexcept {
    detail::finalization_faults().fetch_add(1, std::memory_order_relaxed);
    RCLPP_LOG_ERROR(logging::diagnostics_logger(),
                    "failed to finalize {}: native code {} ({})", resource,
                    ret, native::get_error_string());
    native::reset_error();
}

} // namespace diagnostics

/**
 * @tparam Resource Native resource struct, e.g. `native::node_t`.
 *
 * Non‑copyable and non‑movable; share it through `std::shared_ptr`.
 */
template <typename Resource> class ResourceHandle {
  public:
    using Finalizer = std::function<native::ret_t(Resource&)>;

  private:
    const std::string m_kind; ///< Used in diagnostics only.
    mutable std::mutex m_mutex;
    Resource m_resource;
    Finalizer m_finalizer;

  public:
    /**
     * @param kind      Human readable resource description.
     * @param resource  Already initialized native resource.
     * @param finalizer Invoked once, under exclusive access, on
     *                  destruction.  Whatever it captures lives until
     *                  after it ran.
     */
    ResourceHandle(std::string kind, Resource resource, Finalizer finalizer)
        : m_kind(std::move(kind)), m_resource(resource),
          m_finalizer(std::move(finalizer)) {}

    ~ResourceHandle() {
        std::lock_guard<std::mutex> lock(m_mutex);
        const native::ret_t ret = m_finalizer(m_resource);
        if (ret != native::RET_OK) {
            diagnostics::report_finalization_fault(m_kind, ret);
        }
    }

    ResourceHandle(const ResourceHandle&) = delete;
    ResourceHandle& operator=(const ResourceHandle&) = delete;

    /**
     * @brief Block until exclusive access is obtained, then run @p op.
     * @return Whatever @p op returns.
     */
    template <typename Op> decltype(auto) with_exclusive_access(Op&& op) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::forward<Op>(op)(m_resource);
    }

    template <typename Op>
    decltype(auto) with_exclusive_access(Op&& op) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::forward<Op>(op)(static_cast<const Resource&>(m_resource));
    }

    const std::string& kind() const { return m_kind; }
};

/**
 * @brief Wrap the freshly initialized @p resource in a shared handle.
 *
 * If the handle cannot be allocated, @p finalizer runs here before the
 * exception propagates, so the native resource never leaks.
 */
template <typename Resource, typename Finalizer>
std::shared_ptr<ResourceHandle<Resource>>
make_resource_handle(const std::string& kind, Resource resource,
                     Finalizer finalizer) {
    try {
        return std::make_shared<ResourceHandle<Resource>>(
            kind, resource,
            typename ResourceHandle<Resource>::Finalizer(finalizer));
    } catch (...) {
        const native::ret_t ret = finalizer(resource);
        if (ret != native::RET_OK) {
            diagnostics::report_finalization_fault(kind, ret);
        }
        throw;
    }
}

using ContextHandle = ResourceHandle<native::context_t>;
using NodeHandle = ResourceHandle<native::node_t>;
using PublisherHandle = ResourceHandle<native::publisher_t>;
using SubscriptionHandle = ResourceHandle<native::subscription_t>;

} // namespace rclpp
