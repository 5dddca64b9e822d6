/**
 * @file loopback.hpp
 * @brief In‑process transport backing the native API.
 *
 *   * **Sample**        – one published message copied through its type
 *     support, shared between subscriber queues by intrusive ref‑counting.
 *   * **SharedSample**  – smart pointer over a Sample.
 *   * **SampleQueue**   – per‑subscription lock‑free queue honouring the
 *     keep‑last / keep‑all history policy.
 *   * **TopicEntry**    – endpoints matched on one (topic key, type) pair.
 *   * **Graph**         – process wide registry of TopicEntries.
 *
 * Nothing in here is part of the public API; the functions in api.hpp
 * are the only entry points.
 */

#pragma once

#include <rclpp/native/arguments.hpp>
#include <rclpp/native/types.hpp>

#include <boost/lockfree/queue.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rclpp::native::detail {

// ==========================================================================
// Sample – intrusive ref‑counted message copy
// ==========================================================================

class Sample {
  private:
    const message_type_support_t* m_type_support;
    std::unique_ptr<std::max_align_t[]> m_storage;
    std::atomic<int64_t> m_ref_cnt{0};

    explicit Sample(const message_type_support_t* type_support,
                    std::unique_ptr<std::max_align_t[]> storage)
        : m_type_support(type_support), m_storage(std::move(storage)) {}

  public:
    ~Sample() { m_type_support->fini(m_storage.get()); }

    Sample(const Sample&) = delete;
    Sample& operator=(const Sample&) = delete;

    /**
     * @brief Copy @p message into a freshly allocated sample.
     * @return nullptr when allocation or the type support copy fails.
     */
    static Sample* create(const message_type_support_t* type_support,
                          const void* message) {
        const size_t slots = (type_support->size + sizeof(std::max_align_t) -
                              1) / sizeof(std::max_align_t);
        std::unique_ptr<std::max_align_t[]> storage(
            new (std::nothrow) std::max_align_t[std::max<size_t>(slots, 1)]);
        if (!storage) {
            return nullptr;
        }
        type_support->init(storage.get());
        if (!type_support->copy(message, storage.get())) {
            type_support->fini(storage.get());
            return nullptr;
        }
        Sample* sample = new (std::nothrow) Sample(type_support, nullptr);
        if (!sample) {
            type_support->fini(storage.get());
            return nullptr;
        }
        sample->m_storage = std::move(storage);
        return sample;
    }

    void incref() { m_ref_cnt.fetch_add(1, std::memory_order_relaxed); }

    /** @brief Decrement reference count and destroy on reaching zero. */
    void decref() {
        if (m_ref_cnt.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            delete this;
        }
    }

    int64_t ref_count() const {
        return m_ref_cnt.load(std::memory_order_relaxed);
    }

    const void* data() const { return m_storage.get(); }
    const message_type_support_t* type_support() const {
        return m_type_support;
    }
};

/**
 * Copying bumps the ref‑count, moving transfers ownership.
 */
class SharedSample {
  private:
    Sample* m_sample = nullptr;

  public:
    SharedSample() = default;

    /// Acquire a reference to @p sample (may be nullptr).
    explicit SharedSample(Sample* sample) : m_sample(sample) {
        if (m_sample) {
            m_sample->incref();
        }
    }

    ~SharedSample() {
        if (m_sample) {
            m_sample->decref();
        }
    }

    SharedSample(const SharedSample& other) : SharedSample(other.m_sample) {}

    SharedSample& operator=(const SharedSample& other) {
        if (this != &other) {
            SharedSample copy(other);
            std::swap(m_sample, copy.m_sample);
        }
        return *this;
    }

    SharedSample(SharedSample&& other) noexcept : m_sample(other.m_sample) {
        other.m_sample = nullptr;
    }

    SharedSample& operator=(SharedSample&& other) noexcept {
        if (this != &other) {
            if (m_sample) {
                m_sample->decref();
            }
            m_sample = other.m_sample;
            other.m_sample = nullptr;
        }
        return *this;
    }

    Sample* get() const { return m_sample; }
    Sample* operator->() const { return m_sample; }
    explicit operator bool() const { return m_sample != nullptr; }
};

// ==========================================================================
// QoS resolution
// ==========================================================================

/// Replace every system‑default policy by the value this transport uses.
inline qos_profile_t resolve_qos(qos_profile_t qos) {
    if (qos.history == HISTORY_SYSTEM_DEFAULT) {
        qos.history = HISTORY_KEEP_LAST;
    }
    if (qos.history == HISTORY_KEEP_LAST && qos.depth == 0) {
        qos.depth = DEFAULT_HISTORY_DEPTH;
    }
    if (qos.reliability == RELIABILITY_SYSTEM_DEFAULT) {
        qos.reliability = RELIABILITY_RELIABLE;
    }
    if (qos.durability == DURABILITY_SYSTEM_DEFAULT) {
        qos.durability = DURABILITY_VOLATILE;
    }
    return qos;
}

/// Request/offer matching on resolved profiles.
inline bool qos_compatible(const qos_profile_t& offered,
                           const qos_profile_t& requested) {
    if (offered.reliability == RELIABILITY_BEST_EFFORT &&
        requested.reliability == RELIABILITY_RELIABLE) {
        return false;
    }
    if (offered.durability == DURABILITY_VOLATILE &&
        requested.durability == DURABILITY_TRANSIENT_LOCAL) {
        return false;
    }
    return true;
}

// ==========================================================================
// SampleQueue – per‑subscription inbox
// ==========================================================================

/**
 * @brief Multi‑producer / single‑consumer inbox of one subscription.
 *
 * Under keep‑last the queue never holds more than `depth` samples: a
 * producer finding it full drops the oldest sample first.  Under
 * keep‑all it grows without bound.  The bound is enforced with a
 * separate counter; concurrent producers may overshoot it momentarily.
 */
class SampleQueue {
  private:
    const bool m_keep_all;
    const size_t m_depth;
    boost::lockfree::queue<Sample*> m_queue;
    std::atomic<int64_t> m_size{0};

    bool drop_oldest() {
        Sample* sample = nullptr;
        if (!m_queue.pop(sample)) {
            return false;
        }
        m_size.fetch_sub(1, std::memory_order_acq_rel);
        sample->decref();
        return true;
    }

  public:
    explicit SampleQueue(const qos_profile_t& resolved_qos)
        : m_keep_all(resolved_qos.history == HISTORY_KEEP_ALL),
          m_depth(resolved_qos.depth),
          m_queue(std::max<size_t>(resolved_qos.depth, 1)) {}

    ~SampleQueue() {
        Sample* sample = nullptr;
        while (m_queue.pop(sample)) {
            sample->decref();
        }
    }

    /** @return `false` if the queue could not allocate a node. */
    bool push(const SharedSample& sample) {
        if (!m_keep_all) {
            while (m_size.load(std::memory_order_acquire) >=
                   static_cast<int64_t>(m_depth)) {
                if (!drop_oldest()) {
                    break;
                }
            }
        }
        Sample* raw = sample.get();
        raw->incref(); // The queue owns another reference.
        if (!m_queue.push(raw)) {
            raw->decref();
            return false;
        }
        m_size.fetch_add(1, std::memory_order_acq_rel);
        return true;
    }

    /** @return Oldest sample or `std::nullopt` when the queue is empty. */
    std::optional<SharedSample> pop() {
        Sample* raw = nullptr;
        if (!m_queue.pop(raw)) {
            return std::nullopt;
        }
        m_size.fetch_sub(1, std::memory_order_acq_rel);
        SharedSample out(raw); // Acquire consumer reference.
        raw->decref();         // Drop the queue's own reference.
        return out;
    }

    size_t size() const {
        return static_cast<size_t>(
            std::max<int64_t>(m_size.load(std::memory_order_acquire), 0));
    }
};

// ==========================================================================
// Endpoints and topics
// ==========================================================================

struct ContextState {
    std::atomic<bool> valid{true};
    Arguments arguments;
};

struct PublisherEndpoint {
    qos_profile_t qos; ///< Resolved.
    std::shared_ptr<ContextState> context;
    std::mutex history_mutex;
    std::deque<SharedSample> history; ///< Transient‑local only.

    PublisherEndpoint(const qos_profile_t& resolved_qos,
                      std::shared_ptr<ContextState> owner)
        : qos(resolved_qos), context(std::move(owner)) {}

    bool transient_local() const {
        return qos.durability == DURABILITY_TRANSIENT_LOCAL;
    }
};

struct SubscriberEndpoint {
    qos_profile_t qos; ///< Resolved.
    std::shared_ptr<ContextState> context;
    SampleQueue queue;

    SubscriberEndpoint(const qos_profile_t& resolved_qos,
                       std::shared_ptr<ContextState> owner)
        : qos(resolved_qos), context(std::move(owner)), queue(resolved_qos) {}
};

/**
 * @brief Every endpoint registered on one (topic key, message type) pair.
 *
 * Endpoints are held weakly; an endpoint disappears from the topic as
 * soon as its owning resource is finalized and dead entries are pruned
 * on the next registration.
 */
class TopicEntry {
  private:
    std::mutex m_mutex; ///< Protects both endpoint lists.
    std::vector<std::weak_ptr<PublisherEndpoint>> m_publishers;
    std::vector<std::weak_ptr<SubscriberEndpoint>> m_subscribers;

    template <typename T> static void prune(std::vector<std::weak_ptr<T>>& v) {
        v.erase(std::remove_if(v.begin(), v.end(),
                               [](const auto& weak) { return weak.expired(); }),
                v.end());
    }

  public:
    void add_publisher(const std::shared_ptr<PublisherEndpoint>& publisher) {
        std::lock_guard<std::mutex> lock(m_mutex);
        prune(m_publishers);
        m_publishers.push_back(publisher);
    }

    /**
     * @brief Register @p subscriber and replay transient‑local history
     *        into it.
     * @return `RET_BAD_ALLOC` if the replay could not be queued.
     */
    ret_t add_subscriber(const std::shared_ptr<SubscriberEndpoint>& subscriber) {
        std::lock_guard<std::mutex> lock(m_mutex);
        prune(m_subscribers);
        m_subscribers.push_back(subscriber);
        if (subscriber->qos.durability != DURABILITY_TRANSIENT_LOCAL) {
            return RET_OK;
        }
        for (const auto& weak : m_publishers) {
            auto publisher = weak.lock();
            if (!publisher || !publisher->transient_local() ||
                !qos_compatible(publisher->qos, subscriber->qos)) {
                continue;
            }
            std::lock_guard<std::mutex> history_lock(publisher->history_mutex);
            for (const auto& sample : publisher->history) {
                if (!subscriber->queue.push(sample)) {
                    return fail(RET_BAD_ALLOC,
                                "transient local replay allocation failed");
                }
            }
        }
        return RET_OK;
    }

    /**
     * @brief Fan‑out a sample to every compatible live subscriber.
     * @return `RET_BAD_ALLOC` if any subscriber queue failed to grow.
     */
    ret_t publish(PublisherEndpoint& publisher, const SharedSample& sample) {
        std::vector<std::shared_ptr<SubscriberEndpoint>> targets;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (publisher.transient_local()) {
                std::lock_guard<std::mutex> history_lock(
                    publisher.history_mutex);
                publisher.history.push_back(sample);
                while (publisher.qos.history == HISTORY_KEEP_LAST &&
                       publisher.history.size() > publisher.qos.depth) {
                    publisher.history.pop_front();
                }
            }
            targets.reserve(m_subscribers.size());
            for (const auto& weak : m_subscribers) {
                if (auto subscriber = weak.lock()) {
                    targets.push_back(std::move(subscriber));
                }
            }
        }

        ret_t ret = RET_OK;
        for (const auto& subscriber : targets) {
            if (!subscriber->context->valid.load(std::memory_order_acquire) ||
                !qos_compatible(publisher.qos, subscriber->qos)) {
                continue;
            }
            if (!subscriber->queue.push(sample)) {
                ret = fail(RET_BAD_ALLOC, "subscriber queue allocation failed");
            }
        }
        return ret;
    }

    size_t matched_subscriptions(const PublisherEndpoint& publisher) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::count_if(
            m_subscribers.begin(), m_subscribers.end(), [&](const auto& weak) {
                auto subscriber = weak.lock();
                return subscriber &&
                       qos_compatible(publisher.qos, subscriber->qos);
            });
    }

    size_t matched_publishers(const SubscriberEndpoint& subscriber) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::count_if(
            m_publishers.begin(), m_publishers.end(), [&](const auto& weak) {
                auto publisher = weak.lock();
                return publisher &&
                       qos_compatible(publisher->qos, subscriber.qos);
            });
    }
};

/**
 * @brief Process wide registry of topics.
 *
 * Entries are created lazily and owned by the endpoints registered on
 * them; an entry whose last endpoint was finalized is dropped on the
 * next lookup.
 */
class Graph {
  private:
    std::mutex m_mutex;
    std::unordered_map<std::string, std::weak_ptr<TopicEntry>> m_topics;

    void prune() {
        for (auto it = m_topics.begin(); it != m_topics.end();) {
            if (it->second.expired()) {
                it = m_topics.erase(it);
            } else {
                ++it;
            }
        }
    }

  public:
    std::shared_ptr<TopicEntry> find_or_create(const std::string& topic_key,
                                               const std::string& type_name) {
        const std::string key = topic_key + '\n' + type_name;
        std::lock_guard<std::mutex> lock(m_mutex);
        prune();
        auto& weak = m_topics[key];
        auto entry = weak.lock();
        if (!entry) {
            entry = std::make_shared<TopicEntry>();
            weak = entry;
        }
        return entry;
    }

    /// @return Number of topics that still have an endpoint.
    size_t topic_count() {
        std::lock_guard<std::mutex> lock(m_mutex);
        prune();
        return m_topics.size();
    }
};

/// Singleton accessor for the process wide graph.
inline Graph& graph() {
    static Graph instance;
    return instance;
}

} // namespace rclpp::native::detail
