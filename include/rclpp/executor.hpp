/**
 * @file executor.hpp
 * @brief Dispatch loop that takes pending messages and runs subscription
 *        callbacks.
 */

#pragma once

#include <rclpp/context.hpp>
#include <rclpp/logging.hpp>
#include <rclpp/message.hpp>
#include <rclpp/node.hpp>
#include <rclpp/subscription.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace rclpp {

struct ExecutorOptions {
    size_t n_threads = 1; ///< Workers started by Executor::launch().
    std::chrono::microseconds idle_sleep{100}; ///< Pause after an empty pass.
};

/**
 * @brief Polls every live subscription of its nodes.
 *
 * Nodes are held weakly: dropping the last reference to a node (or to a
 * subscription) removes it from dispatch on the next pass.  With several
 * worker threads, callbacks of different subscriptions may run
 * concurrently, callbacks of one subscription never do.
 *
 * @code
 * rclpp::Executor executor(context);
 * executor.add_node(node);
 * executor.launch();
 * ...
 * executor.stop();
 * @endcode
 */
class Executor {
  private:
    Context m_context;
    const ExecutorOptions m_options;
    logging::Logger m_logger;

    std::mutex m_nodes_mutex;
    std::vector<std::weak_ptr<Node>> m_nodes;

    std::atomic<bool> m_should_run = false;
    std::vector<std::thread> m_threads;

    std::mutex m_error_mutex;
    std::exception_ptr m_error; ///< First failure of any worker.

    std::vector<std::shared_ptr<Node>> live_nodes() {
        std::vector<std::shared_ptr<Node>> live;
        std::lock_guard<std::mutex> lock(m_nodes_mutex);
        live.reserve(m_nodes.size());
        for (const auto& weak : m_nodes) {
            if (auto node = weak.lock()) {
                live.push_back(std::move(node));
            }
        }
        m_nodes.erase(std::remove_if(m_nodes.begin(), m_nodes.end(),
                                     [](const auto& weak) {
                                         return weak.expired();
                                     }),
                      m_nodes.end());
        return live;
    }

    bool should_run() const {
        return m_should_run.load(std::memory_order_relaxed) &&
               m_context.is_valid();
    }

    /// The executor whose worker runs on the calling thread, if any.
    static const Executor*& current_worker() {
        thread_local const Executor* executor = nullptr;
        return executor;
    }

    /// Leaves `m_should_run` cleared on every exit path.
    void run() {
        try {
            while (should_run()) {
                size_t dispatched = 0;
                try {
                    dispatched = spin_once();
                } catch (const TakeError&) {
                    // A shutdown racing the take ends the loop quietly.
                    if (m_context.is_valid()) {
                        throw;
                    }
                    break;
                }
                if (dispatched == 0) {
                    std::this_thread::sleep_for(m_options.idle_sleep);
                }
            }
        } catch (...) {
            m_should_run.store(false, std::memory_order_relaxed);
            throw;
        }
        m_should_run.store(false, std::memory_order_relaxed);
        RCLPP_LOG_DEBUG(m_logger, "dispatch loop left");
    }

  public:
    explicit Executor(const Context& context, ExecutorOptions options = {})
        : m_context(context), m_options(options),
          m_logger(logging::create_logger("executor")) {}

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    /// Stops and joins the workers.  A pending worker failure is logged.
    ~Executor() {
        m_should_run.store(false, std::memory_order_relaxed);
        for (auto& thread : m_threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        if (m_error) {
            RCLPP_LOG_ERROR(m_logger,
                            "executor destroyed with an unreported worker "
                            "failure");
        }
    }

    /// May be called at any time, also while workers are running.
    void add_node(const std::shared_ptr<Node>& node) {
        std::lock_guard<std::mutex> lock(m_nodes_mutex);
        m_nodes.push_back(node);
    }

    /**
     * @brief One dispatch pass: for every live subscription of every live
     *        node, take at most one message and run its callback.
     * @return Number of callbacks run.
     * @throws TakeError for a real take fault.  Whatever a callback throws
     *         propagates as well.
     */
    size_t spin_once() {
        size_t dispatched = 0;
        for (const auto& node : live_nodes()) {
            for (const auto& subscription : node->live_subscriptions()) {
                MessageBuffer message = subscription->create_message();
                if (take_type_erased(*subscription->handle(), message)) {
                    subscription->handle_message(message);
                    ++dispatched;
                }
            }
        }
        return dispatched;
    }

    /**
     * @brief Dispatch on the calling thread until stop() is called from
     *        elsewhere (or a callback) or the context is shut down.
     */
    void spin() {
        m_should_run.store(true, std::memory_order_relaxed);
        run();
    }

    /**
     * @brief Start `n_threads` workers running the dispatch loop.
     *
     * A worker that hits an exception stops every worker; stop()
     * rethrows it.
     */
    void launch() {
        m_should_run = true;
        const size_t n_threads = std::max<size_t>(m_options.n_threads, 1);
        for (size_t i = 0; i < n_threads; ++i) {
            m_threads.emplace_back([this]() {
                current_worker() = this;
                try {
                    run();
                } catch (...) {
                    std::lock_guard<std::mutex> lock(m_error_mutex);
                    if (!m_error) {
                        m_error = std::current_exception();
                    }
                }
            });
        }
        RCLPP_LOG_DEBUG(m_logger, "executor launched {} worker(s)", n_threads);
    }

    /**
     * @brief Stop dispatching and join the workers.
     *
     * Called from a callback running on one of this executor's workers,
     * it only asks the workers to stop; joining them and reporting their
     * failure is left to a later stop() or the destructor.
     *
     * @throws Whatever the first failing worker threw.
     */
    void stop() {
        m_should_run.store(false, std::memory_order_relaxed);
        if (current_worker() == this) {
            return;
        }
        for (auto& thread : m_threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        m_threads.clear();

        std::exception_ptr error;
        {
            std::lock_guard<std::mutex> lock(m_error_mutex);
            std::swap(error, m_error);
        }
        if (error) {
            std::rethrow_exception(error);
        }
    }

    /// `false` after stop() or once a dispatch loop has ended for any reason.
    bool running() const { return m_should_run.load(std::memory_order_relaxed); }
};

} // namespace rclpp
