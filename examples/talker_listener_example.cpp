/**
 * @file talker_listener_example.cpp
 * @brief Minimal end‑to‑end demonstration of rclpp.
 *
 * Two nodes bounce an integer counter back and forth:
 *
 *   1. **ping** publishes on `ping` and listens on `pong`.
 *   2. **pong** mirrors it.
 *
 * A third node, **listener**, receives the greeting each of them sends
 * once on the latched topic `/greetings`, although it subscribes after
 * both were published.
 *
 * Remaps work as usual, e.g.
 * @verbatim
 *     talker_listener_example --ros-args -r __ns:=/demo -r ping:=serve
 * @endverbatim
 */

#include <rclpp/rclpp.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

/**
 * @brief Republishes every counter it receives, incremented, until
 *        @p n_pings is reached.
 */
class PingPong {
  private:
    std::shared_ptr<rclpp::Node> m_node;
    rclpp::Publisher<rclpp::msg::Int64> m_send;
    rclpp::Publisher<rclpp::msg::String> m_greeting;
    std::shared_ptr<rclpp::Subscription<rclpp::msg::Int64>> m_recv;
    int64_t m_n_pings;

  public:
    PingPong(const rclpp::Context& context, const std::string& name,
             const std::string& send_topic, const std::string& recv_topic,
             int64_t n_pings)
        : m_node(context.create_node(name)),
          m_send(m_node->create_publisher<rclpp::msg::Int64>(send_topic)),
          m_greeting(m_node->create_publisher<rclpp::msg::String>(
              "/greetings", latched())),
          m_n_pings(n_pings) {
        m_recv = m_node->create_subscription<rclpp::msg::Int64>(
            recv_topic, rclpp::QOS_PROFILE_DEFAULT,
            [this](const rclpp::msg::Int64& message) { on_message(message); });
        m_greeting.publish(
            rclpp::msg::String{"hello from " + m_node->fully_qualified_name()});
    }

    static rclpp::QoSProfile latched() {
        rclpp::QoSProfile qos = rclpp::QOS_PROFILE_DEFAULT;
        qos.durability = rclpp::DurabilityPolicy::TransientLocal;
        return qos;
    }

    void on_message(const rclpp::msg::Int64& message) {
        RCLPP_LOG_INFO(m_node->logger(), "received {} on {}", message.data,
                       m_recv->topic_name());
        if (message.data >= m_n_pings) {
            return;
        }
        m_send.publish(rclpp::msg::Int64{message.data + 1});
    }

    /// Kick things off.
    void serve() { m_send.publish(rclpp::msg::Int64{0}); }

    const std::shared_ptr<rclpp::Node>& node() const { return m_node; }
};

} // anonymous namespace

int main(int argc, char** argv) {
    // Quill uses a dedicated backend thread. Start it once per process.
    rclpp::logging::start_backend();

    try {
        rclpp::Context context(std::vector<std::string>(argv, argv + argc));

        PingPong ping(context, "ping", "ping", "pong", 10);
        PingPong pong(context, "pong", "pong", "ping", 10);

        auto listener = context.create_node("listener");
        auto greetings = listener->create_subscription<rclpp::msg::String>(
            "/greetings", PingPong::latched(),
            [&listener](const rclpp::msg::String& message) {
                RCLPP_LOG_INFO(listener->logger(), "greeting: {}",
                               message.data);
            });

        rclpp::ExecutorOptions options;
        options.n_threads = 2;
        rclpp::Executor executor(context, options);
        executor.add_node(ping.node());
        executor.add_node(pong.node());
        executor.add_node(listener);
        executor.launch();

        ping.serve();

        // Let the game run for a short while.
        std::this_thread::sleep_for(std::chrono::seconds(1));
        executor.stop();
        context.shutdown();
    } catch (const rclpp::Error& e) {
        std::cerr << "rclpp error (" << rclpp::to_string(e.code())
                  << "): " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
