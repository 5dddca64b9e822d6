#include <benchmark/benchmark.h>

#include <rclpp/rclpp.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace {

/// Echoes every counter from `out` back on `in`.
class EchoNode {
  private:
    std::shared_ptr<rclpp::Node> m_node;
    rclpp::Publisher<rclpp::msg::Int64> m_send;
    std::shared_ptr<rclpp::Subscription<rclpp::msg::Int64>> m_recv;

  public:
    explicit EchoNode(const rclpp::Context& context)
        : m_node(context.create_node("echo")),
          m_send(m_node->create_publisher<rclpp::msg::Int64>("bench_in")) {
        m_recv = m_node->create_subscription<rclpp::msg::Int64>(
            "bench_out", rclpp::QOS_PROFILE_DEFAULT,
            [this](const rclpp::msg::Int64& message) { m_send.publish(message); });
    }

    const std::shared_ptr<rclpp::Node>& node() const { return m_node; }
};

} // anonymous namespace

static void publish_take(benchmark::State& st) {
    rclpp::Context context;
    auto node = context.create_node("bench_local");
    auto publisher = node->create_publisher<rclpp::msg::Int64>("bench_local");
    auto subscription = node->create_subscription<rclpp::msg::Int64>(
        "bench_local", rclpp::QOS_PROFILE_DEFAULT,
        [](const rclpp::msg::Int64&) {});

    int64_t iteration = 0;
    for (auto _ : st) {
        publisher.publish(rclpp::msg::Int64{iteration++});
        auto taken = subscription->take();
        benchmark::DoNotOptimize(taken);
    }
    st.SetItemsProcessed(st.iterations());
}

static void publish_take_string(benchmark::State& st) {
    rclpp::Context context;
    auto node = context.create_node("bench_string");
    auto publisher = node->create_publisher<rclpp::msg::String>("bench_string");
    auto subscription = node->create_subscription<rclpp::msg::String>(
        "bench_string", rclpp::QOS_PROFILE_DEFAULT,
        [](const rclpp::msg::String&) {});

    const rclpp::msg::String message{std::string(st.range(0), 'x')};
    for (auto _ : st) {
        publisher.publish(message);
        auto taken = subscription->take();
        benchmark::DoNotOptimize(taken);
    }
    st.SetBytesProcessed(st.iterations() * st.range(0));
}

static void roundtrip(benchmark::State& st) {
    rclpp::Context context;
    EchoNode echo(context);

    rclpp::Executor echo_executor(context);
    echo_executor.add_node(echo.node());
    echo_executor.launch();

    auto client = context.create_node("client");
    auto publisher = client->create_publisher<rclpp::msg::Int64>("bench_out");
    auto subscription = client->create_subscription<rclpp::msg::Int64>(
        "bench_in", rclpp::QOS_PROFILE_DEFAULT,
        [](const rclpp::msg::Int64&) {});

    int64_t iteration = 0;
    for (auto _ : st) {
        publisher.publish(rclpp::msg::Int64{iteration});
        while (true) {
            auto reply = subscription->take();
            if (reply && reply->data == iteration) {
                break;
            }
        }
        iteration++;
    }

    echo_executor.stop();
    st.SetItemsProcessed(st.iterations());
}

BENCHMARK(publish_take);
BENCHMARK(publish_take_string)->Arg(16)->Arg(1024)->Arg(64 * 1024);
BENCHMARK(roundtrip)->UseRealTime();

BENCHMARK_MAIN();
