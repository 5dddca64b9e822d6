#include <gtest/gtest.h>

#include <rclpp/rclpp.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
rclpp::QoSProfile keep_last(size_t depth) {
    rclpp::QoSProfile qos = rclpp::QOS_PROFILE_DEFAULT;
    qos.depth = depth;
    return qos;
}

auto ignore_int64 = [](const rclpp::msg::Int64&) {};
} // anonymous namespace

TEST(subscription_tests, empty_take_returns_nullopt_without_callback) {
    rclpp::Context context;
    auto node = context.create_node("listener");
    int calls = 0;
    auto subscription = node->create_subscription<rclpp::msg::String>(
        "sub_empty", rclpp::QOS_PROFILE_DEFAULT,
        [&calls](const rclpp::msg::String&) { ++calls; });

    EXPECT_FALSE(subscription->take());
    EXPECT_FALSE(subscription->take());
    EXPECT_EQ(calls, 0);
}

TEST(subscription_tests, publish_then_take_roundtrip) {
    rclpp::Context context;
    auto node = context.create_node("roundtrip");
    auto subscription = node->create_subscription<rclpp::msg::String>(
        "sub_roundtrip", rclpp::QOS_PROFILE_DEFAULT,
        [](const rclpp::msg::String&) {});
    auto publisher = node->create_publisher<rclpp::msg::String>("sub_roundtrip");

    publisher.publish(rclpp::msg::String{"hello"});
    publisher.publish(rclpp::msg::String{std::string(1000, 'x')});

    auto first = subscription->take();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->data, "hello");
    auto second = subscription->take();
    ASSERT_TRUE(second);
    EXPECT_EQ(second->data.size(), 1000u);
    EXPECT_FALSE(subscription->take());
}

TEST(subscription_tests, default_qos_scenario_in_root_namespace) {
    rclpp::Context context;
    auto node = rclpp::Node::create(context, "n", "");
    auto publisher = node->create_publisher<rclpp::msg::String>("t");
    auto subscription = node->create_subscription<rclpp::msg::String>(
        "t", rclpp::QOS_PROFILE_DEFAULT, [](const rclpp::msg::String&) {});

    const rclpp::msg::String m1{"M1"};
    publisher.publish(m1);

    std::optional<rclpp::msg::String> received;
    for (int attempt = 0; attempt < 100 && !received; ++attempt) {
        received = subscription->take();
    }
    ASSERT_TRUE(received);
    EXPECT_EQ(*received, m1);
    EXPECT_EQ(subscription->topic_name(), "/t");
}

TEST(subscription_tests, unregistered_subscription_still_receives) {
    rclpp::Context context;
    auto node = context.create_node("standalone");
    auto subscription = rclpp::Subscription<rclpp::msg::Int64>::create(
        node->handle(), "sub_standalone", rclpp::QOS_PROFILE_DEFAULT,
        ignore_int64);
    EXPECT_EQ(node->subscription_count(), 0u);

    auto publisher = node->create_publisher<rclpp::msg::Int64>("sub_standalone");
    publisher.publish(rclpp::msg::Int64{7});
    auto message = subscription->take();
    ASSERT_TRUE(message);
    EXPECT_EQ(message->data, 7);
}

TEST(subscription_tests, fanout_to_every_subscription) {
    rclpp::Context context;
    auto node = context.create_node("fanout");
    std::vector<std::shared_ptr<rclpp::Subscription<rclpp::msg::Int64>>> subs;
    for (int i = 0; i < 4; ++i) {
        subs.push_back(node->create_subscription<rclpp::msg::Int64>(
            "sub_fanout", rclpp::QOS_PROFILE_DEFAULT, ignore_int64));
    }
    auto publisher = node->create_publisher<rclpp::msg::Int64>("sub_fanout");
    EXPECT_EQ(publisher.subscription_count(), 4u);
    publisher.publish(rclpp::msg::Int64{99});

    for (auto& sub : subs) {
        auto message = sub->take();
        ASSERT_TRUE(message);
        EXPECT_EQ(message->data, 99);
    }
}

TEST(subscription_tests, keep_last_keeps_newest) {
    rclpp::Context context;
    auto node = context.create_node("history");
    auto subscription = node->create_subscription<rclpp::msg::Int64>(
        "sub_keep_last", keep_last(3), ignore_int64);
    auto publisher =
        node->create_publisher<rclpp::msg::Int64>("sub_keep_last", keep_last(3));

    for (int64_t i = 0; i < 7; ++i) {
        publisher.publish(rclpp::msg::Int64{i});
    }

    std::vector<int64_t> seen;
    while (auto message = subscription->take()) {
        seen.push_back(message->data);
    }
    EXPECT_EQ(seen, (std::vector<int64_t>{4, 5, 6}));
}

TEST(subscription_tests, transient_local_reaches_late_joiner) {
    rclpp::Context context;
    auto node = context.create_node("latched");
    rclpp::QoSProfile latched = keep_last(1);
    latched.durability = rclpp::DurabilityPolicy::TransientLocal;

    auto publisher =
        node->create_publisher<rclpp::msg::String>("sub_latched", latched);
    publisher.publish(rclpp::msg::String{"old"});
    publisher.publish(rclpp::msg::String{"latest"});

    auto late = node->create_subscription<rclpp::msg::String>(
        "sub_latched", latched, [](const rclpp::msg::String&) {});
    auto message = late->take();
    ASSERT_TRUE(message);
    EXPECT_EQ(message->data, "latest");
    EXPECT_FALSE(late->take());

    // A volatile subscription gets no history.
    auto late_volatile = node->create_subscription<rclpp::msg::String>(
        "sub_latched", keep_last(1), [](const rclpp::msg::String&) {});
    EXPECT_FALSE(late_volatile->take());
}

TEST(subscription_tests, incompatible_qos_is_not_delivered) {
    rclpp::Context context;
    auto node = context.create_node("mismatch");
    auto reliable = node->create_subscription<rclpp::msg::Int64>(
        "sub_qos_mismatch", rclpp::QOS_PROFILE_DEFAULT, ignore_int64);
    auto best_effort_sub = node->create_subscription<rclpp::msg::Int64>(
        "sub_qos_mismatch", rclpp::QOS_PROFILE_SENSOR_DATA, ignore_int64);
    auto publisher = node->create_publisher<rclpp::msg::Int64>(
        "sub_qos_mismatch", rclpp::QOS_PROFILE_SENSOR_DATA);

    publisher.publish(rclpp::msg::Int64{1});
    EXPECT_FALSE(reliable->take());
    EXPECT_TRUE(best_effort_sub->take());
}

TEST(subscription_tests, endpoints_match_on_type_and_conventions) {
    rclpp::Context context;
    auto node = context.create_node("matching");
    auto int_sub = node->create_subscription<rclpp::msg::Int64>(
        "sub_matching", rclpp::QOS_PROFILE_DEFAULT, ignore_int64);

    rclpp::QoSProfile raw = rclpp::QOS_PROFILE_DEFAULT;
    raw.avoid_ros_namespace_conventions = true;
    auto raw_sub = node->create_subscription<rclpp::msg::Int64>(
        "sub_matching", raw, ignore_int64);

    auto string_pub = node->create_publisher<rclpp::msg::String>("sub_matching");
    string_pub.publish(rclpp::msg::String{"not an integer"});
    EXPECT_FALSE(int_sub->take());
    EXPECT_FALSE(raw_sub->take());

    auto int_pub = node->create_publisher<rclpp::msg::Int64>("sub_matching");
    int_pub.publish(rclpp::msg::Int64{3});
    EXPECT_TRUE(int_sub->take());
    EXPECT_FALSE(raw_sub->take());
}

TEST(subscription_tests, system_default_qos_behaves_like_keep_last_10) {
    rclpp::Context context;
    auto node = context.create_node("defaults");
    auto subscription = node->create_subscription<rclpp::msg::Int64>(
        "sub_system_default", rclpp::QOS_PROFILE_SYSTEM_DEFAULT, ignore_int64);
    auto publisher = node->create_publisher<rclpp::msg::Int64>(
        "sub_system_default", rclpp::QOS_PROFILE_SYSTEM_DEFAULT);

    for (int64_t i = 0; i < 15; ++i) {
        publisher.publish(rclpp::msg::Int64{i});
    }
    int count = 0;
    int64_t first = -1;
    while (auto message = subscription->take()) {
        if (count++ == 0) {
            first = message->data;
        }
    }
    EXPECT_EQ(count, 10);
    EXPECT_EQ(first, 5);
}

TEST(subscription_tests, take_after_shutdown_is_a_real_fault) {
    rclpp::Context context;
    auto node = context.create_node("orphan");
    auto subscription = node->create_subscription<rclpp::msg::Int64>(
        "sub_after_shutdown", rclpp::QOS_PROFILE_DEFAULT, ignore_int64);
    context.shutdown();

    try {
        subscription->take();
        FAIL() << "expected TakeError";
    } catch (const rclpp::TakeError& e) {
        EXPECT_EQ(e.code(), rclpp::ReturnCode::SubscriptionInvalid);
    }
    EXPECT_THROW(subscription->publisher_count(), rclpp::Error);
}

TEST(subscription_tests, creation_errors) {
    rclpp::Context context;
    auto node = context.create_node("broken");
    try {
        node->create_subscription<rclpp::msg::Int64>(
            "1starts_with_digit", rclpp::QOS_PROFILE_DEFAULT, ignore_int64);
        FAIL() << "expected SubscriptionCreationError";
    } catch (const rclpp::SubscriptionCreationError& e) {
        EXPECT_EQ(e.code(), rclpp::ReturnCode::TopicNameInvalid);
    }
    try {
        node->create_subscription<rclpp::msg::Int64>(
            std::string("chat\0ter", 8), rclpp::QOS_PROFILE_DEFAULT,
            ignore_int64);
        FAIL() << "expected SubscriptionCreationError";
    } catch (const rclpp::SubscriptionCreationError& e) {
        EXPECT_EQ(e.code(), rclpp::ReturnCode::TopicNameInvalid);
    }
    EXPECT_EQ(node->subscription_count(), 0u);
}

TEST(subscription_tests, topic_name_is_fully_qualified) {
    rclpp::Context context;
    auto node = context.create_node("listener", "/robot");
    auto subscription = node->create_subscription<rclpp::msg::Int64>(
        "{node}/input", rclpp::QOS_PROFILE_DEFAULT, ignore_int64);
    EXPECT_EQ(subscription->topic_name(), "/robot/listener/input");
}

TEST(subscription_tests, dispatch_interface_runs_callback) {
    rclpp::Context context;
    auto node = context.create_node("dispatch");
    std::vector<std::string> received;
    auto subscription = node->create_subscription<rclpp::msg::String>(
        "sub_dispatch", rclpp::QOS_PROFILE_DEFAULT,
        [&received](const rclpp::msg::String& message) {
            received.push_back(message.data);
        });
    auto publisher = node->create_publisher<rclpp::msg::String>("sub_dispatch");
    publisher.publish(rclpp::msg::String{"via base"});

    std::shared_ptr<rclpp::SubscriptionBase> base = subscription;
    rclpp::MessageBuffer buffer = base->create_message();
    ASSERT_TRUE(rclpp::take_type_erased(*base->handle(), buffer));
    base->handle_message(buffer);
    EXPECT_EQ(received, (std::vector<std::string>{"via base"}));

    rclpp::MessageBuffer empty = base->create_message();
    EXPECT_FALSE(rclpp::take_type_erased(*base->handle(), empty));
}

TEST(message_buffer_tests, type_mismatch_is_rejected) {
    rclpp::MessageBuffer buffer(
        rclpp::message_traits<rclpp::msg::Int64>::type_support());
    EXPECT_EQ(buffer.as<rclpp::msg::Int64>().data, 0);
    EXPECT_THROW(buffer.as<rclpp::msg::String>(), std::invalid_argument);
    EXPECT_THROW(rclpp::MessageBuffer(nullptr), std::invalid_argument);
}
