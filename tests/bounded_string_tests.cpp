#include <gtest/gtest.h>

#include <rclpp/rclpp.hpp>

#include <string>

TEST(bounded_string_tests, accepts_values_up_to_the_bound) {
    rclpp::BoundedString<5> empty;
    EXPECT_TRUE(empty.empty());

    const rclpp::BoundedString<5> full(std::string("hello"));
    EXPECT_EQ(full.str(), "hello");
    EXPECT_EQ(full.size(), 5u);
    EXPECT_EQ(rclpp::BoundedString<5>::upper_bound, 5u);
}

TEST(bounded_string_tests, rejects_values_over_the_bound) {
    try {
        rclpp::BoundedString<5> too_long(std::string("hello!"));
        FAIL() << "expected StringExceedsBoundsError";
    } catch (const rclpp::StringExceedsBoundsError& e) {
        EXPECT_EQ(e.length(), 6u);
        EXPECT_EQ(e.upper_bound(), 5u);
        EXPECT_EQ(e.code(), rclpp::ReturnCode::InvalidArgument);
    }
    EXPECT_THROW(rclpp::BoundedString<0>(std::string("x")), rclpp::Error);
}

TEST(bounded_string_tests, message_roundtrip) {
    using Label = rclpp::msg::BoundedString<16>;
    static_assert(rclpp::Message<Label>);

    rclpp::Context context;
    auto node = context.create_node("labels");
    auto subscription = node->create_subscription<Label>(
        "bounded_roundtrip", rclpp::QOS_PROFILE_DEFAULT, [](const Label&) {});
    auto publisher = node->create_publisher<Label>("bounded_roundtrip");

    const Label sent{rclpp::BoundedString<16>(std::string("sixteen bytes!!!"))};
    publisher.publish(sent);
    auto received = subscription->take();
    ASSERT_TRUE(received);
    EXPECT_EQ(*received, sent);
}

TEST(bounded_string_tests, bounds_are_distinct_types) {
    rclpp::Context context;
    auto node = context.create_node("bounds");
    auto narrow = node->create_subscription<rclpp::msg::BoundedString<8>>(
        "bounded_types", rclpp::QOS_PROFILE_DEFAULT,
        [](const rclpp::msg::BoundedString<8>&) {});
    auto publisher =
        node->create_publisher<rclpp::msg::BoundedString<16>>("bounded_types");

    EXPECT_EQ(publisher.subscription_count(), 0u);
    publisher.publish(rclpp::msg::BoundedString<16>{
        rclpp::BoundedString<16>(std::string("twelve bytes"))});
    EXPECT_FALSE(narrow->take());
}
