#include <gtest/gtest.h>

#include <rclpp/msg/string.hpp>
#include <rclpp/native/api.hpp>
#include <rclpp/native/arguments.hpp>
#include <rclpp/native/string.hpp>
#include <rclpp/native/validate.hpp>

#include <string>
#include <vector>

namespace native = rclpp::native;

namespace {
int node_name_verdict(const char* name) {
    int result = -1;
    size_t index = 0;
    EXPECT_EQ(native::validate_node_name(name, &result, &index),
              native::RET_OK);
    return result;
}

int namespace_verdict(const char* ns) {
    int result = -1;
    size_t index = 0;
    EXPECT_EQ(native::validate_namespace(ns, &result, &index), native::RET_OK);
    return result;
}

std::string expand(const char* topic, const char* name, const char* ns) {
    std::string out;
    EXPECT_EQ(native::expand_topic_name(topic, name, ns, &out),
              native::RET_OK)
        << native::get_error_string();
    return out;
}
} // anonymous namespace

TEST(native_validate_tests, node_names) {
    EXPECT_EQ(node_name_verdict("talker"), native::NAME_VALID);
    EXPECT_EQ(node_name_verdict("talker_2"), native::NAME_VALID);
    EXPECT_EQ(node_name_verdict(""), native::NAME_INVALID_IS_EMPTY_STRING);
    EXPECT_EQ(node_name_verdict("2talker"),
              native::NAME_INVALID_TOKEN_STARTS_WITH_NUMBER);
    EXPECT_EQ(node_name_verdict("bad-name"),
              native::NAME_INVALID_CONTAINS_UNALLOWED_CHARACTERS);
    EXPECT_EQ(node_name_verdict("a/b"),
              native::NAME_INVALID_CONTAINS_UNALLOWED_CHARACTERS);

    const std::string long_name(native::NODE_NAME_MAX_LENGTH + 1, 'n');
    EXPECT_EQ(node_name_verdict(long_name.c_str()),
              native::NAME_INVALID_TOO_LONG);
}

TEST(native_validate_tests, invalid_index_points_at_offender) {
    int result = -1;
    size_t index = 0;
    native::validate_node_name("abc$d", &result, &index);
    EXPECT_EQ(result, native::NAME_INVALID_CONTAINS_UNALLOWED_CHARACTERS);
    EXPECT_EQ(index, 3u);
}

TEST(native_validate_tests, namespaces) {
    EXPECT_EQ(namespace_verdict("/"), native::NAME_VALID);
    EXPECT_EQ(namespace_verdict("/robot"), native::NAME_VALID);
    EXPECT_EQ(namespace_verdict("/robot/arm_1"), native::NAME_VALID);
    EXPECT_EQ(namespace_verdict("robot"), native::NAME_INVALID_NOT_ABSOLUTE);
    EXPECT_EQ(namespace_verdict("/robot/"),
              native::NAME_INVALID_ENDS_WITH_FORWARD_SLASH);
    EXPECT_EQ(namespace_verdict("/robot//arm"),
              native::NAME_INVALID_CONTAINS_REPEATED_FORWARD_SLASH);
    EXPECT_EQ(namespace_verdict("/1robot"),
              native::NAME_INVALID_TOKEN_STARTS_WITH_NUMBER);
    EXPECT_EQ(namespace_verdict("/ro bot"),
              native::NAME_INVALID_CONTAINS_UNALLOWED_CHARACTERS);
}

TEST(native_validate_tests, topic_names_before_expansion) {
    int result = -1;
    native::validate_topic_name("chatter", &result, nullptr);
    EXPECT_EQ(result, native::NAME_VALID);
    native::validate_topic_name("~/status", &result, nullptr);
    EXPECT_EQ(result, native::NAME_VALID);
    native::validate_topic_name("{node}/status", &result, nullptr);
    EXPECT_EQ(result, native::NAME_VALID);
    native::validate_topic_name("a~", &result, nullptr);
    EXPECT_EQ(result, native::NAME_INVALID_MISPLACED_TILDE);
    native::validate_topic_name("{node/status", &result, nullptr);
    EXPECT_EQ(result, native::NAME_INVALID_CONTAINS_UNALLOWED_CHARACTERS);
    native::validate_topic_name("{node", &result, nullptr);
    EXPECT_EQ(result, native::NAME_INVALID_UNMATCHED_CURLY_BRACE);
    native::validate_topic_name("node}", &result, nullptr);
    EXPECT_EQ(result, native::NAME_INVALID_UNMATCHED_CURLY_BRACE);
}

TEST(native_validate_tests, null_arguments_are_errors) {
    int result = -1;
    EXPECT_EQ(native::validate_node_name(nullptr, &result, nullptr),
              native::RET_INVALID_ARGUMENT);
    EXPECT_EQ(native::validate_namespace("/", nullptr, nullptr),
              native::RET_INVALID_ARGUMENT);
    native::reset_error();
}

TEST(native_expand_tests, relative_and_absolute) {
    EXPECT_EQ(expand("chatter", "talker", "/"), "/chatter");
    EXPECT_EQ(expand("chatter", "talker", "/robot"), "/robot/chatter");
    EXPECT_EQ(expand("/chatter", "talker", "/robot"), "/chatter");
    EXPECT_EQ(expand("a/b", "talker", "/robot"), "/robot/a/b");
}

TEST(native_expand_tests, private_names_and_substitutions) {
    EXPECT_EQ(expand("~", "talker", "/robot"), "/robot/talker");
    EXPECT_EQ(expand("~/status", "talker", "/robot"), "/robot/talker/status");
    EXPECT_EQ(expand("~/status", "talker", "/"), "/talker/status");
    EXPECT_EQ(expand("{node}/status", "talker", "/robot"),
              "/robot/talker/status");
    EXPECT_EQ(expand("{ns}/status", "talker", "/robot"), "/robot/status");
    EXPECT_EQ(expand("{namespace}/status", "talker", "/"), "/status");
}

TEST(native_expand_tests, failures) {
    std::string out = "untouched";
    EXPECT_EQ(native::expand_topic_name("{unknown}/x", "talker", "/", &out),
              native::RET_TOPIC_NAME_INVALID);
    EXPECT_FALSE(native::get_error_string().empty());
    native::reset_error();

    EXPECT_EQ(native::expand_topic_name("bad topic", "talker", "/", &out),
              native::RET_TOPIC_NAME_INVALID);
    EXPECT_EQ(native::expand_topic_name("", "talker", "/", &out),
              native::RET_TOPIC_NAME_INVALID);
    EXPECT_EQ(out, "untouched");
    native::reset_error();
}

TEST(native_string_tests, assign_and_copy) {
    native::String a;
    native::String b;
    ASSERT_TRUE(native::string_init(&a));
    ASSERT_TRUE(native::string_init(&b));
    EXPECT_EQ(a.size, 0u);
    EXPECT_STREQ(a.data, "");

    ASSERT_TRUE(native::string_assign(&a, "hello"));
    EXPECT_EQ(a.size, 5u);
    EXPECT_STREQ(a.data, "hello");

    const size_t capacity = a.capacity;
    ASSERT_TRUE(native::string_assign(&a, "hi"));
    EXPECT_EQ(a.capacity, capacity); // storage reused
    EXPECT_STREQ(a.data, "hi");

    ASSERT_TRUE(native::string_copy(&a, &b));
    EXPECT_EQ(b.size, 2u);
    EXPECT_STREQ(b.data, "hi");

    const char with_null[] = {'a', '\0', 'b'};
    ASSERT_TRUE(native::string_assignn(&a, with_null, 3));
    EXPECT_EQ(a.size, 3u);
    EXPECT_EQ(a.data[2], 'b');

    native::string_fini(&a);
    native::string_fini(&b);
    EXPECT_EQ(a.data, nullptr);
    EXPECT_EQ(a.capacity, 0u);
}

TEST(native_arguments_tests, remaps_in_runtime_section) {
    const char* argv[] = {"app",      "--verbose", "--ros-args",
                          "-r",       "__node:=renamed",
                          "--remap",  "__ns:=/robot",
                          "-r",       "chatter:=talk",
                          "--",       "-r"};
    native::Arguments args;
    ASSERT_EQ(native::parse_arguments(11, argv, &args), native::RET_OK);
    EXPECT_EQ(args.argv.size(), 11u);
    ASSERT_TRUE(args.node_name);
    EXPECT_EQ(*args.node_name, "renamed");
    ASSERT_TRUE(args.node_namespace);
    EXPECT_EQ(*args.node_namespace, "/robot");
    ASSERT_EQ(args.topic_remaps.size(), 1u);
    EXPECT_EQ(args.topic_remaps[0].from, "chatter");
    EXPECT_EQ(args.topic_remaps[0].to, "talk");
}

TEST(native_arguments_tests, arguments_outside_runtime_section_are_ignored) {
    const char* argv[] = {"app", "-r", "whatever", "--unknown"};
    native::Arguments args;
    ASSERT_EQ(native::parse_arguments(4, argv, &args), native::RET_OK);
    EXPECT_FALSE(args.node_name);
    EXPECT_TRUE(args.topic_remaps.empty());
}

TEST(native_arguments_tests, malformed_runtime_arguments) {
    native::Arguments args;
    const char* unknown[] = {"app", "--ros-args", "--log-level", "debug"};
    EXPECT_EQ(native::parse_arguments(4, unknown, &args),
              native::RET_INVALID_ARGUMENT);

    native::Arguments args2;
    const char* dangling[] = {"app", "--ros-args", "-r"};
    EXPECT_EQ(native::parse_arguments(3, dangling, &args2),
              native::RET_INVALID_ARGUMENT);

    native::Arguments args3;
    const char* no_separator[] = {"app", "--ros-args", "-r", "chatter"};
    EXPECT_EQ(native::parse_arguments(4, no_separator, &args3),
              native::RET_INVALID_ARGUMENT);
    native::reset_error();
}

TEST(native_api_tests, context_lifecycle_codes) {
    native::context_t context = native::get_zero_initialized_context();
    EXPECT_FALSE(native::context_is_valid(&context));
    EXPECT_EQ(native::shutdown(&context), native::RET_NOT_INIT);

    ASSERT_EQ(native::init(0, nullptr, &context), native::RET_OK);
    EXPECT_TRUE(native::context_is_valid(&context));
    EXPECT_EQ(native::init(0, nullptr, &context), native::RET_ALREADY_INIT);

    EXPECT_EQ(native::shutdown(&context), native::RET_OK);
    EXPECT_FALSE(native::context_is_valid(&context));
    EXPECT_EQ(native::shutdown(&context), native::RET_ALREADY_SHUTDOWN);

    EXPECT_EQ(native::context_fini(&context), native::RET_OK);
    EXPECT_EQ(context.impl, nullptr);
    native::reset_error();
}

TEST(native_api_tests, node_init_codes) {
    native::context_t context = native::get_zero_initialized_context();
    ASSERT_EQ(native::init(0, nullptr, &context), native::RET_OK);
    const native::node_options_t options = native::node_get_default_options();

    native::node_t node = native::get_zero_initialized_node();
    EXPECT_EQ(native::node_init(&node, "9lives", "", &context, &options),
              native::RET_NODE_INVALID_NAME);
    EXPECT_EQ(native::node_init(&node, "cat", "/bad//ns", &context, &options),
              native::RET_NODE_INVALID_NAMESPACE);
    EXPECT_EQ(node.impl, nullptr);

    ASSERT_EQ(native::node_init(&node, "cat", "pets", &context, &options),
              native::RET_OK);
    EXPECT_STREQ(native::node_get_namespace(&node), "/pets");
    EXPECT_STREQ(native::node_get_fully_qualified_name(&node), "/pets/cat");
    EXPECT_EQ(native::node_init(&node, "cat", "pets", &context, &options),
              native::RET_ALREADY_INIT);

    EXPECT_EQ(native::node_fini(&node), native::RET_OK);
    native::shutdown(&context);

    native::node_t late = native::get_zero_initialized_node();
    EXPECT_EQ(native::node_init(&late, "cat", "", &context, &options),
              native::RET_NOT_INIT);
    EXPECT_EQ(native::context_fini(&context), native::RET_OK);
    native::reset_error();
}

TEST(native_api_tests, take_on_empty_subscription_sets_no_error) {
    native::context_t context = native::get_zero_initialized_context();
    ASSERT_EQ(native::init(0, nullptr, &context), native::RET_OK);
    const native::node_options_t node_options =
        native::node_get_default_options();
    native::node_t node = native::get_zero_initialized_node();
    ASSERT_EQ(native::node_init(&node, "taker", "", &context, &node_options),
              native::RET_OK);

    const auto* support =
        rclpp::message_traits<rclpp::msg::String>::type_support();
    const native::subscription_options_t options =
        native::subscription_get_default_options();
    native::subscription_t subscription =
        native::get_zero_initialized_subscription();
    ASSERT_EQ(native::subscription_init(&subscription, &node, support,
                                        "native_empty_take", &options),
              native::RET_OK);
    EXPECT_STREQ(native::subscription_get_topic_name(&subscription),
                 "/native_empty_take");

    native::reset_error();
    native::msg::String message;
    support->init(&message);
    EXPECT_EQ(native::take(&subscription, &message),
              native::RET_SUBSCRIPTION_TAKE_FAILED);
    EXPECT_TRUE(native::get_error_string().empty());
    support->fini(&message);

    EXPECT_EQ(native::subscription_fini(&subscription, &node), native::RET_OK);
    EXPECT_EQ(native::node_fini(&node), native::RET_OK);
    EXPECT_EQ(native::context_fini(&context), native::RET_OK);
}

TEST(native_api_tests, incomplete_type_support_is_rejected) {
    native::context_t context = native::get_zero_initialized_context();
    ASSERT_EQ(native::init(0, nullptr, &context), native::RET_OK);
    const native::node_options_t node_options =
        native::node_get_default_options();
    native::node_t node = native::get_zero_initialized_node();
    ASSERT_EQ(native::node_init(&node, "n", "", &context, &node_options),
              native::RET_OK);

    native::message_type_support_t broken{"broken", 8, nullptr, nullptr,
                                          nullptr};
    const native::publisher_options_t options =
        native::publisher_get_default_options();
    native::publisher_t publisher = native::get_zero_initialized_publisher();
    EXPECT_EQ(native::publisher_init(&publisher, &node, &broken, "x", &options),
              native::RET_INVALID_ARGUMENT);

    EXPECT_EQ(native::node_fini(&node), native::RET_OK);
    EXPECT_EQ(native::context_fini(&context), native::RET_OK);
    native::reset_error();
}
