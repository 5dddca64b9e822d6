/**
 * @file bounded_string.hpp
 * @brief `msg::BoundedString<N>`: a single string field of at most `N`
 *        bytes.
 *
 * Every bound is its own message type: a `BoundedString<8>` publisher
 * never matches a `BoundedString<16>` subscription.
 */

#pragma once

#include <rclpp/bounded_string.hpp>
#include <rclpp/message.hpp>
#include <rclpp/native/string.hpp>
#include <rclpp/native/types.hpp>

#include <cstddef>
#include <memory>
#include <new>
#include <string>

namespace rclpp {

namespace native::msg {
/// Shared by every bound; the type support enforces it.
struct BoundedString {
    native::String data;
};
} // namespace native::msg

namespace msg {
template <size_t N> struct BoundedString {
    ::rclpp::BoundedString<N> data;

    bool operator==(const BoundedString&) const = default;
};
} // namespace msg

template <size_t N> struct message_traits<msg::BoundedString<N>> {
    using native_type = native::msg::BoundedString;

    static const native::message_type_support_t* type_support() {
        static const std::string type_name =
            "rclpp/msg/BoundedString" + std::to_string(N);
        static const native::message_type_support_t support{
            type_name.c_str(), sizeof(native_type),
            [](void* message) {
                native::string_init(&static_cast<native_type*>(message)->data);
            },
            [](void* message) {
                native::string_fini(&static_cast<native_type*>(message)->data);
            },
            [](const void* source, void* destination) {
                const native::String& from =
                    static_cast<const native_type*>(source)->data;
                if (from.size > N) {
                    return false;
                }
                return native::string_copy(
                    &from, &static_cast<native_type*>(destination)->data);
            }};
        return &support;
    }

    static native_type* get_native_message(const msg::BoundedString<N>& message) {
        auto native = std::make_unique<native_type>();
        const std::string& value = message.data.str();
        if (!native::string_init(&native->data) ||
            !native::string_assignn(&native->data, value.data(), value.size())) {
            native::string_fini(&native->data);
            throw std::bad_alloc();
        }
        return native.release();
    }

    static msg::BoundedString<N> from_native_message(const native_type& native) {
        return msg::BoundedString<N>{::rclpp::BoundedString<N>(
            std::string(native.data.data, native.data.size))};
    }

    static void release_native_message(native_type* native) {
        std::unique_ptr<native_type> owned(native);
        if (owned) {
            native::string_fini(&owned->data);
        }
    }
};

} // namespace rclpp
