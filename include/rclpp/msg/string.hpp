/**
 * @file string.hpp
 * @brief `msg::String`: a single unbounded string field.
 */

#pragma once

#include <rclpp/message.hpp>
#include <rclpp/native/string.hpp>
#include <rclpp/native/types.hpp>

#include <memory>
#include <new>
#include <string>

namespace rclpp {

namespace native::msg {
struct String {
    native::String data;
};
} // namespace native::msg

namespace msg {
struct String {
    std::string data;

    bool operator==(const String&) const = default;
};
} // namespace msg

template <> struct message_traits<msg::String> {
    using native_type = native::msg::String;

    static const native::message_type_support_t* type_support() {
        static const native::message_type_support_t support{
            "rclpp/msg/String", sizeof(native_type),
            [](void* message) {
                native::string_init(&static_cast<native_type*>(message)->data);
            },
            [](void* message) {
                native::string_fini(&static_cast<native_type*>(message)->data);
            },
            [](const void* source, void* destination) {
                return native::string_copy(
                    &static_cast<const native_type*>(source)->data,
                    &static_cast<native_type*>(destination)->data);
            }};
        return &support;
    }

    static native_type* get_native_message(const msg::String& message) {
        auto native = std::make_unique<native_type>();
        if (!native::string_init(&native->data) ||
            !native::string_assignn(&native->data, message.data.data(),
                                    message.data.size())) {
            native::string_fini(&native->data);
            throw std::bad_alloc();
        }
        return native.release();
    }

    static msg::String from_native_message(const native_type& native) {
        return msg::String{std::string(native.data.data, native.data.size)};
    }

    static void release_native_message(native_type* native) {
        std::unique_ptr<native_type> owned(native);
        if (owned) {
            native::string_fini(&owned->data);
        }
    }
};

} // namespace rclpp
