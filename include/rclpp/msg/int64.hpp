/**
 * @file int64.hpp
 * @brief `msg::Int64`: a single signed 64 bit integer.
 */

#pragma once

#include <rclpp/message.hpp>
#include <rclpp/native/types.hpp>

#include <cstdint>
#include <memory>

namespace rclpp {

namespace native::msg {
struct Int64 {
    int64_t data;
};
} // namespace native::msg

namespace msg {
struct Int64 {
    int64_t data = 0;

    bool operator==(const Int64&) const = default;
};
} // namespace msg

template <> struct message_traits<msg::Int64> {
    using native_type = native::msg::Int64;

    static const native::message_type_support_t* type_support() {
        static const native::message_type_support_t support{
            "rclpp/msg/Int64", sizeof(native_type),
            [](void* message) { static_cast<native_type*>(message)->data = 0; },
            [](void*) {},
            [](const void* source, void* destination) {
                *static_cast<native_type*>(destination) =
                    *static_cast<const native_type*>(source);
                return true;
            }};
        return &support;
    }

    static native_type* get_native_message(const msg::Int64& message) {
        return std::make_unique<native_type>(native_type{message.data})
            .release();
    }

    static msg::Int64 from_native_message(const native_type& native) {
        return msg::Int64{native.data};
    }

    static void release_native_message(native_type* native) {
        std::unique_ptr<native_type> owned(native);
    }
};

} // namespace rclpp
