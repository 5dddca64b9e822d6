/**
 * @file message.hpp
 * @brief Binding of C++ message types to their native representation.
 *
 * A message type `T` is usable with rclpp once `message_traits<T>` is
 * specialized:
 *
 * @code
 * template <> struct message_traits<MyMsg> {
 *     using native_type = native_my_msg_t;
 *     static const native::message_type_support_t* type_support();
 *     static native_type* get_native_message(const MyMsg&);
 *     static MyMsg from_native_message(const native_type&);
 *     static void release_native_message(native_type*);
 * };
 * @endcode
 *
 * rclpp never looks inside a native message; it only hands it to the
 * middleware and back to the traits.
 */

#pragma once

#include <rclpp/native/types.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <utility>

namespace rclpp {

template <typename T> struct message_traits;

template <typename T>
concept Message = requires(const T& message,
                           const typename message_traits<T>::native_type& native,
                           typename message_traits<T>::native_type* owned) {
    {
        message_traits<T>::type_support()
        } -> std::same_as<const native::message_type_support_t*>;
    {
        message_traits<T>::get_native_message(message)
        } -> std::same_as<typename message_traits<T>::native_type*>;
    { message_traits<T>::from_native_message(native) } -> std::same_as<T>;
    message_traits<T>::release_native_message(owned);
};

/// Releases a native message through its traits exactly once.
template <Message T> struct NativeMessageDeleter {
    void operator()(typename message_traits<T>::native_type* native) const {
        message_traits<T>::release_native_message(native);
    }
};

template <Message T>
using NativeMessagePtr =
    std::unique_ptr<typename message_traits<T>::native_type,
                    NativeMessageDeleter<T>>;

// ==========================================================================
// MessageBuffer – type‑erased native message storage
// ==========================================================================

/**
 * @brief Default valued native message of a type known only through its
 *        type support.
 *
 * The buffer is initialized through the type support on construction
 * and finalized on destruction, so whatever a `take` copied into it is
 * released with it.
 */
class MessageBuffer {
  private:
    const native::message_type_support_t* m_type_support;
    std::unique_ptr<std::max_align_t[]> m_storage;

  public:
    explicit MessageBuffer(const native::message_type_support_t* type_support)
        : m_type_support(type_support) {
        if (!m_type_support) {
            throw std::invalid_argument("type support must not be null");
        }
        const size_t slots =
            (m_type_support->size + sizeof(std::max_align_t) - 1) /
            sizeof(std::max_align_t);
        m_storage =
            std::make_unique<std::max_align_t[]>(std::max<size_t>(slots, 1));
        m_type_support->init(m_storage.get());
    }

    ~MessageBuffer() {
        if (m_storage) {
            m_type_support->fini(m_storage.get());
        }
    }

    MessageBuffer(const MessageBuffer&) = delete;
    MessageBuffer& operator=(const MessageBuffer&) = delete;

    MessageBuffer(MessageBuffer&& other) noexcept
        : m_type_support(other.m_type_support),
          m_storage(std::move(other.m_storage)) {}

    MessageBuffer& operator=(MessageBuffer&& other) noexcept {
        if (this != &other) {
            if (m_storage) {
                m_type_support->fini(m_storage.get());
            }
            m_type_support = other.m_type_support;
            m_storage = std::move(other.m_storage);
        }
        return *this;
    }

    void* get() { return m_storage.get(); }
    const void* get() const { return m_storage.get(); }

    const native::message_type_support_t* type_support() const {
        return m_type_support;
    }

    /// View the buffer as the native type of message `T`.
    template <Message T>
    const typename message_traits<T>::native_type& as() const {
        if (m_type_support != message_traits<T>::type_support()) {
            throw std::invalid_argument(
                "message buffer holds a different message type");
        }
        return *static_cast<const typename message_traits<T>::native_type*>(
            get());
    }
};

} // namespace rclpp
