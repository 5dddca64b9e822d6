/**
 * @file error.hpp
 * @brief Return codes and the exception hierarchy of rclpp.
 *
 * Every native status code maps onto exactly one @ref ReturnCode.
 * Construction and operation failures are thrown as one of the
 * exception types below; each carries the ReturnCode so that callers
 * can tell e.g. an invalid node name from an invalid namespace.
 */

#pragma once

#include <rclpp/native/types.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace rclpp {

enum class ReturnCode : int {
    Ok = native::RET_OK,
    Error = native::RET_ERROR,
    BadAlloc = native::RET_BAD_ALLOC,
    InvalidArgument = native::RET_INVALID_ARGUMENT,
    AlreadyInit = native::RET_ALREADY_INIT,
    NotInit = native::RET_NOT_INIT,
    TopicNameInvalid = native::RET_TOPIC_NAME_INVALID,
    AlreadyShutdown = native::RET_ALREADY_SHUTDOWN,
    NodeInvalid = native::RET_NODE_INVALID,
    NodeInvalidName = native::RET_NODE_INVALID_NAME,
    NodeInvalidNamespace = native::RET_NODE_INVALID_NAMESPACE,
    PublisherInvalid = native::RET_PUBLISHER_INVALID,
    SubscriptionInvalid = native::RET_SUBSCRIPTION_INVALID,
    SubscriptionTakeFailed = native::RET_SUBSCRIPTION_TAKE_FAILED,
};

/// Codes the native layer never documented collapse onto `Error`.
inline ReturnCode to_return_code(native::ret_t ret) {
    switch (ret) {
    case native::RET_OK:
    case native::RET_ERROR:
    case native::RET_BAD_ALLOC:
    case native::RET_INVALID_ARGUMENT:
    case native::RET_ALREADY_INIT:
    case native::RET_NOT_INIT:
    case native::RET_TOPIC_NAME_INVALID:
    case native::RET_ALREADY_SHUTDOWN:
    case native::RET_NODE_INVALID:
    case native::RET_NODE_INVALID_NAME:
    case native::RET_NODE_INVALID_NAMESPACE:
    case native::RET_PUBLISHER_INVALID:
    case native::RET_SUBSCRIPTION_INVALID:
    case native::RET_SUBSCRIPTION_TAKE_FAILED:
        return static_cast<ReturnCode>(ret);
    default:
        return ReturnCode::Error;
    }
}

inline const char* to_string(ReturnCode code) {
    switch (code) {
    case ReturnCode::Ok:
        return "ok";
    case ReturnCode::Error:
        return "unspecified error";
    case ReturnCode::BadAlloc:
        return "allocation failure";
    case ReturnCode::InvalidArgument:
        return "invalid argument";
    case ReturnCode::AlreadyInit:
        return "already initialized";
    case ReturnCode::NotInit:
        return "not initialized";
    case ReturnCode::TopicNameInvalid:
        return "invalid topic name";
    case ReturnCode::AlreadyShutdown:
        return "already shut down";
    case ReturnCode::NodeInvalid:
        return "node invalid";
    case ReturnCode::NodeInvalidName:
        return "invalid node name";
    case ReturnCode::NodeInvalidNamespace:
        return "invalid node namespace";
    case ReturnCode::PublisherInvalid:
        return "publisher invalid";
    case ReturnCode::SubscriptionInvalid:
        return "subscription invalid";
    case ReturnCode::SubscriptionTakeFailed:
        return "no message available";
    }
    return "unknown";
}

// ==========================================================================
// Exceptions
// ==========================================================================

/// Base of every error rclpp throws.
class Error : public std::runtime_error {
  private:
    ReturnCode m_code;

  public:
    Error(ReturnCode code, const std::string& what_arg)
        : std::runtime_error(what_arg), m_code(code) {}

    ReturnCode code() const noexcept { return m_code; }
};

/// Context could not be initialized.  There is no degraded mode.
class InitializationError : public Error {
  public:
    using Error::Error;
};

class NodeCreationError : public Error {
  public:
    using Error::Error;
};

class PublisherCreationError : public Error {
  public:
    using Error::Error;
};

class SubscriptionCreationError : public Error {
  public:
    using Error::Error;
};

class PublishError : public Error {
  public:
    using Error::Error;
};

/// A real take fault.  "Nothing available" is never reported this way.
class TakeError : public Error {
  public:
    using Error::Error;
};

/// A value is longer than the bound of the BoundedString it was meant for.
class StringExceedsBoundsError : public Error {
  private:
    size_t m_length;
    size_t m_upper_bound;

  public:
    StringExceedsBoundsError(size_t length, size_t upper_bound)
        : Error(ReturnCode::InvalidArgument,
                "string of length " + std::to_string(length) +
                    " exceeds upper bound " + std::to_string(upper_bound)),
          m_length(length), m_upper_bound(upper_bound) {}

    size_t length() const noexcept { return m_length; }
    size_t upper_bound() const noexcept { return m_upper_bound; }
};

/**
 * @brief Throw @p Exception for a non‑OK @p ret.
 *
 * The message combines @p what, the code and the native error string,
 * which is reset afterwards.
 */
template <typename Exception>
void throw_on_error(native::ret_t ret, const std::string& what) {
    if (ret == native::RET_OK) {
        return;
    }
    const ReturnCode code = to_return_code(ret);
    std::string message = what + ": " + to_string(code);
    if (!native::get_error_string().empty()) {
        message += " (" + native::get_error_string() + ")";
    }
    native::reset_error();
    throw Exception(code, message);
}

/**
 * @brief Throw @p Exception with @p code if @p value holds a null
 *        character, which the native layer would read as its end.
 */
template <typename Exception>
void require_c_string(const std::string& value, ReturnCode code,
                      const std::string& what) {
    if (value.find('\0') != std::string::npos) {
        throw Exception(code, what + ": " + to_string(code) +
                                  " (embedded null character)");
    }
}

} // namespace rclpp
