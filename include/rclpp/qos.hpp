/**
 * @file qos.hpp
 * @brief Quality of service profiles.
 *
 * A QoSProfile is translated field for field into the native structure;
 * rclpp itself never branches on it.
 */

#pragma once

#include <rclpp/native/types.hpp>

#include <cstddef>

namespace rclpp {

enum class ReliabilityPolicy {
    SystemDefault = 0,
    /// Guarantee that samples are delivered, may retry multiple times.
    Reliable = 1,
    /// Attempt to deliver samples, but may lose them if the network is not
    /// robust.
    BestEffort = 2,
};

enum class HistoryPolicy {
    SystemDefault = 0,
    /// Only store up to `depth` samples.
    KeepLast = 1,
    /// Store all samples, subject to the middleware's resource limits.
    KeepAll = 2,
};

enum class DurabilityPolicy {
    SystemDefault = 0,
    /// The publisher persists samples for late‑joining subscriptions.
    TransientLocal = 1,
    /// No attempt is made to persist samples.
    Volatile = 2,
};

struct QoSProfile {
    HistoryPolicy history;
    size_t depth;
    ReliabilityPolicy reliability;
    DurabilityPolicy durability;
    bool avoid_ros_namespace_conventions;

    native::qos_profile_t to_native() const {
        native::qos_profile_t qos{};
        switch (history) {
        case HistoryPolicy::SystemDefault:
            qos.history = native::HISTORY_SYSTEM_DEFAULT;
            break;
        case HistoryPolicy::KeepLast:
            qos.history = native::HISTORY_KEEP_LAST;
            break;
        case HistoryPolicy::KeepAll:
            qos.history = native::HISTORY_KEEP_ALL;
            break;
        }
        switch (reliability) {
        case ReliabilityPolicy::SystemDefault:
            qos.reliability = native::RELIABILITY_SYSTEM_DEFAULT;
            break;
        case ReliabilityPolicy::Reliable:
            qos.reliability = native::RELIABILITY_RELIABLE;
            break;
        case ReliabilityPolicy::BestEffort:
            qos.reliability = native::RELIABILITY_BEST_EFFORT;
            break;
        }
        switch (durability) {
        case DurabilityPolicy::SystemDefault:
            qos.durability = native::DURABILITY_SYSTEM_DEFAULT;
            break;
        case DurabilityPolicy::TransientLocal:
            qos.durability = native::DURABILITY_TRANSIENT_LOCAL;
            break;
        case DurabilityPolicy::Volatile:
            qos.durability = native::DURABILITY_VOLATILE;
            break;
        }
        qos.depth = depth;
        qos.avoid_ros_namespace_conventions = avoid_ros_namespace_conventions;
        return qos;
    }
};

inline constexpr size_t SYSTEM_DEFAULT_DEPTH = 0;

/// Timely readings over complete ones: best effort with a small queue.
inline constexpr QoSProfile QOS_PROFILE_SENSOR_DATA{
    HistoryPolicy::KeepLast, 5, ReliabilityPolicy::BestEffort,
    DurabilityPolicy::Volatile, false};

/// Large queue so that requests are not lost while a server is unreachable.
inline constexpr QoSProfile QOS_PROFILE_PARAMETERS{
    HistoryPolicy::KeepLast, 1000, ReliabilityPolicy::Reliable,
    DurabilityPolicy::Volatile, false};

/// Keep last 10, reliable, volatile.
inline constexpr QoSProfile QOS_PROFILE_DEFAULT{
    HistoryPolicy::KeepLast, 10, ReliabilityPolicy::Reliable,
    DurabilityPolicy::Volatile, false};

inline constexpr QoSProfile QOS_PROFILE_SERVICES_DEFAULT{
    HistoryPolicy::KeepLast, 10, ReliabilityPolicy::Reliable,
    DurabilityPolicy::Volatile, false};

inline constexpr QoSProfile QOS_PROFILE_PARAMETER_EVENTS{
    HistoryPolicy::KeepAll, 1000, ReliabilityPolicy::Reliable,
    DurabilityPolicy::Volatile, false};

/// Every policy left to the middleware's defaults.
inline constexpr QoSProfile QOS_PROFILE_SYSTEM_DEFAULT{
    HistoryPolicy::SystemDefault, SYSTEM_DEFAULT_DEPTH,
    ReliabilityPolicy::SystemDefault, DurabilityPolicy::SystemDefault, false};

} // namespace rclpp
