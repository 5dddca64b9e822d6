/**
 * @file rclpp.hpp
 * @brief Header‑only publish/subscribe client runtime.
 *
 *   * **Context**      – process level initialization, root of ownership.
 *   * **Node**         – named participant creating endpoints.
 *   * **Publisher**    – typed send endpoint.
 *   * **Subscription** – typed receive endpoint with a callback.
 *   * **Executor**     – dispatch loop running subscription callbacks.
 *
 * Every native resource lives in a @ref rclpp::ResourceHandle, which
 * serializes access to it and finalizes it after everything created from
 * it.  The native layer itself is an in‑process loopback middleware
 * built on `Boost.Lockfree`; logging goes through `quill` when
 * `RCLPP_USE_QUILL` is defined.
 *
 * @note All public types live inside the `rclpp` namespace.
 */

#pragma once

#include <rclpp/bounded_string.hpp>
#include <rclpp/context.hpp>
#include <rclpp/error.hpp>
#include <rclpp/executor.hpp>
#include <rclpp/logging.hpp>
#include <rclpp/message.hpp>
#include <rclpp/msg/bounded_string.hpp>
#include <rclpp/msg/int64.hpp>
#include <rclpp/msg/string.hpp>
#include <rclpp/node.hpp>
#include <rclpp/publisher.hpp>
#include <rclpp/qos.hpp>
#include <rclpp/resource_handle.hpp>
#include <rclpp/subscription.hpp>
