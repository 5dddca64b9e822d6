/**
 * @file bounded_string.hpp
 * @brief String value with a compile time upper bound on its length.
 */

#pragma once

#include <rclpp/error.hpp>

#include <cstddef>
#include <string>
#include <utility>

namespace rclpp {

/**
 * @tparam N Maximum length in bytes, terminator not included.
 *
 * The bound is checked once, on construction; afterwards the value is
 * immutable.
 */
template <size_t N> class BoundedString {
  private:
    std::string m_data;

  public:
    static constexpr size_t upper_bound = N;

    BoundedString() = default;

    /// @throws StringExceedsBoundsError if @p value is longer than `N`.
    explicit BoundedString(std::string value) : m_data(std::move(value)) {
        if (m_data.size() > N) {
            throw StringExceedsBoundsError(m_data.size(), N);
        }
    }

    const std::string& str() const { return m_data; }
    size_t size() const { return m_data.size(); }
    bool empty() const { return m_data.empty(); }

    bool operator==(const BoundedString&) const = default;
};

} // namespace rclpp
