/**
 * @file string.hpp
 * @brief Native unbounded string used inside native message layouts.
 *
 * `data` is always null‑terminated once initialized; `size` excludes the
 * terminator and `capacity` includes it.  The payload may contain
 * interior null bytes.
 */

#pragma once

#include <cstddef>
#include <cstring>
#include <new>

namespace rclpp::native {

struct String {
    char* data;
    size_t size;
    size_t capacity;
};

/// Initialize @p str to the empty string.  @return `false` on allocation failure.
inline bool string_init(String* str) {
    if (!str) {
        return false;
    }
    str->data = new (std::nothrow) char[1];
    if (!str->data) {
        str->size = 0;
        str->capacity = 0;
        return false;
    }
    str->data[0] = '\0';
    str->size = 0;
    str->capacity = 1;
    return true;
}

/// Release the storage of @p str and leave it zeroed.
inline void string_fini(String* str) {
    if (!str) {
        return;
    }
    delete[] str->data;
    str->data = nullptr;
    str->size = 0;
    str->capacity = 0;
}

/**
 * @brief Assign the first @p n bytes of @p value to @p str.
 *
 * Existing storage is reused when large enough.  On failure @p str is
 * left untouched.
 */
inline bool string_assignn(String* str, const char* value, size_t n) {
    if (!str || (!value && n > 0)) {
        return false;
    }
    if (n + 1 > str->capacity) {
        char* data = new (std::nothrow) char[n + 1];
        if (!data) {
            return false;
        }
        delete[] str->data;
        str->data = data;
        str->capacity = n + 1;
    }
    if (n > 0) {
        std::memcpy(str->data, value, n);
    }
    str->data[n] = '\0';
    str->size = n;
    return true;
}

inline bool string_assign(String* str, const char* value) {
    if (!value) {
        return false;
    }
    return string_assignn(str, value, std::strlen(value));
}

inline bool string_copy(const String* input, String* output) {
    if (!input || !output) {
        return false;
    }
    if (input == output) {
        return true;
    }
    return string_assignn(output, input->data, input->size);
}

} // namespace rclpp::native
