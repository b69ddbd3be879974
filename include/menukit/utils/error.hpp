#pragma once

#include <string>
#include <string_view>
#include <stdexcept>
#include <variant>
#include <optional>
#include <source_location>

// C++20 compatibility - std::expected is C++23
#if __cplusplus >= 202302L
#include <expected>
#endif

namespace openflow::menukit {

enum class ErrorCode {
    SUCCESS = 0,

    // Configuration errors
    CONFIG_INVALID_FORMAT = 1000,
    CONFIG_INVALID_VALUE = 1002,
    CONFIG_FILE_NOT_FOUND = 1003,
    CONFIG_WRITE_FAILED = 1004,

    // Host element errors
    ELEMENT_NOT_FOUND = 2000,
    ELEMENT_INVALID_BOUNDS = 2002,

    // Event registry errors
    LISTENER_NOT_FOUND = 3000,

    // Graphics host errors
    GRAPHICS_INIT_FAILED = 5000,

    // System errors
    SYSTEM_NOT_INITIALIZED = 6000,
    SYSTEM_ALREADY_RUNNING = 6001,

    // Generic errors
    INVALID_PARAMETER = 8000,
    OPERATION_FAILED = 8002
};

class Error {
public:
    explicit Error(ErrorCode code,
                   std::source_location location = std::source_location::current())
        : code_(code), message_(), location_(location) {}

    Error(ErrorCode code,
          const std::string& message,
          std::source_location location = std::source_location::current())
        : code_(code), message_(message), location_(location) {}

    Error(ErrorCode code,
          std::string&& message,
          std::source_location location = std::source_location::current())
        : code_(code), message_(std::move(message)), location_(location) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::source_location& location() const noexcept { return location_; }

    std::string to_string() const;

    bool operator==(const Error& other) const noexcept {
        return code_ == other.code_;
    }

    bool operator==(ErrorCode code) const noexcept {
        return code_ == code;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::source_location location_;
};

// C++20 compatible implementation of std::expected (must come before Result typedef)
#if __cplusplus < 202302L
template<typename T>
class unexpected {
private:
    T error_;

public:
    constexpr explicit unexpected(T&& error) : error_(std::move(error)) {}
    constexpr explicit unexpected(const T& error) : error_(error) {}

    constexpr const T& value() const& { return error_; }
    constexpr T& value() & { return error_; }
    constexpr T&& value() && { return std::move(error_); }
};

template<typename T, typename E>
class expected {
private:
    std::variant<T, E> data_;

public:
    constexpr expected() = default;
    constexpr expected(const T& value) : data_(value) {}
    constexpr expected(T&& value) : data_(std::move(value)) {}
    constexpr expected(const unexpected<E>& unexp) : data_(std::in_place_index<1>, unexp.value()) {}
    constexpr expected(unexpected<E>&& unexp) : data_(std::in_place_index<1>, std::move(unexp).value()) {}

    constexpr bool has_value() const { return data_.index() == 0; }
    constexpr explicit operator bool() const { return has_value(); }

    constexpr const T& value() const& { return std::get<0>(data_); }
    constexpr T& value() & { return std::get<0>(data_); }
    constexpr T&& value() && { return std::get<0>(std::move(data_)); }

    template<typename U>
    constexpr T value_or(U&& fallback) const& {
        return has_value() ? std::get<0>(data_) : static_cast<T>(std::forward<U>(fallback));
    }

    constexpr const E& error() const& { return std::get<1>(data_); }
    constexpr E& error() & { return std::get<1>(data_); }
    constexpr E&& error() && { return std::get<1>(std::move(data_)); }

    constexpr const T& operator*() const& { return value(); }
    constexpr T& operator*() & { return value(); }
    constexpr T&& operator*() && { return std::move(value()); }

    constexpr const T* operator->() const { return &value(); }
    constexpr T* operator->() { return &value(); }
};

// Specialization for void
template<typename E>
class expected<void, E> {
private:
    std::optional<E> error_;

public:
    constexpr expected() = default;
    constexpr expected(const unexpected<E>& unexp) : error_(unexp.value()) {}
    constexpr expected(unexpected<E>&& unexp) : error_(std::move(unexp).value()) {}

    constexpr bool has_value() const { return !error_.has_value(); }
    constexpr explicit operator bool() const { return has_value(); }

    void value() const {
        if (error_.has_value()) {
            throw std::runtime_error("Expected contains error");
        }
    }

    constexpr const E& error() const& { return error_.value(); }
    constexpr E& error() & { return error_.value(); }
    constexpr E&& error() && { return std::move(error_.value()); }
};
#endif // __cplusplus < 202302L

#if __cplusplus >= 202302L
template<typename T>
using Result = std::expected<T, Error>;
using std::unexpected;
#else
template<typename T>
using Result = expected<T, Error>;
#endif

using VoidResult = Result<void>;

#define RETURN_IF_ERROR(expr) \
    do { \
        auto result_ = (expr); \
        if (!result_) { \
            return unexpected(result_.error()); \
        } \
    } while (0)

#define MAKE_ERROR(code, message) \
    ::openflow::menukit::Error(::openflow::menukit::ErrorCode::code, message)

#define MAKE_SIMPLE_ERROR(code) \
    ::openflow::menukit::Error(::openflow::menukit::ErrorCode::code)

// Helper function for making errors
inline Error make_error(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

const char* error_code_to_string(ErrorCode code) noexcept;

}  // namespace openflow::menukit
