/**
 * @file types.h
 * @brief Core type definitions for azblob
 */

#ifndef AZBLOB_CORE_TYPES_H
#define AZBLOB_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace azblob {

/**
 * @brief Error codes for blob storage operations
 *
 * Error code ranges:
 * - -100 to -109: Configuration Errors
 * - -110 to -119: Authentication Errors
 * - -120 to -129: HTTP Status Errors
 * - -130 to -139: Response Parsing Errors
 * - -140 to -149: Stream Errors
 * - -150 to -159: Line Handler Errors
 * - -200 to -209: Internal Errors
 */
enum class error_code {
    success = 0,

    // Configuration errors (-100 to -109)
    configuration_error = -100,
    invalid_argument = -101,

    // Authentication errors (-110 to -119)
    authentication_error = -110,

    // HTTP status errors (-120 to -129)
    http_status_error = -120,

    // Response parsing errors (-130 to -139)
    xml_parse_error = -130,

    // Stream errors (-140 to -149)
    stream_error = -140,
    decompression_error = -141,

    // Line handler errors (-150 to -159)
    line_handler_error = -150,

    // Internal errors (-200 to -209)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::configuration_error:
            return "configuration error";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::authentication_error:
            return "authentication error";
        case error_code::http_status_error:
            return "http status error";
        case error_code::xml_parse_error:
            return "xml parse error";
        case error_code::stream_error:
            return "stream error";
        case error_code::decompression_error:
            return "decompression error";
        case error_code::line_handler_error:
            return "line handler error";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code, message and the HTTP status that caused it
 */
struct error {
    error_code code;
    std::string message;
    std::optional<int> http_status;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, int status)
        : code(c), message(std::move(msg)), http_status(status) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Build the error for a non-200 HTTP response
 *
 * 401 and 403 mean the service rejected the signature and are reported as
 * authentication errors; everything else is an HTTP status error.
 */
[[nodiscard]] inline auto make_http_status_error(int status, const std::string& context) -> error {
    if (status == 401 || status == 403) {
        return error{error_code::authentication_error,
            context + ": HTTP " + std::to_string(status) + " (signature rejected)", status};
    }
    return error{error_code::http_status_error,
        context + ": HTTP " + std::to_string(status), status};
}

}  // namespace azblob

#endif  // AZBLOB_CORE_TYPES_H
