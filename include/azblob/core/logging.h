// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define AZBLOB_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace azblob {

/**
 * @brief Log categories for the blob storage client
 */
struct log_category {
    static constexpr std::string_view credentials = "azblob.credentials";
    static constexpr std::string_view sas = "azblob.sas";
    static constexpr std::string_view auth = "azblob.auth";
    static constexpr std::string_view lister = "azblob.lister";
    static constexpr std::string_view download = "azblob.download";
    static constexpr std::string_view filter = "azblob.filter";
    static constexpr std::string_view transport = "azblob.transport";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for credential masking in log output
 */
struct masking_config {
    bool mask_signatures = true;    ///< SAS `sig=` values and SharedKey signatures
    bool mask_account_keys = true;  ///< `AccountKey=` values in connection strings
    std::string replacement = "[REDACTED]";

    static masking_config all_masked() {
        return {true, true, "[REDACTED]"};
    }

    static masking_config none() {
        return {false, false, "[REDACTED]"};
    }
};

/**
 * @brief Redacts storage secrets from log messages
 *
 * Signed URLs and connection strings end up in diagnostics all the time;
 * the masker keeps their shape readable while removing the secret parts.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::all_masked())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_signatures && !config_.mask_account_keys) {
            return input;
        }

        std::string result = input;

        if (config_.mask_signatures) {
            static const std::regex sas_sig(R"((sig=)[^&\s"]+)");
            static const std::regex shared_key(R"((SharedKey [^:\s]+:)[^\s"]+)");
            result = std::regex_replace(result, sas_sig, "$1" + config_.replacement);
            result = std::regex_replace(result, shared_key, "$1" + config_.replacement);
        }

        if (config_.mask_account_keys) {
            static const std::regex account_key(R"((AccountKey=)[^;\s"]+)");
            result = std::regex_replace(result, account_key, "$1" + config_.replacement);
        }

        return result;
    }

    /**
     * @brief Mask a bare secret, keeping the first four characters
     *
     * At most 20 mask characters are emitted so the secret length is not
     * disclosed.
     */
    [[nodiscard]] static auto mask_secret(const std::string& secret) -> std::string {
        constexpr std::size_t shown = 4;
        if (secret.size() <= shown) {
            return "***";
        }
        return secret.substr(0, shown) +
               std::string(std::min<std::size_t>(secret.size() - shown, 20), '*');
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    masking_config config_;
};

namespace detail {

inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured context for a storage operation
 */
struct blob_log_context {
    std::string blob_name;
    std::optional<std::string> container;
    std::optional<uint64_t> bytes_downloaded;
    std::optional<uint64_t> lines_processed;
    std::optional<uint32_t> page;
    std::optional<uint64_t> blob_count;
    std::optional<uint64_t> duration_ms;
    std::optional<int> http_status;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            std::string masked = masker ? masker->mask(value) : value;
            oss << "\"" << name << "\":\"" << detail::escape_json_string(masked) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!blob_name.empty()) add_field("blob", blob_name);
        if (container) add_field("container", *container);
        if (bytes_downloaded) add_uint("bytes_downloaded", *bytes_downloaded);
        if (lines_processed) add_uint("lines_processed", *lines_processed);
        if (page) add_uint("page", *page);
        if (blob_count) add_uint("blob_count", *blob_count);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (http_status) add_uint("http_status", static_cast<uint64_t>(*http_status));
        if (error_message) add_field("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<blob_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder class for creating structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::download)
 *     .with_message("Blob streamed")
 *     .with_blob_name("y=2024/m=03/d=15/h=09/m=00/PT1H.json")
 *     .with_lines_processed(1200)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_blob_name(std::string_view name) -> log_entry_builder& {
        ensure_context();
        entry_.context->blob_name = std::string(name);
        return *this;
    }

    auto with_bytes_downloaded(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes_downloaded = bytes;
        return *this;
    }

    auto with_lines_processed(uint64_t lines) -> log_entry_builder& {
        ensure_context();
        entry_.context->lines_processed = lines;
        return *this;
    }

    auto with_http_status(int status) -> log_entry_builder& {
        ensure_context();
        entry_.context->http_status = status;
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const blob_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = blob_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Logger instance injected into every storage component
 *
 * There is no process-wide instance; callers create one and share it with
 * the components that should report through it. Without a callback the
 * logger writes to stderr (or to logger_system when that integration is
 * compiled in).
 */
class storage_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const blob_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    storage_logger() {
#ifdef AZBLOB_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    ~storage_logger() {
#ifdef AZBLOB_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
        }
#endif
    }

    storage_logger(const storage_logger&) = delete;
    storage_logger& operator=(const storage_logger&) = delete;

    void set_level(log_level level) {
        min_level_.store(level);
#ifdef AZBLOB_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Route messages to a callback instead of the default sink
     *
     * The callback receives the masked message.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const blob_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {

        if (!is_enabled(level)) return;

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string masked = current_masker.mask(std::string(message));

        bool handled = false;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked, context);
                handled = true;
            }
        }

        if (format == log_output_format::json) {
            log_json(level, category, masked, context, file, line, function, current_masker, handled);
        } else if (!handled) {
            log_text(level, category, masked, context, current_masker);
        }
    }

    void flush() {
#ifdef AZBLOB_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void log_json(log_level level,
                  std::string_view category,
                  const std::string& message,
                  const blob_log_context* context,
                  const char* file,
                  int line,
                  const char* function,
                  const sensitive_info_masker& masker,
                  bool handled) {

        auto builder = log_entry_builder()
            .with_level(level)
            .with_category(category)
            .with_message(message);

        if (file || line > 0 || function) {
            builder.with_source_location(file, line, function);
        }

        if (context) {
            builder.with_context(*context);
        }

        auto entry = builder.build();
        std::string json_str = entry.to_json_with_masking(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
                return;
            }
        }

        if (!handled) {
            emit(level, json_str);
        }
    }

    void log_text(log_level level,
                  std::string_view category,
                  const std::string& message,
                  const blob_log_context* context,
                  const sensitive_info_masker& masker) {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ["
            << category << "] " << message;
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }
        emit(level, oss.str());
    }

    void emit([[maybe_unused]] log_level level, const std::string& line) {
#ifdef AZBLOB_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), line);
            return;
        }
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << line << "\n";
    }

#ifdef AZBLOB_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Return @p logger, or a fresh stderr logger when it is null
 */
inline auto ensure_logger(std::shared_ptr<storage_logger> logger) -> std::shared_ptr<storage_logger> {
    if (logger) {
        return logger;
    }
    return std::make_shared<storage_logger>();
}

// Logging macros for convenience
#define AZB_LOG(logger, level, category, message) \
    (logger).log(level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define AZB_LOG_CTX(logger, level, category, message, context) \
    (logger).log(level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define AZB_LOG_TRACE(logger, category, message) \
    AZB_LOG(logger, azblob::log_level::trace, category, message)

#define AZB_LOG_DEBUG(logger, category, message) \
    AZB_LOG(logger, azblob::log_level::debug, category, message)

#define AZB_LOG_INFO(logger, category, message) \
    AZB_LOG(logger, azblob::log_level::info, category, message)

#define AZB_LOG_WARN(logger, category, message) \
    AZB_LOG(logger, azblob::log_level::warn, category, message)

#define AZB_LOG_ERROR(logger, category, message) \
    AZB_LOG(logger, azblob::log_level::error, category, message)

#define AZB_LOG_INFO_CTX(logger, category, message, ctx) \
    AZB_LOG_CTX(logger, azblob::log_level::info, category, message, ctx)

#define AZB_LOG_WARN_CTX(logger, category, message, ctx) \
    AZB_LOG_CTX(logger, azblob::log_level::warn, category, message, ctx)

}  // namespace azblob
