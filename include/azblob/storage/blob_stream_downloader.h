/**
 * @file blob_stream_downloader.h
 * @brief Streamed blob download with gzip decoding and line dispatch
 */

#ifndef AZBLOB_STORAGE_BLOB_STREAM_DOWNLOADER_H
#define AZBLOB_STORAGE_BLOB_STREAM_DOWNLOADER_H

#include <azblob/core/logging.h>
#include <azblob/core/types.h>
#include <azblob/storage/http_transport.h>
#include <azblob/storage/storage_config.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace azblob {

/**
 * @brief Splits a byte stream into lines
 *
 * Complete lines are handed to the sink as soon as their terminating '\n'
 * arrives; the trailing fragment stays buffered until more data or
 * finish(). A trailing '\r' is stripped and whitespace-only lines are
 * dropped. The string_view passed to the sink is only valid for the
 * duration of the call.
 */
class line_assembler {
public:
    using line_sink = std::function<void(std::string_view)>;

    explicit line_assembler(line_sink sink);

    /**
     * @brief Append decoded bytes and dispatch every completed line
     */
    auto feed(std::string_view chunk) -> void;

    /**
     * @brief Dispatch the buffered fragment as the final line
     */
    auto finish() -> void;

    [[nodiscard]] auto buffered_bytes() const -> std::size_t { return buffer_.size(); }

private:
    auto dispatch(std::string_view line) -> void;

    line_sink sink_;
    std::string buffer_;
};

/**
 * @brief Per-call download options
 */
struct download_options {
    bool debug = false;  ///< log each line handler failure at debug level
};

/**
 * @brief Statistics for one completed download
 */
struct download_stats {
    uint64_t bytes_downloaded = 0;          ///< decoded bytes handed to the line splitter
    uint64_t lines_processed = 0;           ///< lines handed to the handler
    uint64_t line_errors = 0;               ///< lines whose handler failed
    uint64_t duration_ms = 0;
    uint64_t throughput_bytes_per_sec = 0;
    bool gzip = false;                      ///< body was gzip-encoded
};

/**
 * @brief Streams a blob and feeds it to a line handler
 *
 * The handler runs on the transport's callback, so the next network read
 * does not start until it returns; memory is bounded by one chunk plus one
 * partial line. Handler failures are counted and never abort the stream.
 *
 * @code
 * blob_stream_downloader downloader(transport, config, logger);
 * auto stats = downloader.stream_blob(blob_url, [&](std::string_view line) {
 *     records.push_back(parse(line));
 * });
 * @endcode
 */
class blob_stream_downloader {
public:
    using line_handler = std::function<result<void>(std::string_view)>;

    /**
     * @param transport HTTP transport; a curl transport is created when null
     * @param config Client configuration
     * @param logger Logger; a stderr logger is created when null
     */
    explicit blob_stream_downloader(std::shared_ptr<http_transport_interface> transport = nullptr,
                                    blob_client_config config = {},
                                    std::shared_ptr<storage_logger> logger = nullptr);

    /**
     * @brief Download a blob and dispatch its lines
     * @param blob_url Blob URL carrying a read SAS
     * @param handler Called once per non-blank line, in order
     * @param options Per-call options
     * @return Statistics, http_status_error / authentication_error for a
     *         non-200 response, stream_error for transport or gzip failures
     */
    [[nodiscard]] auto stream_blob(const std::string& blob_url,
                                   const line_handler& handler,
                                   download_options options = {}) const
        -> result<download_stats>;

    /**
     * @brief Overload for handlers that report failure only by throwing
     */
    template <typename Handler>
        requires std::is_void_v<std::invoke_result_t<Handler&, std::string_view>>
    [[nodiscard]] auto stream_blob(const std::string& blob_url,
                                   Handler&& handler,
                                   download_options options = {}) const
        -> result<download_stats> {
        line_handler wrapped = [&handler](std::string_view line) -> result<void> {
            handler(line);
            return {};
        };
        return stream_blob(blob_url, wrapped, options);
    }

private:
    std::shared_ptr<http_transport_interface> transport_;
    blob_client_config config_;
    std::shared_ptr<storage_logger> logger_;
};

}  // namespace azblob

#endif  // AZBLOB_STORAGE_BLOB_STREAM_DOWNLOADER_H
