/**
 * @file http_transport.h
 * @brief HTTP transport seam used by the lister and the downloader
 *
 * Production code uses curl_http_transport; tests inject a scripted
 * implementation of http_transport_interface.
 */

#ifndef AZBLOB_STORAGE_HTTP_TRANSPORT_H
#define AZBLOB_STORAGE_HTTP_TRANSPORT_H

#include <azblob/core/logging.h>
#include <azblob/core/types.h>
#include <azblob/storage/storage_config.h>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace azblob {

/// Request or response headers; response header names are lowercase
using http_headers = std::map<std::string, std::string>;

/**
 * @brief Status line and headers of a response
 */
struct http_response_head {
    int status_code = 0;
    http_headers headers;

    /**
     * @brief Case-insensitive header lookup
     */
    [[nodiscard]] auto get_header(std::string_view name) const -> std::optional<std::string>;
};

/**
 * @brief Fully buffered response
 */
struct http_response : http_response_head {
    std::string body;
};

/**
 * @brief HTTP transport interface
 *
 * This interface allows for dependency injection of HTTP clients,
 * enabling mock implementations for testing.
 */
class http_transport_interface {
public:
    /// Called once with the status and headers before any body bytes
    using head_callback = std::function<result<void>(const http_response_head&)>;

    /// Called for each body chunk, in order, exactly as received
    using chunk_callback = std::function<result<void>(std::string_view)>;

    virtual ~http_transport_interface() = default;

    /**
     * @brief Perform a GET and buffer the whole body
     *
     * Any HTTP status is returned as a response; only transport failures
     * are errors.
     */
    [[nodiscard]] virtual auto get(const std::string& url,
                                   const http_headers& headers) -> result<http_response> = 0;

    /**
     * @brief Perform a GET and deliver the body chunk by chunk
     *
     * The body is not content-decoded. An error returned by either callback
     * aborts the transfer and is returned unchanged; the next chunk is not
     * read until the chunk callback returns.
     */
    [[nodiscard]] virtual auto get_stream(const std::string& url,
                                          const http_headers& headers,
                                          const head_callback& on_head,
                                          const chunk_callback& on_chunk) -> result<void> = 0;
};

/**
 * @brief libcurl implementation of http_transport_interface
 *
 * Every request uses its own easy handle, so one instance may serve
 * concurrent callers.
 */
class curl_http_transport : public http_transport_interface {
public:
    explicit curl_http_transport(blob_client_config config = {},
                                 std::shared_ptr<storage_logger> logger = nullptr);

    ~curl_http_transport() override;

    curl_http_transport(const curl_http_transport&) = delete;
    auto operator=(const curl_http_transport&) -> curl_http_transport& = delete;
    curl_http_transport(curl_http_transport&&) noexcept;
    auto operator=(curl_http_transport&&) noexcept -> curl_http_transport&;

    [[nodiscard]] auto get(const std::string& url,
                           const http_headers& headers) -> result<http_response> override;

    [[nodiscard]] auto get_stream(const std::string& url,
                                  const http_headers& headers,
                                  const head_callback& on_head,
                                  const chunk_callback& on_chunk) -> result<void> override;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace azblob

#endif  // AZBLOB_STORAGE_HTTP_TRANSPORT_H
