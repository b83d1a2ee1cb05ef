/**
 * @file http_transport.cpp
 * @brief libcurl HTTP transport
 */

#include <azblob/storage/http_transport.h>
#include <azblob/storage/storage_utils.h>

#include <exception>
#include <mutex>

#include <curl/curl.h>

namespace azblob {

auto http_response_head::get_header(std::string_view name) const -> std::optional<std::string> {
    auto it = headers.find(storage_utils::to_lower(name));
    if (it != headers.end()) {
        return it->second;
    }
    for (const auto& [key, value] : headers) {
        if (storage_utils::iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

namespace {

// State shared with the curl callbacks for one transfer
struct transfer_context {
    CURL* handle = nullptr;
    const http_transport_interface::head_callback* on_head = nullptr;
    const http_transport_interface::chunk_callback* on_chunk = nullptr;
    http_response_head head;
    bool head_delivered = false;
    std::optional<error> callback_error;
    std::exception_ptr callback_exception;
};

auto deliver_head(transfer_context& ctx) -> bool {
    if (ctx.head_delivered) {
        return true;
    }
    ctx.head_delivered = true;

    long status = 0;
    curl_easy_getinfo(ctx.handle, CURLINFO_RESPONSE_CODE, &status);
    ctx.head.status_code = static_cast<int>(status);

    if (ctx.on_head && *ctx.on_head) {
        auto accepted = (*ctx.on_head)(ctx.head);
        if (!accepted) {
            ctx.callback_error = accepted.error();
            return false;
        }
    }
    return true;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<transfer_context*>(userdata);
    size_t bytes = size * nmemb;

    try {
        if (!deliver_head(*ctx)) {
            return 0;  // Return 0 to signal error and abort transfer
        }
        if (ctx->on_chunk && *ctx->on_chunk) {
            auto consumed = (*ctx->on_chunk)(std::string_view(ptr, bytes));
            if (!consumed) {
                ctx->callback_error = consumed.error();
                return 0;
            }
        }
    } catch (...) {
        // Rethrown once the easy handle has been released
        ctx->callback_exception = std::current_exception();
        return 0;
    }

    return bytes;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<transfer_context*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    // Remove trailing CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.empty()) {
        return bytes;
    }

    // A new status line starts a new header block (e.g. after 100 Continue)
    if (line.rfind("HTTP/", 0) == 0) {
        ctx->head.headers.clear();
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = storage_utils::to_lower(line.substr(0, colon));
        std::string value = line.substr(colon + 1);

        // Trim leading whitespace from value
        size_t start = value.find_first_not_of(" \t");
        value = (start == std::string::npos) ? std::string() : value.substr(start);

        ctx->head.headers[name] = value;
    }

    return bytes;
}

struct curl_easy_deleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct curl_slist_deleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

struct curl_http_transport::impl {
    blob_client_config config;
    std::shared_ptr<storage_logger> logger;

    impl(blob_client_config cfg, std::shared_ptr<storage_logger> log)
        : config(std::move(cfg)), logger(ensure_logger(std::move(log))) {
        // Initialize CURL globally (thread-safe)
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });
    }

    auto perform(const std::string& url,
                 const http_headers& headers,
                 const head_callback& on_head,
                 const chunk_callback& on_chunk) -> result<void> {
        // The query carries the SAS signature; keep it out of messages
        std::string target(storage_utils::strip_query(url));

        std::unique_ptr<CURL, curl_easy_deleter> curl(curl_easy_init());
        if (!curl) {
            return unexpected(error(error_code::internal_error,
                                    "Failed to create curl handle"));
        }

        std::unique_ptr<curl_slist, curl_slist_deleter> header_list;
        for (const auto& [name, value] : headers) {
            std::string header = name + ": " + value;
            auto* appended = curl_slist_append(header_list.get(), header.c_str());
            if (!appended) {
                return unexpected(error(error_code::internal_error,
                                        "Failed to build request headers"));
            }
            header_list.release();
            header_list.reset(appended);
        }

        transfer_context ctx;
        ctx.handle = curl.get();
        ctx.on_head = &on_head;
        ctx.on_chunk = &on_chunk;

        CURL* handle = curl.get();
        curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
        if (header_list) {
            curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
        }
        if (!config.user_agent.empty()) {
            curl_easy_setopt(handle, CURLOPT_USERAGENT, config.user_agent.c_str());
        }

        // Content decoding is left to the caller; no CURLOPT_ACCEPT_ENCODING
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(handle, CURLOPT_HEADERDATA, &ctx);

        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config.connect_timeout.count()));
        curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(config.request_timeout.count()));

        if (config.verify_tls) {
            curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 0L);
        }

        AZB_LOG_TRACE(*logger, log_category::transport, "GET " + target);

        CURLcode res = curl_easy_perform(handle);

        // Bodies that are empty never reach the write callback
        if (res == CURLE_OK && !ctx.head_delivered) {
            try {
                deliver_head(ctx);
            } catch (...) {
                ctx.callback_exception = std::current_exception();
            }
        }

        header_list.reset();
        curl.reset();

        if (ctx.callback_exception) {
            std::rethrow_exception(ctx.callback_exception);
        }
        if (ctx.callback_error) {
            return unexpected(*ctx.callback_error);
        }
        if (res != CURLE_OK) {
            std::string message = "GET " + target + " failed: " + curl_easy_strerror(res);
            AZB_LOG_WARN(*logger, log_category::transport, message);
            return unexpected(error(error_code::stream_error, message));
        }

        AZB_LOG_TRACE(*logger, log_category::transport,
                      "GET " + target + " -> HTTP " + std::to_string(ctx.head.status_code));
        return {};
    }
};

curl_http_transport::curl_http_transport(blob_client_config config,
                                         std::shared_ptr<storage_logger> logger)
    : impl_(std::make_unique<impl>(std::move(config), std::move(logger))) {}

curl_http_transport::~curl_http_transport() = default;

curl_http_transport::curl_http_transport(curl_http_transport&&) noexcept = default;

auto curl_http_transport::operator=(curl_http_transport&&) noexcept
    -> curl_http_transport& = default;

auto curl_http_transport::get(const std::string& url,
                              const http_headers& headers) -> result<http_response> {
    http_response response;

    head_callback on_head = [&response](const http_response_head& head) -> result<void> {
        response.status_code = head.status_code;
        response.headers = head.headers;
        return {};
    };
    chunk_callback on_chunk = [&response](std::string_view chunk) -> result<void> {
        response.body.append(chunk);
        return {};
    };

    auto performed = impl_->perform(url, headers, on_head, on_chunk);
    if (!performed) {
        return unexpected(performed.error());
    }
    return response;
}

auto curl_http_transport::get_stream(const std::string& url,
                                     const http_headers& headers,
                                     const head_callback& on_head,
                                     const chunk_callback& on_chunk) -> result<void> {
    return impl_->perform(url, headers, on_head, on_chunk);
}

}  // namespace azblob
