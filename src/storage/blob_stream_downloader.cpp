/**
 * @file blob_stream_downloader.cpp
 * @brief Streamed blob download with gzip decoding and line dispatch
 */

#include <azblob/storage/blob_stream_downloader.h>
#include <azblob/core/gzip_inflater.h>
#include <azblob/storage/storage_utils.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <optional>

namespace azblob {

// ============================================================================
// line_assembler
// ============================================================================

line_assembler::line_assembler(line_sink sink) : sink_(std::move(sink)) {}

auto line_assembler::feed(std::string_view chunk) -> void {
    buffer_.append(chunk);

    std::size_t line_start = 0;
    std::size_t newline;
    while ((newline = buffer_.find('\n', line_start)) != std::string::npos) {
        dispatch(std::string_view(buffer_).substr(line_start, newline - line_start));
        line_start = newline + 1;
    }

    buffer_.erase(0, line_start);
}

auto line_assembler::finish() -> void {
    if (!buffer_.empty()) {
        std::string last;
        last.swap(buffer_);
        dispatch(last);
    }
}

auto line_assembler::dispatch(std::string_view line) -> void {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (storage_utils::is_blank(line)) {
        return;
    }
    sink_(line);
}

// ============================================================================
// blob_stream_downloader
// ============================================================================

namespace {

auto blob_name_for_log(const std::string& url) -> std::string {
    auto path = storage_utils::strip_query(url);
    auto host_end = path.find("://");
    if (host_end != std::string_view::npos) {
        auto path_start = path.find('/', host_end + 3);
        if (path_start != std::string_view::npos) {
            return std::string(path.substr(path_start + 1));
        }
    }
    return std::string(path);
}

}  // namespace

blob_stream_downloader::blob_stream_downloader(std::shared_ptr<http_transport_interface> transport,
                                               blob_client_config config,
                                               std::shared_ptr<storage_logger> logger)
    : transport_(std::move(transport)),
      config_(std::move(config)),
      logger_(ensure_logger(std::move(logger))) {
    if (!transport_) {
        transport_ = std::make_shared<curl_http_transport>(config_, logger_);
    }
}

auto blob_stream_downloader::stream_blob(const std::string& blob_url,
                                         const line_handler& handler,
                                         download_options options) const
    -> result<download_stats> {
    const bool debug = options.debug || config_.debug;
    const auto blob_name = blob_name_for_log(blob_url);
    const auto start = std::chrono::steady_clock::now();

    download_stats stats;
    std::optional<gzip_inflater> inflater;

    line_assembler assembler([&](std::string_view line) {
        ++stats.lines_processed;
        try {
            auto handled = handler(line);
            if (!handled) {
                ++stats.line_errors;
                if (debug) {
                    AZB_LOG_DEBUG(*logger_, log_category::download,
                                  "Line " + std::to_string(stats.lines_processed) +
                                      " of " + blob_name + " rejected: " +
                                      handled.error().message);
                }
            }
        } catch (const std::exception& e) {
            ++stats.line_errors;
            if (debug) {
                AZB_LOG_DEBUG(*logger_, log_category::download,
                              "Line " + std::to_string(stats.lines_processed) + " of " +
                                  blob_name + " threw: " + e.what());
            }
        } catch (...) {
            ++stats.line_errors;
            if (debug) {
                AZB_LOG_DEBUG(*logger_, log_category::download,
                              "Line " + std::to_string(stats.lines_processed) + " of " +
                                  blob_name + " threw a non-standard exception");
            }
        }
    });

    http_transport_interface::head_callback on_head =
        [&](const http_response_head& head) -> result<void> {
        if (head.status_code != 200) {
            return unexpected(make_http_status_error(head.status_code, "Download " + blob_name));
        }
        auto encoding = head.get_header("content-encoding");
        if (encoding && storage_utils::to_lower(*encoding).find("gzip") != std::string::npos) {
            inflater.emplace();
            stats.gzip = true;
        }
        return {};
    };

    http_transport_interface::chunk_callback on_chunk =
        [&](std::string_view chunk) -> result<void> {
        if (!inflater) {
            stats.bytes_downloaded += chunk.size();
            assembler.feed(chunk);
            return {};
        }

        auto decoded = inflater->inflate(chunk, [&](std::string_view piece) {
            stats.bytes_downloaded += piece.size();
            assembler.feed(piece);
        });
        if (!decoded) {
            return unexpected(error(error_code::stream_error,
                                    "Download " + blob_name + ": " + decoded.error().message));
        }
        return {};
    };

    auto streamed = transport_->get_stream(blob_url, {{"Accept-Encoding", "gzip"}},
                                           on_head, on_chunk);

    if (streamed && inflater) {
        auto finished = inflater->finish();
        if (!finished) {
            streamed = unexpected(error(error_code::stream_error,
                                        "Download " + blob_name + ": " +
                                            finished.error().message));
        }
    }

    if (!streamed) {
        blob_log_context ctx;
        ctx.blob_name = blob_name;
        ctx.bytes_downloaded = stats.bytes_downloaded;
        ctx.lines_processed = stats.lines_processed;
        ctx.http_status = streamed.error().http_status;
        ctx.error_message = streamed.error().message;
        AZB_LOG_CTX(*logger_, log_level::error, log_category::download,
                    "Blob download failed", ctx);
        return unexpected(streamed.error());
    }

    assembler.finish();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    stats.duration_ms = static_cast<uint64_t>(elapsed.count());
    stats.throughput_bytes_per_sec =
        stats.bytes_downloaded * 1000 / std::max<uint64_t>(stats.duration_ms, 1);

    blob_log_context ctx;
    ctx.blob_name = blob_name;
    ctx.bytes_downloaded = stats.bytes_downloaded;
    ctx.lines_processed = stats.lines_processed;
    ctx.duration_ms = stats.duration_ms;
    AZB_LOG_INFO_CTX(*logger_, log_category::download, "Blob streamed", ctx);
    if (stats.line_errors > 0) {
        AZB_LOG_WARN(*logger_, log_category::download,
                     std::to_string(stats.line_errors) + " of " +
                         std::to_string(stats.lines_processed) + " lines in " + blob_name +
                         " failed to process");
    }

    return stats;
}

}  // namespace azblob
