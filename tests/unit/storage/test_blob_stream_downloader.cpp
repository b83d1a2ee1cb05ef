/**
 * @file test_blob_stream_downloader.cpp
 * @brief Unit tests for streamed blob download and line dispatch
 */

#include <gtest/gtest.h>

#include <azblob/storage/blob_stream_downloader.h>

#include "../gzip_fixture.h"
#include "../mock_http_transport.h"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace azblob::test {

namespace {

constexpr const char* blob_url =
    "https://acct.blob.core.windows.net/logs/y=2024/m=03/d=15/h=09/m=00/PT1H.json?sv=1&sig=abc";

}  // namespace

// =============================================================================
// Line Assembler Tests
// =============================================================================

class LineAssemblerTest : public ::testing::Test {
protected:
    std::vector<std::string> lines_;
    line_assembler assembler_{[this](std::string_view line) { lines_.emplace_back(line); }};
};

TEST_F(LineAssemblerTest, SplitsCompleteLines) {
    assembler_.feed("one\ntwo\n");

    EXPECT_EQ(lines_, (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(assembler_.buffered_bytes(), 0u);
}

TEST_F(LineAssemblerTest, HoldsPartialLineUntilNewline) {
    assembler_.feed("{\"a\":");
    EXPECT_TRUE(lines_.empty());
    EXPECT_EQ(assembler_.buffered_bytes(), 5u);

    assembler_.feed("1}\n{\"b\"");
    EXPECT_EQ(lines_, (std::vector<std::string>{"{\"a\":1}"}));

    assembler_.feed(":2}");
    assembler_.finish();
    EXPECT_EQ(lines_, (std::vector<std::string>{"{\"a\":1}", "{\"b\":2}"}));
}

TEST_F(LineAssemblerTest, StripsCarriageReturn) {
    assembler_.feed("first\r\nsecond\r");
    assembler_.finish();

    EXPECT_EQ(lines_, (std::vector<std::string>{"first", "second"}));
}

TEST_F(LineAssemblerTest, SkipsBlankLines) {
    assembler_.feed("a\n\n  \n\r\nb\n\t");
    assembler_.finish();

    EXPECT_EQ(lines_, (std::vector<std::string>{"a", "b"}));
}

TEST_F(LineAssemblerTest, ByteAtATimeMatchesWholeFeed) {
    std::string text = "alpha\nbeta\r\ngamma";
    for (char c : text) {
        assembler_.feed(std::string_view(&c, 1));
    }
    assembler_.finish();

    EXPECT_EQ(lines_, (std::vector<std::string>{"alpha", "beta", "gamma"}));
}

// =============================================================================
// Downloader Tests
// =============================================================================

class BlobStreamDownloaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<mock_http_transport>();
        logger_ = std::make_shared<storage_logger>();
        logger_->set_callback([this](log_level level, std::string_view, std::string_view message,
                                     const blob_log_context*) {
            log_.emplace_back(level, std::string(message));
        });
    }

    auto make_downloader(blob_client_config config = {}) -> blob_stream_downloader {
        return blob_stream_downloader(transport_, std::move(config), logger_);
    }

    auto collect() -> blob_stream_downloader::line_handler {
        return [this](std::string_view line) -> result<void> {
            lines_.emplace_back(line);
            return {};
        };
    }

    std::shared_ptr<mock_http_transport> transport_;
    std::shared_ptr<storage_logger> logger_;
    std::vector<std::pair<log_level, std::string>> log_;
    std::vector<std::string> lines_;
};

TEST_F(BlobStreamDownloaderTest, LineSplitAcrossChunks) {
    transport_->enqueue_chunks({"{\"a\":", "1}\n{\"b\":2}\n"});

    auto stats = make_downloader().stream_blob(blob_url, collect());

    ASSERT_TRUE(stats.has_value()) << stats.error().message;
    EXPECT_EQ(lines_, (std::vector<std::string>{"{\"a\":1}", "{\"b\":2}"}));
    EXPECT_EQ(stats.value().lines_processed, 2u);
    EXPECT_EQ(stats.value().line_errors, 0u);
    EXPECT_EQ(stats.value().bytes_downloaded, 16u);
    EXPECT_FALSE(stats.value().gzip);
}

TEST_F(BlobStreamDownloaderTest, TrailingFragmentDispatchedAtEndOfStream) {
    transport_->enqueue_chunks({"{\"a\":1}\n{\"b\":2}\n{partial", ""});

    auto stats = make_downloader().stream_blob(blob_url, collect());

    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(lines_, (std::vector<std::string>{"{\"a\":1}", "{\"b\":2}", "{partial"}));
    EXPECT_EQ(stats.value().lines_processed, 3u);
}

TEST_F(BlobStreamDownloaderTest, RequestsGzipEncoding) {
    transport_->enqueue(200, "x\n");

    auto stats = make_downloader().stream_blob(blob_url, collect());

    ASSERT_TRUE(stats.has_value());
    ASSERT_EQ(transport_->requests.size(), 1u);
    EXPECT_EQ(transport_->requests[0].url, blob_url);
    EXPECT_EQ(transport_->requests[0].headers.at("Accept-Encoding"), "gzip");
}

TEST_F(BlobStreamDownloaderTest, FinalLineWithoutNewline) {
    transport_->enqueue(200, "first\nlast");

    auto stats = make_downloader().stream_blob(blob_url, collect());

    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(lines_, (std::vector<std::string>{"first", "last"}));
}

TEST_F(BlobStreamDownloaderTest, CrlfAndBlankLines) {
    transport_->enqueue(200, "a\r\n\r\n\nb\r\n");

    auto stats = make_downloader().stream_blob(blob_url, collect());

    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(lines_, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(stats.value().lines_processed, 2u);
}

TEST_F(BlobStreamDownloaderTest, EmptyBlob) {
    transport_->enqueue(200, "");

    auto stats = make_downloader().stream_blob(blob_url, collect());

    ASSERT_TRUE(stats.has_value());
    EXPECT_TRUE(lines_.empty());
    EXPECT_EQ(stats.value().bytes_downloaded, 0u);
}

TEST_F(BlobStreamDownloaderTest, ThrowingHandlerDoesNotAbortStream) {
    transport_->enqueue(200, "one\ntwo\nthree\n");

    std::vector<std::string> seen;
    auto stats = make_downloader().stream_blob(blob_url, [&](std::string_view line) -> result<void> {
        seen.emplace_back(line);
        if (line == "two") {
            throw std::runtime_error("bad record");
        }
        return {};
    });

    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(seen, (std::vector<std::string>{"one", "two", "three"}));
    EXPECT_EQ(stats.value().lines_processed, 3u);
    EXPECT_EQ(stats.value().line_errors, 1u);
}

TEST_F(BlobStreamDownloaderTest, NonStandardExceptionDoesNotAbortStream) {
    struct record_rejected {};
    transport_->enqueue(200, "a\nb\nc\n");

    std::vector<std::string> seen;
    auto stats = make_downloader().stream_blob(blob_url, [&](std::string_view line) {
        seen.emplace_back(line);
        if (line == "b") {
            throw record_rejected{};
        }
    });

    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(stats.value().lines_processed, 3u);
    EXPECT_EQ(stats.value().line_errors, 1u);
}

TEST_F(BlobStreamDownloaderTest, HandlerErrorIsCountedAndWarned) {
    transport_->enqueue(200, "one\ntwo\n");

    auto stats = make_downloader().stream_blob(blob_url, [](std::string_view line) -> result<void> {
        if (line == "one") {
            return unexpected(error(error_code::line_handler_error, "not json"));
        }
        return {};
    });

    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats.value().lines_processed, 2u);
    EXPECT_EQ(stats.value().line_errors, 1u);

    bool warned = false;
    for (const auto& [level, message] : log_) {
        if (level == log_level::warn && message.find("1 of 2 lines") != std::string::npos) {
            warned = true;
        }
    }
    EXPECT_TRUE(warned);
}

TEST_F(BlobStreamDownloaderTest, HandlerFailureDetailOnlyInDebug) {
    logger_->set_level(log_level::debug);
    transport_->enqueue(200, "one\n");
    transport_->enqueue(200, "one\n");

    auto failing = [](std::string_view) -> result<void> {
        return unexpected(error(error_code::line_handler_error, "schema mismatch"));
    };
    auto count_detail = [this] {
        int count = 0;
        for (const auto& entry : log_) {
            if (entry.second.find("schema mismatch") != std::string::npos) ++count;
        }
        return count;
    };

    ASSERT_TRUE(make_downloader().stream_blob(blob_url, failing).has_value());
    EXPECT_EQ(count_detail(), 0);

    download_options options;
    options.debug = true;
    ASSERT_TRUE(make_downloader().stream_blob(blob_url, failing, options).has_value());
    EXPECT_EQ(count_detail(), 1);
}

TEST_F(BlobStreamDownloaderTest, VoidHandlerOverload) {
    transport_->enqueue(200, "a\nb\n");

    std::vector<std::string> seen;
    auto stats = make_downloader().stream_blob(blob_url, [&](std::string_view line) {
        seen.emplace_back(line);
    });

    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b"}));
}

TEST_F(BlobStreamDownloaderTest, GzipBodyMatchesPlainBody) {
    std::string body;
    for (int i = 0; i < 200; ++i) {
        body += "{\"seq\":" + std::to_string(i) + ",\"msg\":\"console output\"}\n";
    }
    auto compressed = gzip_compress(body);
    ASSERT_FALSE(compressed.empty());

    transport_->enqueue_chunks({body.substr(0, 100), body.substr(100)});
    transport_->enqueue_chunks(split_chunks(compressed, 64), {{"content-encoding", "gzip"}});

    auto plain = make_downloader().stream_blob(blob_url, collect());
    ASSERT_TRUE(plain.has_value());
    auto plain_lines = lines_;
    lines_.clear();

    auto gzipped = make_downloader().stream_blob(blob_url, collect());
    ASSERT_TRUE(gzipped.has_value()) << gzipped.error().message;

    EXPECT_EQ(lines_, plain_lines);
    EXPECT_EQ(lines_.size(), 200u);
    EXPECT_TRUE(gzipped.value().gzip);
    EXPECT_EQ(gzipped.value().bytes_downloaded, body.size());
    EXPECT_EQ(plain.value().bytes_downloaded, body.size());
}

TEST_F(BlobStreamDownloaderTest, CompressibleGzipChunkStreamsLineByLine) {
    const std::string line(1000, 'x');
    std::string body;
    for (int i = 0; i < 4096; ++i) {
        body += line + "\n";
    }
    auto compressed = gzip_compress(body);
    ASSERT_FALSE(compressed.empty());
    ASSERT_LT(compressed.size(), body.size() / 100);

    transport_->enqueue(200, compressed, {{"content-encoding", "gzip"}});

    uint64_t count = 0;
    bool intact = true;
    auto stats = make_downloader().stream_blob(blob_url, [&](std::string_view received) {
        ++count;
        intact = intact && received == line;
    });

    ASSERT_TRUE(stats.has_value()) << stats.error().message;
    EXPECT_EQ(count, 4096u);
    EXPECT_TRUE(intact);
    EXPECT_EQ(stats.value().bytes_downloaded, body.size());
}

TEST_F(BlobStreamDownloaderTest, CorruptGzipIsStreamError) {
    transport_->enqueue(200, "definitely not gzip", {{"content-encoding", "gzip"}});

    auto stats = make_downloader().stream_blob(blob_url, collect());

    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, error_code::stream_error);
    EXPECT_TRUE(lines_.empty());
}

TEST_F(BlobStreamDownloaderTest, TruncatedGzipIsStreamError) {
    auto compressed = gzip_compress("line one\nline two\n");
    transport_->enqueue(200, compressed.substr(0, compressed.size() - 6),
                        {{"content-encoding", "gzip"}});

    auto stats = make_downloader().stream_blob(blob_url, collect());

    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, error_code::stream_error);
}

TEST_F(BlobStreamDownloaderTest, ForbiddenAbortsBeforeAnyLine) {
    transport_->enqueue(403, "<Error><Code>AuthenticationFailed</Code></Error>");

    auto stats = make_downloader().stream_blob(blob_url, collect());

    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, error_code::authentication_error);
    EXPECT_EQ(stats.error().http_status, 403);
    EXPECT_TRUE(lines_.empty());
}

TEST_F(BlobStreamDownloaderTest, NotFoundIsHttpStatusError) {
    transport_->enqueue(404, "");

    auto stats = make_downloader().stream_blob(blob_url, collect());

    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, error_code::http_status_error);
    EXPECT_EQ(stats.error().http_status, 404);
}

TEST_F(BlobStreamDownloaderTest, MidStreamFailureIsReturned) {
    mock_http_transport::mock_response response;
    response.chunks = {"one\ntwo\n"};
    response.failure = error(error_code::stream_error, "connection reset by peer");
    transport_->responses.push_back(response);

    auto stats = make_downloader().stream_blob(blob_url, collect());

    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, error_code::stream_error);
    // Lines completed before the failure were already delivered
    EXPECT_EQ(lines_, (std::vector<std::string>{"one", "two"}));
}

TEST_F(BlobStreamDownloaderTest, LogsUseBlobNameWithoutSignature) {
    transport_->enqueue(404, "");

    auto stats = make_downloader().stream_blob(blob_url, collect());
    ASSERT_FALSE(stats.has_value());

    EXPECT_EQ(stats.error().message.find("sig=abc"), std::string::npos);
    for (const auto& entry : log_) {
        EXPECT_EQ(entry.second.find("sig=abc"), std::string::npos);
    }
}

}  // namespace azblob::test
