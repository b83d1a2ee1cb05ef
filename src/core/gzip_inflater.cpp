/**
 * @file gzip_inflater.cpp
 * @brief zlib gzip decoder implementation
 */

#include <azblob/core/gzip_inflater.h>

#include <array>

#include <zlib.h>

namespace azblob {

namespace {

// 16 selects gzip framing in inflateInit2
constexpr int gzip_window_bits = 16 + MAX_WBITS;

auto zlib_message(const z_stream& strm, int rc) -> std::string {
    if (strm.msg != nullptr) {
        return strm.msg;
    }
    return "zlib error " + std::to_string(rc);
}

}  // namespace

struct gzip_inflater::impl {
    z_stream strm{};
    bool initialized = false;
    bool member_ended = false;
    bool failed = false;
    inflate_stats stats;

    impl() {
        initialized = (inflateInit2(&strm, gzip_window_bits) == Z_OK);
    }

    ~impl() {
        if (initialized) {
            inflateEnd(&strm);
        }
    }

    impl(const impl&) = delete;
    auto operator=(const impl&) -> impl& = delete;

    auto fail(std::string message) -> result<void> {
        failed = true;
        return unexpected(error(error_code::decompression_error, std::move(message)));
    }

    auto inflate(std::string_view input, const output_sink& sink) -> result<void> {
        if (!initialized) {
            return unexpected(error(error_code::decompression_error,
                                    "Failed to initialize zlib inflate stream"));
        }
        if (failed) {
            return unexpected(error(error_code::decompression_error,
                                    "Inflate stream already failed"));
        }

        std::array<unsigned char, output_window_size> window{};

        strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
        strm.avail_in = static_cast<uInt>(input.size());

        while (true) {
            if (member_ended) {
                if (strm.avail_in == 0) {
                    break;
                }
                // Another gzip member follows
                if (inflateReset(&strm) != Z_OK) {
                    return fail("Failed to reset inflate stream");
                }
                member_ended = false;
            }

            strm.next_out = window.data();
            strm.avail_out = static_cast<uInt>(window.size());

            auto avail_before = strm.avail_in;
            int rc = ::inflate(&strm, Z_NO_FLUSH);

            auto produced = window.size() - strm.avail_out;
            stats.total_input_bytes += avail_before - strm.avail_in;
            stats.total_output_bytes += produced;
            if (produced > 0) {
                sink(std::string_view(reinterpret_cast<const char*>(window.data()), produced));
            }

            if (rc == Z_STREAM_END) {
                member_ended = true;
                ++stats.members;
                continue;
            }
            if (rc == Z_BUF_ERROR) {
                // No progress possible until more input arrives
                break;
            }
            if (rc != Z_OK) {
                return fail("gzip decode failed: " + zlib_message(strm, rc));
            }
            if (strm.avail_in == 0 && strm.avail_out != 0) {
                break;
            }
        }

        return {};
    }

    auto finish() -> result<void> {
        if (failed) {
            return unexpected(error(error_code::decompression_error,
                                    "Inflate stream already failed"));
        }
        if (stats.total_input_bytes > 0 && !member_ended) {
            failed = true;
            return unexpected(error(error_code::decompression_error,
                                    "gzip stream truncated: unexpected end of file"));
        }
        return {};
    }
};

gzip_inflater::gzip_inflater() : impl_(std::make_unique<impl>()) {}

gzip_inflater::~gzip_inflater() = default;

gzip_inflater::gzip_inflater(gzip_inflater&&) noexcept = default;

auto gzip_inflater::operator=(gzip_inflater&&) noexcept -> gzip_inflater& = default;

auto gzip_inflater::inflate(std::string_view input) -> result<std::string> {
    std::string output;
    auto decoded = impl_->inflate(input, [&output](std::string_view piece) {
        output.append(piece);
    });
    if (!decoded) {
        return unexpected(decoded.error());
    }
    return output;
}

auto gzip_inflater::inflate(std::string_view input, const output_sink& sink) -> result<void> {
    return impl_->inflate(input, sink);
}

auto gzip_inflater::finish() -> result<void> {
    return impl_->finish();
}

auto gzip_inflater::stats() const -> inflate_stats {
    return impl_->stats;
}

}  // namespace azblob
