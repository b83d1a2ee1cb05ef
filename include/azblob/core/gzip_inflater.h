/**
 * @file gzip_inflater.h
 * @brief Incremental gzip decoder for streamed response bodies
 */

#ifndef AZBLOB_CORE_GZIP_INFLATER_H
#define AZBLOB_CORE_GZIP_INFLATER_H

#include <azblob/core/types.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace azblob {

/**
 * @brief Decoding statistics
 */
struct inflate_stats {
    uint64_t total_input_bytes = 0;   ///< Compressed bytes consumed
    uint64_t total_output_bytes = 0;  ///< Decoded bytes produced
    uint32_t members = 0;             ///< Completed gzip members
};

/**
 * @brief zlib-based gzip decoder fed one chunk at a time
 *
 * Output is produced as soon as zlib can decode it. The sink overload hands
 * it out one output window (at most output_window_size bytes) at a time, so
 * a highly compressible chunk never expands into one large buffer.
 * Concatenated gzip members are decoded back to back.
 *
 * @code
 * gzip_inflater inflater;
 * for (auto chunk : chunks) {
 *     auto decoded = inflater.inflate(chunk);
 *     if (!decoded) return decoded.error();
 *     consume(decoded.value());
 * }
 * auto done = inflater.finish();
 * @endcode
 */
class gzip_inflater {
public:
    /// Receives decoded bytes; the view is valid only during the call
    using output_sink = std::function<void(std::string_view)>;

    /// Upper bound on the size of one piece handed to an output_sink
    static constexpr std::size_t output_window_size = 16 * 1024;

    gzip_inflater();
    ~gzip_inflater();

    // Non-copyable but movable
    gzip_inflater(const gzip_inflater&) = delete;
    auto operator=(const gzip_inflater&) -> gzip_inflater& = delete;
    gzip_inflater(gzip_inflater&&) noexcept;
    auto operator=(gzip_inflater&&) noexcept -> gzip_inflater&;

    /**
     * @brief Decode the next chunk of compressed input
     * @param input Compressed bytes
     * @return Decoded bytes (possibly empty) or decompression_error
     */
    [[nodiscard]] auto inflate(std::string_view input) -> result<std::string>;

    /**
     * @brief Decode the next chunk, delivering output window by window
     * @param input Compressed bytes
     * @param sink Called once per decoded window, in order
     * @return decompression_error on corrupt input
     */
    [[nodiscard]] auto inflate(std::string_view input, const output_sink& sink) -> result<void>;

    /**
     * @brief Verify the stream ended on a member boundary
     * @return decompression_error if the input was truncated
     */
    [[nodiscard]] auto finish() -> result<void>;

    [[nodiscard]] auto stats() const -> inflate_stats;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace azblob

#endif  // AZBLOB_CORE_GZIP_INFLATER_H
