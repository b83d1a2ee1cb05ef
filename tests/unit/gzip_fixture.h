/**
 * @file gzip_fixture.h
 * @brief Builds gzip payloads with zlib for decoder tests
 */

#ifndef AZBLOB_TESTS_GZIP_FIXTURE_H
#define AZBLOB_TESTS_GZIP_FIXTURE_H

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include <zlib.h>

namespace azblob::test {

/**
 * @brief Compress @p input into a single gzip member
 * @return Compressed bytes, or an empty string if zlib failed
 */
inline auto gzip_compress(std::string_view input) -> std::string {
    z_stream strm{};
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }

    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    strm.avail_in = static_cast<uInt>(input.size());

    std::string output;
    std::array<unsigned char, 4096> window{};
    int rc = Z_OK;
    do {
        strm.next_out = window.data();
        strm.avail_out = static_cast<uInt>(window.size());
        rc = deflate(&strm, Z_FINISH);
        output.append(reinterpret_cast<const char*>(window.data()),
                      window.size() - strm.avail_out);
    } while (rc == Z_OK || rc == Z_BUF_ERROR);

    deflateEnd(&strm);
    return rc == Z_STREAM_END ? output : std::string{};
}

/**
 * @brief Split @p data into pieces of at most @p size bytes
 */
inline auto split_chunks(const std::string& data, std::size_t size) -> std::vector<std::string> {
    std::vector<std::string> chunks;
    for (std::size_t pos = 0; pos < data.size(); pos += size) {
        chunks.push_back(data.substr(pos, size));
    }
    return chunks;
}

}  // namespace azblob::test

#endif  // AZBLOB_TESTS_GZIP_FIXTURE_H
