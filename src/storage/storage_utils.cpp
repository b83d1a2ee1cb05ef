/**
 * @file storage_utils.cpp
 * @brief Utility functions shared by the storage signing and listing code
 */

#include <azblob/storage/storage_utils.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace azblob::storage_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

namespace {
constexpr const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

auto base64_value(unsigned char c) -> int {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

auto is_unreserved(unsigned char c) -> bool {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

// RFC 3986 sub-delims plus ':' and '@'
auto is_path_safe(unsigned char c) -> bool {
    switch (c) {
        case '!': case '$': case '&': case '\'': case '(': case ')':
        case '*': case '+': case ',': case ';': case '=':
        case ':': case '@': case '/':
            return true;
        default:
            return is_unreserved(c);
    }
}

auto percent_encode(std::ostringstream& out, unsigned char c) -> void {
    out << '%' << std::setw(2) << std::uppercase << std::hex
        << static_cast<int>(c) << std::dec;
}
}  // namespace

auto base64_encode(const std::vector<uint8_t>& data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(data[i + 2]);

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

auto base64_encode(const std::string& data) -> std::string {
    std::vector<uint8_t> bytes(data.begin(), data.end());
    return base64_encode(bytes);
}

auto base64_decode(const std::string& encoded) -> std::vector<uint8_t> {
    std::vector<uint8_t> result;
    result.reserve((encoded.size() / 4) * 3);

    uint32_t bits = 0;
    int bit_count = 0;

    for (char c : encoded) {
        if (c == '=') break;
        int val = base64_value(static_cast<unsigned char>(c));
        if (val < 0) continue;

        bits = (bits << 6) | static_cast<uint32_t>(val);
        bit_count += 6;

        if (bit_count >= 8) {
            bit_count -= 8;
            result.push_back(static_cast<uint8_t>((bits >> bit_count) & 0xFF));
        }
    }

    return result;
}

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');

    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        if (is_unreserved(uc) || (c == '/' && !encode_slash)) {
            escaped << c;
        } else {
            percent_encode(escaped, uc);
        }
    }

    return escaped.str();
}

auto encode_blob_path(const std::string& name) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');

    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (is_path_safe(uc)) {
            escaped << c;
        } else {
            percent_encode(escaped, uc);
        }
    }

    return escaped.str();
}

// ============================================================================
// Cryptographic Utilities
// ============================================================================

auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    HMAC(EVP_sha256(),
         key.data(),
         static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()),
         data.size(),
         result.data(),
         &len);

    result.resize(len);
    return result;
}

auto sign_with_account_key(const std::string& base64_key,
                           const std::string& data) -> result<std::string> {
    auto key = base64_decode(base64_key);
    if (key.empty()) {
        return unexpected(error(error_code::configuration_error,
                                "Account key is not valid base64"));
    }
    auto digest = hmac_sha256(key, data);
    if (digest.empty()) {
        return unexpected(error(error_code::internal_error, "HMAC-SHA256 failed"));
    }
    return base64_encode(digest);
}

// ============================================================================
// Time Utilities
// ============================================================================

namespace {
auto to_utc_tm(std::chrono::system_clock::time_point tp) -> std::tm {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time_t);
#else
    gmtime_r(&time_t, &tm);
#endif
    return tm;
}
}  // namespace

auto format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
    auto tm = to_utc_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

auto format_rfc1123(std::chrono::system_clock::time_point tp) -> std::string {
    auto tm = to_utc_tm(tp);
    std::ostringstream oss;
    // Day and month names must be English regardless of the global locale
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

auto make_utc_time(int year, int month, int day,
                   int hour, int minute, int second)
    -> std::chrono::system_clock::time_point {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
#ifdef _WIN32
    auto time_t = _mkgmtime(&tm);
#else
    auto time_t = timegm(&tm);
#endif
    return std::chrono::system_clock::from_time_t(time_t);
}

// ============================================================================
// URL Utilities
// ============================================================================

auto parse_url(const std::string& url) -> std::optional<url_parts> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }

    url_parts parts;
    parts.scheme = url.substr(0, scheme_end);

    auto host_start = scheme_end + 3;
    auto host_end = url.find_first_of("/?", host_start);
    parts.host = url.substr(host_start, host_end == std::string::npos
                                            ? std::string::npos
                                            : host_end - host_start);
    if (parts.host.empty()) {
        return std::nullopt;
    }

    if (host_end == std::string::npos) {
        return parts;
    }

    auto query_start = url.find('?', host_end);
    if (query_start == std::string::npos) {
        parts.path = url.substr(host_end);
    } else {
        parts.path = url.substr(host_end, query_start - host_end);
        parts.query = url.substr(query_start + 1);
    }

    while (!parts.path.empty() && parts.path.back() == '/') {
        parts.path.pop_back();
    }

    return parts;
}

auto append_query(const std::string& url, const std::string& fragment) -> std::string {
    if (fragment.empty()) {
        return url;
    }
    if (url.find('?') == std::string::npos) {
        return url + "?" + fragment;
    }
    if (url.back() == '?' || url.back() == '&') {
        return url + fragment;
    }
    return url + "&" + fragment;
}

auto strip_query(std::string_view url) -> std::string_view {
    auto pos = url.find('?');
    return pos == std::string_view::npos ? url : url.substr(0, pos);
}

// ============================================================================
// XML Utilities
// ============================================================================

auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string> {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    auto start_pos = xml.find(open_tag);
    if (start_pos == std::string::npos) {
        return std::nullopt;
    }
    start_pos += open_tag.length();

    auto end_pos = xml.find(close_tag, start_pos);
    if (end_pos == std::string::npos) {
        return std::nullopt;
    }

    return xml.substr(start_pos, end_pos - start_pos);
}

auto extract_xml_elements(const std::string& xml,
                          const std::string& tag) -> result<std::vector<std::string>> {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    std::vector<std::string> values;
    std::size_t pos = 0;
    while ((pos = xml.find(open_tag, pos)) != std::string::npos) {
        auto value_start = pos + open_tag.length();
        auto value_end = xml.find(close_tag, value_start);
        if (value_end == std::string::npos) {
            return unexpected(error(error_code::xml_parse_error,
                                    "Unterminated <" + tag + "> element"));
        }
        values.push_back(xml.substr(value_start, value_end - value_start));
        pos = value_end + close_tag.length();
    }

    return values;
}

auto decode_xml_entities(const std::string& text) -> std::string {
    if (text.find('&') == std::string::npos) {
        return text;
    }

    static constexpr std::pair<std::string_view, char> entities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''},
    };

    std::string decoded;
    decoded.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        bool replaced = false;
        if (text[i] == '&') {
            for (const auto& [entity, ch] : entities) {
                if (text.compare(i, entity.size(), entity) == 0) {
                    decoded += ch;
                    i += entity.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            decoded += text[i++];
        }
    }
    return decoded;
}

// ============================================================================
// String Utilities
// ============================================================================

auto to_lower(std::string_view value) -> std::string {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

auto iequals(std::string_view lhs, std::string_view rhs) -> bool {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

auto is_blank(std::string_view value) -> bool {
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

}  // namespace azblob::storage_utils
