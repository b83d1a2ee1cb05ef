/**
 * @file time_window_filter.cpp
 * @brief Partition-path parsing and hour-overlap filtering
 */

#include <azblob/storage/time_window_filter.h>
#include <azblob/storage/storage_utils.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace azblob {

namespace {

using time_point = std::chrono::system_clock::time_point;

auto is_leap_year(int year) -> bool {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

auto days_in_month(int year, int month) -> int {
    static constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return days[month - 1];
}

auto valid_hour_fields(int year, int month, int day, int hour) -> bool {
    return year >= 1970 && year <= 9999 &&
           month >= 1 && month <= 12 &&
           day >= 1 && day <= days_in_month(year, month) &&
           hour >= 0 && hour <= 23;
}

auto parse_number(std::string_view text) -> std::optional<int> {
    if (text.empty() || text.size() > 4) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

auto blob_path(std::string_view url) -> std::string {
    auto stripped = storage_utils::strip_query(url);
    auto scheme = stripped.find("://");
    if (scheme == std::string_view::npos) {
        return std::string(stripped);
    }
    auto path_start = stripped.find('/', scheme + 3);
    if (path_start == std::string_view::npos) {
        return {};
    }
    return std::string(stripped.substr(path_start + 1));
}

auto split_segments(std::string_view path) -> std::vector<std::string_view> {
    std::vector<std::string_view> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        if (end > start) {
            segments.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

// Result of reading the hierarchical layout
enum class hierarchical_match { absent, invalid, found };

auto parse_hierarchical(const std::string& path, blob_descriptor& descriptor)
    -> hierarchical_match {
    std::optional<std::string_view> year, month, day, hour, minute;

    for (auto segment : split_segments(path)) {
        auto eq = segment.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            continue;
        }
        auto key = segment.substr(0, eq);
        auto value = segment.substr(eq + 1);

        // Schema order: y, m (month), d, h, m (minute)
        if (key == "y") {
            if (!year) year = value;
        } else if (key == "m") {
            if (year && !month) {
                month = value;
            } else if (month && !minute) {
                minute = value;
            }
        } else if (key == "d") {
            if (!day) day = value;
        } else if (key == "h") {
            if (!hour) hour = value;
        }
    }

    if (!year || !month || !day || !hour) {
        return hierarchical_match::absent;
    }

    auto y = parse_number(*year);
    auto mo = parse_number(*month);
    auto d = parse_number(*day);
    auto h = parse_number(*hour);
    if (!y || !mo || !d || !h || !valid_hour_fields(*y, *mo, *d, *h)) {
        return hierarchical_match::invalid;
    }

    descriptor.scheme = partition_scheme::hierarchical;
    descriptor.year = *y;
    descriptor.month = *mo;
    descriptor.day = *d;
    descriptor.hour = *h;
    if (minute) {
        auto mi = parse_number(*minute);
        if (mi && *mi <= 59) {
            descriptor.minute = *mi;
        }
    }
    return hierarchical_match::found;
}

auto parse_legacy(const std::string& path, blob_descriptor& descriptor) -> bool {
    static const std::regex legacy_layout(R"(/(\d{4})/(\d{2})/(\d{2})/(\d{2})/)");

    // Relative names have no leading '/'
    std::string anchored = "/" + path;
    std::smatch match;
    if (!std::regex_search(anchored, match, legacy_layout)) {
        return false;
    }

    int y = std::stoi(match[1].str());
    int mo = std::stoi(match[2].str());
    int d = std::stoi(match[3].str());
    int h = std::stoi(match[4].str());
    if (!valid_hour_fields(y, mo, d, h)) {
        return false;
    }

    descriptor.scheme = partition_scheme::legacy;
    descriptor.year = y;
    descriptor.month = mo;
    descriptor.day = d;
    descriptor.hour = h;
    return true;
}

auto is_archive(std::string_view url) -> bool {
    auto path = storage_utils::strip_query(url);
    return path.find(".zip") != std::string_view::npos ||
           path.find(".gz") != std::string_view::npos;
}

// Minimal cursor over a timestamp string
class timestamp_reader {
public:
    explicit timestamp_reader(std::string_view text) : text_(text) {}

    auto digits(std::size_t count) -> std::optional<int> {
        if (pos_ + count > text_.size()) {
            return std::nullopt;
        }
        int value = 0;
        for (std::size_t i = 0; i < count; ++i) {
            char c = text_[pos_ + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            value = value * 10 + (c - '0');
        }
        pos_ += count;
        return value;
    }

    auto accept(char c) -> bool {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    [[nodiscard]] auto peek() const -> char {
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    [[nodiscard]] auto done() const -> bool { return pos_ == text_.size(); }

    auto skip() -> void { ++pos_; }

private:
    std::string_view text_;
    std::size_t pos_ = 0;
};

auto invalid_timestamp(std::string_view text) -> error {
    return error(error_code::invalid_argument,
                 "Invalid UTC timestamp: '" + std::string(text) + "'");
}

}  // namespace

auto blob_descriptor::hour_start() const -> time_point {
    return storage_utils::make_utc_time(year, month, day, hour);
}

auto blob_descriptor::hour_end() const -> time_point {
    return storage_utils::make_utc_time(year, month, day, hour, 59, 59);
}

auto parse_blob_partition(std::string_view url) -> std::optional<blob_descriptor> {
    blob_descriptor descriptor;
    descriptor.name = blob_path(url);

    switch (parse_hierarchical(descriptor.name, descriptor)) {
        case hierarchical_match::found:
            return descriptor;
        case hierarchical_match::invalid:
            return std::nullopt;
        case hierarchical_match::absent:
            break;
    }

    if (parse_legacy(descriptor.name, descriptor)) {
        return descriptor;
    }
    return std::nullopt;
}

auto parse_utc_timestamp(std::string_view text) -> result<time_point> {
    timestamp_reader reader(text);

    auto year = reader.digits(4);
    if (!year || !reader.accept('-')) return unexpected(invalid_timestamp(text));
    auto month = reader.digits(2);
    if (!month || !reader.accept('-')) return unexpected(invalid_timestamp(text));
    auto day = reader.digits(2);
    if (!day) return unexpected(invalid_timestamp(text));

    int hour = 0;
    int minute = 0;
    int second = 0;
    std::chrono::milliseconds fraction{0};
    std::chrono::minutes offset{0};

    if (!reader.done()) {
        if (!reader.accept('T') && !reader.accept('t') && !reader.accept(' ')) {
            return unexpected(invalid_timestamp(text));
        }
        auto h = reader.digits(2);
        if (!h || !reader.accept(':')) return unexpected(invalid_timestamp(text));
        auto mi = reader.digits(2);
        if (!mi) return unexpected(invalid_timestamp(text));
        hour = *h;
        minute = *mi;

        if (reader.accept(':')) {
            auto s = reader.digits(2);
            if (!s) return unexpected(invalid_timestamp(text));
            second = *s;

            if (reader.accept('.')) {
                int scale = 100;
                int millis = 0;
                bool any = false;
                while (std::isdigit(static_cast<unsigned char>(reader.peek()))) {
                    millis += (reader.peek() - '0') * scale;
                    scale /= 10;
                    any = true;
                    reader.skip();
                }
                if (!any) return unexpected(invalid_timestamp(text));
                fraction = std::chrono::milliseconds(millis);
            }
        }

        if (reader.accept('Z') || reader.accept('z')) {
            // UTC
        } else if (reader.peek() == '+' || reader.peek() == '-') {
            int sign = reader.peek() == '-' ? -1 : 1;
            reader.skip();
            auto oh = reader.digits(2);
            reader.accept(':');
            auto om = reader.digits(2);
            if (!oh || !om || *oh > 23 || *om > 59) {
                return unexpected(invalid_timestamp(text));
            }
            offset = std::chrono::minutes(sign * (*oh * 60 + *om));
        }
    }

    if (!reader.done() || !valid_hour_fields(*year, *month, *day, hour) ||
        minute > 59 || second > 59) {
        return unexpected(invalid_timestamp(text));
    }

    return storage_utils::make_utc_time(*year, *month, *day, hour, minute, second) +
           fraction - offset;
}

auto time_window::from_strings(std::string_view from, std::string_view to)
    -> result<time_window> {
    auto start_time = parse_utc_timestamp(from);
    if (!start_time) {
        return unexpected(start_time.error());
    }
    auto end_time = parse_utc_timestamp(to);
    if (!end_time) {
        return unexpected(end_time.error());
    }
    if (end_time.value() < start_time.value()) {
        return unexpected(error(error_code::invalid_argument,
                                "Time window ends before it starts"));
    }
    return between(start_time.value(), end_time.value());
}

auto time_window::resolve(time_point now) const
    -> std::optional<std::pair<time_point, time_point>> {
    if (minutes_back && *minutes_back > 0) {
        return std::make_pair(now - std::chrono::minutes(*minutes_back), now);
    }
    if (start && end) {
        return std::make_pair(*start, *end);
    }
    return std::nullopt;
}

time_window_filter::time_window_filter(filter_options options,
                                       std::shared_ptr<storage_logger> logger)
    : options_(options), logger_(ensure_logger(std::move(logger))) {}

auto time_window_filter::filter_blobs_by_date(const std::vector<std::string>& urls,
                                              const time_window& window,
                                              clock::time_point now) const
    -> std::vector<std::string> {
    auto range = window.resolve(now);
    if (!range) {
        return urls;
    }
    const auto [range_start, range_end] = *range;
    const auto range_text = storage_utils::format_iso8601(range_start) + " to " +
                            storage_utils::format_iso8601(range_end);

    AZB_LOG_INFO(*logger_, log_category::filter,
                 "Filtering " + std::to_string(urls.size()) + " blobs for " + range_text);

    if (options_.exclude_archives) {
        auto archives = std::count_if(urls.begin(), urls.end(),
                                      [](const std::string& url) { return is_archive(url); });
        if (archives > 0) {
            AZB_LOG_WARN(*logger_, log_category::filter,
                         std::to_string(archives) +
                             " archived exports (.zip/.gz) excluded from the window");
        }
    }

    std::vector<std::string> selected;
    selected.reserve(urls.size());
    std::size_t unparsed = 0;

    for (const auto& url : urls) {
        if (options_.exclude_archives && is_archive(url)) {
            if (options_.debug) {
                AZB_LOG_DEBUG(*logger_, log_category::filter, "Excluding archive: " + url);
            }
            continue;
        }

        auto descriptor = parse_blob_partition(url);
        if (!descriptor) {
            ++unparsed;
            if (options_.debug) {
                AZB_LOG_DEBUG(*logger_, log_category::filter,
                              "Keeping blob without a recognizable partition: " + url);
            }
            selected.push_back(url);
            continue;
        }

        auto hour_start = descriptor->hour_start();
        auto hour_end = descriptor->hour_end();
        bool overlaps = hour_end >= range_start && hour_start <= range_end;

        if (options_.debug) {
            auto hour_text = storage_utils::format_iso8601(hour_start) + " - " +
                             storage_utils::format_iso8601(hour_end);
            if (overlaps) {
                AZB_LOG_DEBUG(*logger_, log_category::filter,
                              std::string("Including ") + to_string(descriptor->scheme) +
                                  " blob " + descriptor->name + " (" + hour_text + ")");
            } else {
                AZB_LOG_DEBUG(*logger_, log_category::filter,
                              std::string("Excluding ") + to_string(descriptor->scheme) +
                                  " blob " + descriptor->name + " (" + hour_text + "): " +
                                  (hour_end < range_start ? "ends before the window starts"
                                                          : "starts after the window ends"));
            }
        }

        if (overlaps) {
            selected.push_back(url);
        }
    }

    if (unparsed > 0) {
        AZB_LOG_WARN(*logger_, log_category::filter,
                     std::to_string(unparsed) +
                         " blobs had no recognizable partition path and were kept");
    }
    AZB_LOG_INFO(*logger_, log_category::filter,
                 "Kept " + std::to_string(selected.size()) + " of " +
                     std::to_string(urls.size()) + " blobs");
    return selected;
}

auto filter_blobs_by_date(const std::vector<std::string>& urls,
                          const time_window& window,
                          std::chrono::system_clock::time_point now)
    -> std::vector<std::string> {
    return time_window_filter().filter_blobs_by_date(urls, window, now);
}

}  // namespace azblob
