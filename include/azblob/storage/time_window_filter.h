/**
 * @file time_window_filter.h
 * @brief Selects blobs whose partition hour overlaps a UTC time window
 *
 * Diagnostic log blobs are partitioned by hour, either hierarchically
 * (`y=2024/m=03/d=15/h=09/m=00/PT1H.json`) or with a legacy flat layout
 * (`/2024/03/15/09/`). Each blob is assumed to hold one full clock hour;
 * the minute segment is parsed but never narrows that hour. Sub-hour
 * partitions would need a different overlap rule.
 */

#ifndef AZBLOB_STORAGE_TIME_WINDOW_FILTER_H
#define AZBLOB_STORAGE_TIME_WINDOW_FILTER_H

#include <azblob/core/logging.h>
#include <azblob/core/types.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace azblob {

/**
 * @brief Blob path layout a partition was recognized from
 */
enum class partition_scheme {
    hierarchical,  ///< y=YYYY/m=MM/d=DD/h=HH[/m=mm]
    legacy         ///< /YYYY/MM/DD/HH/
};

[[nodiscard]] constexpr auto to_string(partition_scheme scheme) -> const char* {
    switch (scheme) {
        case partition_scheme::hierarchical: return "hierarchical";
        case partition_scheme::legacy: return "legacy";
        default: return "unknown";
    }
}

/**
 * @brief The hour a blob covers, as encoded in its path
 */
struct blob_descriptor {
    using time_point = std::chrono::system_clock::time_point;

    std::string name;  ///< blob path without host and query
    partition_scheme scheme = partition_scheme::hierarchical;
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    std::optional<int> minute;

    /// HH:00:00 of the covered hour
    [[nodiscard]] auto hour_start() const -> time_point;

    /// HH:59:59 of the covered hour
    [[nodiscard]] auto hour_end() const -> time_point;
};

/**
 * @brief Requested UTC window
 *
 * Either minutes_back (relative to the filter's notion of now) or both
 * start and end. A window with neither, or with only one bound, disables
 * filtering.
 */
struct time_window {
    using time_point = std::chrono::system_clock::time_point;

    std::optional<uint32_t> minutes_back;
    std::optional<time_point> start;
    std::optional<time_point> end;

    [[nodiscard]] static auto last_minutes(uint32_t minutes) -> time_window {
        time_window window;
        window.minutes_back = minutes;
        return window;
    }

    [[nodiscard]] static auto between(time_point from, time_point to) -> time_window {
        time_window window;
        window.start = from;
        window.end = to;
        return window;
    }

    /**
     * @brief Window from two timestamps accepted by parse_utc_timestamp()
     */
    [[nodiscard]] static auto from_strings(std::string_view from, std::string_view to)
        -> result<time_window>;

    /**
     * @brief Concrete [start, end] range, or nullopt when nothing is filtered
     */
    [[nodiscard]] auto resolve(time_point now) const
        -> std::optional<std::pair<time_point, time_point>>;
};

/**
 * @brief Filtering options
 */
struct filter_options {
    bool debug = false;             ///< log every include/exclude decision
    bool exclude_archives = false;  ///< drop .zip and .gz exports
};

/**
 * @brief Recognize the partition hour encoded in a blob URL or name
 *
 * The query string is ignored. The hierarchical layout is tried first:
 * path segments are read as ordered key=value pairs, and of the `m=`
 * segments following `y=` the first is the month and the next the minute.
 *
 * @return Descriptor, or nullopt when no layout matches or a field is out
 *         of range
 */
[[nodiscard]] auto parse_blob_partition(std::string_view url) -> std::optional<blob_descriptor>;

/**
 * @brief Parse YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)
 *
 * A date alone means midnight UTC; a missing offset means UTC.
 *
 * @return Time point, or invalid_argument
 */
[[nodiscard]] auto parse_utc_timestamp(std::string_view text)
    -> result<std::chrono::system_clock::time_point>;

/**
 * @brief Filters blob URLs by partition hour
 *
 * @code
 * time_window_filter filter({.debug = true}, logger);
 * auto recent = filter.filter_blobs_by_date(listing.urls, time_window::last_minutes(60));
 * @endcode
 */
class time_window_filter {
public:
    using clock = std::chrono::system_clock;

    explicit time_window_filter(filter_options options = {},
                                std::shared_ptr<storage_logger> logger = nullptr);

    /**
     * @brief Keep the URLs whose hour overlaps the window
     *
     * Blobs whose path matches no layout are kept. Input order is preserved.
     */
    [[nodiscard]] auto filter_blobs_by_date(const std::vector<std::string>& urls,
                                            const time_window& window,
                                            clock::time_point now = clock::now()) const
        -> std::vector<std::string>;

private:
    filter_options options_;
    std::shared_ptr<storage_logger> logger_;
};

/**
 * @brief Filter with default options
 * @see time_window_filter::filter_blobs_by_date
 */
[[nodiscard]] auto filter_blobs_by_date(const std::vector<std::string>& urls,
                                        const time_window& window,
                                        std::chrono::system_clock::time_point now =
                                            std::chrono::system_clock::now())
    -> std::vector<std::string>;

}  // namespace azblob

#endif  // AZBLOB_STORAGE_TIME_WINDOW_FILTER_H
