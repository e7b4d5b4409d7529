#ifndef TELEMDB_STORAGE_INDEX_H_
#define TELEMDB_STORAGE_INDEX_H_

#include <atomic>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "telemdb/core/types.h"
#include "telemdb/storage/series.h"

namespace telemdb {
namespace storage {

/**
 * @brief Index metrics for performance monitoring
 */
struct IndexMetrics {
    std::atomic<uint64_t> add_count{0};
    std::atomic<uint64_t> lookup_count{0};
    std::atomic<uint64_t> intersect_count{0};
    std::atomic<uint64_t> lookup_time_us{0};

    void reset() {
        add_count = 0;
        lookup_count = 0;
        intersect_count = 0;
        lookup_time_us = 0;
    }
};

/**
 * @brief Maps series keys to series, with inverted postings for tag matching
 *
 * Forward index: SeriesKey -> SeriesID -> Series.
 * Inverted index: measurement -> posting list, (tag name, tag value) -> posting list.
 * Posting lists are sorted vectors of SeriesID, so a query is the
 * intersection of the measurement list with one list per filter tag.
 *
 * Series are never removed individually; a series emptied by retention stays
 * visible until clear().
 */
class SeriesIndex {
public:
    SeriesIndex();
    ~SeriesIndex();

    /**
     * @brief Find the series for `key`, creating it on first use
     */
    std::shared_ptr<Series> get_or_create(const core::SeriesKey& key);

    std::shared_ptr<Series> find(const core::SeriesKey& key) const;

    /**
     * @brief Series whose measurement equals `measurement` and whose tags are
     *        a superset of `filter`, in creation order
     */
    std::vector<std::shared_ptr<Series>> find_series(const std::string& measurement,
                                                     const core::Tags& filter) const;

    std::vector<std::shared_ptr<Series>> all_series() const;

    void clear();

    // Get index statistics for monitoring
    size_t num_series() const;
    size_t num_posting_lists() const;

    IndexMetrics& get_metrics() { return metrics_; }
    const IndexMetrics& get_metrics() const { return metrics_; }

private:
    using PostingList = std::vector<core::SeriesID>;

    static void add_to_posting_list(PostingList& list, core::SeriesID id);
    PostingList intersect_posting_lists(const PostingList& a, const PostingList& b) const;

    std::map<core::SeriesKey, core::SeriesID> ids_;
    std::unordered_map<core::SeriesID, std::shared_ptr<Series>> series_;
    std::map<std::string, PostingList> measurement_postings_;
    std::map<std::pair<std::string, std::string>, PostingList> tag_postings_;
    core::SeriesID next_id_ = 1;

    mutable std::shared_mutex mutex_;  // Protects concurrent access to index
    mutable IndexMetrics metrics_;
};

} // namespace storage
} // namespace telemdb

#endif // TELEMDB_STORAGE_INDEX_H_
