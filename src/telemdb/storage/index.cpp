#include "telemdb/storage/index.h"
#include <algorithm>
#include <chrono>
#include <iterator>
#include <mutex>

namespace telemdb {
namespace storage {

SeriesIndex::SeriesIndex() {
    metrics_.reset();
}

SeriesIndex::~SeriesIndex() = default;

void SeriesIndex::add_to_posting_list(PostingList& list, core::SeriesID id) {
    // Binary search to find insertion point (maintain sorted order)
    auto insert_pos = std::lower_bound(list.begin(), list.end(), id);
    if (insert_pos == list.end() || *insert_pos != id) {
        list.insert(insert_pos, id);
    }
}

SeriesIndex::PostingList SeriesIndex::intersect_posting_lists(const PostingList& a, const PostingList& b) const {
    PostingList result;
    result.reserve(std::min(a.size(), b.size()));
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(result));
    metrics_.intersect_count.fetch_add(1, std::memory_order_relaxed);
    return result;
}

std::shared_ptr<Series> SeriesIndex::get_or_create(const core::SeriesKey& key) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = ids_.find(key);
        if (it != ids_.end()) {
            return series_.at(it->second);
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    // Another writer may have created it between the two locks
    auto it = ids_.find(key);
    if (it != ids_.end()) {
        return series_.at(it->second);
    }

    const core::SeriesID id = next_id_++;
    auto series = std::make_shared<Series>(id, key);
    ids_.emplace(key, id);
    series_.emplace(id, series);

    add_to_posting_list(measurement_postings_[key.measurement()], id);
    for (const auto& [name, value] : key.tags().map()) {
        add_to_posting_list(tag_postings_[{name, value}], id);
    }

    metrics_.add_count.fetch_add(1, std::memory_order_relaxed);
    return series;
}

std::shared_ptr<Series> SeriesIndex::find(const core::SeriesKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = ids_.find(key);
    if (it == ids_.end()) {
        return nullptr;
    }
    return series_.at(it->second);
}

std::vector<std::shared_ptr<Series>> SeriesIndex::find_series(const std::string& measurement,
                                                              const core::Tags& filter) const {
    auto start = std::chrono::steady_clock::now();
    std::vector<std::shared_ptr<Series>> result;

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto mit = measurement_postings_.find(measurement);
        if (mit != measurement_postings_.end()) {
            PostingList candidates = mit->second;

            for (const auto& [name, value] : filter.map()) {
                auto tit = tag_postings_.find({name, value});
                if (tit == tag_postings_.end()) {
                    // If any equality filter finds nothing, the intersection is empty
                    candidates.clear();
                    break;
                }
                candidates = intersect_posting_lists(candidates, tit->second);
                if (candidates.empty()) {
                    break;
                }
            }

            result.reserve(candidates.size());
            for (core::SeriesID id : candidates) {
                result.push_back(series_.at(id));
            }
        }
    }

    auto duration_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count();
    metrics_.lookup_count.fetch_add(1, std::memory_order_relaxed);
    metrics_.lookup_time_us.fetch_add(static_cast<uint64_t>(duration_us), std::memory_order_relaxed);
    return result;
}

std::vector<std::shared_ptr<Series>> SeriesIndex::all_series() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<Series>> result;
    result.reserve(ids_.size());
    for (const auto& entry : ids_) {
        result.push_back(series_.at(entry.second));
    }
    return result;
}

void SeriesIndex::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ids_.clear();
    series_.clear();
    measurement_postings_.clear();
    tag_postings_.clear();
}

size_t SeriesIndex::num_series() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return ids_.size();
}

size_t SeriesIndex::num_posting_lists() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return measurement_postings_.size() + tag_postings_.size();
}

} // namespace storage
} // namespace telemdb
