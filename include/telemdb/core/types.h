#ifndef TELEMDB_CORE_TYPES_H_
#define TELEMDB_CORE_TYPES_H_

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace telemdb {
namespace core {

/**
 * @brief Represents a unique identifier for a series inside one index
 */
using SeriesID = uint64_t;

/**
 * @brief Represents a timestamp in milliseconds since Unix epoch
 */
using Timestamp = int64_t;

/**
 * @brief Represents a duration in milliseconds
 */
using Duration = int64_t;

/**
 * @brief Represents a set of tags that scope a measurement to an entity
 *
 * Tags are kept sorted by name, so two tag sets built in different orders
 * compare equal.
 */
class Tags {
public:
    using Map = std::map<std::string, std::string>;

    Tags() = default;
    explicit Tags(const Map& tags);
    Tags(std::initializer_list<Map::value_type> tags);

    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);
    void clear();
    bool has(const std::string& name) const;
    std::optional<std::string> get(const std::string& name) const;

    /**
     * @brief True if every tag in `filter` is present here with an equal value
     */
    bool contains(const Tags& filter) const;

    const Map& map() const { return tags_; }
    bool empty() const { return tags_.empty(); }
    size_t size() const { return tags_.size(); }

    bool operator==(const Tags& other) const;
    bool operator!=(const Tags& other) const;
    bool operator<(const Tags& other) const;

    std::string to_string() const;

private:
    Map tags_;
};

/**
 * @brief Named numeric values carried by a point
 */
using Fields = std::map<std::string, double>;

/**
 * @brief One timestamped observation. Immutable once constructed.
 */
class Point {
public:
    Point(Timestamp ts, Fields fields, Tags tags);

    Timestamp timestamp() const { return timestamp_; }
    const Fields& fields() const { return fields_; }
    const Tags& tags() const { return tags_; }

    std::optional<double> field(const std::string& name) const;

    bool operator==(const Point& other) const;
    bool operator!=(const Point& other) const;

private:
    Timestamp timestamp_;
    Fields fields_;
    Tags tags_;
};

using PointPtr = std::shared_ptr<const Point>;
using PointList = std::vector<PointPtr>;

/**
 * @brief Identity of a series: a measurement plus its sorted tag set
 */
class SeriesKey {
public:
    SeriesKey() = default;
    SeriesKey(std::string measurement, Tags tags);

    const std::string& measurement() const { return measurement_; }
    const Tags& tags() const { return tags_; }

    /**
     * @brief Measurement equality plus tag superset match
     */
    bool matches(const std::string& measurement, const Tags& filter) const;

    bool operator==(const SeriesKey& other) const;
    bool operator!=(const SeriesKey& other) const;
    bool operator<(const SeriesKey& other) const;

    /**
     * @brief Canonical form `measurement,tag1=val1,tag2=val2`
     *
     * Backslash, comma and equals inside names and values are escaped with a
     * backslash so that parse() can always recover the original key.
     */
    std::string to_string() const;

    static std::optional<SeriesKey> parse(const std::string& canonical);

private:
    std::string measurement_;
    Tags tags_;
};

} // namespace core
} // namespace telemdb

#endif // TELEMDB_CORE_TYPES_H_
