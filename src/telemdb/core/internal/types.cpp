#include "telemdb/core/types.h"
#include "telemdb/core/error.h"
#include <algorithm>
#include <sstream>

namespace telemdb {
namespace core {

namespace {

void append_escaped(std::string& out, const std::string& text) {
    for (char c : text) {
        if (c == '\\' || c == ',' || c == '=') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
}

} // namespace

Tags::Tags(const Map& tags) {
    for (const auto& [name, value] : tags) {
        add(name, value);
    }
}

Tags::Tags(std::initializer_list<Map::value_type> tags) {
    for (const auto& [name, value] : tags) {
        add(name, value);
    }
}

void Tags::add(const std::string& name, const std::string& value) {
    if (name.empty()) {
        throw InvalidArgumentError("Tag name cannot be empty");
    }
    tags_[name] = value;
}

void Tags::remove(const std::string& name) {
    tags_.erase(name);
}

void Tags::clear() {
    tags_.clear();
}

bool Tags::has(const std::string& name) const {
    return tags_.find(name) != tags_.end();
}

std::optional<std::string> Tags::get(const std::string& name) const {
    auto it = tags_.find(name);
    if (it != tags_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Tags::contains(const Tags& filter) const {
    return std::all_of(filter.tags_.begin(), filter.tags_.end(), [this](const auto& entry) {
        auto it = tags_.find(entry.first);
        return it != tags_.end() && it->second == entry.second;
    });
}

bool Tags::operator==(const Tags& other) const {
    return tags_ == other.tags_;
}

bool Tags::operator!=(const Tags& other) const {
    return !(*this == other);
}

bool Tags::operator<(const Tags& other) const {
    return tags_ < other.tags_;
}

std::string Tags::to_string() const {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [name, value] : tags_) {
        if (!first) {
            oss << ", ";
        }
        oss << name << "=\"" << value << "\"";
        first = false;
    }
    oss << "}";
    return oss.str();
}

Point::Point(Timestamp ts, Fields fields, Tags tags)
    : timestamp_(ts), fields_(std::move(fields)), tags_(std::move(tags)) {}

std::optional<double> Point::field(const std::string& name) const {
    auto it = fields_.find(name);
    if (it != fields_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Point::operator==(const Point& other) const {
    return timestamp_ == other.timestamp_ && fields_ == other.fields_ && tags_ == other.tags_;
}

bool Point::operator!=(const Point& other) const {
    return !(*this == other);
}

SeriesKey::SeriesKey(std::string measurement, Tags tags)
    : measurement_(std::move(measurement)), tags_(std::move(tags)) {
    if (measurement_.empty()) {
        throw InvalidArgumentError("Measurement cannot be empty");
    }
}

bool SeriesKey::matches(const std::string& measurement, const Tags& filter) const {
    return measurement_ == measurement && tags_.contains(filter);
}

bool SeriesKey::operator==(const SeriesKey& other) const {
    return measurement_ == other.measurement_ && tags_ == other.tags_;
}

bool SeriesKey::operator!=(const SeriesKey& other) const {
    return !(*this == other);
}

bool SeriesKey::operator<(const SeriesKey& other) const {
    if (measurement_ != other.measurement_) {
        return measurement_ < other.measurement_;
    }
    return tags_ < other.tags_;
}

std::string SeriesKey::to_string() const {
    std::string out;
    append_escaped(out, measurement_);
    for (const auto& [name, value] : tags_.map()) {
        out.push_back(',');
        append_escaped(out, name);
        out.push_back('=');
        append_escaped(out, value);
    }
    return out;
}

std::optional<SeriesKey> SeriesKey::parse(const std::string& canonical) {
    enum class Part { MEASUREMENT, NAME, VALUE };

    std::string measurement;
    std::string name;
    std::string value;
    Tags tags;
    Part part = Part::MEASUREMENT;
    std::string* current = &measurement;

    auto finish_segment = [&]() -> bool {
        if (part == Part::MEASUREMENT) {
            return !measurement.empty();
        }
        if (part == Part::NAME || name.empty()) {
            return false;
        }
        tags.add(name, value);
        name.clear();
        value.clear();
        return true;
    };

    for (size_t i = 0; i < canonical.size(); ++i) {
        char c = canonical[i];
        if (c == '\\') {
            if (i + 1 >= canonical.size()) {
                return std::nullopt;
            }
            current->push_back(canonical[++i]);
        } else if (c == ',') {
            if (!finish_segment()) {
                return std::nullopt;
            }
            part = Part::NAME;
            current = &name;
        } else if (c == '=') {
            if (part != Part::NAME) {
                return std::nullopt;
            }
            part = Part::VALUE;
            current = &value;
        } else {
            current->push_back(c);
        }
    }
    if (!finish_segment()) {
        return std::nullopt;
    }
    return SeriesKey(std::move(measurement), std::move(tags));
}

} // namespace core
} // namespace telemdb
