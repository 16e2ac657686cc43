#include "cronlet/cron/schedule.hpp"

namespace cronlet::cron {

auto FieldValueSet::contains(int value) const noexcept -> bool {
    if (value < 0 || value >= kCapacity) return false;
    return bits_.test(static_cast<std::size_t>(value));
}

void FieldValueSet::insert(int value) {
    bits_.set(static_cast<std::size_t>(value));
}

void FieldValueSet::insert_range(int start, int end, int step) {
    for (int v = start; v <= end; v += step) {
        insert(v);
    }
}

auto FieldValueSet::values() const -> std::vector<int> {
    std::vector<int> result;
    result.reserve(size());
    auto [min, max] = bounds();
    for (int v = min; v <= max; ++v) {
        if (contains(v)) result.push_back(v);
    }
    return result;
}

auto FieldValueSet::full() const noexcept -> bool {
    auto [min, max] = bounds();
    return size() == static_cast<std::size_t>(max - min + 1);
}

auto ParsedSchedule::field(FieldName name) const -> const FieldValueSet& {
    switch (name) {
        case FieldName::Second: return second;
        case FieldName::Minute: return minute;
        case FieldName::Hour: return hour;
        case FieldName::Day: return day;
        case FieldName::Month: return month;
        case FieldName::Weekday: return weekday;
    }
    return minute;
}

auto ParsedSchedule::field(FieldName name) -> FieldValueSet& {
    const auto& self = *this;
    return const_cast<FieldValueSet&>(self.field(name));
}

auto ParsedSchedule::describe() const -> std::string {
    std::string out;
    auto append = [&out](const FieldValueSet& set) {
        out += to_string(set.field());
        out += ": ";
        if (set.full()) {
            out += "*";
        } else {
            bool first = true;
            for (int v : set.values()) {
                if (!first) out += ",";
                out += std::to_string(v);
                first = false;
            }
        }
        out += "\n";
    };

    if (has_seconds) append(second);
    append(minute);
    append(hour);
    append(day);
    append(month);
    append(weekday);
    return out;
}

} // namespace cronlet::cron
