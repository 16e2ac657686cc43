#pragma once

#include <bitset>
#include <cstdint>
#include <string>
#include <vector>

#include "cronlet/cron/token.hpp"

namespace cronlet::cron {

struct FieldBounds {
    int min;
    int max;
};

/// Inclusive bounds of each field. Weekday 0 is Sunday.
constexpr auto field_bounds(FieldName field) -> FieldBounds {
    switch (field) {
        case FieldName::Second: return {0, 59};
        case FieldName::Minute: return {0, 59};
        case FieldName::Hour: return {0, 23};
        case FieldName::Day: return {1, 31};
        case FieldName::Month: return {1, 12};
        case FieldName::Weekday: return {0, 6};
    }
    return {0, 0};
}

/// The permitted values of one field, indexed by value.
class FieldValueSet {
public:
    static constexpr int kCapacity = 64;

    FieldValueSet() = default;
    explicit FieldValueSet(FieldName field) : field_(field) {}

    [[nodiscard]] auto field() const noexcept -> FieldName { return field_; }
    [[nodiscard]] auto bounds() const noexcept -> FieldBounds { return field_bounds(field_); }

    /// Values outside the field's bounds are never members.
    [[nodiscard]] auto contains(int value) const noexcept -> bool;

    /// Callers guarantee `value` lies within bounds().
    void insert(int value);

    /// Mark `start, start + step, ...` up to and including `end`.
    void insert_range(int start, int end, int step = 1);

    /// Members in ascending order.
    [[nodiscard]] auto values() const -> std::vector<int>;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return bits_.count(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return bits_.none(); }

    /// True when every value in the field's bounds is a member.
    [[nodiscard]] auto full() const noexcept -> bool;

    auto operator==(const FieldValueSet&) const -> bool = default;

private:
    FieldName field_ = FieldName::Minute;
    std::bitset<kCapacity> bits_;
};

/// Per-field permitted values of a schedule. Built once by the expander
/// and never modified afterwards.
struct ParsedSchedule {
    bool has_seconds = false;
    FieldValueSet second{FieldName::Second};
    FieldValueSet minute{FieldName::Minute};
    FieldValueSet hour{FieldName::Hour};
    FieldValueSet day{FieldName::Day};
    FieldValueSet month{FieldName::Month};
    FieldValueSet weekday{FieldName::Weekday};

    [[nodiscard]] auto field(FieldName name) const -> const FieldValueSet&;
    [[nodiscard]] auto field(FieldName name) -> FieldValueSet&;

    /// One line per field, e.g. "minute: 0,15,30,45" (full fields print "*").
    [[nodiscard]] auto describe() const -> std::string;

    auto operator==(const ParsedSchedule&) const -> bool = default;
};

} // namespace cronlet::cron
