#include <stdexcept>
#include "primitive_date_time.hpp"

using namespace wallclock;

namespace {
    std::optional<Date> applyAdjustment(Date date, DateAdjustment adjustment) noexcept {
        switch (adjustment) {
            case DateAdjustment::Next:
                return date.nextDay();
            case DateAdjustment::Previous:
                return date.previousDay();
            case DateAdjustment::None:
                break;
        }
        return date;
    }
}

const PrimitiveDateTime PrimitiveDateTime::MIN{Date::MIN, Time::MIN};
const PrimitiveDateTime PrimitiveDateTime::MAX{Date::MAX, Time::MAX};

std::optional<PrimitiveDateTime> PrimitiveDateTime::checkedAdd(Duration duration) const noexcept {
    auto [adjustment, time] = times.adjustingAdd(duration);
    auto date = dates.checkedAdd(duration);
    if (!date) {
        return std::nullopt;
    }
    date = applyAdjustment(*date, adjustment);
    if (!date) {
        return std::nullopt;
    }
    return PrimitiveDateTime(*date, time);
}

std::optional<PrimitiveDateTime> PrimitiveDateTime::checkedSub(Duration duration) const noexcept {
    auto [adjustment, time] = times.adjustingSub(duration);
    auto date = dates.checkedSub(duration);
    if (!date) {
        return std::nullopt;
    }
    date = applyAdjustment(*date, adjustment);
    if (!date) {
        return std::nullopt;
    }
    return PrimitiveDateTime(*date, time);
}

std::string PrimitiveDateTime::toString() const {
    return dates.toString() + " " + times.toString();
}

PrimitiveDateTime &PrimitiveDateTime::operator+=(Duration duration) {
    *this = *this + duration;
    return *this;
}

PrimitiveDateTime &PrimitiveDateTime::operator+=(StdDuration duration) {
    *this = *this + duration;
    return *this;
}

PrimitiveDateTime &PrimitiveDateTime::operator-=(Duration duration) {
    *this = *this - duration;
    return *this;
}

PrimitiveDateTime &PrimitiveDateTime::operator-=(StdDuration duration) {
    *this = *this - duration;
    return *this;
}

PrimitiveDateTime wallclock::operator+(PrimitiveDateTime dateTime, Duration duration) {
    auto result = dateTime.checkedAdd(duration);
    if (!result) {
        throw std::overflow_error("resulting value is out of range");
    }
    return *result;
}

PrimitiveDateTime wallclock::operator+(PrimitiveDateTime dateTime, StdDuration duration) {
    auto [isNextDay, time] = dateTime.time().adjustingAddStd(duration);
    auto date = dateTime.date() + duration;
    if (isNextDay) {
        auto next = date.nextDay();
        if (!next) {
            throw std::overflow_error("resulting value is out of range");
        }
        date = *next;
    }
    return {date, time};
}

PrimitiveDateTime wallclock::operator-(PrimitiveDateTime dateTime, Duration duration) {
    auto result = dateTime.checkedSub(duration);
    if (!result) {
        throw std::overflow_error("resulting value is out of range");
    }
    return *result;
}

PrimitiveDateTime wallclock::operator-(PrimitiveDateTime dateTime, StdDuration duration) {
    auto [isPreviousDay, time] = dateTime.time().adjustingSubStd(duration);
    auto date = dateTime.date() - duration;
    if (isPreviousDay) {
        auto previous = date.previousDay();
        if (!previous) {
            throw std::overflow_error("resulting value is out of range");
        }
        date = *previous;
    }
    return {date, time};
}

Duration wallclock::operator-(PrimitiveDateTime lhs, PrimitiveDateTime rhs) {
    return (lhs.date() - rhs.date()) + (lhs.time() - rhs.time());
}

std::ostream &wallclock::operator<<(std::ostream &os, const PrimitiveDateTime &dateTime) {
    return os << dateTime.toString();
}
