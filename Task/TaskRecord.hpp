#pragma once
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <variant>

#include "../Json/Json.hpp"
#include "Clock.hpp"
#include "Errors.hpp"

namespace tsched {

using Payload = json::Value;

struct TaskRecord {
    std::string                         id;
    EpochSeconds                        dueTime{0};
    int                                 priority{1};   // меньше значит раньше
    Payload                             payload;
    bool                                recurring{false};
    std::optional<std::chrono::seconds> interval;      // только для recurring
    EpochSeconds                        createdAt{0};  // информативно
    bool                                cancelled{false};
    std::uint64_t                       seq{0};        // порядок вставки, последний tie-break
};

// Строгий порядок кучи: (dueTime, priority, seq)
inline bool runsBefore(const TaskRecord& a, const TaskRecord& b) {
    if (a.dueTime != b.dueTime)   return a.dueTime < b.dueTime;
    if (a.priority != b.priority) return a.priority < b.priority;
    return a.seq < b.seq;
}

// -------------------------
// Due time spec
// -------------------------
struct DueAt { EpochSeconds epoch; };                 // абсолютное время
struct DueIn { std::chrono::duration<double> delay; };  // смещение от now
struct DueIso { std::string text; };                   // ISO-8601 строка

using DueTimeSpec = std::variant<DueAt, DueIn, DueIso>;

inline DueTimeSpec at(EpochSeconds t) { return DueAt{t}; }
inline DueTimeSpec in(std::chrono::duration<double> d) { return DueIn{d}; }
inline DueTimeSpec iso(std::string s) { return DueIso{std::move(s)}; }

// Интервал серии не длиннее 100 лет
constexpr std::int64_t kMaxRecurrenceSeconds = 100LL * 366 * 24 * 3600;

inline void validateDueTime(EpochSeconds t) {
    if (!std::isfinite(t) || t <= 0)
        throw ValidationError("Execution time must be a positive finite epoch time");
    if (t > kMaxEpochSeconds)
        throw ValidationError("Execution time is after 9999-12-31T23:59:59Z");
}

inline EpochSeconds resolveDueTime(const DueTimeSpec& spec, EpochSeconds now) {
    EpochSeconds t = 0;
    if (auto a = std::get_if<DueAt>(&spec)) {
        t = a->epoch;
    } else if (auto d = std::get_if<DueIn>(&spec)) {
        t = now + d->delay.count();
    } else {
        t = parseIsoTimestamp(std::get<DueIso>(spec).text);
    }
    validateDueTime(t);
    return t;
}

inline void validateRecurrence(bool recurring, const std::optional<std::chrono::seconds>& interval) {
    if (!recurring) return;
    if (!interval || interval->count() <= 0)
        throw ValidationError("Recurring task requires a positive recurrence interval");
    if (interval->count() > kMaxRecurrenceSeconds)
        throw ValidationError("Recurrence interval is longer than 100 years");
}

inline int checkedPriority(std::int64_t v) {
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        throw ValidationError("Priority out of range: " + std::to_string(v));
    return (int)v;
}

// Для list_pending: "<agent>.<action>"
inline std::string summarize(const Payload& p) {
    return p.getString("agent", "unknown") + "." + p.getString("action", "unknown");
}

// Корень серии: "report_next_1700000000_next_1700000060" -> "report"
inline std::string seriesRoot(const std::string& id) {
    auto pos = id.find("_next_");
    return pos == std::string::npos ? id : id.substr(0, pos);
}

} // namespace tsched
