#pragma once
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "../Json/Json.hpp"
#include "../Log/Log.hpp"
#include "Scheduler.hpp"

namespace tsched::cmd {

// Варианты команд управляющего протокола ({"action": "..."})
struct ScheduleTask    { ScheduleRequest req; };
struct CancelTask      { std::string taskId; };
struct GetPendingTasks {};
struct StartScheduler  {};
struct StopScheduler   {};
struct GetStats        {};

using Command = std::variant<ScheduleTask, CancelTask, GetPendingTasks, StartScheduler, StopScheduler, GetStats>;

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

inline const char* toString(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE:       return "none";
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::NOT_FOUND:  return "not_found";
        case ErrorKind::INTERNAL:   return "internal";
    }
    return "internal";
}

// -------------------------- PARSE --------------------------

// execution_time: число (epoch), ISO-строка или {"delay_seconds": N}; либо delay_seconds на верхнем уровне
inline DueTimeSpec parseDueTime(const json::Value& body) {
    const json::Value* et = body.find("execution_time");
    if (et && !et->isNull()) {
        if (et->isNumber()) return at(et->asDouble());
        if (et->isString()) return iso(et->asString());
        if (et->isObject()) {
            const json::Value* d = et->find("delay_seconds");
            if (d && d->isNumber()) return in(std::chrono::duration<double>(d->asDouble()));
        }
        throw ValidationError("execution_time must be an epoch number, an ISO-8601 string or {\"delay_seconds\": N}");
    }
    if (const json::Value* d = body.find("delay_seconds"); d && d->isNumber())
        return in(std::chrono::duration<double>(d->asDouble()));
    throw ValidationError("execution_time is required");
}

inline ScheduleRequest parseScheduleRequest(const json::Value& body) {
    if (!body.isObject()) throw ValidationError("schedule request must be a JSON object");

    ScheduleRequest req;
    const json::Value* data = body.find("task_data");
    req.payload = data ? *data : json::Value::object();
    req.when    = parseDueTime(body);

    try {
        if (const auto* p = body.find("priority"); p && !p->isNull())
            req.priority = checkedPriority(p->asInt());
        if (const auto* id = body.find("task_id"); id && !id->isNull())
            req.taskId = id->asString();
        if (const auto* r = body.find("recurring"); r && !r->isNull())
            req.recurring = r->asBool();
        if (const auto* iv = body.find("recurrence_interval"); iv && !iv->isNull()) {
            const std::int64_t secs = iv->asInt();
            if (secs <= 0 || secs > kMaxRecurrenceSeconds)
                throw ValidationError("recurrence_interval out of range: " + std::to_string(secs));
            req.interval = std::chrono::seconds(secs);
        }
    } catch (const ValidationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ValidationError(std::string("bad schedule request field: ") + e.what());
    }
    return req;
}

inline Command parseCommand(const json::Value& body) {
    if (!body.isObject()) throw ValidationError("command must be a JSON object");
    const std::string action = body.getString("action");

    if (action == "schedule_task")     return ScheduleTask{parseScheduleRequest(body)};
    if (action == "cancel_task") {
        const json::Value* id = body.find("task_id");
        if (!id || !id->isString()) throw ValidationError("cancel_task requires a string task_id");
        return CancelTask{id->asString()};
    }
    if (action == "get_pending_tasks") return GetPendingTasks{};
    if (action == "start_scheduler")   return StartScheduler{};
    if (action == "stop_scheduler")    return StopScheduler{};
    if (action == "get_stats")         return GetStats{};
    throw ValidationError("Unknown action: " + action);
}

// -------------------------- RENDER --------------------------

inline json::Value toJson(const OpResult& r) {
    json::Value v = json::Value::object();
    v["status"]  = tsched::toString(r.status);
    v["message"] = r.message;
    if (r.status == Status::ERROR) v["error"] = toString(r.error);
    return v;
}

inline json::Value toJson(const ScheduleResult& r) {
    json::Value v = toJson(static_cast<const OpResult&>(r));
    if (r.ok()) {
        v["task_id"]        = r.taskId;
        v["execution_time"] = formatIsoTimestamp(r.executionTime);
        v["timestamp"]      = r.executionTime;
    }
    return v;
}

inline json::Value toJson(const std::vector<PendingTask>& tasks) {
    json::Value arr = json::Value::array();
    for (const auto& t : tasks) {
        json::Value e = json::Value::object();
        e["task_id"]             = t.taskId;
        e["execution_time"]      = formatIsoTimestamp(t.executionTime);
        e["timestamp"]           = t.executionTime;
        e["priority"]            = t.priority;
        e["recurring"]           = t.recurring;
        e["recurrence_interval"] = t.interval ? json::Value((long long)t.interval->count()) : json::Value(nullptr);
        e["summary"]             = t.summary;
        arr.push_back(std::move(e));
    }
    json::Value v = json::Value::object();
    v["status"]        = "success";
    v["pending_tasks"] = std::move(arr);
    return v;
}

inline json::Value toJson(const SchedulerStats& s) {
    json::Value st = json::Value::object();
    st["total_scheduled"] = (long long)s.totalScheduled;
    st["total_executed"]  = (long long)s.totalExecuted;
    st["total_failed"]    = (long long)s.totalFailed;
    st["tasks_in_queue"]  = (long long)s.tasksInQueue;
    st["last_execution"]  = s.lastExecution ? json::Value(formatIsoTimestamp(*s.lastExecution)) : json::Value(nullptr);
    st["running"]         = s.running;

    json::Value v = json::Value::object();
    v["status"] = "success";
    v["stats"]  = std::move(st);
    return v;
}

// -------------------------- RUN --------------------------

// Не бросает: любая ошибка -> {"status":"error","error":"internal"}
inline json::Value run(Scheduler& sched, const Command& c) {
    try {
        return std::visit(overloaded{
            [&](const ScheduleTask& x)    { return toJson(sched.schedule(x.req)); },
            [&](const CancelTask& x)      { return toJson(sched.cancel(x.taskId)); },
            [&](const GetPendingTasks&)   { return toJson(sched.listPending()); },
            [&](const StartScheduler&)    { return toJson(sched.start()); },
            [&](const StopScheduler&)     { return toJson(sched.stop()); },
            [&](const GetStats&)          { return toJson(sched.getStats()); },
        }, c);
    } catch (const std::exception& e) {
        log::error("Commands", std::string("command failed: ") + e.what());
        return toJson(OpResult::fail(ErrorKind::INTERNAL, e.what()));
    }
}

// parse + run; ошибки разбора тоже превращаются в {"status":"error"}
inline json::Value handle(Scheduler& sched, const json::Value& body) {
    try {
        return run(sched, parseCommand(body));
    } catch (const ValidationError& e) {
        return toJson(OpResult::fail(ErrorKind::VALIDATION, e.what()));
    } catch (const std::exception& e) {
        log::error("Commands", std::string("bad command: ") + e.what());
        return toJson(OpResult::fail(ErrorKind::INTERNAL, e.what()));
    }
}

} // namespace tsched::cmd
