#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../Task/TaskRecord.hpp"

namespace tsched {

enum class Status : uint8_t { SUCCESS, ERROR, INFO };
enum class ErrorKind : uint8_t { NONE, VALIDATION, NOT_FOUND, INTERNAL };

inline const char* toString(Status s) {
    switch (s) {
        case Status::SUCCESS: return "success";
        case Status::ERROR:   return "error";
        case Status::INFO:    return "info";
    }
    return "error";
}

struct OpResult {
    Status      status{Status::SUCCESS};
    ErrorKind   error{ErrorKind::NONE};
    std::string message;

    bool ok() const { return status != Status::ERROR; }

    static OpResult success(std::string msg) { return {Status::SUCCESS, ErrorKind::NONE, std::move(msg)}; }
    static OpResult info(std::string msg)    { return {Status::INFO, ErrorKind::NONE, std::move(msg)}; }
    static OpResult fail(ErrorKind k, std::string msg) { return {Status::ERROR, k, std::move(msg)}; }
};

struct ScheduleResult : OpResult {
    std::string  taskId;
    EpochSeconds executionTime{0};
};

// Параметры schedule(); значения по умолчанию как у публичной операции
struct ScheduleRequest {
    Payload                             payload;
    DueTimeSpec                         when{DueIn{std::chrono::seconds(0)}};
    int                                 priority{1};
    std::optional<std::string>          taskId;
    bool                                recurring{false};
    std::optional<std::chrono::seconds> interval;
};

struct PendingTask {
    std::string                         taskId;
    EpochSeconds                        executionTime{0};
    int                                 priority{1};
    bool                                recurring{false};
    std::optional<std::chrono::seconds> interval;
    std::string                         summary;
};

struct SchedulerStats {
    std::uint64_t               totalScheduled{0};
    std::uint64_t               totalExecuted{0};   // включая неудачные
    std::uint64_t               totalFailed{0};
    std::size_t                 tasksInQueue{0};
    std::optional<EpochSeconds> lastExecution;
    bool                        running{false};
};

} // namespace tsched
