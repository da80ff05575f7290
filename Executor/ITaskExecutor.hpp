#pragma once
#include <string>

#include "../Task/TaskRecord.hpp"

namespace tsched::exec {

// Что именно передаём исполнителю при срабатывании задачи
struct ExecRequest {
    std::string  taskId;
    Payload      payload;
    EpochSeconds scheduledTime{0};
    EpochSeconds executionTime{0};
};

struct ExecResult {
    bool        ok{false};
    std::string status;   // "success", "error", ... (от стратегии)
    std::string message;

    static ExecResult success(std::string msg = "") { return {true, "success", std::move(msg)}; }
    static ExecResult failure(std::string msg)      { return {false, "error", std::move(msg)}; }
};

// Граница планировщика: синхронный вызов из рабочего потока
class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;
    virtual ExecResult execute(const ExecRequest& req) = 0;
};

} // namespace tsched::exec
