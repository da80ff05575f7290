#pragma once
#include <atomic>

#include "../Log/Log.hpp"
#include "AExecutor_Strategy.hpp"

namespace tsched::exec {

// Пишет событие в лог и считает задачу выполненной
class ExecutorStrategyLog final : public AExecutorStrategy {
public:
    ExecutorStrategyLog() = default;
    explicit ExecutorStrategyLog(std::string tag) : tag_(std::move(tag)) {}

    ExecResult execute(const ExecRequest& req) override {
        log::info(tag_, "task " + req.taskId
                            + " scheduled=" + formatIsoTimestamp(req.scheduledTime)
                            + " data=" + req.payload.dump());
        ++calls_;
        return ExecResult::success("logged");
    }

    std::string name() const override { return "LOG"; }
    std::size_t calls() const { return calls_.load(); }

private:
    std::string tag_{"Task"};
    std::atomic<std::size_t> calls_{0};
};

} // namespace tsched::exec
