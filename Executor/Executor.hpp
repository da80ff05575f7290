#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "../Log/Log.hpp"
#include "AExecutor_Strategy.hpp"
#include "ITaskExecutor.hpp"

namespace tsched::exec {

// Реестр стратегий: capability (payload["agent"]) -> стратегия.
// Собирается один раз при старте, потом seal() и только чтение.
class Executor final : public ITaskExecutor {
public:
    using Ctx = AExecutorStrategy::Ctx;
    using StrategyUP = std::unique_ptr<AExecutorStrategy>;

    explicit Executor(std::string routeKey = "agent") : routeKey_(std::move(routeKey)) {}

    // --- команды ---
    bool registerCommand(const std::string& key, StrategyUP strat) {
        if (!strat || sealed_) return false;
        return commands_.emplace(key, std::move(strat)).second;
    }
    bool hasCommand(const std::string& key) const { return commands_.find(key) != commands_.end(); }

    // --- init всех команд общим контекстом ---
    void initAll(const Ctx& ctx) {
        for (auto& kv : commands_) {
            if (kv.second) kv.second->init(ctx);
        }
    }

    void seal() { sealed_ = true; }
    bool sealed() const { return sealed_; }

    std::vector<std::string> capabilities() const {
        std::vector<std::string> out;
        out.reserve(commands_.size());
        for (const auto& kv : commands_) out.push_back(kv.first);
        return out;
    }

    ExecResult execute(const ExecRequest& req) override {
        const std::string key = req.payload.getString(routeKey_);
        if (key.empty())
            return ExecResult::failure("payload has no '" + routeKey_ + "' field");

        auto it = commands_.find(key);
        if (it == commands_.end()) {
            log::warn("Executor", "command not found: " + key);
            return ExecResult::failure("command not found: " + key);
        }

        try {
            return it->second->execute(req);
        } catch (const std::exception& e) {
            log::error("Executor", "error executing '" + key + "' for task " + req.taskId + ": " + e.what());
            return ExecResult::failure(e.what());
        } catch (...) {
            log::error("Executor", "unknown error executing '" + key + "' for task " + req.taskId);
            return ExecResult::failure("unknown error");
        }
    }

    const std::string& routeKey() const { return routeKey_; }

private:
    std::string routeKey_;
    std::unordered_map<std::string, StrategyUP> commands_;
    bool sealed_{false};
};

} // namespace tsched::exec
