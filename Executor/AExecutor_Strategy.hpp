#pragma once
#include <any>
#include <string>
#include <unordered_map>

#include "ITaskExecutor.hpp"

namespace tsched::exec {

class AExecutorStrategy {
public:
    using Ctx = std::unordered_map<std::string, std::any>;

    virtual ~AExecutorStrategy() = default;

    // Основной вызов
    virtual ExecResult execute(const ExecRequest& req) = 0;

    // Инициализация зависимостей (по умолчанию: ничего)
    virtual void init(const Ctx& /*ctx*/) {}

    // Имя стратегии (для логов/отладки)
    virtual std::string name() const { return "AExecutorStrategy"; }
};

} // namespace tsched::exec
