#include "API/HttpServer.hpp"
#include "Config/Config.hpp"
#include "Executor/Executor.hpp"
#include "Executor/Executor_Strategy_Log.hpp"
#include "Executor/Executor_Strategy_Webhook.hpp"
#include "Log/Log.hpp"
#include "Scheduler/Scheduler.hpp"
#include "Store/FileTaskStore.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <thread>

using namespace std::chrono_literals;
using namespace tsched;

static std::atomic<bool> g_stop{false};
static void install_signal_handlers(){
    std::signal(SIGINT,  [](int){ g_stop = true; });
    std::signal(SIGTERM, [](int){ g_stop = true; });
}

// Реестр исполнителей собирается один раз из конфига
static void build_executors(exec::Executor& ex, const TS_Config& cfg) {
    for (const auto& spec : cfg.executors) {
        std::unique_ptr<exec::AExecutorStrategy> strat;
        switch (spec.kind) {
            case TS_ExecutorSpec::Kind::LOG:
                strat = std::make_unique<exec::ExecutorStrategyLog>(spec.capability);
                break;
            case TS_ExecutorSpec::Kind::WEBHOOK:
                strat = std::make_unique<exec::ExecutorStrategyWebhook>(spec.host, spec.port, spec.target);
                break;
        }
        if (!ex.registerCommand(spec.capability, std::move(strat)))
            throw std::runtime_error("Duplicate executor capability: " + spec.capability);
    }
    // по умолчанию хотя бы лог
    if (!ex.hasCommand("log"))
        ex.registerCommand("log", std::make_unique<exec::ExecutorStrategyLog>());

    exec::AExecutorStrategy::Ctx ctx;
    ctx["http_timeout_ms"] = cfg.httpTimeoutMs;
    ex.initAll(ctx);
    ex.seal();
}

int main(int argc, char** argv){
    install_signal_handlers();

    // 1) Конфиг
    const std::string cfgPath = argc > 1 ? argv[1] : "scheduler.conf";
    TS_Config cfg;
    try {
        if (!cfg.loadFromTxt(cfgPath))
            log::warn("Main", "config " + cfgPath + " not found, using defaults");
    } catch (const std::exception& e) {
        log::error("Main", "bad config " + cfgPath + ": " + e.what());
        return 2;
    }
    log::setLevel(cfg.logLevel);

    try {
        // 2) Store + Executor
        FileTaskStore store(cfg.tasksFile);
        exec::Executor ex;
        build_executors(ex, cfg);

        // 3) Scheduler
        SchedulerOptions opts;
        opts.pollInterval        = cfg.pollInterval;
        opts.stopTimeout         = cfg.stopTimeout;
        opts.compactionThreshold = cfg.compactionThreshold;
        Scheduler sched(store, ex, opts);
        if (cfg.autostart) sched.start();

        // 4) HTTP API в своём потоке
        std::unique_ptr<TS_HttpServer> server;
        std::thread httpThr;
        if (cfg.httpEnabled) {
            server = std::make_unique<TS_HttpServer>(cfg.httpAddress, cfg.httpPort, sched, cfg.httpThreads);
            server->start();
            httpThr = std::thread([&]{ server->run(); });
        }

        log::info("Main", "running, press Ctrl+C to exit");

        // 5) Главный поток ждёт сигнал
        while (!g_stop.load()) std::this_thread::sleep_for(100ms);

        // 6) Завершение
        if (server) server->stop();
        if (httpThr.joinable()) httpThr.join();
        auto r = sched.stop();
        log::info("Main", r.message);
    } catch (const std::exception& e) {
        log::error("Main", std::string("fatal: ") + e.what());
        return 1;
    }

    log::info("Main", "done");
    return 0;
}
