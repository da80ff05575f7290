#pragma once
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../Executor/ITaskExecutor.hpp"
#include "../Log/Log.hpp"
#include "../Queue/TaskQueue.hpp"
#include "../Store/ITaskStore.hpp"
#include "Results.hpp"

namespace tsched {

struct SchedulerOptions {
    std::chrono::milliseconds pollInterval{std::chrono::seconds(60)};
    std::chrono::milliseconds stopTimeout{std::chrono::seconds(5)};
    std::size_t               compactionThreshold{64};
};

// Планировщик: куча задач + один фоновый поток, который раз в pollInterval
// снимает просроченные задачи и отдаёт их исполнителю вне мьютекса.
// Store и Executor не владеем: должны пережить Scheduler.
class Scheduler final {
public:
    Scheduler(ITaskStore& store, exec::ITaskExecutor& executor, SchedulerOptions opts = {})
        : store_(store), executor_(executor), opts_(opts) {
        loadFromStore();
    }

    ~Scheduler() {
        stop();
        // если исполнитель завис: ждём здесь, пока вызов не вернётся
        pool_.join();
    }

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // -------------------------
    // schedule / cancel / list
    // -------------------------
    ScheduleResult schedule(ScheduleRequest req) {
        ScheduleResult res;
        try {
            const EpochSeconds now = nowSeconds();
            const EpochSeconds due = resolveDueTime(req.when, now);
            validateRecurrence(req.recurring, req.interval);
            if (req.taskId && req.taskId->empty())
                throw ValidationError("Task id must not be empty");

            TaskRecord rec;
            rec.dueTime   = due;
            rec.priority  = req.priority;
            rec.payload   = std::move(req.payload);
            rec.recurring = req.recurring;
            rec.interval  = req.interval;
            rec.createdAt = now;

            {
                std::lock_guard<std::mutex> lk(mtx_);
                rec.id = req.taskId ? *req.taskId : nextTaskIdLocked(now);
                const TaskRecord& pushed = queue_.push(std::move(rec));
                res.taskId        = pushed.id;
                res.executionTime = pushed.dueTime;
                ++stats_.totalScheduled;
                ++version_;
            }
            persist();

            log::info("Scheduler", "task " + res.taskId + " scheduled for " + formatIsoTimestamp(res.executionTime));
            res.status  = Status::SUCCESS;
            res.message = "Task scheduled";
        } catch (const ValidationError& e) {
            log::warn("Scheduler", std::string("schedule rejected: ") + e.what());
            res.status  = Status::ERROR;
            res.error   = ErrorKind::VALIDATION;
            res.message = e.what();
        } catch (const std::exception& e) {
            log::error("Scheduler", std::string("error scheduling task: ") + e.what());
            res.status  = Status::ERROR;
            res.error   = ErrorKind::INTERNAL;
            res.message = e.what();
        }
        return res;
    }

    ScheduleResult schedule(Payload payload, DueTimeSpec when, int priority = 1,
                            std::optional<std::string> taskId = std::nullopt,
                            bool recurring = false,
                            std::optional<std::chrono::seconds> interval = std::nullopt) {
        ScheduleRequest req;
        req.payload   = std::move(payload);
        req.when      = std::move(when);
        req.priority  = priority;
        req.taskId    = std::move(taskId);
        req.recurring = recurring;
        req.interval  = interval;
        return schedule(std::move(req));
    }

    // Отмена не прерывает уже снятую сканом задачу
    OpResult cancel(const std::string& taskId) {
        try {
            {
                std::lock_guard<std::mutex> lk(mtx_);
                if (!queue_.cancel(taskId))
                    throw NotFoundError("Task " + taskId + " not found");
                if (queue_.compactIfNeeded(opts_.compactionThreshold))
                    log::debug("Scheduler", "heap compacted after cancel");
                ++version_;
            }
            persist();
            log::info("Scheduler", "task " + taskId + " cancelled");
            return OpResult::success("Task " + taskId + " cancelled");
        } catch (const NotFoundError& e) {
            return OpResult::fail(ErrorKind::NOT_FOUND, e.what());
        } catch (const std::exception& e) {
            log::error("Scheduler", "error cancelling task " + taskId + ": " + e.what());
            return OpResult::fail(ErrorKind::INTERNAL, e.what());
        }
    }

    std::vector<PendingTask> listPending() const {
        std::vector<TaskRecord> recs;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            recs = queue_.pending();
        }
        std::vector<PendingTask> out;
        out.reserve(recs.size());
        for (const auto& r : recs) {
            out.push_back(PendingTask{r.id, r.dueTime, r.priority, r.recurring, r.interval, summarize(r.payload)});
        }
        return out;
    }

    SchedulerStats getStats() const {
        SchedulerStats s;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            s = stats_;
            s.tasksInQueue = queue_.size();
        }
        s.running = isRunning();
        return s;
    }

    // -------------------------
    // start / stop
    // -------------------------
    OpResult start() {
        std::uint64_t gen = 0;
        {
            std::lock_guard<std::mutex> lk(ctlMtx_);
            if (running_) return OpResult::info("Scheduler is already running");
            running_ = true;
            gen = ++generation_;
            ++activeLoops_;
        }
        // один поток в пуле: новый цикл встанет в очередь за старым, если тот ещё не вышел
        boost::asio::post(pool_, [this, gen] { loop(gen); });

        log::info("Scheduler", "started, poll interval " + std::to_string(opts_.pollInterval.count()) + " ms");
        return OpResult::success("Scheduler started");
    }

    OpResult stop() {
        std::unique_lock<std::mutex> lk(ctlMtx_);
        if (!running_) return OpResult::info("Scheduler is not running");
        running_ = false;
        ctlCv_.notify_all();

        const bool exited = ctlCv_.wait_for(lk, opts_.stopTimeout, [&] { return activeLoops_ == 0; });
        lk.unlock();

        if (!exited) {
            log::warn("Scheduler", "worker did not exit within stop timeout; it will exit after the current task");
            return OpResult::success("Scheduler stop requested; worker is still finishing a task");
        }
        log::info("Scheduler", "stopped");
        return OpResult::success("Scheduler stopped");
    }

    bool isRunning() const {
        std::lock_guard<std::mutex> lk(ctlMtx_);
        return running_;
    }

    // Разбудить рабочий поток раньше pollInterval
    void wake() {
        {
            std::lock_guard<std::mutex> lk(ctlMtx_);
            wakeRequested_ = true;
        }
        ctlCv_.notify_all();
    }

    // Один скан синхронно в вызывающем потоке. Возвращает число отданных задач.
    std::size_t runPendingOnce() {
        const EpochSeconds now = nowSeconds();
        std::vector<TaskRecord> ready;
        std::size_t discarded = 0;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            while (const TaskRecord* top = queue_.top()) {
                if (top->cancelled) {
                    queue_.popTop();
                    ++discarded;
                    continue;
                }
                if (top->dueTime > now) break;

                TaskRecord rec = queue_.popTop();
                // следующий экземпляр серии ставим до dispatch: серия переживёт ошибку исполнителя
                if (rec.recurring && rec.interval) {
                    if (auto next = makeSuccessorLocked(rec, now)) queue_.push(std::move(*next));
                    else log::warn("Scheduler", "series " + seriesRoot(rec.id) + " ends: next run is past the supported time range");
                }
                ready.push_back(std::move(rec));
            }
            if (queue_.compactIfNeeded(opts_.compactionThreshold))
                log::debug("Scheduler", "heap compacted during scan");
            if (!ready.empty()) ++version_;
        }

        if (discarded)
            log::debug("Scheduler", "discarded " + std::to_string(discarded) + " cancelled task(s)");

        for (const auto& rec : ready) dispatch(rec);

        if (!ready.empty()) persist();
        return ready.size();
    }

    const SchedulerOptions& options() const { return opts_; }

private:
    void loadFromStore() {
        std::vector<TaskRecord> recs;
        try {
            recs = store_.load(nowSeconds());
        } catch (const std::exception& e) {
            log::error("Scheduler", std::string("error loading tasks: ") + e.what());
            return;
        }

        std::size_t loaded = 0;
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto& r : recs) {
            try {
                validateDueTime(r.dueTime);
                validateRecurrence(r.recurring, r.interval);
                queue_.push(std::move(r));
                ++loaded;
            } catch (const ValidationError& e) {
                log::warn("Scheduler", std::string("skipping stored task: ") + e.what());
            }
        }
        log::info("Scheduler", "loaded " + std::to_string(loaded) + " scheduled task(s) from " + store_.describe());
    }

    void loop(std::uint64_t gen) {
        log::info("Scheduler", "worker loop started");
        for (;;) {
            {
                std::lock_guard<std::mutex> lk(ctlMtx_);
                if (!running_ || generation_ != gen) break;
            }

            try {
                runPendingOnce();
            } catch (const std::exception& e) {
                log::error("Scheduler", std::string("error in scheduler loop: ") + e.what());
            } catch (...) {
                log::error("Scheduler", "unknown error in scheduler loop");
            }

            std::unique_lock<std::mutex> lk(ctlMtx_);
            ctlCv_.wait_for(lk, opts_.pollInterval, [&] {
                return !running_ || generation_ != gen || wakeRequested_;
            });
            wakeRequested_ = false;
        }

        {
            std::lock_guard<std::mutex> lk(ctlMtx_);
            --activeLoops_;
        }
        ctlCv_.notify_all();
        log::info("Scheduler", "worker loop stopped");
    }

    void dispatch(const TaskRecord& rec) {
        exec::ExecRequest req{rec.id, rec.payload, rec.dueTime, nowSeconds()};
        bool ok = false;

        log::info("Scheduler", "executing task " + rec.id);
        try {
            exec::ExecResult r = executor_.execute(req);
            ok = r.ok;
            if (ok) log::info("Scheduler", "task " + rec.id + " executed with status: " + r.status);
            else    log::warn("Scheduler", "task " + rec.id + " failed: " + r.message);
        } catch (const std::exception& e) {
            log::error("Scheduler", "error executing task " + rec.id + ": " + e.what());
        } catch (...) {
            log::error("Scheduler", "unknown error executing task " + rec.id);
        }

        std::lock_guard<std::mutex> lk(mtx_);
        ++stats_.totalExecuted;
        if (!ok) ++stats_.totalFailed;
        stats_.lastExecution = req.executionTime;
    }

    // Снапшот под mtx_, запись на диск вне него. Старый снапшот не перезаписывает новый.
    void persist() {
        std::vector<TaskRecord> snapshot;
        std::uint64_t ver = 0;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            snapshot = queue_.pending();
            ver = version_;
        }

        std::lock_guard<std::mutex> slk(saveMtx_);
        if (ver <= savedVersion_) return;
        try {
            store_.save(snapshot);
            savedVersion_ = ver;
        } catch (const std::exception& e) {
            log::error("Scheduler", std::string("error saving tasks: ") + e.what());
        }
    }

    // "task_<epoch>_<n>"
    std::string nextTaskIdLocked(EpochSeconds now) {
        std::string id;
        do {
            id = "task_" + std::to_string((long long)now) + "_" + std::to_string(idCounter_++);
        } while (queue_.contains(id));
        return id;
    }

    // Новая запись серии: dueTime = now + interval (от фактического запуска)
    std::optional<TaskRecord> makeSuccessorLocked(const TaskRecord& rec, EpochSeconds now) {
        const EpochSeconds due = now + (double)rec.interval->count();
        if (due > kMaxEpochSeconds) return std::nullopt;

        const std::string base = seriesRoot(rec.id) + "_next_" + std::to_string((long long)now);
        std::string id = base;
        for (int n = 1; queue_.contains(id); ++n) id = base + "_" + std::to_string(n);

        TaskRecord next;
        next.id        = std::move(id);
        next.dueTime   = due;
        next.priority  = rec.priority;
        next.payload   = rec.payload;
        next.recurring = true;
        next.interval  = rec.interval;
        next.createdAt = now;
        return next;
    }

private:
    ITaskStore&          store_;
    exec::ITaskExecutor& executor_;
    SchedulerOptions     opts_;

    // куча, индекс, счётчики
    mutable std::mutex mtx_;
    TaskQueue          queue_;
    SchedulerStats     stats_;
    std::uint64_t      idCounter_{0};
    std::uint64_t      version_{0};

    std::mutex    saveMtx_;
    std::uint64_t savedVersion_{0};

    // состояние рабочего потока
    mutable std::mutex      ctlMtx_;
    std::condition_variable ctlCv_;
    bool                    running_{false};
    bool                    wakeRequested_{false};
    std::uint64_t           generation_{0};
    int                     activeLoops_{0};

    boost::asio::thread_pool pool_{1};
};

} // namespace tsched
