#pragma once
#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "../Task/TaskRecord.hpp"

namespace tsched {

// Min-heap по (dueTime, priority, seq) + индекс id -> запись.
// Не потокобезопасна: владелец держит мьютекс.
class TaskQueue {
public:
    using RecordPtr = std::shared_ptr<TaskRecord>;

    // seq назначается здесь; id должен быть свободен среди активных
    const TaskRecord& push(TaskRecord rec) {
        if (rec.id.empty())
            throw ValidationError("Task id must not be empty");
        if (index_.count(rec.id))
            throw ValidationError("Task id already pending: " + rec.id);

        rec.cancelled = false;
        rec.seq = nextSeq_++;
        auto p = std::make_shared<TaskRecord>(std::move(rec));
        heap_.push_back(p);
        std::push_heap(heap_.begin(), heap_.end(), Later{});
        index_.emplace(p->id, p);
        return *p;
    }

    bool contains(const std::string& id) const { return index_.count(id) > 0; }

    // Tombstone: флаг + удаление из индекса. Узел остаётся в куче до pop/compact.
    bool cancel(const std::string& id) {
        auto it = index_.find(id);
        if (it == index_.end()) return false;
        it->second->cancelled = true;
        index_.erase(it);
        ++tombstones_;
        return true;
    }

    const TaskRecord* top() const { return heap_.empty() ? nullptr : heap_.front().get(); }

    // Снимает вершину. Живая запись уходит и из индекса.
    TaskRecord popTop() {
        std::pop_heap(heap_.begin(), heap_.end(), Later{});
        RecordPtr p = std::move(heap_.back());
        heap_.pop_back();

        if (p->cancelled) {
            if (tombstones_ > 0) --tombstones_;
        } else {
            auto it = index_.find(p->id);
            if (it != index_.end() && it->second == p) index_.erase(it);
        }
        return std::move(*p);
    }

    // Перестроить кучу только из живых записей
    void compact() {
        std::vector<RecordPtr> live;
        live.reserve(index_.size());
        for (auto& p : heap_)
            if (!p->cancelled) live.push_back(std::move(p));
        heap_ = std::move(live);
        std::make_heap(heap_.begin(), heap_.end(), Later{});
        tombstones_ = 0;
    }

    // threshold == 0: компактировать при любом tombstone
    bool compactIfNeeded(std::size_t threshold) {
        if (tombstones_ == 0) return false;
        if (tombstones_ < threshold || tombstones_ * 2 < index_.size()) return false;
        compact();
        return true;
    }

    // Копии активных записей, отсортированные в порядке исполнения
    std::vector<TaskRecord> pending() const {
        std::vector<TaskRecord> out;
        out.reserve(index_.size());
        for (const auto& kv : index_) out.push_back(*kv.second);
        std::sort(out.begin(), out.end(), runsBefore);
        return out;
    }

    std::size_t size()       const { return index_.size(); }
    std::size_t heapSize()   const { return heap_.size(); }
    std::size_t tombstones() const { return tombstones_; }
    bool        empty()      const { return index_.empty(); }

private:
    // для std::*_heap: "a ниже b" => min-heap
    struct Later {
        bool operator()(const RecordPtr& a, const RecordPtr& b) const noexcept {
            return runsBefore(*b, *a);
        }
    };

    std::vector<RecordPtr>                     heap_;
    std::unordered_map<std::string, RecordPtr> index_;
    std::size_t                                tombstones_{0};
    std::uint64_t                              nextSeq_{1};
};

} // namespace tsched
