#pragma once
#include <vector>

#include "../Task/TaskRecord.hpp"

namespace tsched {

class ITaskStore {
public:
    virtual ~ITaskStore() = default;

    // Записи с dueTime <= now отбрасываются. Ошибка чтения: PersistenceError.
    virtual std::vector<TaskRecord> load(EpochSeconds now) = 0;

    // Полная перезапись снапшота. Ошибка записи: PersistenceError.
    virtual void save(const std::vector<TaskRecord>& records) = 0;

    virtual std::string describe() const { return "ITaskStore"; }
};

} // namespace tsched
