#pragma once
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "../Json/Json.hpp"
#include "../Log/Log.hpp"
#include "ITaskStore.hpp"

namespace tsched {

// Снапшот в JSON-файле:
// [{"timestamp":..,"priority":..,"task_id":"..","task_data":{..},"recurring":..,"recurrence_interval":..|null}, ...]
class FileTaskStore final : public ITaskStore {
public:
    explicit FileTaskStore(std::string path) : path_(std::move(path)) {}

    std::vector<TaskRecord> load(EpochSeconds now) override {
        std::vector<TaskRecord> out;

        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            log::info("TaskStore", "no snapshot at " + path_ + ", starting empty");
            return out;
        }

        std::ifstream in(path_);
        if (!in.is_open())
            throw PersistenceError("Cannot open task snapshot: " + path_);
        std::stringstream ss;
        ss << in.rdbuf();

        json::Value doc;
        try {
            doc = json::Value::parse(ss.str());
        } catch (const json::ParseError& e) {
            throw PersistenceError("Corrupt task snapshot " + path_ + ": " + e.what());
        }
        if (!doc.isArray())
            throw PersistenceError("Task snapshot must be a JSON array: " + path_);

        std::size_t expired = 0;
        for (const auto& item : doc.asArray()) {
            TaskRecord rec;
            try {
                rec = fromJson(item);
            } catch (const std::exception& e) {
                throw PersistenceError("Bad record in " + path_ + ": " + e.what());
            }
            // просроченные после рестарта не выполняем
            if (rec.dueTime <= now) { ++expired; continue; }
            out.push_back(std::move(rec));
        }

        if (expired)
            log::info("TaskStore", "dropped " + std::to_string(expired) + " expired task(s) from " + path_);
        return out;
    }

    void save(const std::vector<TaskRecord>& records) override {
        json::Value doc = json::Value::array();
        for (const auto& r : records) doc.push_back(toJson(r));

        std::filesystem::path p(path_);
        std::error_code ec;
        if (p.has_parent_path() && !std::filesystem::exists(p.parent_path(), ec)) {
            std::filesystem::create_directories(p.parent_path(), ec);
            if (ec) throw PersistenceError("Cannot create directory " + p.parent_path().string() + ": " + ec.message());
        }

        std::ofstream out(path_, std::ios::trunc);
        if (!out.is_open())
            throw PersistenceError("Cannot open task snapshot for writing: " + path_);
        out << doc.dump(2) << '\n';
        out.flush();
        if (!out)
            throw PersistenceError("Write failed: " + path_);
    }

    std::string describe() const override { return "file:" + path_; }
    const std::string& path() const { return path_; }

    static json::Value toJson(const TaskRecord& r) {
        json::Value v = json::Value::object();
        v["timestamp"] = r.dueTime;
        v["priority"]  = r.priority;
        v["task_id"]   = r.id;
        v["task_data"] = r.payload;
        v["recurring"] = r.recurring;
        v["recurrence_interval"] = r.interval ? json::Value((long long)r.interval->count()) : json::Value(nullptr);
        return v;
    }

    static TaskRecord fromJson(const json::Value& v) {
        auto field = [&](const char* key) -> const json::Value& {
            const json::Value* f = v.find(key);
            if (!f) throw std::runtime_error(std::string("missing field '") + key + "'");
            return *f;
        };

        TaskRecord r;
        r.dueTime  = field("timestamp").asDouble();
        r.priority = checkedPriority(field("priority").asInt());
        r.id       = field("task_id").asString();
        r.payload  = field("task_data");

        if (const auto* rec = v.find("recurring"); rec && !rec->isNull())
            r.recurring = rec->asBool();
        if (const auto* iv = v.find("recurrence_interval"); iv && !iv->isNull()) {
            const std::int64_t secs = iv->asInt();
            if (secs <= 0 || secs > kMaxRecurrenceSeconds)
                throw std::runtime_error("recurrence_interval out of range: " + std::to_string(secs));
            r.interval = std::chrono::seconds(secs);
        }

        r.createdAt = nowSeconds();
        return r;
    }

private:
    std::string path_;
};

} // namespace tsched
