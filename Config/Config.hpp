#pragma once
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../Log/Log.hpp"

// Описание исполнителя из секции [executors]
struct TS_ExecutorSpec {
    enum class Kind : uint8_t { LOG, WEBHOOK };

    std::string capability;   // payload["agent"]
    Kind        kind{Kind::LOG};
    std::string host;
    uint16_t    port{80};
    std::string target{"/"};
};

struct TS_Config final {
    // [scheduler]
    std::chrono::seconds pollInterval{60};
    std::chrono::seconds stopTimeout{5};
    std::size_t          compactionThreshold{64};
    bool                 autostart{true};

    // [store]
    std::string tasksFile{"data/scheduled_tasks.json"};

    // [http]
    bool        httpEnabled{true};
    std::string httpAddress{"127.0.0.1"};
    uint16_t    httpPort{8080};
    int         httpTimeoutMs{10000};
    int         httpThreads{2};

    // [log]
    tsched::log::Level logLevel{tsched::log::Level::INFO};

    // [executors]
    std::vector<TS_ExecutorSpec> executors;

    // -------------------------
    // Load from txt config (config errors = фатально)
    // -------------------------
    bool loadFromTxt(const std::string& path) {
        std::ifstream in(path);
        if (!in.is_open()) return false;
        std::stringstream ss;
        ss << in.rdbuf();
        loadFromString(ss.str());
        return true;
    }

    void loadFromString(const std::string& text) {
        enum class Section { NONE, SCHEDULER, STORE, HTTP, LOG, EXECUTORS };
        Section sec = Section::NONE;

        std::istringstream in(text);
        std::string line;
        int lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            line = trim(stripComment(line));
            if (line.empty()) continue;

            if (isSection(line, "scheduler")) { sec = Section::SCHEDULER; continue; }
            if (isSection(line, "store"))     { sec = Section::STORE;     continue; }
            if (isSection(line, "http"))      { sec = Section::HTTP;      continue; }
            if (isSection(line, "log"))       { sec = Section::LOG;       continue; }
            if (isSection(line, "executors")) { sec = Section::EXECUTORS; continue; }
            if (line.front() == '[')
                throw std::runtime_error("Unknown config section at line " + std::to_string(lineNo) + ": " + line);

            auto eq = line.find('=');
            if (eq == std::string::npos)
                throw std::runtime_error("Config line " + std::to_string(lineNo) + " must be key=value: " + line);
            std::string rawKey = trim(line.substr(0, eq));
            std::string key = toLower(rawKey);
            std::string val = trim(line.substr(eq + 1));

            switch (sec) {
                case Section::SCHEDULER: parseSchedulerKey(key, val); break;
                case Section::STORE:     parseStoreKey(key, val);     break;
                case Section::HTTP:      parseHttpKey(key, val);      break;
                case Section::LOG:       parseLogKey(key, val);       break;
                case Section::EXECUTORS: parseExecutorLine(rawKey, val); break;   // capability чувствительна к регистру
                case Section::NONE:
                    throw std::runtime_error("Config key outside of a section at line " + std::to_string(lineNo) + ": " + key);
            }
        }
    }

private:
    // -------------------------
    // Parsing
    // -------------------------
    void parseSchedulerKey(const std::string& key, const std::string& val) {
        if (key == "poll_interval_seconds") {
            int v = parseInt(val);
            if (v <= 0) throw std::runtime_error("poll_interval_seconds must be > 0");
            pollInterval = std::chrono::seconds(v);
        } else if (key == "stop_timeout_seconds") {
            int v = parseInt(val);
            if (v < 0) throw std::runtime_error("stop_timeout_seconds must be >= 0");
            stopTimeout = std::chrono::seconds(v);
        } else if (key == "compaction_threshold") {
            int v = parseInt(val);
            if (v < 0) throw std::runtime_error("compaction_threshold must be >= 0");
            compactionThreshold = (std::size_t)v;
        } else if (key == "autostart") {
            autostart = parseBool(val);
        } else {
            unknownKey("scheduler", key);
        }
    }

    void parseStoreKey(const std::string& key, const std::string& val) {
        if (key == "tasks_file") {
            if (val.empty()) throw std::runtime_error("tasks_file must not be empty");
            tasksFile = val;
        } else {
            unknownKey("store", key);
        }
    }

    void parseHttpKey(const std::string& key, const std::string& val) {
        if (key == "enabled")         httpEnabled = parseBool(val);
        else if (key == "address")    httpAddress = val;
        else if (key == "port")       httpPort = parsePort(val);
        else if (key == "timeout_ms") {
            httpTimeoutMs = parseInt(val);
            if (httpTimeoutMs <= 0) throw std::runtime_error("timeout_ms must be > 0");
        }
        else if (key == "threads") {
            httpThreads = parseInt(val);
            if (httpThreads < 1 || httpThreads > 64) throw std::runtime_error("threads must be in 1..64");
        }
        else unknownKey("http", key);
    }

    void parseLogKey(const std::string& key, const std::string& val) {
        if (key == "level") logLevel = tsched::log::parseLevel(val);
        else unknownKey("log", key);
    }

    // capability = log
    // capability = webhook,host,port,/target
    void parseExecutorLine(const std::string& capability, const std::string& rhs) {
        auto parts = split(rhs, ',');
        if (parts.empty())
            throw std::runtime_error("Executor line must be: capability=kind[,args] : " + capability);

        TS_ExecutorSpec spec;
        spec.capability = capability;
        std::string kind = toLower(trim(parts[0]));
        if (kind == "log") {
            spec.kind = TS_ExecutorSpec::Kind::LOG;
        } else if (kind == "webhook") {
            if (parts.size() < 4)
                throw std::runtime_error("Webhook executor must be: capability=webhook,host,port,target : " + capability);
            spec.kind   = TS_ExecutorSpec::Kind::WEBHOOK;
            spec.host   = trim(parts[1]);
            spec.port   = parsePort(parts[2]);
            spec.target = trim(parts[3]);
            if (spec.target.empty() || spec.target.front() != '/')
                throw std::runtime_error("Webhook target must start with '/': " + spec.target);
        } else {
            throw std::runtime_error("Unknown executor kind (log/webhook): " + kind);
        }
        executors.push_back(std::move(spec));
    }

    [[noreturn]] static void unknownKey(const std::string& section, const std::string& key) {
        throw std::runtime_error("Unknown key in [" + section + "]: " + key);
    }

    // -------------------------
    // Utils
    // -------------------------
    static std::string stripComment(const std::string& s) {
        auto pos = s.find('#');
        return (pos == std::string::npos) ? s : s.substr(0, pos);
    }

    static bool isSection(const std::string& line, const std::string& nameLower) {
        std::string l = toLower(trim(line));
        return l == ("[" + nameLower + "]");
    }

    static std::string trim(std::string s) {
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
        return s;
    }

    static std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c){ return (char)std::tolower(c); });
        return s;
    }

    static std::vector<std::string> split(const std::string& s, char delim) {
        std::vector<std::string> out;
        std::stringstream ss(s);
        std::string item;
        while (std::getline(ss, item, delim)) out.push_back(item);
        return out;
    }

    static bool parseBool(std::string s) {
        s = toLower(trim(s));
        if (s == "1" || s == "true"  || s == "on"  || s == "yes") return true;
        if (s == "0" || s == "false" || s == "off" || s == "no")  return false;
        throw std::runtime_error("Invalid bool: " + s);
    }

    static int parseInt(std::string s) {
        s = trim(s);
        size_t idx = 0;
        int v = 0;
        try {
            v = std::stoi(s, &idx, 10);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid int: " + s);
        }
        if (idx != s.size()) throw std::runtime_error("Invalid int: " + s);
        return v;
    }

    static uint16_t parsePort(const std::string& s) {
        int v = parseInt(s);
        if (v <= 0 || v > 65535) throw std::runtime_error("Invalid port: " + s);
        return (uint16_t)v;
    }
};
