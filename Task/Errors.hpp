#pragma once
#include <stdexcept>
#include <string>

namespace tsched {

// Ошибки, которые ловятся на публичной границе Scheduler и превращаются в статус

class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace tsched
