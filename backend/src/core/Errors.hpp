#pragma once
#include <stdexcept>
#include <string>

// All engine failures are local precondition violations; nothing here is
// transient, so callers should never retry an operation that threw.
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& what) : std::runtime_error(what) {}
};

// Raw review signal is missing fields or out of range.
class InvalidOutcomeError : public EngineError {
public:
    explicit InvalidOutcomeError(const std::string& what) : EngineError(what) {}
};

// Persisted SchedulingState violates its invariants. Never auto-corrected.
class InvalidStateError : public EngineError {
public:
    explicit InvalidStateError(const std::string& what) : EngineError(what) {}
};

// Bad threshold, limit, config value or timestamp.
class InvalidArgumentError : public EngineError {
public:
    explicit InvalidArgumentError(const std::string& what) : EngineError(what) {}
};

// Session referenced an item that is not in its queue.
class UnknownItemError : public EngineError {
public:
    explicit UnknownItemError(const std::string& what) : EngineError(what) {}
};

// Session operation called in the wrong lifecycle state.
class InvalidSessionStateError : public EngineError {
public:
    explicit InvalidSessionStateError(const std::string& what) : EngineError(what) {}
};
