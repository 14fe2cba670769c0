// Result.hpp
#pragma once
#include "engine_error.hpp"
#include <utility>

template<typename T>
struct Result {
    bool success;
    EngineError error;
    T data;

    static Result<T> Ok(T data) {
        return {true, EngineError{}, std::move(data)};
    }

    static Result<T> Error(EngineError err) {
        return {false, std::move(err), T{}};
    }
};

// Specialization for void
template<>
struct Result<void> {
    bool success;
    EngineError error;

    static Result<void> Ok() {
        return {true, EngineError{}};
    }

    static Result<void> Error(EngineError err) {
        return {false, std::move(err)};
    }
};
