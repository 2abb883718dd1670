/**
 * @file types.hpp
 * @brief Common type definitions for the TagAttest SDK
 */

#pragma once

#include "tagattest/sdk/errors.hpp"
#include "tagattest/sdk/constants.hpp"
#include <vector>
#include <array>
#include <string>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace tagattest {
namespace sdk {

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(ErrorCode::SUCCESS) {}
    Result(ErrorCode error) : error_(error) {}

    bool is_ok() const { return error_ == ErrorCode::SUCCESS; }
    bool is_err() const { return !is_ok(); }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Attempted to access value of an error result");
        }
        return value_;
    }

    // Move the value out, leaving the result empty
    T take() {
        if (is_err()) {
            throw std::runtime_error("Attempted to take value of an error result");
        }
        return std::move(value_);
    }

    ErrorCode error() const { return error_; }

    std::string error_message() const {
        return ErrorCodeToString(error_);
    }

private:
    T value_{};
    ErrorCode error_;
};

// Specialization for void result
template<>
class Result<void> {
public:
    Result() : error_(ErrorCode::SUCCESS) {}
    Result(ErrorCode error) : error_(error) {}

    bool is_ok() const { return error_ == ErrorCode::SUCCESS; }
    bool is_err() const { return !is_ok(); }

    ErrorCode error() const { return error_; }

    std::string error_message() const {
        return ErrorCodeToString(error_);
    }

private:
    ErrorCode error_;
};

// Common type aliases
using ByteVector = std::vector<uint8_t>;
using Digest = std::array<uint8_t, constants::DIGEST_SIZE>;
using TimePoint = std::chrono::system_clock::time_point;

} // namespace sdk
} // namespace tagattest
