// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * Toolgate a resilient tool-serving process.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef TOOLGATE_COMMON_ERROR_HPP
#define TOOLGATE_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <chrono>
#include <memory>
#include <variant>
#include <unordered_set>
#include <unordered_map>
#include <functional>
#include <type_traits>

namespace toolgate {

enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    RateLimited = 2,
    CircuitOpen = 3,
    RetryExhausted = 4,
    Cancelled = 5,
    Timeout = 6,
    StoreFailure = 7,
    NotFound = 8,
    ToolFailure = 9,
    Unavailable = 10,
    Internal = 11,
    Unknown = 128
};

struct ErrorCodeHash {
    std::size_t operator()(const ErrorCode& code) const noexcept {
        return std::hash<std::underlying_type_t<ErrorCode>>{}(static_cast<std::underlying_type_t<ErrorCode>>(code));
    }
};

extern const std::unordered_map<std::string, std::unordered_set<ErrorCode, ErrorCodeHash>> retriableErrorCodes;
bool isRetriable(const std::string& tool, const ErrorCode& code);

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

// Coarse grouping reported to callers, e.g. "rate_limit" or "circuit_breaker".
std::string category(const ErrorCode& code);

// HTTP-like status code reported alongside the category.
int statusCode(const ErrorCode& code);

struct Error;

struct RateLimitError {
    std::string key;
    int limit;
    std::chrono::milliseconds window;
    std::chrono::milliseconds retryAfter;
};

struct CircuitBreakerError {
    std::string name;
    std::string message;
    std::shared_ptr<const Error> cause;
};

struct RetryError {
    std::shared_ptr<const Error> originalError;
    unsigned attempts;
    std::chrono::microseconds lastDelay;
    std::chrono::microseconds totalDelay;
};

using ErrorDetails = std::variant<std::monostate, RateLimitError, CircuitBreakerError, RetryError>;

struct Error {
    ErrorCode code;
    std::string what;
    ErrorDetails details;

    Error(const ErrorCode& c, std::string w);
    explicit Error(const ErrorCode& c);
    explicit Error(RateLimitError e);
    explicit Error(CircuitBreakerError e);
    explicit Error(RetryError e);

    // The error that started the chain: the cause of a breaker rejection or
    // the last failure behind an exhausted retry.
    [[nodiscard]] const Error& root() const;

    // True if this error or any error it wraps carries the given code.
    [[nodiscard]] bool is(const ErrorCode& c) const;
};

std::ostream& operator<<(std::ostream& os, const Error& error);

} // namespace toolgate

#endif // TOOLGATE_COMMON_ERROR_HPP
