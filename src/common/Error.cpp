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
#include "common/Error.hpp"
#include "common/Util.hpp"
#include <fmt/format.h>
#include <string>
#include <ostream>
#include <memory>
#include <utility>
#include <variant>
#include <unordered_map>
#include <unordered_set>

namespace toolgate {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::RateLimited: return "RateLimitExceeded";
        case ErrorCode::CircuitOpen: return "CircuitBreakerOpen";
        case ErrorCode::RetryExhausted: return "RetryExhausted";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::StoreFailure: return "StoreFailure";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::ToolFailure: return "ToolFailure";
        case ErrorCode::Unavailable: return "Unavailable";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

std::string category(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::OK: return "ok";
        case ErrorCode::InvalidArg: return "validation";
        case ErrorCode::RateLimited: return "rate_limit";
        case ErrorCode::CircuitOpen: return "circuit_breaker";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::Unavailable: return "unavailable";
        case ErrorCode::RetryExhausted:
        case ErrorCode::StoreFailure:
        case ErrorCode::ToolFailure:
        case ErrorCode::Internal:
        case ErrorCode::Unknown:
            return "internal";
    }
    std::unreachable();
}

int statusCode(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::OK: return 200;
        case ErrorCode::InvalidArg: return 400;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::Timeout: return 408;
        case ErrorCode::RateLimited: return 429;
        case ErrorCode::Cancelled: return 499;
        case ErrorCode::CircuitOpen:
        case ErrorCode::Unavailable:
            return 503;
        case ErrorCode::RetryExhausted:
        case ErrorCode::StoreFailure:
        case ErrorCode::ToolFailure:
        case ErrorCode::Internal:
        case ErrorCode::Unknown:
            return 500;
    }
    std::unreachable();
}

const std::unordered_map<std::string, std::unordered_set<ErrorCode, ErrorCodeHash>> retriableErrorCodes = {
    {"go-doc", {
        ErrorCode::Timeout,
        ErrorCode::ToolFailure,
        ErrorCode::Unavailable,
        ErrorCode::Unknown,
    }},
    {"default", {
        ErrorCode::Timeout,
        ErrorCode::ToolFailure,
        ErrorCode::Unavailable,
        ErrorCode::StoreFailure,
        ErrorCode::Internal,
        ErrorCode::Unknown,
    }}
};

bool isRetriable(const std::string& tool, const ErrorCode& code) {
    auto it = retriableErrorCodes.find(tool);
    if (it != retriableErrorCodes.end()) {
        return it->second.contains(code);
    } else {
        auto d = retriableErrorCodes.find("default");
        return d->second.contains(code);
    }
}

Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, details {} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, details {} {}

Error::Error(RateLimitError e)
    : code {ErrorCode::RateLimited},
      what {fmt::format("rate limit exceeded for key {}: {} requests per {} exceeded, retry after {}",
          e.key, e.limit, formatDuration(e.window), formatDuration(e.retryAfter))},
      details {std::move(e)} {}

Error::Error(CircuitBreakerError e)
    : code {ErrorCode::CircuitOpen},
      what {e.cause
          ? fmt::format("circuit breaker '{}': {}: {}", e.name, e.message, e.cause->what)
          : fmt::format("circuit breaker '{}': {}", e.name, e.message)},
      details {std::move(e)} {}

Error::Error(RetryError e)
    : code {ErrorCode::RetryExhausted},
      what {fmt::format("retry failed after {} attempts (total delay: {}): {}",
          e.attempts, formatDuration(e.totalDelay), e.originalError ? e.originalError->what : "unknown error")},
      details {std::move(e)} {}

const Error& Error::root() const {
    if (const auto* cb = std::get_if<CircuitBreakerError>(&details); cb != nullptr && cb->cause) {
        return cb->cause->root();
    }
    if (const auto* r = std::get_if<RetryError>(&details); r != nullptr && r->originalError) {
        return r->originalError->root();
    }
    return *this;
}

bool Error::is(const ErrorCode& c) const {
    if (code == c) {
        return true;
    }
    if (const auto* cb = std::get_if<CircuitBreakerError>(&details); cb != nullptr && cb->cause) {
        return cb->cause->is(c);
    }
    if (const auto* r = std::get_if<RetryError>(&details); r != nullptr && r->originalError) {
        return r->originalError->is(c);
    }
    return false;
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << toString(error.code) << ": " << error.what;
    return os;
}

} // namespace toolgate
