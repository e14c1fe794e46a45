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
#include "server/ErrorConverter.hpp"
#include "common/Error.hpp"
#include "proto/error.pb.h"
#include <google/protobuf/any.pb.h>
#include <grpcpp/support/status.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace toolgate {

grpc::StatusCode toGrpcStatusCode(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::OK:
            return grpc::StatusCode::OK;
        case ErrorCode::InvalidArg:
            return grpc::StatusCode::INVALID_ARGUMENT;
        case ErrorCode::NotFound:
            return grpc::StatusCode::NOT_FOUND;
        case ErrorCode::RateLimited:
            return grpc::StatusCode::RESOURCE_EXHAUSTED;
        case ErrorCode::CircuitOpen:
        case ErrorCode::Unavailable:
            return grpc::StatusCode::UNAVAILABLE;
        case ErrorCode::Cancelled:
            return grpc::StatusCode::CANCELLED;
        case ErrorCode::Timeout:
            return grpc::StatusCode::DEADLINE_EXCEEDED;
        case ErrorCode::Unknown:
            return grpc::StatusCode::UNKNOWN;
        case ErrorCode::RetryExhausted:
        case ErrorCode::StoreFailure:
        case ErrorCode::ToolFailure:
        case ErrorCode::Internal:
            return grpc::StatusCode::INTERNAL;
    }
    std::unreachable();
}

proto::ErrorDetails toProto(const Error& error) {
    proto::ErrorDetails details;
    details.set_code(static_cast<proto::ErrorCode>(error.code));
    details.set_what(error.what);
    std::visit([&details](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, RateLimitError>) {
            auto* r = details.mutable_rate_limit();
            r->set_key(d.key);
            r->set_limit(d.limit);
            r->set_window_ms(d.window.count());
            r->set_retry_after_ms(d.retryAfter.count());
        } else if constexpr (std::is_same_v<T, CircuitBreakerError>) {
            auto* c = details.mutable_circuit_breaker();
            c->set_name(d.name);
            c->set_message(d.message);
            if (d.cause) {
                *c->mutable_cause() = toProto(*d.cause);
            }
        } else if constexpr (std::is_same_v<T, RetryError>) {
            auto* r = details.mutable_retry();
            if (d.originalError) {
                *r->mutable_original_error() = toProto(*d.originalError);
            }
            r->set_attempts(d.attempts);
            r->set_last_delay_us(d.lastDelay.count());
            r->set_total_delay_us(d.totalDelay.count());
        }
    }, error.details);
    return details;
}

Error fromProto(const proto::ErrorDetails& details) {
    Error error {static_cast<ErrorCode>(details.code()), details.what()};
    switch (details.detail_case()) {
        case proto::ErrorDetails::kRateLimit: {
            const auto& r = details.rate_limit();
            error = Error {RateLimitError {
                r.key(),
                r.limit(),
                std::chrono::milliseconds {r.window_ms()},
                std::chrono::milliseconds {r.retry_after_ms()}
            }};
            break;
        }
        case proto::ErrorDetails::kCircuitBreaker: {
            const auto& c = details.circuit_breaker();
            error = Error {CircuitBreakerError {
                c.name(),
                c.message(),
                c.has_cause() ? std::make_shared<const Error>(fromProto(c.cause())) : nullptr
            }};
            break;
        }
        case proto::ErrorDetails::kRetry: {
            const auto& r = details.retry();
            error = Error {RetryError {
                r.has_original_error() ? std::make_shared<const Error>(fromProto(r.original_error())) : nullptr,
                r.attempts(),
                std::chrono::microseconds {r.last_delay_us()},
                std::chrono::microseconds {r.total_delay_us()}
            }};
            break;
        }
        case proto::ErrorDetails::DETAIL_NOT_SET:
            break;
    }
    error.code = static_cast<ErrorCode>(details.code());
    error.what = details.what();
    return error;
}

grpc::Status toGrpcStatus(const Error& error) {
    google::protobuf::Any anyDetail;
    anyDetail.PackFrom(toProto(error));
    return grpc::Status(toGrpcStatusCode(error.code), error.what, anyDetail.SerializeAsString());
}

Error toError(const grpc::Status& status) {
    if (status.error_code() == grpc::StatusCode::OK) {
        throw std::logic_error("Cannot convert OK status to error");
    }
    proto::ErrorDetails details;
    google::protobuf::Any any;
    if (any.ParseFromString(status.error_details()) && any.UnpackTo(&details)) {
        return fromProto(details);
    }
    ErrorCode code = ErrorCode::Unknown;
    switch (status.error_code()) {
        case grpc::StatusCode::INVALID_ARGUMENT:
            code = ErrorCode::InvalidArg;
            break;
        case grpc::StatusCode::NOT_FOUND:
            code = ErrorCode::NotFound;
            break;
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
            code = ErrorCode::RateLimited;
            break;
        case grpc::StatusCode::UNAVAILABLE:
            code = ErrorCode::Unavailable;
            break;
        case grpc::StatusCode::CANCELLED:
            code = ErrorCode::Cancelled;
            break;
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            code = ErrorCode::Timeout;
            break;
        case grpc::StatusCode::INTERNAL:
            code = ErrorCode::Internal;
            break;
        default:
            code = ErrorCode::Unknown;
    }
    return Error(code, status.error_message());
}

std::expected<std::monostate, Error> toExpected(const grpc::Status& status) {
    if (status.ok()) {
        return {};
    }
    return std::unexpected {toError(status)};
}

} // namespace toolgate
