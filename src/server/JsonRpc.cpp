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
#include "server/JsonRpc.hpp"
#include "common/Error.hpp"
#include <chrono>
#include <cstdint>
#include <type_traits>
#include <utility>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace toolgate::jsonrpc {

namespace {

template<typename Rep, typename Period>
int64_t millis(std::chrono::duration<Rep, Period> d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

} // namespace

std::expected<Request, std::string> parseRequest(const nlohmann::json& message) {
    if (!message.is_object()) {
        return std::unexpected {std::string {"request must be an object"}};
    }
    if (!message.contains("jsonrpc") || message.at("jsonrpc") != "2.0") {
        return std::unexpected {std::string {"missing or invalid jsonrpc version"}};
    }
    if (!message.contains("method") || !message.at("method").is_string()) {
        return std::unexpected {std::string {"missing or invalid method"}};
    }
    const bool notification = !message.contains("id");
    nlohmann::json id = notification ? nlohmann::json {} : message.at("id");
    if (!id.is_null() && !id.is_string() && !id.is_number_integer()) {
        return std::unexpected {std::string {"invalid id"}};
    }
    auto params = message.value("params", nlohmann::json::object());
    if (!params.is_object() && !params.is_array()) {
        return std::unexpected {std::string {"params must be an object or array"}};
    }
    return Request {message.at("method").get<std::string>(), std::move(params), std::move(id), notification};
}

nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message, const nlohmann::json& data) {
    nlohmann::json error {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", error}
    };
}

int rpcCode(const Error& error) {
    switch (error.code) {
        case ErrorCode::InvalidArg:
            return invalidParams;
        case ErrorCode::Internal:
            return internalError;
        default:
            return toolExecutionError;
    }
}

nlohmann::json errorData(const Error& error) {
    nlohmann::json data {
        {"code", toString(error.code)},
        {"category", category(error.code)},
        {"status_code", statusCode(error.code)}
    };
    std::visit([&data](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, RateLimitError>) {
            data["key"] = d.key;
            data["limit"] = d.limit;
            data["window_ms"] = millis(d.window);
            data["retry_after_ms"] = millis(d.retryAfter);
        } else if constexpr (std::is_same_v<T, CircuitBreakerError>) {
            data["circuit_breaker"] = d.name;
        } else if constexpr (std::is_same_v<T, RetryError>) {
            data["attempts"] = d.attempts;
            data["last_delay_ms"] = millis(d.lastDelay);
            data["total_delay_ms"] = millis(d.totalDelay);
        }
    }, error.details);
    if (const auto& root = error.root(); &root != &error) {
        data["cause"] = {
            {"code", toString(root.code)},
            {"message", root.what}
        };
    }
    return data;
}

nlohmann::json fromError(const nlohmann::json& id, const Error& error) {
    return makeError(id, rpcCode(error), error.what, errorData(error));
}

} // namespace toolgate::jsonrpc
