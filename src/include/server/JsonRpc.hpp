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
#ifndef TOOLGATE_JSON_RPC_H
#define TOOLGATE_JSON_RPC_H

#include <expected>
#include <string>
#include <nlohmann/json.hpp>
#include "common/Error.hpp"

namespace toolgate::jsonrpc {

constexpr int parseError = -32700;
constexpr int invalidRequest = -32600;
constexpr int methodNotFound = -32601;
constexpr int invalidParams = -32602;
constexpr int internalError = -32603;
constexpr int toolNotFound = -32001;
constexpr int toolExecutionError = -32002;

struct Request {
    std::string method;
    nlohmann::json params;
    nlohmann::json id;
    // A request without an id gets no response.
    bool notification;
};

// Message is the JSON-RPC error message for an invalid request.
std::expected<Request, std::string> parseRequest(const nlohmann::json& message);

nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message, const nlohmann::json& data = nullptr);

// JSON-RPC code for a failed tool call.
int rpcCode(const Error& error);

// {code, category, status_code, ...} plus the typed details of the error:
// retry_after_ms for rate limits, circuit_breaker for rejected calls,
// attempts and total_delay_ms for exhausted retries.
nlohmann::json errorData(const Error& error);

nlohmann::json fromError(const nlohmann::json& id, const Error& error);

} // namespace toolgate::jsonrpc

#endif // TOOLGATE_JSON_RPC_H
