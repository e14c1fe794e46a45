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
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include "common/Error.hpp"
#include "server/JsonRpc.hpp"

using toolgate::CircuitBreakerError;
using toolgate::Error;
using toolgate::ErrorCode;
using toolgate::RateLimitError;
using toolgate::RetryError;
using nlohmann::json;
namespace jsonrpc = toolgate::jsonrpc;

TEST(JsonRpcTest, ParsesRequest) {
    auto r = jsonrpc::parseRequest(json::parse(R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})"));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->method, "tools/list");
    EXPECT_EQ(r->id, 7);
    EXPECT_FALSE(r->notification);
    EXPECT_TRUE(r->params.is_object());
    EXPECT_TRUE(r->params.empty());
}

TEST(JsonRpcTest, NotificationHasNoId) {
    auto r = jsonrpc::parseRequest(json::parse(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->notification);
    EXPECT_TRUE(r->id.is_null());
}

TEST(JsonRpcTest, RejectsMalformedRequests) {
    EXPECT_EQ(jsonrpc::parseRequest(json::array()).error(), "request must be an object");
    EXPECT_EQ(jsonrpc::parseRequest(json::parse(R"({"id":1,"method":"ping"})")).error(),
        "missing or invalid jsonrpc version");
    EXPECT_EQ(jsonrpc::parseRequest(json::parse(R"({"jsonrpc":"1.0","id":1,"method":"ping"})")).error(),
        "missing or invalid jsonrpc version");
    EXPECT_EQ(jsonrpc::parseRequest(json::parse(R"({"jsonrpc":"2.0","id":1,"method":5})")).error(),
        "missing or invalid method");
    EXPECT_EQ(jsonrpc::parseRequest(json::parse(R"({"jsonrpc":"2.0","id":{},"method":"ping"})")).error(),
        "invalid id");
    EXPECT_EQ(jsonrpc::parseRequest(json::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":3})")).error(),
        "params must be an object or array");
}

TEST(JsonRpcTest, ResultAndErrorEnvelopes) {
    EXPECT_EQ(jsonrpc::makeResult("a", json {{"ok", true}}),
        json::parse(R"({"jsonrpc":"2.0","id":"a","result":{"ok":true}})"));
    EXPECT_EQ(jsonrpc::makeError(1, jsonrpc::methodNotFound, "method not found: x"),
        json::parse(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"method not found: x"}})"));
    EXPECT_EQ(jsonrpc::makeError(nullptr, -1, "m", json {{"k", 1}})["error"]["data"]["k"], 1);
}

TEST(JsonRpcTest, CodesForToolErrors) {
    EXPECT_EQ(jsonrpc::rpcCode(Error {ErrorCode::InvalidArg, "x"}), jsonrpc::invalidParams);
    EXPECT_EQ(jsonrpc::rpcCode(Error {ErrorCode::Internal, "x"}), jsonrpc::internalError);
    EXPECT_EQ(jsonrpc::rpcCode(Error {ErrorCode::RateLimited, "x"}), jsonrpc::toolExecutionError);
    EXPECT_EQ(jsonrpc::rpcCode(Error {ErrorCode::CircuitOpen, "x"}), jsonrpc::toolExecutionError);
}

TEST(JsonRpcTest, RateLimitData) {
    const Error e {RateLimitError {"toolgate:tool:go-doc", 50, std::chrono::minutes {1}, std::chrono::seconds {30}}};
    const auto data = jsonrpc::errorData(e);
    EXPECT_EQ(data["code"], "RateLimitExceeded");
    EXPECT_EQ(data["category"], "rate_limit");
    EXPECT_EQ(data["status_code"], 429);
    EXPECT_EQ(data["key"], "toolgate:tool:go-doc");
    EXPECT_EQ(data["limit"], 50);
    EXPECT_EQ(data["window_ms"], 60000);
    EXPECT_EQ(data["retry_after_ms"], 30000);
    EXPECT_FALSE(data.contains("cause"));
}

TEST(JsonRpcTest, CircuitBreakerDataCarriesCause) {
    const Error e {CircuitBreakerError {"go-doc", "request rejected",
        std::make_shared<const Error>(ErrorCode::CircuitOpen, "circuit breaker is open")}};
    const auto data = jsonrpc::errorData(e);
    EXPECT_EQ(data["circuit_breaker"], "go-doc");
    EXPECT_EQ(data["status_code"], 503);
    EXPECT_EQ(data["cause"]["message"], "circuit breaker is open");
}

TEST(JsonRpcTest, RetryData) {
    const Error e {RetryError {std::make_shared<const Error>(ErrorCode::Timeout, "slow"), 3,
        std::chrono::milliseconds {400}, std::chrono::milliseconds {600}}};
    const auto response = jsonrpc::fromError(9, e);
    EXPECT_EQ(response["id"], 9);
    EXPECT_EQ(response["error"]["code"], jsonrpc::toolExecutionError);
    EXPECT_EQ(response["error"]["message"], e.what);
    const auto& data = response["error"]["data"];
    EXPECT_EQ(data["attempts"], 3);
    EXPECT_EQ(data["last_delay_ms"], 400);
    EXPECT_EQ(data["total_delay_ms"], 600);
    EXPECT_EQ(data["cause"]["code"], "Timeout");
}
