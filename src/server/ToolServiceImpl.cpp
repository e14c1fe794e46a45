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
#include "server/ToolServiceImpl.hpp"
#include "common/Context.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include "proto/toolService.pb.h"
#include "server/ErrorConverter.hpp"
#include <grpcpp/support/status.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <string>
#include <tuple>

namespace toolgate {

namespace {

// Per-call context bounded by the client's deadline.
Context callContext(const Context& root, const grpc::ServerContext* context) {
    const auto remaining = context->deadline() - std::chrono::system_clock::now();
    if (context->deadline() == std::chrono::system_clock::time_point::max() || remaining > std::chrono::hours {24}) {
        return root.withCancel();
    }
    return root.withTimeout(std::chrono::duration_cast<std::chrono::microseconds>(remaining));
}

} // namespace

ToolServiceImpl::ToolServiceImpl(ToolDispatcher& dispatcher, const HealthChecker& health)
    : tools {dispatcher}, healthChecker {health}, root {} {}

grpc::Status ToolServiceImpl::callTool(
    grpc::ServerContext* context,
    const proto::CallToolRequest* request,
    proto::CallToolReply* reply) {
    nlohmann::json args = nlohmann::json::object();
    if (!request->arguments().empty()) {
        try {
            args = nlohmann::json::parse(request->arguments());
        } catch (const nlohmann::json::parse_error& e) {
            return toGrpcStatus(Error {ErrorCode::InvalidArg, std::string {"invalid arguments: "} + e.what()});
        }
    }
    const auto requestId = newRequestId();
    spdlog::debug("[{}] callTool {} client '{}' from {}", requestId, request->name(), request->client_id(), context->peer());
    auto result = tools.callTool(callContext(root, context), request->name(), args, request->client_id());
    if (!result.has_value()) {
        spdlog::info("[{}] {} failed: {}", requestId, request->name(), result.error().what);
        return toGrpcStatus(result.error());
    }
    const auto& value = result.value();
    if (value.is_object() && value.contains("text") && value.at("text").is_string()) {
        reply->set_text(value.at("text").get<std::string>());
    }
    reply->set_result(value.dump());
    return grpc::Status::OK;
}

grpc::Status ToolServiceImpl::listTools(
    grpc::ServerContext* context,
    const proto::ListToolsRequest* request,
    proto::ListToolsReply* reply) {
    std::ignore = context;
    std::ignore = request;
    for (const auto& tool : tools.listTools()) {
        auto* info = reply->add_tools();
        info->set_name(tool.at("name").get<std::string>());
        info->set_description(tool.at("description").get<std::string>());
        info->set_input_schema(tool.at("inputSchema").dump());
    }
    return grpc::Status::OK;
}

grpc::Status ToolServiceImpl::health(
    grpc::ServerContext* context,
    const proto::HealthRequest* request,
    proto::HealthReply* reply) {
    std::ignore = context;
    std::ignore = request;
    const auto h = healthChecker.check();
    reply->set_status(toString(h.status));
    reply->set_version(h.version);
    reply->set_uptime_seconds(h.uptime.count());
    for (const auto& c : h.checks) {
        auto* check = reply->add_checks();
        check->set_name(c.name);
        check->set_status(toString(c.status));
        check->set_message(c.message);
    }
    return grpc::Status::OK;
}

void ToolServiceImpl::cancelAll() {
    root.cancel();
}

} // namespace toolgate
