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
#ifndef TOOLGATE_TOOL_SERVICE_IMPL_H
#define TOOLGATE_TOOL_SERVICE_IMPL_H

#include <grpcpp/grpcpp.h>
#include "common/Context.hpp"
#include "proto/toolService.grpc.pb.h"
#include "server/HealthChecker.hpp"
#include "server/RPCServer.hpp"
#include "server/ToolDispatcher.hpp"

namespace toolgate {

class ToolServiceImpl final : public proto::ToolService::Service {
public:
    ToolServiceImpl(ToolDispatcher& dispatcher, const HealthChecker& health);
    grpc::Status callTool(
        grpc::ServerContext* context,
        const proto::CallToolRequest* request,
        proto::CallToolReply* reply) override;
    grpc::Status listTools(
        grpc::ServerContext* context,
        const proto::ListToolsRequest* request,
        proto::ListToolsReply* reply) override;
    grpc::Status health(
        grpc::ServerContext* context,
        const proto::HealthRequest* request,
        proto::HealthReply* reply) override;
    // Cancels every running call.
    void cancelAll();
private:
    ToolDispatcher& tools;
    const HealthChecker& healthChecker;
    Context root;
};

using ToolServer = RPCServer<ToolServiceImpl>;

} // namespace toolgate

#endif // TOOLGATE_TOOL_SERVICE_IMPL_H
