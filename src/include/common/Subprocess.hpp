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
#ifndef TOOLGATE_SUBPROCESS_H
#define TOOLGATE_SUBPROCESS_H

#include <expected>
#include <string>
#include <vector>
#include "common/Context.hpp"
#include "common/Error.hpp"

namespace toolgate {

struct ProcessResult {
    int exitCode;
    // stdout and stderr interleaved as the child wrote them.
    std::string output;
};

// Runs argv[0] (looked up on PATH) in workingDir, or the current directory
// when empty. The child is killed when ctx is cancelled or its deadline
// passes, and the context error is returned. A child that cannot be
// executed exits with 127.
std::expected<ProcessResult, Error> runProcess(
    const Context& ctx,
    const std::vector<std::string>& argv,
    const std::string& workingDir = "");

} // namespace toolgate

#endif // TOOLGATE_SUBPROCESS_H
