//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.cpp
// Purpose: Default transport launcher (process transports for stdio servers, HTTP for network servers)
//==========================================================================================================

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/CommandBuilder.h"
#include "mcphost/HTTPTransport.hpp"
#include "mcphost/ProcessTransport.hpp"
#include "mcphost/Transport.h"
#include "mcphost/config/ServerConfig.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

DefaultTransportLauncher::DefaultTransportLauncher()
    : shutdownGrace(GetEnvMillisOrDefault("MCPHOST_SHUTDOWN_GRACE_MS", std::chrono::seconds(5))) {}

std::unique_ptr<ITransport> DefaultTransportLauncher::CreateTransport(const ServerConfig& config,
                                                                      const LaunchSpec& launch) {
    FUNC_SCOPE();
    if (config.transport == TransportKind::Http) {
        if (!launch.url) {
            throw HostError(ErrorKind::ValidationError, "Network tool server '" + config.name + "' has no URL");
        }
        LOG_DEBUG("Launcher: HTTP transport for '{}' ({} headers)", config.name, launch.headers.size());
        return std::make_unique<HTTPTransport>(*launch.url, launch.headers);
    }
    if (!launch.command) {
        throw HostError(ErrorKind::ValidationError, "Tool server '" + config.name + "' has no command");
    }
    ProcessTransport::Options opts;
    opts.shutdownGrace = shutdownGrace;
    LOG_DEBUG("Launcher: process transport for '{}' ({} env overrides)", config.name, launch.environment.size());
    return std::make_unique<ProcessTransport>(*launch.command, launch.environment, opts);
}

} // namespace mcphost
