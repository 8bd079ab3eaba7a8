#pragma once

#include "annomics/config.hpp"

#include <optional>

namespace annomics::cli {

    // Fills `cfg` from the command line and the optional config file. A value means the
    // process should exit with it (help, version, --print-config or a usage error).
    std::optional<int> parse_cli(int argc, char** argv, server_config& cfg);

    // Resolves and probes the annotation runtime, then serves MCP on stdin/stdout.
    int run_server(const server_config& cfg);

}  // namespace annomics::cli
