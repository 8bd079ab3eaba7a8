#include "cli.hpp"

#include "annomics/errors.hpp"
#include "annomics/log.hpp"

#include <csignal>
#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    ::signal(SIGPIPE, SIG_IGN);

    try {
        annomics::server_config cfg{};
        if (auto cli_result = annomics::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return annomics::cli::run_server(cfg);
    } catch (const annomics::environment_error& e) {
        annomics::log::error("environment check failed: {}", e.what());
        return 1;
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
