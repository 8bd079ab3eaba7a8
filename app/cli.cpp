#include "cli.hpp"

#include "annomics/format.hpp"
#include "annomics/handlers.hpp"
#include "annomics/log.hpp"
#include "annomics/mcp.hpp"
#include "annomics/supervisor.hpp"

#include <CLI/CLI.hpp>
#include <glaze/glaze.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

using namespace annomics::literals;

namespace annomics::cli { namespace detail {

    namespace fs = std::filesystem;

    // JSON config file; every key is optional and flags given on the command line win.
    struct config_file {
        int schema_version{1};
        std::optional<std::string> rscript{};
        std::optional<std::string> script{};
        std::optional<std::string> working_dir{};
        std::optional<int64_t> probe_timeout{};
        std::optional<bool> check_runtime{};
        std::optional<std::string> log_level{};
    };

}}  // namespace annomics::cli::detail

namespace glz {

    template <>
    struct meta<annomics::cli::detail::config_file> {
        using T = annomics::cli::detail::config_file;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "rscript",
                       &T::rscript,
                       "script",
                       &T::script,
                       "working_dir",
                       &T::working_dir,
                       "probe_timeout",
                       &T::probe_timeout,
                       "check_runtime",
                       &T::check_runtime,
                       "log_level",
                       &T::log_level);
    };

}  // namespace glz

namespace annomics::cli {

    namespace detail {

        static constexpr auto version_string = "annomics 1.0.0"sv;

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open " + path.string());
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read " + path.string());
            }
            return ss.str();
        }

        template <typename T>
        static T read_json_file(const fs::path& path) {
            T value{};
            auto json = read_text_file(path);
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, json);
            if (ec) {
                throw std::runtime_error(
                        "failed to parse json file {}: {}"_format(path.string(), glz::format_error(ec, json)));
            }
            return value;
        }

        static void validate_supported_schema_version(int schema_version, const fs::path& path) {
            constexpr int supported_schema_version = 1;
            if (schema_version > supported_schema_version) {
                throw std::runtime_error(
                        "unsupported schema_version in {}: {} > {}"_format(
                                path.string(), schema_version, supported_schema_version));
            }
        }

        static bool try_parse_log_level(std::string_view text, log::level& out) {
            for (auto lvl : {log::level::error, log::level::warn, log::level::info, log::level::debug}) {
                if (utils::str_case_eq(text, to_string(lvl))) {
                    out = lvl;
                    return true;
                }
            }
            return false;
        }

        static void apply_config_file(const config_file& data, server_config& cfg) {
            if (data.rscript) {
                cfg.rscript_path = *data.rscript;
            }
            if (data.script) {
                cfg.script_path = fs::path{*data.script};
            }
            if (data.working_dir) {
                cfg.working_dir = fs::path{*data.working_dir};
            }
            if (data.probe_timeout) {
                if (*data.probe_timeout <= 0) {
                    throw std::runtime_error("probe_timeout must be positive, got {}"_format(*data.probe_timeout));
                }
                cfg.probe_timeout = std::chrono::seconds{*data.probe_timeout};
            }
            if (data.check_runtime) {
                cfg.check_runtime = *data.check_runtime;
            }
        }

        template <typename T>
        static std::string optional_or_default(const std::optional<T>& value, std::string_view fallback) {
            if (!value) {
                return std::string{fallback};
            }
            if constexpr (std::is_same_v<T, fs::path>) {
                return value->string();
            }
            else {
                return std::string{*value};
            }
        }

        static void print_config(const server_config& cfg, std::ostream& os) {
            os << ("  rscript={}\n"
                   "  script={}\n"
                   "  working_dir={}\n"
                   "  probe_timeout={}s\n"
                   "  check_runtime={}\n"
                   "  config_file={}\n"
                   "  log_level={}\n"_format(
                           cfg.rscript_path.string(),
                           optional_or_default(cfg.script_path, "<search>"),
                           optional_or_default(cfg.working_dir, "<script parent>"),
                           cfg.probe_timeout.count(),
                           cfg.check_runtime,
                           optional_or_default(cfg.config_file, "<none>"),
                           log::current_level()));
        }

        static fs::path executable_dir() {
            std::error_code ec{};
            auto exe = fs::read_symlink("/proc/self/exe", ec);
            if (ec) {
                return {};
            }
            return exe.parent_path();
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, server_config& cfg) {
        CLI::App app{"annomics: MCP server for genomic region annotation"};

        bool show_version = false;
        bool skip_runtime_check = false;
        std::string rscript_arg{cfg.rscript_path.string()};
        std::string script_arg{};
        std::string working_dir_arg{};
        std::string config_arg{};
        int64_t probe_timeout_arg{cfg.probe_timeout.count()};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--rscript", rscript_arg, "Rscript executable (name on PATH or path)");
        app.add_option("--script", script_arg, "Path to annotate_genomic_segments.R");
        app.add_option("--working-dir", working_dir_arg, "Working directory for annotation runs");
        app.add_option("--config", config_arg, "JSON config file; explicit flags take precedence");
        app.add_option("--probe-timeout", probe_timeout_arg, "Seconds allowed for the Rscript --version probe");
        app.add_flag("--skip-runtime-check", skip_runtime_check, "Skip the Rscript --version probe at startup");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Only log warnings and errors");
        app.add_flag("--verbose", cfg.verbose, "Enable debug logging");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << detail::version_string << '\n';
            return std::optional<int>{0};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (!config_arg.empty()) {
            cfg.config_file = fs::path{config_arg};
            auto data = detail::read_json_file<detail::config_file>(*cfg.config_file);
            detail::validate_supported_schema_version(data.schema_version, *cfg.config_file);
            detail::apply_config_file(data, cfg);

            if (data.log_level) {
                log::level lvl{};
                if (!detail::try_parse_log_level(*data.log_level, lvl)) {
                    std::cerr << "invalid log_level in " << config_arg << ": " << *data.log_level
                              << " (expected error|warn|info|debug)\n";
                    return std::optional<int>{2};
                }
                log::set_level(lvl);
            }
        }

        if (app.count("--rscript") > 0U) {
            cfg.rscript_path = rscript_arg;
        }
        if (app.count("--script") > 0U) {
            cfg.script_path = fs::path{script_arg};
        }
        if (app.count("--working-dir") > 0U) {
            cfg.working_dir = fs::path{working_dir_arg};
        }
        if (app.count("--probe-timeout") > 0U) {
            if (probe_timeout_arg <= 0) {
                std::cerr << "invalid --probe-timeout value: " << probe_timeout_arg << " (expected > 0)\n";
                return std::optional<int>{2};
            }
            cfg.probe_timeout = std::chrono::seconds{probe_timeout_arg};
        }
        if (skip_runtime_check) {
            cfg.check_runtime = false;
        }

        if (cfg.quiet) {
            log::set_level(log::level::warn);
        }
        else if (cfg.verbose) {
            log::set_level(log::level::debug);
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

    int run_server(const server_config& cfg) {
        auto runner = std::make_shared<const supervisor>(resolve_runtime(cfg, detail::executable_dir()));
        log::info(
                "runtime: rscript={} script={} working_dir={}",
                runner->runtime().rscript.string(),
                runner->runtime().script.string(),
                runner->runtime().working_dir.string());

        if (cfg.check_runtime) {
            runner->probe(cfg.probe_timeout);
        }
        else {
            runner->probe(std::nullopt);
        }

        auto registry = make_annotation_registry(runner);
        return mcp::run_mcp_server(registry, std::cin, std::cout);
    }

}  // namespace annomics::cli
