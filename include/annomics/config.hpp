#pragma once

#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace annomics {

    using namespace std::string_view_literals;

    /*
     * annomics Startup Config Options
     *
     * Annotation runtime
     * - rscript_path: Rscript executable (bare names are looked up on PATH).
     * - script_path: annotate_genomic_segments.R; searched in the default locations when unset.
     * - working_dir: Directory the annotation process runs in; relative output paths resolve here.
     *   Defaults to the parent of the script's directory.
     * - probe_timeout: Time limit for the `Rscript --version` startup probe.
     * - check_runtime: Run the version probe at startup.
     *
     * Sources and UX
     * - config_file: Optional JSON file with the same keys; explicit flags win.
     * - quiet/verbose: Log threshold (warn / debug instead of info).
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     */

    enum class plot_format : uint8_t { png, pdf, svg };

    inline constexpr std::string_view to_string(plot_format format) {
        switch (format) {
            case plot_format::png:
                return "png"sv;
            case plot_format::pdf:
                return "pdf"sv;
            case plot_format::svg:
                return "svg"sv;
        }
        return "png"sv;
    }

    inline constexpr bool try_parse_plot_format(std::string_view text, plot_format& out) {
        if (utils::str_case_eq(text, "png"sv)) {
            out = plot_format::png;
            return true;
        }
        if (utils::str_case_eq(text, "pdf"sv)) {
            out = plot_format::pdf;
            return true;
        }
        if (utils::str_case_eq(text, "svg"sv)) {
            out = plot_format::svg;
            return true;
        }
        return false;
    }

    inline constexpr auto default_script_name = "annotate_genomic_segments.R"sv;
    inline constexpr auto default_file_pattern = "*.bed"sv;
    inline constexpr std::chrono::seconds default_job_timeout{300};
    inline constexpr std::chrono::seconds max_job_timeout{std::chrono::hours{24 * 7}};

    struct server_config {
        std::filesystem::path rscript_path{"Rscript"};
        std::optional<std::filesystem::path> script_path{};
        std::optional<std::filesystem::path> working_dir{};
        std::chrono::seconds probe_timeout{10};
        bool check_runtime{true};

        std::optional<std::filesystem::path> config_file{};
        bool quiet{false};
        bool verbose{false};

        bool print_config{false};
    };

}  // namespace annomics
