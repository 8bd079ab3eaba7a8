#pragma once

#include "config.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace annomics {

    // Loosely-typed argument bag of annotate_genomic_regions, as decoded from JSON.
    // `input_files` accepts a single path, a comma-joined string or an array of paths.
    struct job_arguments {
        std::optional<std::variant<std::string, std::vector<std::string>>> input_files{};
        std::optional<std::string> genome_build{};
        std::optional<std::string> output_directory{};
        std::optional<std::string> sample_name{};
        std::optional<bool> include_cpg{};
        std::optional<bool> include_genic{};
        std::optional<std::vector<std::string>> plot_formats{};
        std::optional<bool> combine_analysis{};
        std::optional<std::string> pattern{};
        std::optional<int64_t> timeout{};
    };

    // Validated description of one annotation run. Built only by build_job_spec and
    // never modified afterwards; every dispatch builds a fresh one.
    struct job_spec {
        std::vector<std::string> input_files{};
        std::string genome{};
        std::filesystem::path output_directory{};
        std::optional<std::string> sample_name{};
        bool include_cpg{true};
        bool include_genic{true};
        std::vector<plot_format> plot_formats{};
        bool combine{false};
        std::string pattern{default_file_pattern};
        std::chrono::seconds timeout{default_job_timeout};
    };

    // Canonical, ordered input list: comma-joined strings are split, entries trimmed,
    // empty entries dropped.
    std::vector<std::string> normalize_input_files(const std::variant<std::string, std::vector<std::string>>& raw);

    // Throws validation_error; never touches the filesystem.
    job_spec build_job_spec(const job_arguments& args);

    // Decodes `raw_arguments` (a JSON object) then builds; malformed JSON or wrongly typed
    // fields are reported as validation_error.
    job_spec build_job_spec(std::string_view raw_arguments);

}  // namespace annomics
