#include "annomics/handlers.hpp"

#include "annomics/bed.hpp"
#include "annomics/errors.hpp"
#include "annomics/format.hpp"
#include "annomics/genomes.hpp"
#include "annomics/job.hpp"
#include "annomics/log.hpp"
#include "annomics/manifest.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <fstream>
#include <ranges>
#include <sstream>
#include <stdexcept>

using namespace annomics::literals;
namespace fs = std::filesystem;

namespace annomics {

    namespace detail {

        struct bed_validation_args {
            std::string file_path{};
            struct glaze {
                using T = bed_validation_args;
                static constexpr auto value = glz::object(&T::file_path);
            };
        };

        struct summary_args {
            std::string results_directory{};
            std::optional<std::string> sample_name{};
            struct glaze {
                using T = summary_args;
                static constexpr auto value = glz::object(&T::results_directory, &T::sample_name);
            };
        };

        template <typename T>
        static T read_args(std::string_view tool, std::string_view raw_arguments) {
            std::string buffer{utils::trim_view(raw_arguments)};
            if (buffer.empty()) {
                buffer = "{}";
            }
            T args{};
            if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(args, buffer)) {
                throw validation_error{"invalid {} arguments: {}"_format(tool, glz::format_error(ec, buffer))};
            }
            return args;
        }

        static constexpr size_t key_file_limit = 5U;
        static constexpr size_t plot_preview_limit = 3U;
        static constexpr size_t summary_listing_limit = 5U;
        static constexpr size_t summary_table_lines = 6U;

        static void write_list(std::ostream& os, const std::vector<std::string>& items, size_t limit) {
            if (items.empty()) {
                os << "- (none)\n";
                return;
            }
            for (const auto& item : items | std::views::take(limit)) {
                os << "- " << item << '\n';
            }
            if (items.size() > limit) {
                os << "- ... and " << (items.size() - limit) << " more\n";
            }
        }

        static void write_counts(std::ostream& os, const file_manifest& manifest) {
            os << "- Annotation files: " << manifest.annotation_files.size() << '\n';
            os << "- Summary files: " << manifest.summary_files.size() << '\n';
            os << "- Plot files: " << manifest.plot_files.size() << '\n';
            os << "- Combined files: " << manifest.combined_files.size() << '\n';
        }

        // ── annotate_genomic_regions ────────────────────────────────────

        static std::string render_annotation_report(
                const job_spec& spec, const process_outcome& outcome, const file_manifest& manifest) {
            std::ostringstream os{};
            os << "Genomic annotation completed successfully.\n\n";
            os << "Input: " << utils::join_with_separator(spec.input_files, ", ") << '\n';
            os << "Genome Build: " << spec.genome;
            if (const auto* genome = find_genome(spec.genome)) {
                os << " (" << genome->description << ')';
            }
            os << '\n';
            os << "Output Directory: " << outcome.output_directory.string() << '\n';
            os << "Elapsed: " << "{:.1f}s"_format(static_cast<double>(outcome.elapsed.count()) / 1000.0) << "\n\n";

            os << "Generated Files:\n";
            write_counts(os, manifest);

            os << "\nKey Output Files:\n";
            write_list(os, manifest.annotation_files, key_file_limit);

            if (!manifest.plot_files.empty()) {
                auto shown = manifest.plot_files | std::views::take(plot_preview_limit) |
                             std::ranges::to<std::vector<std::string>>();
                os << "\nVisualizations created: " << utils::join_with_separator(shown, ", ") << '\n';
            }
            return os.str();
        }

        static tool_result annotate(const supervisor& runner, std::string_view raw_arguments) {
            auto spec = build_job_spec(raw_arguments);
            auto outcome = runner.run(spec);

            switch (outcome.status) {
                case process_status::timed_out:
                    throw timeout_failure{
                            "R script execution timed out after {} seconds"_format(spec.timeout.count())};
                case process_status::non_zero_exit:
                    throw process_failure{
                            "R script failed with return code {}:\n{}"_format(outcome.exit_code, outcome.stderr_text)};
                case process_status::launch_failed:
                    throw environment_error{outcome.stderr_text};
                case process_status::success:
                    break;
            }

            auto manifest = scan_output_directory(outcome.output_directory);
            if (manifest.empty()) {
                log::warn("annotation run produced no recognised files in {}", outcome.output_directory.string());
            }
            return tool_result::text(render_annotation_report(spec, outcome, manifest));
        }

        static tool_descriptor annotate_descriptor() {
            return tool_descriptor{
                    .name = std::string{annotate_tool_name},
                    .description = "Annotate genomic regions from BED files with CpG and genic features",
                    .parameters = {
                            {.name = "input_files",
                             .type = param_type::string_or_array,
                             .description = "Single BED file path, comma-separated list, or array of file paths",
                             .required = true},
                            {.name = "genome_build",
                             .type = param_type::string,
                             .description = "Target genome build ({})"_format(supported_genome_ids()),
                             .required = true},
                            {.name = "output_directory",
                             .type = param_type::string,
                             .description = "Output directory path",
                             .required = true},
                            {.name = "sample_name",
                             .type = param_type::string,
                             .description = "Optional sample name for output files"},
                            {.name = "include_cpg",
                             .type = param_type::boolean,
                             .description = "Include CpG island annotations",
                             .default_json = "true"},
                            {.name = "include_genic",
                             .type = param_type::boolean,
                             .description = "Include genic feature annotations",
                             .default_json = "true"},
                            {.name = "plot_formats",
                             .type = param_type::string_array,
                             .description = "Output plot formats",
                             .default_json = R"(["png","pdf"])",
                             .allowed = {"png", "pdf", "svg"}},
                            {.name = "combine_analysis",
                             .type = param_type::boolean,
                             .description = "Create combined analysis for multiple files",
                             .default_json = "false"},
                            {.name = "pattern",
                             .type = param_type::string,
                             .description = "File pattern used when an input is a directory",
                             .default_json = R"("*.bed")"},
                            {.name = "timeout",
                             .type = param_type::integer,
                             .description = "Execution timeout in seconds",
                             .default_json = std::to_string(default_job_timeout.count())},
                    }};
        }

        // ── list_supported_genomes ──────────────────────────────────────

        static tool_result list_genomes() {
            std::ostringstream os{};
            os << "Supported Genome Builds\n\n";
            for (const auto& genome : supported_genomes()) {
                os << genome.id << ": " << genome.description << '\n';
                os << "  - Species: " << genome.species << '\n';
                os << "  - Assembly: " << genome.assembly << '\n';
                os << "  - Chromosome naming: " << genome.chromosome_style << '\n';
                os << "  - Annotations: " << genome.annotations[0] << ", " << genome.annotations[1] << "\n\n";
            }
            os << "Usage: pass any of these identifiers as `genome_build` to " << annotate_tool_name << ".\n";
            return tool_result::text(os.str());
        }

        // ── validate_bed_format ─────────────────────────────────────────

        static tool_result validate_bed(std::string_view raw_arguments) {
            auto args = read_args<bed_validation_args>(validate_bed_tool_name, raw_arguments);
            fs::path file{args.file_path};

            std::error_code ec{};
            if (!fs::is_regular_file(file, ec)) {
                throw validation_error{"File not found: {}"_format(args.file_path)};
            }

            auto format = detect_bed_format(file);
            if (format == bed_format::unknown) {
                throw validation_error{
                        "{} has no records with at least 3 tab-separated columns"_format(args.file_path)};
            }

            std::ostringstream os{};
            os << "BED File Validation Results\n\n";
            os << "File: " << args.file_path << '\n';
            os << "Detected Format: " << to_string(format) << '\n';
            os << "Status: Valid BED format detected\n\n";
            os << "Preview (first 5 lines):\n";
            for (const auto& line : read_bed_preview(file)) {
                os << line << '\n';
            }
            os << "\nFormat Details:\n";
            os << "- bed3: chrom, chromStart, chromEnd\n";
            os << "- bed6: + name, score, strand\n";
            os << "- bed12: + thickStart, thickEnd, itemRgb, blockCount, blockSizes, blockStarts\n";
            return tool_result::text(os.str());
        }

        static tool_descriptor validate_bed_descriptor() {
            return tool_descriptor{
                    .name = std::string{validate_bed_tool_name},
                    .description = "Validate BED file format and structure",
                    .parameters = {
                            {.name = "file_path",
                             .type = param_type::string,
                             .description = "Path to BED file to validate",
                             .required = true},
                    }};
        }

        // ── get_annotation_summary ──────────────────────────────────────

        static void keep_sample_files(std::vector<std::string>& files, std::string_view sample) {
            std::erase_if(files, [sample](const std::string& rel) {
                return fs::path{rel}.filename().string().find(sample) == std::string::npos;
            });
        }

        static std::vector<std::string> read_head(const fs::path& file, size_t max_lines) {
            std::vector<std::string> lines{};
            std::ifstream in{file};
            std::string line{};
            while (lines.size() < max_lines && std::getline(in, line)) {
                lines.push_back(line);
            }
            return lines;
        }

        static tool_result summarize(std::string_view raw_arguments) {
            auto args = read_args<summary_args>(annotation_summary_tool_name, raw_arguments);
            fs::path dir{args.results_directory};

            std::error_code ec{};
            if (!fs::is_directory(dir, ec)) {
                throw validation_error{"Results directory not found: {}"_format(args.results_directory)};
            }

            auto manifest = scan_output_directory(dir);
            std::optional<std::string_view> sample{};
            if (args.sample_name && !utils::trim_view(*args.sample_name).empty()) {
                sample = utils::trim_view(*args.sample_name);
                keep_sample_files(manifest.annotation_files, *sample);
                keep_sample_files(manifest.summary_files, *sample);
                keep_sample_files(manifest.combined_files, *sample);
                keep_sample_files(manifest.plot_files, *sample);
            }

            std::ostringstream os{};
            os << "Annotation Results Summary\n\n";
            os << "Directory: " << args.results_directory << '\n';
            if (sample) {
                os << "Sample: " << *sample << '\n';
            }
            os << "\nFiles Found:\n";
            write_counts(os, manifest);

            os << "\nSummary Files:\n";
            write_list(os, manifest.summary_files, summary_listing_limit);
            os << "\nAnnotation Files:\n";
            write_list(os, manifest.annotation_files, summary_listing_limit);
            os << "\nCombined Files:\n";
            write_list(os, manifest.combined_files, summary_listing_limit);
            os << "\nVisualizations:\n";
            write_list(os, manifest.plot_files, summary_listing_limit);

            if (!manifest.summary_files.empty()) {
                const auto& first = manifest.summary_files.front();
                auto head = read_head(dir / first, summary_table_lines);
                os << "\nSample Summary (from " << first << "):\n";
                if (head.empty()) {
                    os << "(summary table is empty or unreadable)\n";
                }
                for (const auto& line : head) {
                    os << line << '\n';
                }
            }
            return tool_result::text(os.str());
        }

        static tool_descriptor summary_descriptor() {
            return tool_descriptor{
                    .name = std::string{annotation_summary_tool_name},
                    .description = "Get summary of annotation results from output directory",
                    .parameters = {
                            {.name = "results_directory",
                             .type = param_type::string,
                             .description = "Path to annotation results directory",
                             .required = true},
                            {.name = "sample_name",
                             .type = param_type::string,
                             .description = "Specific sample name (optional, defaults to all samples)"},
                    }};
        }

    }  // namespace detail

    tool_registry make_annotation_registry(std::shared_ptr<const supervisor> runner) {
        if (!runner) {
            throw std::invalid_argument{"annotation registry requires a supervisor"};
        }

        tool_registry registry{};
        registry.register_tool(detail::annotate_descriptor(), [runner](std::string_view raw) {
            return detail::annotate(*runner, raw);
        });
        registry.register_tool(
                tool_descriptor{
                        .name = std::string{list_genomes_tool_name},
                        .description = "List all supported genome builds and their details"},
                [](std::string_view) { return detail::list_genomes(); });
        registry.register_tool(detail::validate_bed_descriptor(), detail::validate_bed);
        registry.register_tool(detail::summary_descriptor(), detail::summarize);
        return registry;
    }

}  // namespace annomics
