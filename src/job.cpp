#include "annomics/job.hpp"

#include "annomics/errors.hpp"
#include "annomics/format.hpp"
#include "annomics/genomes.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <array>

using namespace annomics::literals;

namespace glz {

    template <>
    struct meta<annomics::job_arguments> {
        using T = annomics::job_arguments;
        static constexpr auto value =
                object("input_files",
                       &T::input_files,
                       "genome_build",
                       &T::genome_build,
                       "output_directory",
                       &T::output_directory,
                       "sample_name",
                       &T::sample_name,
                       "include_cpg",
                       &T::include_cpg,
                       "include_genic",
                       &T::include_genic,
                       "plot_formats",
                       &T::plot_formats,
                       "combine_analysis",
                       &T::combine_analysis,
                       "pattern",
                       &T::pattern,
                       "timeout",
                       &T::timeout);
    };

}  // namespace glz

namespace annomics {

    namespace detail {

        static constexpr auto default_plot_formats = std::array{plot_format::png, plot_format::pdf};

        [[noreturn]] static void missing_argument(std::string_view name) {
            throw validation_error{"missing required argument: {}"_format(name)};
        }

        static std::vector<plot_format> parse_plot_formats(const std::optional<std::vector<std::string>>& raw) {
            if (!raw) {
                return {default_plot_formats.begin(), default_plot_formats.end()};
            }

            std::vector<plot_format> formats{};
            for (const auto& token : *raw) {
                plot_format format{};
                if (!try_parse_plot_format(utils::trim_view(token), format)) {
                    throw validation_error{"unsupported plot format '{}' (expected png|pdf|svg)"_format(token)};
                }
                if (std::ranges::find(formats, format) == formats.end()) {
                    formats.push_back(format);
                }
            }

            if (formats.empty()) {
                throw validation_error{"plot_formats must contain at least one of png, pdf, svg"};
            }
            return formats;
        }

    }  // namespace detail

    std::vector<std::string> normalize_input_files(const std::variant<std::string, std::vector<std::string>>& raw) {
        if (const auto* joined = std::get_if<std::string>(&raw)) {
            return utils::split_trimmed(*joined, ',');
        }

        std::vector<std::string> files{};
        for (const auto& item : std::get<std::vector<std::string>>(raw)) {
            for (auto& piece : utils::split_trimmed(item, ',')) {
                files.push_back(std::move(piece));
            }
        }
        return files;
    }

    job_spec build_job_spec(const job_arguments& args) {
        if (!args.input_files) {
            detail::missing_argument("input_files");
        }
        if (!args.genome_build) {
            detail::missing_argument("genome_build");
        }
        if (!args.output_directory) {
            detail::missing_argument("output_directory");
        }

        job_spec spec{};

        spec.input_files = normalize_input_files(*args.input_files);
        if (spec.input_files.empty()) {
            throw validation_error{"input_files must name at least one file"};
        }

        if (!is_supported_genome(*args.genome_build)) {
            throw validation_error{
                    "Unsupported genome build '{}'. Available: {}"_format(*args.genome_build, supported_genome_ids())};
        }
        spec.genome = *args.genome_build;

        auto output_dir = utils::trim_view(*args.output_directory);
        if (output_dir.empty()) {
            throw validation_error{"output_directory must not be empty"};
        }
        spec.output_directory = std::filesystem::path{std::string{output_dir}};

        if (args.sample_name) {
            auto name = utils::trim_view(*args.sample_name);
            if (!name.empty()) {
                spec.sample_name = std::string{name};
            }
        }

        spec.include_cpg = args.include_cpg.value_or(true);
        spec.include_genic = args.include_genic.value_or(true);
        spec.plot_formats = detail::parse_plot_formats(args.plot_formats);
        spec.combine = args.combine_analysis.value_or(false);

        if (args.pattern) {
            auto pattern = utils::trim_view(*args.pattern);
            if (pattern.empty()) {
                throw validation_error{"pattern must not be empty"};
            }
            spec.pattern = std::string{pattern};
        }

        if (args.timeout) {
            if (*args.timeout <= 0) {
                throw validation_error{"timeout must be a positive number of seconds, got {}"_format(*args.timeout)};
            }
            if (*args.timeout > max_job_timeout.count()) {
                throw validation_error{"timeout must not exceed {} seconds, got {}"_format(
                        max_job_timeout.count(), *args.timeout)};
            }
            spec.timeout = std::chrono::seconds{*args.timeout};
        }

        return spec;
    }

    job_spec build_job_spec(std::string_view raw_arguments) {
        std::string buffer{utils::trim_view(raw_arguments)};
        if (buffer.empty()) {
            buffer = "{}";
        }

        job_arguments args{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(args, buffer);
        if (ec) {
            throw validation_error{"invalid annotation arguments: {}"_format(glz::format_error(ec, buffer))};
        }
        return build_job_spec(args);
    }

}  // namespace annomics
