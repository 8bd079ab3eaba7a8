#include "annomics/bed.hpp"

#include "annomics/utils.hpp"

#include <algorithm>
#include <fstream>

namespace annomics {

    namespace detail {

        static bool is_data_line(std::string_view line) {
            auto trimmed = utils::trim_view(line);
            return !trimmed.empty() && !trimmed.starts_with('#');
        }

    }  // namespace detail

    bed_format classify_bed_line(std::string_view line) {
        auto trimmed = utils::trim_view(line);
        if (trimmed.empty()) {
            return bed_format::unknown;
        }

        auto columns = static_cast<std::size_t>(std::ranges::count(trimmed, '\t')) + 1U;
        if (columns >= 12U) {
            return bed_format::bed12;
        }
        if (columns >= 6U) {
            return bed_format::bed6;
        }
        if (columns >= 3U) {
            return bed_format::bed3;
        }
        return bed_format::unknown;
    }

    bed_format detect_bed_format(const std::filesystem::path& path) {
        std::ifstream in{path};
        if (!in) {
            return bed_format::unknown;
        }

        std::string line{};
        while (std::getline(in, line)) {
            if (detail::is_data_line(line)) {
                return classify_bed_line(line);
            }
        }
        return bed_format::unknown;
    }

    std::vector<std::string> read_bed_preview(const std::filesystem::path& path, std::size_t max_lines) {
        std::vector<std::string> lines{};
        std::ifstream in{path};
        if (!in) {
            return lines;
        }

        std::string line{};
        while (lines.size() < max_lines && std::getline(in, line)) {
            if (detail::is_data_line(line)) {
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                lines.push_back(line);
            }
        }
        return lines;
    }

}  // namespace annomics
