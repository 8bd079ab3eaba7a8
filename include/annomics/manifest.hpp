#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace annomics {

    using namespace std::string_view_literals;

    enum class file_category : uint8_t { annotation, summary, combined, plot, ignored };

    inline constexpr std::string_view to_string(file_category category) {
        switch (category) {
            case file_category::annotation:
                return "annotation"sv;
            case file_category::summary:
                return "summary"sv;
            case file_category::combined:
                return "combined"sv;
            case file_category::plot:
                return "plot"sv;
            case file_category::ignored:
                return "ignored"sv;
        }
        return "ignored"sv;
    }

    // Files produced by one annotation run, as generic paths relative to the scanned directory.
    struct file_manifest {
        std::vector<std::string> annotation_files{};
        std::vector<std::string> summary_files{};
        std::vector<std::string> combined_files{};
        std::vector<std::string> plot_files{};

        std::size_t total() const {
            return annotation_files.size() + summary_files.size() + combined_files.size() + plot_files.size();
        }
        bool empty() const { return total() == 0U; }
    };

    // `.tsv`: "summary" in the file name wins over "combined"; any other `.tsv` is an
    // annotation table. `.png`, `.pdf` and `.svg` are plots. Matching is case-sensitive.
    file_category classify_output_file(const std::filesystem::path& file);

    // Recursive, read-only walk; entries of each directory are visited in lexicographic order.
    // A missing directory yields an empty manifest and unreadable entries are skipped.
    file_manifest scan_output_directory(const std::filesystem::path& directory);

}  // namespace annomics
