#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace annomics {

    using namespace std::string_view_literals;

    enum class bed_format : uint8_t { bed3, bed6, bed12, unknown };

    inline constexpr std::string_view to_string(bed_format format) {
        switch (format) {
            case bed_format::bed3:
                return "bed3"sv;
            case bed_format::bed6:
                return "bed6"sv;
            case bed_format::bed12:
                return "bed12"sv;
            case bed_format::unknown:
                return "unknown"sv;
        }
        return "unknown"sv;
    }

    // Classifies a single tab-separated data line by column count.
    bed_format classify_bed_line(std::string_view line);

    // Format of the first non-blank, non-comment line; unknown for unreadable or empty files.
    bed_format detect_bed_format(const std::filesystem::path& path);

    // Up to `max_lines` non-blank, non-comment lines from the head of the file.
    std::vector<std::string> read_bed_preview(const std::filesystem::path& path, std::size_t max_lines = 5U);

}  // namespace annomics
