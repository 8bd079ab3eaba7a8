#pragma once

#include <array>
#include <span>
#include <string>
#include <string_view>

namespace annomics {

    struct genome_entry {
        std::string_view id{};
        std::string_view description{};
        std::string_view species{};
        std::string_view assembly{};
        std::string_view chromosome_style{};
        std::array<std::string_view, 2> annotations{};
    };

    std::span<const genome_entry> supported_genomes();

    // nullptr when `id` is not one of the supported builds; lookup is case-sensitive.
    const genome_entry* find_genome(std::string_view id);

    bool is_supported_genome(std::string_view id);

    // "hg19, hg38, ..." in registry order
    std::string supported_genome_ids(std::string_view separator = ", ");

}  // namespace annomics
