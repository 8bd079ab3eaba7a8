#include "annomics/genomes.hpp"

#include <algorithm>

namespace annomics {

    namespace detail {

        using namespace std::string_view_literals;

        static constexpr std::array<std::string_view, 2> cpg_and_genic{"cpg"sv, "genic"sv};

        static constexpr std::array<genome_entry, 9> genome_table{{
                {"hg19"sv, "Human (GRCh37)"sv, "Homo sapiens"sv, "GRCh37"sv, "chr1"sv, cpg_and_genic},
                {"hg38"sv, "Human (GRCh38)"sv, "Homo sapiens"sv, "GRCh38"sv, "chr1"sv, cpg_and_genic},
                {"mm9"sv, "Mouse (NCBI37)"sv, "Mus musculus"sv, "NCBI37"sv, "chr1"sv, cpg_and_genic},
                {"mm10"sv, "Mouse (GRCm38)"sv, "Mus musculus"sv, "GRCm38"sv, "chr1"sv, cpg_and_genic},
                {"dm3"sv,
                 "Drosophila (BDGP Release 5)"sv,
                 "Drosophila melanogaster"sv,
                 "BDGP Release 5"sv,
                 "chr2L"sv,
                 cpg_and_genic},
                {"dm6"sv,
                 "Drosophila (BDGP Release 6)"sv,
                 "Drosophila melanogaster"sv,
                 "BDGP Release 6"sv,
                 "chr2L"sv,
                 cpg_and_genic},
                {"rn4"sv, "Rat (RGSC 3.4)"sv, "Rattus norvegicus"sv, "RGSC 3.4"sv, "chr1"sv, cpg_and_genic},
                {"rn5"sv, "Rat (RGSC 5.0)"sv, "Rattus norvegicus"sv, "RGSC 5.0"sv, "chr1"sv, cpg_and_genic},
                {"rn6"sv, "Rat (RGSC 6.0)"sv, "Rattus norvegicus"sv, "RGSC 6.0"sv, "chr1"sv, cpg_and_genic},
        }};

    }  // namespace detail

    std::span<const genome_entry> supported_genomes() {
        return detail::genome_table;
    }

    const genome_entry* find_genome(std::string_view id) {
        auto it = std::ranges::find(detail::genome_table, id, &genome_entry::id);
        if (it == detail::genome_table.end()) {
            return nullptr;
        }
        return &*it;
    }

    bool is_supported_genome(std::string_view id) {
        return find_genome(id) != nullptr;
    }

    std::string supported_genome_ids(std::string_view separator) {
        std::string out{};
        for (const auto& entry : detail::genome_table) {
            if (!out.empty()) {
                out.append(separator);
            }
            out.append(entry.id);
        }
        return out;
    }

}  // namespace annomics
