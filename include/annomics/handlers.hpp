#pragma once

#include "supervisor.hpp"
#include "tools.hpp"

#include <memory>

namespace annomics {

    inline constexpr auto annotate_tool_name = "annotate_genomic_regions"sv;
    inline constexpr auto list_genomes_tool_name = "list_supported_genomes"sv;
    inline constexpr auto validate_bed_tool_name = "validate_bed_format"sv;
    inline constexpr auto annotation_summary_tool_name = "get_annotation_summary"sv;

    // Registry holding the four annotation tools; `runner` is shared by every annotation call.
    tool_registry make_annotation_registry(std::shared_ptr<const supervisor> runner);

}  // namespace annomics
