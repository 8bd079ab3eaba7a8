#pragma once

#include "annomics/bed.hpp"
#include "annomics/config.hpp"
#include "annomics/errors.hpp"
#include "annomics/genomes.hpp"
#include "annomics/handlers.hpp"
#include "annomics/job.hpp"
#include "annomics/log.hpp"
#include "annomics/manifest.hpp"
#include "annomics/mcp.hpp"
#include "annomics/supervisor.hpp"
#include "annomics/tools.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace annomics::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        if (p.has_parent_path()) {
            fs::create_directories(p.parent_path());
        }
        std::ofstream out{p};
        REQUIRE(out.good());
        out << content;
    }

    inline bool contains(std::string_view haystack, std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    }

    // Annotation runtime backed by /bin/sh: `body` becomes the annotation script, with the
    // job arguments in "$@" and the runtime root as the working directory.
    inline runtime_config shell_runtime(const fs::path& root, std::string_view body) {
        auto script = root / "scripts" / "annotate.sh";
        write_file(script, "#!/bin/sh\n" + std::string{body} + "\n");
        return runtime_config{.rscript = "/bin/sh", .script = script, .working_dir = root};
    }

    inline job_spec make_spec(const fs::path& output_directory, std::chrono::seconds timeout = std::chrono::seconds{30}) {
        job_spec spec{};
        spec.input_files = {"a.bed"};
        spec.genome = "hg38";
        spec.output_directory = output_directory;
        spec.plot_formats = {plot_format::png, plot_format::pdf};
        spec.timeout = timeout;
        return spec;
    }

    inline std::string joined_text(const tool_result& result) {
        std::string out{};
        for (const auto& text : result.contents) {
            out += text;
        }
        return out;
    }
}  // namespace annomics::test::detail
