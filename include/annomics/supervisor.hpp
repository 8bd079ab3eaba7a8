#pragma once

#include "config.hpp"
#include "job.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace annomics {

    enum class process_status : uint8_t {
        success,
        non_zero_exit,
        timed_out,
        launch_failed,
    };

    inline constexpr std::string_view to_string(process_status status) {
        switch (status) {
            case process_status::success:
                return "success"sv;
            case process_status::non_zero_exit:
                return "non-zero-exit"sv;
            case process_status::timed_out:
                return "timed-out"sv;
            case process_status::launch_failed:
                return "launch-failed"sv;
        }
        return "launch-failed"sv;
    }

    struct process_outcome {
        process_status status{process_status::launch_failed};
        int exit_code{-1};
        std::string stdout_text{};
        std::string stderr_text{};
        std::filesystem::path output_directory{};
        std::chrono::milliseconds elapsed{};

        bool ok() const { return status == process_status::success; }
    };

    struct runtime_config {
        std::filesystem::path rscript{"Rscript"};
        std::filesystem::path script{};
        std::filesystem::path working_dir{};
    };

    /*
     * Runs `args` (argv[0] resolved through PATH) with stdin bound to /dev/null and both
     * output streams captured. The child leads its own process group; when `timeout`
     * elapses the whole group is killed and the outcome is timed_out. Exec or chdir
     * failures in the child surface as launch_failed with the errno text in stderr_text.
     * Safe to call from several threads at once.
     */
    process_outcome run_process(
            const std::vector<std::string>& args,
            const std::filesystem::path& working_dir,
            std::chrono::milliseconds timeout);

    // `<rscript> <script> -i a,b -g id -o dir --formats png,pdf [-n name] [--pattern glob] [--combine]`
    std::vector<std::string> build_command_line(const runtime_config& runtime, const job_spec& spec);

    // Absolute path of an executable; bare names are searched on PATH.
    std::optional<std::filesystem::path> find_executable(const std::filesystem::path& name);

    // Resolves script and working directory from the startup config; throws environment_error
    // when no annotation script can be located.
    runtime_config resolve_runtime(const server_config& cfg, const std::filesystem::path& exe_dir);

    class supervisor {
      public:
        explicit supervisor(runtime_config runtime);

        const runtime_config& runtime() const { return runtime_; }

        std::vector<std::string> command_line(const job_spec& spec) const;

        // Relative output directories are interpreted against the pinned working directory.
        std::filesystem::path resolve_output_directory(const job_spec& spec) const;

        // One attempt, no retries; blocks the calling thread only.
        process_outcome run(const job_spec& spec) const;

        // Supervises the job on its own thread. The supervisor must outlive the future.
        std::future<process_outcome> launch(job_spec spec) const;

        // Throws environment_error when the script or executable is unusable. With a
        // `version_timeout`, additionally requires `<rscript> --version` to exit 0 in time.
        void probe(std::optional<std::chrono::seconds> version_timeout) const;

      private:
        runtime_config runtime_;
    };

}  // namespace annomics
