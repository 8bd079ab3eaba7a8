#include "annomics/supervisor.hpp"

#include "annomics/errors.hpp"
#include "annomics/format.hpp"
#include "annomics/log.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <system_error>
#include <thread>

using namespace annomics::literals;
namespace fs = std::filesystem;

namespace annomics {

    namespace detail {

        namespace arg_tokens {
            static constexpr auto input = "-i"sv;
            static constexpr auto genome = "-g"sv;
            static constexpr auto output = "-o"sv;
            static constexpr auto formats = "--formats"sv;
            static constexpr auto sample_name = "-n"sv;
            static constexpr auto pattern = "--pattern"sv;
            static constexpr auto combine = "--combine"sv;
            static constexpr auto version = "--version"sv;
        }  // namespace arg_tokens

        using clock = std::chrono::steady_clock;

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        static void close_pipe(int (&fds)[2]) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }

        enum class launch_stage : int { chdir, exec };

        // Called between fork and exec: async-signal-safe only.
        static void report_child_errno(int fd, launch_stage stage, int err) {
            int report[2]{static_cast<int>(stage), err};
            auto written = ::write(fd, report, sizeof(report));
            (void)written;
        }

        static int decode_exit_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

        static int wait_blocking(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    return -1;
                }
            }
            return status;
        }

        // Reaps `pid` if it exits before `deadline`.
        static std::optional<int> wait_until(pid_t pid, clock::time_point deadline) {
            for (;;) {
                int status = 0;
                auto ret = ::waitpid(pid, &status, WNOHANG);
                if (ret == pid) {
                    return status;
                }
                if (ret < 0 && errno != EINTR) {
                    return -1;
                }
                if (clock::now() >= deadline) {
                    return std::nullopt;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{10});
            }
        }

        static void kill_group(pid_t pid) {
            if (::kill(-pid, SIGKILL) != 0) {
                ::kill(pid, SIGKILL);
            }
        }

        static std::string errno_text(int err) {
            return std::system_category().message(err);
        }

        static bool is_executable_file(const fs::path& path) {
            std::error_code ec{};
            return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
        }

    }  // namespace detail

    process_outcome run_process(
            const std::vector<std::string>& args, const fs::path& working_dir, std::chrono::milliseconds timeout) {
        process_outcome outcome{};
        auto started = detail::clock::now();
        auto finish = [&]() -> process_outcome {
            outcome.elapsed =
                    std::chrono::duration_cast<std::chrono::milliseconds>(detail::clock::now() - started);
            return std::move(outcome);
        };

        if (args.empty()) {
            outcome.stderr_text = "empty command line";
            return finish();
        }

        // everything the child touches is prepared before fork
        std::vector<char*> argv{};
        argv.reserve(args.size() + 1U);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);
        auto cwd = working_dir.string();

        int stdout_pipe[2]{-1, -1};
        int stderr_pipe[2]{-1, -1};
        int status_pipe[2]{-1, -1};
        if (::pipe2(stdout_pipe, O_CLOEXEC) != 0 || ::pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
            ::pipe2(status_pipe, O_CLOEXEC) != 0) {
            auto err = errno;
            detail::close_pipe(stdout_pipe);
            detail::close_pipe(stderr_pipe);
            detail::close_pipe(status_pipe);
            outcome.stderr_text = "pipe() failed: {}"_format(detail::errno_text(err));
            return finish();
        }

        int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (null_fd < 0) {
            auto err = errno;
            detail::close_pipe(stdout_pipe);
            detail::close_pipe(stderr_pipe);
            detail::close_pipe(status_pipe);
            outcome.stderr_text = "failed to open /dev/null: {}"_format(detail::errno_text(err));
            return finish();
        }

        auto pid = ::fork();
        if (pid < 0) {
            auto err = errno;
            detail::close_pipe(stdout_pipe);
            detail::close_pipe(stderr_pipe);
            detail::close_pipe(status_pipe);
            detail::close_fd(null_fd);
            outcome.stderr_text = "fork() failed: {}"_format(detail::errno_text(err));
            return finish();
        }

        if (pid == 0) {
            ::setpgid(0, 0);
            ::dup2(null_fd, STDIN_FILENO);
            ::dup2(stdout_pipe[1], STDOUT_FILENO);
            ::dup2(stderr_pipe[1], STDERR_FILENO);

            if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
                detail::report_child_errno(status_pipe[1], detail::launch_stage::chdir, errno);
                _exit(127);
            }

            ::execvp(argv[0], argv.data());
            detail::report_child_errno(status_pipe[1], detail::launch_stage::exec, errno);
            _exit(127);
        }

        // parent; mirror the child's setpgid so killing the group cannot race it
        ::setpgid(pid, pid);
        detail::close_fd(stdout_pipe[1]);
        detail::close_fd(stderr_pipe[1]);
        detail::close_fd(status_pipe[1]);
        detail::close_fd(null_fd);

        // the status pipe closes on a successful exec, otherwise it carries {stage, errno}
        int report[2]{};
        ssize_t status_bytes = 0;
        do {
            status_bytes = ::read(status_pipe[0], report, sizeof(report));
        } while (status_bytes < 0 && errno == EINTR);
        detail::close_fd(status_pipe[0]);

        if (status_bytes == static_cast<ssize_t>(sizeof(report))) {
            detail::wait_blocking(pid);
            detail::close_fd(stdout_pipe[0]);
            detail::close_fd(stderr_pipe[0]);
            if (report[0] == static_cast<int>(detail::launch_stage::chdir)) {
                outcome.stderr_text = "failed to enter working directory {}: {}"_format(cwd, detail::errno_text(report[1]));
            }
            else {
                outcome.stderr_text = "failed to launch {}: {}"_format(args.front(), detail::errno_text(report[1]));
            }
            return finish();
        }

        std::string out_buf{};
        std::string err_buf{};
        bool timed_out = false;
        int fds_open = 2;

        pollfd fds[2]{};
        fds[0] = {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0};
        fds[1] = {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0};

        auto deadline = started + timeout;

        while (fds_open > 0) {
            auto remaining =
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - detail::clock::now()).count();
            if (remaining <= 0) {
                timed_out = true;
                break;
            }

            // longer waits just take another turn of the loop
            auto wait_ms = static_cast<int>(std::min<int64_t>(remaining, std::numeric_limits<int>::max()));
            int ret = ::poll(fds, 2, wait_ms);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (ret == 0) {
                timed_out = true;
                break;
            }

            char chunk[4096]{};
            for (auto& pfd : fds) {
                if (pfd.fd < 0) {
                    continue;
                }
                if ((pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                    auto n = ::read(pfd.fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        (&pfd == &fds[0] ? out_buf : err_buf).append(chunk, static_cast<size_t>(n));
                    }
                    else if (n == 0 || errno != EINTR) {
                        detail::close_fd(pfd.fd);
                        --fds_open;
                    }
                }
            }
        }

        int status = 0;
        if (!timed_out) {
            // both streams are closed, but the process may still be running
            if (auto reaped = detail::wait_until(pid, deadline)) {
                status = *reaped;
            }
            else {
                timed_out = true;
            }
        }

        if (timed_out) {
            detail::kill_group(pid);
            status = detail::wait_blocking(pid);
        }

        for (auto& pfd : fds) {
            detail::close_fd(pfd.fd);
        }

        outcome.stdout_text = std::move(out_buf);
        outcome.stderr_text = std::move(err_buf);

        if (timed_out) {
            outcome.status = process_status::timed_out;
            return finish();
        }

        outcome.exit_code = status < 0 ? 1 : detail::decode_exit_status(status);
        outcome.status = outcome.exit_code == 0 ? process_status::success : process_status::non_zero_exit;
        return finish();
    }

    std::vector<std::string> build_command_line(const runtime_config& runtime, const job_spec& spec) {
        std::vector<std::string> formats{};
        formats.reserve(spec.plot_formats.size());
        for (auto format : spec.plot_formats) {
            formats.emplace_back(to_string(format));
        }

        std::vector<std::string> cmd{};
        cmd.push_back(runtime.rscript.string());
        cmd.push_back(runtime.script.string());

        cmd.emplace_back(detail::arg_tokens::input);
        cmd.push_back(utils::join_with_separator(spec.input_files, ","));
        cmd.emplace_back(detail::arg_tokens::genome);
        cmd.push_back(spec.genome);
        cmd.emplace_back(detail::arg_tokens::output);
        cmd.push_back(spec.output_directory.string());
        cmd.emplace_back(detail::arg_tokens::formats);
        cmd.push_back(utils::join_with_separator(formats, ","));

        if (spec.sample_name) {
            cmd.emplace_back(detail::arg_tokens::sample_name);
            cmd.push_back(*spec.sample_name);
        }
        if (spec.pattern != default_file_pattern) {
            cmd.emplace_back(detail::arg_tokens::pattern);
            cmd.push_back(spec.pattern);
        }
        if (spec.combine) {
            cmd.emplace_back(detail::arg_tokens::combine);
        }

        return cmd;
    }

    std::optional<fs::path> find_executable(const fs::path& name) {
        if (name.empty()) {
            return std::nullopt;
        }

        if (name.has_parent_path()) {
            if (detail::is_executable_file(name)) {
                return fs::absolute(name);
            }
            return std::nullopt;
        }

        const char* path_env = std::getenv("PATH");
        if (path_env == nullptr) {
            return std::nullopt;
        }

        for (const auto& dir : utils::split_trimmed(path_env, ':')) {
            auto candidate = fs::path{dir} / name;
            if (detail::is_executable_file(candidate)) {
                return candidate;
            }
        }
        return std::nullopt;
    }

    runtime_config resolve_runtime(const server_config& cfg, const fs::path& exe_dir) {
        runtime_config runtime{};
        runtime.rscript = cfg.rscript_path;

        std::error_code ec{};
        if (cfg.script_path) {
            runtime.script = fs::absolute(*cfg.script_path, ec);
            if (ec) {
                runtime.script = *cfg.script_path;
            }
        }
        else {
            std::vector<fs::path> candidates{
                    fs::path{"/app/scripts"} / default_script_name,
                    fs::current_path(ec) / "scripts" / default_script_name,
            };
            if (!exe_dir.empty()) {
                candidates.push_back(exe_dir.parent_path() / "scripts" / default_script_name);
                candidates.push_back(exe_dir / "scripts" / default_script_name);
            }

            for (const auto& candidate : candidates) {
                if (fs::is_regular_file(candidate, ec)) {
                    runtime.script = candidate.lexically_normal();
                    break;
                }
            }

            if (runtime.script.empty()) {
                std::vector<std::string> searched{};
                for (const auto& candidate : candidates) {
                    searched.push_back(candidate.string());
                }
                throw environment_error{"annotation script not found in any of: {}"_format(
                        utils::join_with_separator(searched, ", "))};
            }
            log::info("using annotation script {}", runtime.script.string());
        }

        if (cfg.working_dir) {
            runtime.working_dir = fs::absolute(*cfg.working_dir, ec);
        }
        else {
            runtime.working_dir = runtime.script.parent_path().parent_path();
            if (runtime.working_dir.empty()) {
                runtime.working_dir = fs::current_path(ec);
            }
        }

        return runtime;
    }

    supervisor::supervisor(runtime_config runtime) : runtime_{std::move(runtime)} {}

    std::vector<std::string> supervisor::command_line(const job_spec& spec) const {
        return build_command_line(runtime_, spec);
    }

    fs::path supervisor::resolve_output_directory(const job_spec& spec) const {
        if (spec.output_directory.is_absolute() || runtime_.working_dir.empty()) {
            return spec.output_directory;
        }
        return runtime_.working_dir / spec.output_directory;
    }

    process_outcome supervisor::run(const job_spec& spec) const {
        auto cmd = command_line(spec);
        log::info("running annotation job: {}", utils::join_with_separator(cmd, " "));

        auto outcome = run_process(cmd, runtime_.working_dir, spec.timeout);
        outcome.output_directory = resolve_output_directory(spec);

        log::info(
                "annotation job finished: status={} exit_code={} elapsed={}ms",
                outcome.status,
                outcome.exit_code,
                outcome.elapsed.count());
        return outcome;
    }

    std::future<process_outcome> supervisor::launch(job_spec spec) const {
        return std::async(std::launch::async, [this, spec = std::move(spec)] { return run(spec); });
    }

    void supervisor::probe(std::optional<std::chrono::seconds> version_timeout) const {
        std::error_code ec{};
        if (runtime_.script.empty() || !fs::is_regular_file(runtime_.script, ec)) {
            throw environment_error{"annotation script not found: {}"_format(runtime_.script.string())};
        }

        if (!runtime_.working_dir.empty() && !fs::is_directory(runtime_.working_dir, ec)) {
            throw environment_error{"working directory does not exist: {}"_format(runtime_.working_dir.string())};
        }

        auto executable = find_executable(runtime_.rscript);
        if (!executable) {
            throw environment_error{"{} not found or not executable"_format(runtime_.rscript.string())};
        }

        if (!version_timeout) {
            return;
        }

        auto outcome = run_process(
                {executable->string(), std::string{detail::arg_tokens::version}}, runtime_.working_dir, *version_timeout);
        if (!outcome.ok()) {
            throw environment_error{"{} --version failed ({}): {}"_format(
                    runtime_.rscript.string(), outcome.status, utils::trim_view(outcome.stderr_text))};
        }

        // Rscript prints its version on stderr
        auto banner = utils::trim_view(outcome.stderr_text.empty() ? outcome.stdout_text : outcome.stderr_text);
        log::info("runtime check passed: {}", banner);
    }

}  // namespace annomics
