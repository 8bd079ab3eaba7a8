#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace annomics {

    using namespace std::string_view_literals;

    /*
     * Failure taxonomy
     *
     * - validation:   bad or missing argument, unsupported genome; rejected before any process starts.
     * - environment:  runtime executable or annotation script unusable; fatal at startup.
     * - process:      the annotation process exited non-zero; carries its stderr verbatim.
     * - timeout:      the deadline elapsed and the process group was killed.
     * - unknown_tool: tools/call named a tool that is not registered.
     * - protocol:     malformed request or unknown method.
     * - internal:     anything else escaping a handler.
     */
    enum class failure_kind : uint8_t {
        validation,
        environment,
        process,
        timeout,
        unknown_tool,
        protocol,
        internal,
    };

    inline constexpr std::string_view to_string(failure_kind kind) {
        switch (kind) {
            case failure_kind::validation:
                return "validation"sv;
            case failure_kind::environment:
                return "environment"sv;
            case failure_kind::process:
                return "process"sv;
            case failure_kind::timeout:
                return "timeout"sv;
            case failure_kind::unknown_tool:
                return "unknown_tool"sv;
            case failure_kind::protocol:
                return "protocol"sv;
            case failure_kind::internal:
                return "internal"sv;
        }
        return "internal"sv;
    }

    class error : public std::runtime_error {
      public:
        error(failure_kind kind, const std::string& message) : std::runtime_error{message}, kind_{kind} {}

        failure_kind kind() const noexcept { return kind_; }

      private:
        failure_kind kind_;
    };

    struct validation_error : error {
        explicit validation_error(const std::string& message) : error{failure_kind::validation, message} {}
    };

    struct environment_error : error {
        explicit environment_error(const std::string& message) : error{failure_kind::environment, message} {}
    };

    struct process_failure : error {
        explicit process_failure(const std::string& message) : error{failure_kind::process, message} {}
    };

    struct timeout_failure : error {
        explicit timeout_failure(const std::string& message) : error{failure_kind::timeout, message} {}
    };

    struct unknown_tool_error : error {
        explicit unknown_tool_error(const std::string& message) : error{failure_kind::unknown_tool, message} {}
    };

    struct protocol_error : error {
        explicit protocol_error(const std::string& message) : error{failure_kind::protocol, message} {}
    };

}  // namespace annomics
