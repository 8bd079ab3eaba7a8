#pragma once

#include "errors.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace annomics {

    enum class param_type : uint8_t { string, boolean, integer, string_array, string_or_array };

    inline constexpr std::string_view to_string(param_type type) {
        switch (type) {
            case param_type::string:
                return "string"sv;
            case param_type::boolean:
                return "boolean"sv;
            case param_type::integer:
                return "integer"sv;
            case param_type::string_array:
                return "array of strings"sv;
            case param_type::string_or_array:
                return "string or array of strings"sv;
        }
        return "string"sv;
    }

    struct parameter_spec {
        std::string name{};
        param_type type{param_type::string};
        std::string description{};
        bool required{false};
        // JSON text, rendered verbatim as the schema default
        std::optional<std::string> default_json{};
        // case-insensitive; applies to array elements for array types
        std::vector<std::string> allowed{};
    };

    struct tool_descriptor {
        std::string name{};
        std::string description{};
        std::vector<parameter_spec> parameters{};
    };

    struct tool_result {
        std::vector<std::string> contents{};
        bool is_error{false};
        std::optional<failure_kind> failure{};

        static tool_result text(std::string body) { return tool_result{.contents = {std::move(body)}}; }

        static tool_result error(failure_kind kind, std::string message) {
            return tool_result{.contents = {std::move(message)}, .is_error = true, .failure = kind};
        }
    };

    // Receives the raw JSON arguments object; reports failures by throwing annomics::error.
    using tool_handler = std::function<tool_result(std::string_view raw_arguments)>;

    struct registered_tool {
        tool_descriptor descriptor{};
        tool_handler handler{};
    };

    // Throws validation_error unless `raw_arguments` is a JSON object whose members match the
    // declared parameters. Members not declared are tolerated; null counts as absent.
    void validate_arguments(const tool_descriptor& descriptor, std::string_view raw_arguments);

    // JSON-Schema object describing the descriptor's parameters (`inputSchema` of tools/list).
    std::string input_schema_json(const tool_descriptor& descriptor);

    class tool_registry {
      public:
        // Throws std::invalid_argument on an empty or duplicate name.
        void register_tool(tool_descriptor descriptor, tool_handler handler);

        // Registration order.
        const std::vector<registered_tool>& tools() const { return tools_; }

        const registered_tool* find(std::string_view name) const;

        // Never throws: unknown names, validation failures and handler exceptions all come
        // back as error results tagged with their failure kind.
        tool_result dispatch(std::string_view name, std::string_view raw_arguments) const;

      private:
        std::vector<registered_tool> tools_{};
    };

}  // namespace annomics
