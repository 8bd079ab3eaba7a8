#include "annomics/tools.hpp"

#include "annomics/format.hpp"
#include "annomics/log.hpp"
#include "annomics/utils.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <cstdint>
#include <map>
#include <stdexcept>

using namespace annomics::literals;

namespace annomics {

    namespace detail {

        // ── JSON-Schema rendering ───────────────────────────────────────

        struct item_schema {
            std::string type{"string"};
            std::optional<std::vector<std::string>> enum_values{};
            struct glaze {
                using T = item_schema;
                static constexpr auto value = glz::object(&T::type, "enum", &T::enum_values);
            };
        };

        struct property_schema {
            glz::raw_json type{};
            std::string description{};
            std::optional<item_schema> items{};
            std::optional<std::vector<std::string>> enum_values{};
            std::optional<glz::raw_json> default_value{};
            struct glaze {
                using T = property_schema;
                static constexpr auto value = glz::object(
                        &T::type,
                        &T::description,
                        &T::items,
                        "enum",
                        &T::enum_values,
                        "default",
                        &T::default_value);
            };
        };

        struct object_schema {
            std::string type{"object"};
            std::map<std::string, property_schema> properties{};
            std::vector<std::string> required{};
            struct glaze {
                using T = object_schema;
                static constexpr auto value = glz::object(&T::type, &T::properties, &T::required);
            };
        };

        static constexpr std::string_view schema_type(param_type type) {
            switch (type) {
                case param_type::string:
                    return R"("string")"sv;
                case param_type::boolean:
                    return R"("boolean")"sv;
                case param_type::integer:
                    return R"("integer")"sv;
                case param_type::string_array:
                    return R"("array")"sv;
                case param_type::string_or_array:
                    return R"(["string","array"])"sv;
            }
            return R"("string")"sv;
        }

        static property_schema make_property(const parameter_spec& param) {
            property_schema prop{};
            prop.type = glz::raw_json{std::string{schema_type(param.type)}};
            prop.description = param.description;

            std::optional<std::vector<std::string>> allowed{};
            if (!param.allowed.empty()) {
                allowed = param.allowed;
            }

            switch (param.type) {
                case param_type::string_array:
                case param_type::string_or_array:
                    prop.items = item_schema{.enum_values = std::move(allowed)};
                    break;
                default:
                    prop.enum_values = std::move(allowed);
                    break;
            }

            if (param.default_json) {
                prop.default_value = glz::raw_json{*param.default_json};
            }
            return prop;
        }

        // ── Argument validation ─────────────────────────────────────────

        static bool is_allowed(const parameter_spec& param, std::string_view value) {
            return param.allowed.empty() || std::ranges::any_of(param.allowed, [value](const std::string& candidate) {
                       return utils::str_case_eq(candidate, value);
                   });
        }

        [[noreturn]] static void type_mismatch(const parameter_spec& param) {
            throw validation_error{"argument '{}' must be of type {}"_format(param.name, param.type)};
        }

        static void check_string(const parameter_spec& param, const glz::generic& value) {
            if (!value.is_string()) {
                type_mismatch(param);
            }
            const auto& text = value.get_string();
            if (!is_allowed(param, text)) {
                throw validation_error{"invalid value '{}' for {} (expected one of: {})"_format(
                        text, param.name, utils::join_with_separator(param.allowed, ", "))};
            }
        }

        static void check_string_array(const parameter_spec& param, const glz::generic& value) {
            if (!value.is_array()) {
                type_mismatch(param);
            }
            for (const auto& element : value.get_array()) {
                if (!element.is_string()) {
                    type_mismatch(param);
                }
                check_string(param, element);
            }
        }

        static void check_integer(const parameter_spec& param, const glz::generic& value) {
            if (!value.is_number()) {
                type_mismatch(param);
            }
            std::string text{};
            if (glz::write_json(value, text) || !utils::parse_integer<int64_t>(text)) {
                throw validation_error{"argument '{}' must be an integer, got {}"_format(param.name, text)};
            }
        }

        static void check_parameter(const parameter_spec& param, const glz::generic& value) {
            switch (param.type) {
                case param_type::string:
                    check_string(param, value);
                    break;
                case param_type::boolean:
                    if (!value.is_boolean()) {
                        type_mismatch(param);
                    }
                    break;
                case param_type::integer:
                    check_integer(param, value);
                    break;
                case param_type::string_array:
                    check_string_array(param, value);
                    break;
                case param_type::string_or_array:
                    if (value.is_string()) {
                        check_string(param, value);
                    }
                    else {
                        check_string_array(param, value);
                    }
                    break;
            }
        }

    }  // namespace detail

    void validate_arguments(const tool_descriptor& descriptor, std::string_view raw_arguments) {
        std::string buffer{utils::trim_view(raw_arguments)};
        if (buffer.empty()) {
            buffer = "{}";
        }

        glz::generic args{};
        if (auto ec = glz::read_json(args, buffer)) {
            throw validation_error{"arguments are not valid JSON: {}"_format(glz::format_error(ec, buffer))};
        }
        if (!args.is_object()) {
            throw validation_error{"arguments must be a JSON object"};
        }

        const auto& members = args.get_object();
        for (const auto& param : descriptor.parameters) {
            auto it = members.find(param.name);
            if (it == members.end() || it->second.is_null()) {
                if (param.required) {
                    throw validation_error{"missing required argument: {}"_format(param.name)};
                }
                continue;
            }
            detail::check_parameter(param, it->second);
        }
    }

    std::string input_schema_json(const tool_descriptor& descriptor) {
        detail::object_schema schema{};
        for (const auto& param : descriptor.parameters) {
            schema.properties.emplace(param.name, detail::make_property(param));
            if (param.required) {
                schema.required.push_back(param.name);
            }
        }

        std::string json{};
        if (auto ec = glz::write_json(schema, json)) {
            throw std::runtime_error{"failed to render input schema for {}"_format(descriptor.name)};
        }
        return json;
    }

    void tool_registry::register_tool(tool_descriptor descriptor, tool_handler handler) {
        if (descriptor.name.empty()) {
            throw std::invalid_argument{"tool name must not be empty"};
        }
        if (find(descriptor.name) != nullptr) {
            throw std::invalid_argument{"tool already registered: {}"_format(descriptor.name)};
        }
        if (!handler) {
            throw std::invalid_argument{"tool {} registered without a handler"_format(descriptor.name)};
        }
        tools_.push_back(registered_tool{.descriptor = std::move(descriptor), .handler = std::move(handler)});
    }

    const registered_tool* tool_registry::find(std::string_view name) const {
        auto it = std::ranges::find(tools_, name, [](const registered_tool& t) -> std::string_view {
            return t.descriptor.name;
        });
        return it == tools_.end() ? nullptr : &*it;
    }

    tool_result tool_registry::dispatch(std::string_view name, std::string_view raw_arguments) const {
        try {
            const auto* tool = find(name);
            if (tool == nullptr) {
                throw unknown_tool_error{"Unknown tool: {}"_format(name)};
            }

            log::debug("dispatching {} with {}", name, raw_arguments);
            validate_arguments(tool->descriptor, raw_arguments);
            return tool->handler(raw_arguments);
        } catch (const unknown_tool_error& e) {
            log::warn("call to unknown tool '{}'", name);
            return tool_result::error(e.kind(), e.what());
        } catch (const error& e) {
            log::error("{} failed ({}): {}", name, e.kind(), e.what());
            return tool_result::error(e.kind(), "Error executing {}: {}"_format(name, e.what()));
        } catch (const std::exception& e) {
            log::error("{} failed: {}", name, e.what());
            return tool_result::error(failure_kind::internal, "Error executing {}: {}"_format(name, e.what()));
        } catch (...) {
            log::error("{} failed with a non-standard exception", name);
            return tool_result::error(failure_kind::internal, "Error executing {}: unknown error"_format(name));
        }
    }

}  // namespace annomics
