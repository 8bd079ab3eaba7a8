#include "annomics/mcp.hpp"

#include "annomics/errors.hpp"
#include "annomics/format.hpp"
#include "annomics/log.hpp"
#include "annomics/utils.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace annomics::literals;

namespace annomics::mcp::detail {

    // name/version pair used for both clientInfo and serverInfo
    struct implementation_info {
        std::string name{};
        std::string version{};
    };

    struct initialize_request {
        std::string protocol_version{};
        implementation_info client{};
    };

    struct initialize_reply {
        std::string protocol_version{std::string{mcp::protocol_version}};
        // only the tools capability is advertised
        glz::raw_json capabilities{R"({"tools":{}})"};
        implementation_info server{.name = std::string{server_name}, .version = std::string{server_version}};
    };

    struct listed_tool {
        std::string name{};
        std::string description{};
        glz::raw_json input_schema{};
    };

    struct tools_listing {
        std::vector<listed_tool> tools{};
    };

    struct call_request {
        std::string name{};
        glz::raw_json arguments{"{}"};
    };

    struct content_block {
        std::string type{"text"};
        std::string text{};
    };

    struct call_reply {
        std::vector<content_block> content{};
        bool is_error{false};
    };

}  // namespace annomics::mcp::detail

namespace glz {

    template <>
    struct meta<annomics::mcp::detail::implementation_info> {
        using T = annomics::mcp::detail::implementation_info;
        static constexpr auto value = object("name", &T::name, "version", &T::version);
    };

    template <>
    struct meta<annomics::mcp::detail::initialize_request> {
        using T = annomics::mcp::detail::initialize_request;
        static constexpr auto value = object("protocolVersion", &T::protocol_version, "clientInfo", &T::client);
    };

    template <>
    struct meta<annomics::mcp::detail::initialize_reply> {
        using T = annomics::mcp::detail::initialize_reply;
        static constexpr auto value = object(
                "protocolVersion", &T::protocol_version, "capabilities", &T::capabilities, "serverInfo", &T::server);
    };

    template <>
    struct meta<annomics::mcp::detail::listed_tool> {
        using T = annomics::mcp::detail::listed_tool;
        static constexpr auto value =
                object("name", &T::name, "description", &T::description, "inputSchema", &T::input_schema);
    };

    template <>
    struct meta<annomics::mcp::detail::tools_listing> {
        using T = annomics::mcp::detail::tools_listing;
        static constexpr auto value = object("tools", &T::tools);
    };

    template <>
    struct meta<annomics::mcp::detail::call_request> {
        using T = annomics::mcp::detail::call_request;
        static constexpr auto value = object("name", &T::name, "arguments", &T::arguments);
    };

    template <>
    struct meta<annomics::mcp::detail::content_block> {
        using T = annomics::mcp::detail::content_block;
        static constexpr auto value = object("type", &T::type, "text", &T::text);
    };

    template <>
    struct meta<annomics::mcp::detail::call_reply> {
        using T = annomics::mcp::detail::call_reply;
        static constexpr auto value = object("content", &T::content, "isError", &T::is_error);
    };

}  // namespace glz

namespace annomics::mcp {

    namespace detail {

        // ── Response helpers ────────────────────────────────────────────

        static std::string make_error_response(
                const glz::rpc::id_t& id, glz::rpc::error_e code, const std::string& message) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{code, std::nullopt, message};
            std::string json{};
            if (auto ec = glz::write_json(resp, json)) {
                return R"({"jsonrpc":"2.0","error":{"code":-32603,"message":"failed to encode error"},"id":null})";
            }
            return json;
        }

        template <typename T>
        static std::string make_response(const glz::rpc::id_t& id, T&& result) {
            glz::rpc::response_t<std::decay_t<T>> resp{};
            resp.id = id;
            resp.result = std::forward<T>(result);
            std::string json{};
            if (auto ec = glz::write_json(resp, json)) {
                return make_error_response(
                        id, glz::rpc::error_e::internal_error, "failed to encode response: {}"_format(glz::format_error(ec)));
            }
            return json;
        }

        // Missing, null or blank arguments mean "no arguments".
        static std::string_view normalize_arguments(const glz::raw_json& raw) {
            auto text = utils::trim_view(raw.str);
            if (text.empty() || text == "null"sv || text == R"("")"sv) {
                return "{}"sv;
            }
            return text;
        }

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_initialize(const glz::rpc::id_t& id, glz::raw_json_view raw_params) {
            initialize_request params{};
            if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str); !ec) {
                log::info(
                        "client {} {} connected (protocol {})",
                        params.client.name,
                        params.client.version,
                        params.protocol_version);
            }
            return make_response(id, initialize_reply{});
        }

        static std::string handle_tools_list(const glz::rpc::id_t& id, const tool_registry& registry) {
            tools_listing listing{};
            for (const auto& tool : registry.tools()) {
                listing.tools.push_back(
                        listed_tool{
                                .name = tool.descriptor.name,
                                .description = tool.descriptor.description,
                                .input_schema = glz::raw_json{input_schema_json(tool.descriptor)},
                        });
            }
            return make_response(id, std::move(listing));
        }

        static std::string handle_tools_call(
                const glz::rpc::id_t& id, glz::raw_json_view raw_params, const tool_registry& registry) {
            call_request params{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str);
            if (ec || params.name.empty()) {
                throw protocol_error{"Failed to parse tool call params"};
            }

            auto outcome = registry.dispatch(params.name, normalize_arguments(params.arguments));

            call_reply reply{.is_error = outcome.is_error};
            for (auto& text : outcome.contents) {
                reply.content.push_back(content_block{.text = std::move(text)});
            }
            return make_response(id, std::move(reply));
        }

        static std::optional<std::string> handle_request(
                const tool_registry& registry, const glz::rpc::generic_request_t& request) {
            bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);

            if (request.method.starts_with("notifications/"sv) || is_notification) {
                log::debug("notification {}", request.method);
                return std::nullopt;
            }
            if (request.method == "initialize"sv) {
                return handle_initialize(request.id, request.params);
            }
            if (request.method == "tools/list"sv) {
                return handle_tools_list(request.id, registry);
            }
            if (request.method == "tools/call"sv) {
                return handle_tools_call(request.id, request.params, registry);
            }
            return make_error_response(
                    request.id,
                    glz::rpc::error_e::method_not_found,
                    "Unknown method: {}"_format(std::string{request.method}));
        }

    }  // namespace detail

    std::optional<std::string> handle_message(const tool_registry& registry, std::string_view line) {
        std::string buffer{utils::trim_view(line)};
        if (buffer.empty()) {
            return std::nullopt;
        }

        glz::rpc::generic_request_t request{};
        if (auto ec = glz::read_json(request, buffer)) {
            log::warn("unparseable request: {}", glz::format_error(ec, buffer));
            return detail::make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error");
        }

        try {
            return detail::handle_request(registry, request);
        } catch (const protocol_error& e) {
            log::warn("rejected {}: {}", request.method, e.what());
            return detail::make_error_response(request.id, glz::rpc::error_e::invalid_params, e.what());
        } catch (const std::exception& e) {
            log::error("internal error handling {}: {}", request.method, e.what());
            return detail::make_error_response(
                    request.id, glz::rpc::error_e::internal_error, "Internal error: {}"_format(e.what()));
        } catch (...) {
            log::error("internal error handling {}: non-standard exception", request.method);
            return detail::make_error_response(request.id, glz::rpc::error_e::internal_error, "Internal error");
        }
    }

    int run_mcp_server(const tool_registry& registry, std::istream& in, std::ostream& out) {
        log::info("serving {} tools over stdio", registry.tools().size());

        std::string line{};
        while (std::getline(in, line)) {
            if (auto response = handle_message(registry, line)) {
                out << *response << '\n';
                out.flush();
            }
        }

        log::info("input closed, shutting down");
        return 0;
    }

}  // namespace annomics::mcp
