/// Calculator server: one tool, one prompt, a static resource and a
/// user://{userId} resource template, served over stdio.
/// Usage: SPDLOG_LEVEL=debug ./calculator_server

#include <mcpgate/mcpgate.hpp>
#include <spdlog/cfg/env.h>
#include <csignal>
#include <stdexcept>

namespace {

double calculate(const std::string& op, double a, double b) {
    if (op == "add") return a + b;
    if (op == "subtract") return a - b;
    if (op == "multiply") return a * b;
    if (op == "divide") {
        if (b == 0) throw std::invalid_argument("division by zero");
        return a / b;
    }
    throw std::invalid_argument("unknown operation: " + op);
}

std::string format_number(double v) {
    nlohmann::json j = v;
    return j.dump();
}

} // namespace

int main() {
    spdlog::cfg::load_env_levels();
    // A peer that disappears mid-write must surface as a transport error.
    std::signal(SIGPIPE, SIG_IGN);

    mcpgate::Session::Options opts;
    opts.identity = {"calculator-server", "1.0.0"};
    opts.instructions = "Arithmetic tool, greeting prompt and a user directory.";

    mcpgate::Session session{std::move(opts)};

    mcpgate::ToolDefinition calc;
    calc.name = "calculator";
    calc.description = "Perform basic arithmetic";
    calc.input_schema = {
        {"type", "object"},
        {"properties", {
            {"operation", {{"type", "string"},
                           {"enum", {"add", "subtract", "multiply", "divide"}}}},
            {"a", {{"type", "number"}}},
            {"b", {{"type", "number"}}}
        }},
        {"required", {"operation", "a", "b"}}
    };
    session.add_tool(calc, [](const mcpgate::RequestContext&,
                              const nlohmann::json& args) -> mcpgate::CallToolResult {
        double result = calculate(args.at("operation").get<std::string>(),
                                  args.at("a").get<double>(),
                                  args.at("b").get<double>());
        mcpgate::CallToolResult out;
        out.content.push_back(mcpgate::TextContent{format_number(result)});
        return out;
    });

    mcpgate::PromptDefinition greeting;
    greeting.name = "greeting";
    greeting.description = "Greet someone by name";
    greeting.arguments.push_back({"name", std::string("Who to greet"), true});
    session.add_prompt(greeting, [](const mcpgate::RequestContext&,
                                    const nlohmann::json& args) -> mcpgate::GetPromptResult {
        std::string name = args.value("name", std::string("there"));
        mcpgate::GetPromptResult out;
        out.description = "A friendly greeting";
        out.messages.push_back({"user", mcpgate::TextContent{"Say hello to " + name + "."}});
        return out;
    });

    mcpgate::ResourceDefinition about;
    about.uri = "info://about";
    about.name = "About";
    about.mime_type = "text/plain";
    session.add_resource(about, [](const mcpgate::RequestContext&, const std::string& uri) {
        return std::vector<mcpgate::ResourceContent>{
            {uri, std::string("text/plain"), std::string("mcpgate calculator example"), std::nullopt}};
    });

    mcpgate::ResourceTemplate user;
    user.uri_template = "user://{userId}";
    user.name = "User profile";
    user.mime_type = "application/json";
    session.add_resource_template(user, [](const mcpgate::RequestContext&, const std::string& uri,
                                           const mcpgate::UriParams& params) {
        nlohmann::json profile = {{"id", params.at("userId")},
                                  {"name", "User " + params.at("userId")}};
        return std::vector<mcpgate::ResourceContent>{
            {uri, std::string("application/json"), profile.dump(), std::nullopt}};
    });

    // Blocks until stdin closes
    session.serve_stdio();
    return 0;
}
