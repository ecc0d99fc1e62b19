#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "uri_template.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpgate {

/// Read-only view of a cancellation flag. Handlers poll it; the session
/// never blocks on it.
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<const std::atomic<bool>> flag_;
};

class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void request_cancel() { flag_->store(true, std::memory_order_release); }
    [[nodiscard]] bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }
    [[nodiscard]] CancellationToken token() const { return CancellationToken{flag_}; }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/// Passed through to every handler invocation unchanged.
struct RequestContext {
    std::optional<RequestId> request_id;
    std::string method;
    CancellationToken cancellation;
};

// ---- Handler interfaces ----

class ResourceHandler {
public:
    virtual ~ResourceHandler() = default;
    virtual std::vector<ResourceContent> read(const RequestContext& ctx,
                                              const std::string& uri) = 0;
};

class ResourceTemplateHandler {
public:
    virtual ~ResourceTemplateHandler() = default;
    virtual std::vector<ResourceContent> read(const RequestContext& ctx,
                                              const std::string& uri,
                                              const UriParams& params) = 0;
};

class ToolHandler {
public:
    virtual ~ToolHandler() = default;
    /// Throwing reports a tool failure to the peer as an isError result.
    virtual CallToolResult call(const RequestContext& ctx,
                                const nlohmann::json& arguments) = 0;
};

class PromptHandler {
public:
    virtual ~PromptHandler() = default;
    virtual GetPromptResult get(const RequestContext& ctx,
                                const nlohmann::json& arguments) = 0;
};

// ---- Function adapters ----

using ResourceReadFn = std::function<std::vector<ResourceContent>(
    const RequestContext& ctx, const std::string& uri)>;
using ResourceTemplateReadFn = std::function<std::vector<ResourceContent>(
    const RequestContext& ctx, const std::string& uri, const UriParams& params)>;
using ToolFn = std::function<CallToolResult(const RequestContext& ctx,
                                            const nlohmann::json& arguments)>;
using PromptFn = std::function<GetPromptResult(const RequestContext& ctx,
                                               const nlohmann::json& arguments)>;

std::shared_ptr<ResourceHandler> make_resource_handler(ResourceReadFn fn);
std::shared_ptr<ResourceTemplateHandler> make_resource_template_handler(ResourceTemplateReadFn fn);
std::shared_ptr<ToolHandler> make_tool_handler(ToolFn fn);
std::shared_ptr<PromptHandler> make_prompt_handler(PromptFn fn);

} // namespace mcpgate
