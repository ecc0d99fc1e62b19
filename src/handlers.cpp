#include "mcpgate/handlers.hpp"
#include <stdexcept>

namespace mcpgate {

namespace {

class FnResourceHandler : public ResourceHandler {
public:
    explicit FnResourceHandler(ResourceReadFn fn) : fn_(std::move(fn)) {}
    std::vector<ResourceContent> read(const RequestContext& ctx,
                                      const std::string& uri) override {
        return fn_(ctx, uri);
    }
private:
    ResourceReadFn fn_;
};

class FnResourceTemplateHandler : public ResourceTemplateHandler {
public:
    explicit FnResourceTemplateHandler(ResourceTemplateReadFn fn) : fn_(std::move(fn)) {}
    std::vector<ResourceContent> read(const RequestContext& ctx, const std::string& uri,
                                      const UriParams& params) override {
        return fn_(ctx, uri, params);
    }
private:
    ResourceTemplateReadFn fn_;
};

class FnToolHandler : public ToolHandler {
public:
    explicit FnToolHandler(ToolFn fn) : fn_(std::move(fn)) {}
    CallToolResult call(const RequestContext& ctx, const nlohmann::json& arguments) override {
        return fn_(ctx, arguments);
    }
private:
    ToolFn fn_;
};

class FnPromptHandler : public PromptHandler {
public:
    explicit FnPromptHandler(PromptFn fn) : fn_(std::move(fn)) {}
    GetPromptResult get(const RequestContext& ctx, const nlohmann::json& arguments) override {
        return fn_(ctx, arguments);
    }
private:
    PromptFn fn_;
};

template <typename Fn>
void require_callable(const Fn& fn) {
    if (!fn) throw std::invalid_argument("Handler function must not be empty");
}

} // anonymous namespace

std::shared_ptr<ResourceHandler> make_resource_handler(ResourceReadFn fn) {
    require_callable(fn);
    return std::make_shared<FnResourceHandler>(std::move(fn));
}

std::shared_ptr<ResourceTemplateHandler> make_resource_template_handler(ResourceTemplateReadFn fn) {
    require_callable(fn);
    return std::make_shared<FnResourceTemplateHandler>(std::move(fn));
}

std::shared_ptr<ToolHandler> make_tool_handler(ToolFn fn) {
    require_callable(fn);
    return std::make_shared<FnToolHandler>(std::move(fn));
}

std::shared_ptr<PromptHandler> make_prompt_handler(PromptFn fn) {
    require_callable(fn);
    return std::make_shared<FnPromptHandler>(std::move(fn));
}

} // namespace mcpgate
