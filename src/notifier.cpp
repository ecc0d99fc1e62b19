#include "mcpgate/notifier.hpp"
#include "mcpgate/log.hpp"
#include "mcpgate/methods.hpp"

namespace mcpgate {

void TransportSlot::attach(std::shared_ptr<ITransport> transport) {
    std::lock_guard<std::mutex> lock(mutex_);
    transport_ = std::move(transport);
}

std::shared_ptr<ITransport> TransportSlot::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::exchange(transport_, nullptr);
}

std::shared_ptr<ITransport> TransportSlot::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transport_;
}

bool TransportSlot::send(const JsonRpcMessage& msg) const {
    // Send outside the lock so a slow peer cannot block detach()/close().
    auto transport = get();
    if (!transport) return false;
    transport->send(msg);
    return true;
}

bool NotificationEmitter::notify(std::string method, std::optional<nlohmann::json> params) {
    JsonRpcNotification notif;
    notif.method = std::move(method);
    notif.params = std::move(params);
    if (!slot_.send(notif)) {
        logger()->debug("Dropping {}: no transport attached", notif.method);
        return false;
    }
    return true;
}

bool NotificationEmitter::resources_list_changed() {
    return notify(std::string(methods::ResourcesListChanged));
}

bool NotificationEmitter::tools_list_changed() {
    return notify(std::string(methods::ToolsListChanged));
}

bool NotificationEmitter::prompts_list_changed() {
    return notify(std::string(methods::PromptsListChanged));
}

bool NotificationEmitter::resource_updated(const std::string& uri) {
    return notify(std::string(methods::ResourceUpdated), nlohmann::json{{"uri", uri}});
}

bool NotificationEmitter::log_message(LogLevel level, const nlohmann::json& data,
                                      std::optional<std::string> logger_name) {
    LogMessage msg{level, std::move(logger_name), data};
    nlohmann::json params;
    to_json(params, msg);
    return notify(std::string(methods::LogMessage), std::move(params));
}

} // namespace mcpgate
