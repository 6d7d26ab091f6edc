#include "TopicEventRouter.hpp"
#include "RelayLogging.hpp"
#include <mutex>

void TopicEventRouter::listen(const std::string& topic, RawHandler handler) {
    if (!handler) return;
    std::unique_lock lock(m_mx);
    m_handlers[topic].push_back(std::move(handler));
}

void TopicEventRouter::unsubscribeTopic(const std::string& topic) {
    std::unique_lock lock(m_mx);
    m_handlers.erase(topic);
}

void TopicEventRouter::dispatch(const Envelope& envelope) {
    // Copy out so handlers may (un)bind without deadlocking
    std::vector<RawHandler> handlers;
    {
        std::shared_lock lock(m_mx);
        auto it = m_handlers.find(envelope.topic);
        if (it == m_handlers.end()) return;
        handlers = it->second;
    }

    for (const auto& handler : handlers) {
        try {
            handler(envelope);
        } catch (const nlohmann::json::exception& e) {
            rLog_Warning("Payload for topic" << QString::fromStdString(envelope.topic)
                         << "does not match the bound type:" << e.what());
        } catch (const std::exception& e) {
            rLog_Error("Handler for topic" << QString::fromStdString(envelope.topic) << "threw:" << e.what());
        }
    }
}

std::size_t TopicEventRouter::handlerCount(const std::string& topic) const {
    std::shared_lock lock(m_mx);
    auto it = m_handlers.find(topic);
    return it == m_handlers.end() ? 0 : it->second.size();
}

std::vector<std::string> TopicEventRouter::topics() const {
    std::shared_lock lock(m_mx);
    std::vector<std::string> out;
    out.reserve(m_handlers.size());
    for (const auto& entry : m_handlers) {
        out.push_back(entry.first);
    }
    return out;
}
