#pragma once
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>
#include "TopicDispatcher.hpp"

// In-process TopicDispatcher: fans each inbound envelope out to the handlers bound
// to its topic. Handlers bound to one topic run in registration order.
class TopicEventRouter : public TopicDispatcher {
public:
    void listen(const std::string& topic, RawHandler handler) override;
    void unsubscribeTopic(const std::string& topic) override;
    void dispatch(const Envelope& envelope) override;

    [[nodiscard]] std::size_t handlerCount(const std::string& topic) const;
    [[nodiscard]] std::vector<std::string> topics() const;

private:
    mutable std::shared_mutex                       m_mx;
    std::map<std::string, std::vector<RawHandler>>  m_handlers;
};
