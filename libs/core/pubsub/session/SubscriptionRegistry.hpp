#pragma once
#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include "../model/Envelope.hpp"

// Desired topic set, kept in insertion order so replay is deterministic.
// Writers are the session strand; readers may snapshot from any thread.
class SubscriptionRegistry {
public:
    // Returns false when the topic was already registered.
    bool add(const std::string& topic) {
        std::unique_lock lock(m_mx);
        if (std::find(m_topics.begin(), m_topics.end(), topic) != m_topics.end()) return false;
        m_topics.push_back(topic);
        return true;
    }

    // Drops every topic and hands the removed set back so bindings can be released.
    std::vector<std::string> clear() {
        std::unique_lock lock(m_mx);
        std::vector<std::string> removed;
        removed.swap(m_topics);
        return removed;
    }

    [[nodiscard]] std::vector<std::string> topics() const {
        std::shared_lock lock(m_mx);
        return m_topics;
    }

    [[nodiscard]] std::size_t size() const {
        std::shared_lock lock(m_mx);
        return m_topics.size();
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

    // One subscribe-envelope per registered topic, in registration order.
    [[nodiscard]] std::vector<Envelope> buildReplay() const {
        std::shared_lock lock(m_mx);
        std::vector<Envelope> out;
        out.reserve(m_topics.size());
        for (const auto& topic : m_topics) {
            out.push_back(Envelope::subscribe(topic));
        }
        return out;
    }

private:
    mutable std::shared_mutex m_mx;
    std::vector<std::string>  m_topics;
};
