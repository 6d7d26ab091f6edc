#pragma once
#include <algorithm>
#include <deque>
#include <iterator>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include "../model/Envelope.hpp"

// FIFO of envelopes waiting for an open connection.
// Mutated on the session strand only; size/empty reads are safe from any thread.
class OutboundQueue {
public:
    void push(Envelope envelope) {
        std::unique_lock lock(m_mx);
        m_items.push_back(std::move(envelope));
    }

    // Removes and returns everything queued, oldest first.
    [[nodiscard]] std::vector<Envelope> drain() {
        std::unique_lock lock(m_mx);
        std::vector<Envelope> out(std::make_move_iterator(m_items.begin()),
                                  std::make_move_iterator(m_items.end()));
        m_items.clear();
        return out;
    }

    void clear() {
        std::unique_lock lock(m_mx);
        m_items.clear();
    }

    [[nodiscard]] bool hasSubscribeFor(const std::string& topic) const {
        std::shared_lock lock(m_mx);
        return std::any_of(m_items.begin(), m_items.end(), [&](const Envelope& e) {
            return e.isSubscribe() && e.topic == topic;
        });
    }

    [[nodiscard]] std::size_t size() const {
        std::shared_lock lock(m_mx);
        return m_items.size();
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

private:
    mutable std::shared_mutex m_mx;
    std::deque<Envelope>      m_items;
};
