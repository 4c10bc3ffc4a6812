#pragma once

#include <QMutex>
#include <deque>
#include <iterator>
#include <vector>
#include "ConversionTypes.h"

// Unbounded hand-off from the conversion worker to the UI thread. push()
// never waits on the consumer, so a slow UI cannot back up the engine's pipe.
class EventQueue {
public:
    void push(const ConversionEvent& event) {
        QMutexLocker lock(&m_mutex);
        m_queue.push_back(event);
    }

    bool tryPop(ConversionEvent& event) {
        QMutexLocker lock(&m_mutex);
        if (m_queue.empty()) return false;
        event = std::move(m_queue.front());
        m_queue.pop_front();
        return true;
    }

    // Takes everything queued so far in arrival order.
    std::vector<ConversionEvent> drain() {
        QMutexLocker lock(&m_mutex);
        std::vector<ConversionEvent> events(std::make_move_iterator(m_queue.begin()),
                                            std::make_move_iterator(m_queue.end()));
        m_queue.clear();
        return events;
    }

    void clear() {
        QMutexLocker lock(&m_mutex);
        m_queue.clear();
    }

    int size() const {
        QMutexLocker lock(&m_mutex);
        return static_cast<int>(m_queue.size());
    }

    bool isEmpty() const {
        QMutexLocker lock(&m_mutex);
        return m_queue.empty();
    }

private:
    mutable QMutex m_mutex;
    std::deque<ConversionEvent> m_queue;
};
