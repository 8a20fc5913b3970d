//
//  channel.hpp
//  aberred
//
//  Created by the aberred authors on 04/08/2025.
//

#pragma once

#include <deque>
#include <vector>
#include <optional>
#include <atomic>
#include <chrono>
#include <mutex>
#include <condition_variable>

// Single-consumer queue shared between the main thread and a worker
template<typename T>
class Channel {
    std::deque<T> _queue;
    mutable std::mutex _queue_mutex;
    std::condition_variable _condition;
    std::atomic<bool> _closed{false};

public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    bool send(T item) {
        {
            std::lock_guard<std::mutex> lock(_queue_mutex);
            if (_closed.load())
                return false;
            _queue.push_back(std::move(item));
        }
        _condition.notify_one();
        return true;
    }

    std::optional<T> try_recv() {
        std::lock_guard<std::mutex> lock(_queue_mutex);
        if (_queue.empty())
            return std::nullopt;
        T item = std::move(_queue.front());
        _queue.pop_front();
        return item;
    }

    // Blocks up to `timeout`, returns nothing on timeout or when closed and empty
    template<typename Rep, typename Period>
    std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(_queue_mutex);
        if (!_condition.wait_for(lock, timeout, [this] {
            return _closed.load() || !_queue.empty();
        }))
            return std::nullopt;
        if (_queue.empty())
            return std::nullopt;
        T item = std::move(_queue.front());
        _queue.pop_front();
        return item;
    }

    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(_queue_mutex);
        std::vector<T> items;
        items.reserve(_queue.size());
        while (!_queue.empty()) {
            items.push_back(std::move(_queue.front()));
            _queue.pop_front();
        }
        return items;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(_queue_mutex);
            _closed.store(true);
        }
        _condition.notify_all();
    }

    bool closed() const {
        return _closed.load();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(_queue_mutex);
        return _queue.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(_queue_mutex);
        return _queue.size();
    }
};
