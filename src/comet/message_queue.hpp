#ifndef MESSAGE_QUEUE_HPP
#define MESSAGE_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>


// Multi-producer, multi-consumer FIFO
// Once closed, pushes are dropped and consumers drain what is left, then get `nullopt`
template<typename T>
class MessageQueue {
    std::queue<T> _items;
    bool _closed;

    mutable std::mutex _mutex;
    std::condition_variable _available;

public:
    MessageQueue() : _closed(false) {}

    void push(T item) {
        {
            std::lock_guard lock(_mutex);
            if (_closed) return;
            _items.push(std::move(item));
        }
        _available.notify_one();
    }

    void close() {
        {
            std::lock_guard lock(_mutex);
            _closed = true;
        }
        _available.notify_all();
    }

    bool closed() const {
        std::lock_guard lock(_mutex);
        return _closed;
    }

    bool empty() const {
        std::lock_guard lock(_mutex);
        return _items.empty();
    }

    std::optional<T> tryPop() {
        std::lock_guard lock(_mutex);
        return popLocked();
    }

    // Everything currently queued, in order; empty if nothing is
    std::vector<T> drain() {
        std::lock_guard lock(_mutex);
        std::vector<T> items;
        items.reserve(_items.size());
        while (!_items.empty()) {
            items.push_back(std::move(_items.front()));
            _items.pop();
        }
        return items;
    }

    std::optional<T> pop() {
        std::unique_lock lock(_mutex);
        _available.wait(lock, [this]() { return _closed || !_items.empty(); });
        return popLocked();
    }

    template<typename Rep, typename Period>
    std::optional<T> popFor(std::chrono::duration<Rep, Period> const & timeout) {
        std::unique_lock lock(_mutex);
        _available.wait_for(lock, timeout, [this]() { return _closed || !_items.empty(); });
        return popLocked();
    }

private:
    std::optional<T> popLocked() {
        if (_items.empty()) return std::nullopt;
        std::optional<T> item(std::move(_items.front()));
        _items.pop();
        return item;
    }
};


#endif
