#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

namespace meshirc::mesh {

// Bounded multi-producer hand-off queue. When full, the oldest entry is
// discarded so the newest events always get through.
template <typename T>
class EventQueue {
public:
    explicit EventQueue(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    // Returns false if an older entry was dropped to make room.
    bool push(T item) {
        std::lock_guard<std::mutex> lk(mu_);
        bool kept_all = true;
        if (items_.size() >= capacity_) {
            items_.pop_front();
            ++dropped_;
            kept_all = false;
        }
        items_.push_back(std::move(item));
        return kept_all;
    }

    std::deque<T> take_all() {
        std::deque<T> out;
        std::lock_guard<std::mutex> lk(mu_);
        out.swap(items_);
        return out;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return items_.size();
    }

    std::uint64_t dropped() const {
        std::lock_guard<std::mutex> lk(mu_);
        return dropped_;
    }

    std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mu_;
    std::deque<T> items_;
    std::uint64_t dropped_ = 0;
};

} // namespace meshirc::mesh
