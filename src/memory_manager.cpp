#include "memory_manager.hpp"
#include <iostream>

namespace sound_hazard {

MemoryManager& MemoryManager::instance() {
    static MemoryManager instance;
    return instance;
}

void MemoryManager::track_allocation(const std::string& tag, size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    allocations_[tag] += bytes;
    total_allocated_ += bytes;

    size_t current_total = total_allocated_.load();
    size_t current_peak = peak_usage_.load();

    while (current_total > current_peak &&
           !peak_usage_.compare_exchange_weak(current_peak, current_total)) {
        current_peak = peak_usage_.load();
    }
}

void MemoryManager::track_deallocation(const std::string& tag, size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = allocations_.find(tag);
    if (it != allocations_.end()) {
        it->second = (it->second >= bytes) ? it->second - bytes : 0;
        if (it->second == 0) {
            allocations_.erase(it);
        }
    }

    size_t current_total = total_allocated_.load();
    total_allocated_ = (current_total >= bytes) ? current_total - bytes : 0;
}

size_t MemoryManager::get_total_allocated() const {
    return total_allocated_.load();
}

size_t MemoryManager::get_peak_usage() const {
    return peak_usage_.load();
}

size_t MemoryManager::get_usage(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allocations_.find(tag);
    return it != allocations_.end() ? it->second : 0;
}

std::unordered_map<std::string, size_t> MemoryManager::get_allocation_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocations_;
}

void MemoryManager::reset_peak() {
    std::lock_guard<std::mutex> lock(mutex_);
    peak_usage_.store(total_allocated_.load());
}

bool MemoryManager::is_memory_available(size_t required_bytes) const {
    size_t current_usage = total_allocated_.load();
    size_t limit = memory_limit_.load();

    return (current_usage + required_bytes) <= limit;
}

void MemoryManager::report() const {
    std::cout << "[MemoryManager] Tracked usage: "
              << (get_total_allocated() / 1024) << " KB, peak "
              << (get_peak_usage() / 1024) << " KB" << std::endl;

    auto stats = get_allocation_stats();
    for (const auto& [tag, bytes] : stats) {
        std::cout << "  " << tag << ": " << (bytes / 1024) << " KB" << std::endl;
    }
}

void MemoryManager::set_memory_limit(size_t limit_bytes) {
    memory_limit_.store(limit_bytes);
}

} // namespace sound_hazard
