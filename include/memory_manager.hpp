#pragma once

#include <memory>
#include <atomic>
#include <mutex>
#include <new>
#include <unordered_map>
#include <string>
#include <cstdlib>
#include <utility>

namespace sound_hazard {

class MemoryManager {
public:
    static MemoryManager& instance();

    // Memory tracking
    void track_allocation(const std::string& tag, size_t bytes);
    void track_deallocation(const std::string& tag, size_t bytes);

    // Memory statistics
    size_t get_total_allocated() const;
    size_t get_peak_usage() const;
    size_t get_usage(const std::string& tag) const;
    std::unordered_map<std::string, size_t> get_allocation_stats() const;

    // Restart peak tracking from the current total
    void reset_peak();

    // Memory management
    bool is_memory_available(size_t required_bytes) const;
    void report() const;
    void set_memory_limit(size_t limit_bytes);

    // Allocator for per-call scratch buffers, usable with std containers
    template<typename T>
    class TrackedAllocator {
    public:
        using value_type = T;

        explicit TrackedAllocator(std::string tag) : tag_(std::move(tag)) {}

        template<typename U>
        TrackedAllocator(const TrackedAllocator<U>& other) : tag_(other.tag()) {}

        // Throws std::bad_alloc past the manager's memory limit
        T* allocate(size_t n) {
            size_t bytes = n * sizeof(T);
            if (!MemoryManager::instance().is_memory_available(bytes)) {
                throw std::bad_alloc();
            }

            // aligned_alloc wants a multiple of the alignment
            size_t padded = ((bytes + kAlignment - 1) / kAlignment) * kAlignment;
            T* ptr = static_cast<T*>(std::aligned_alloc(kAlignment, padded == 0 ? kAlignment : padded));
            if (!ptr) {
                throw std::bad_alloc();
            }

            MemoryManager::instance().track_allocation(tag_, bytes);
            return ptr;
        }

        void deallocate(T* ptr, size_t n) {
            if (ptr) {
                size_t bytes = n * sizeof(T);
                MemoryManager::instance().track_deallocation(tag_, bytes);
                std::free(ptr);
            }
        }

        const std::string& tag() const { return tag_; }

        template<typename U>
        bool operator==(const TrackedAllocator<U>& other) const { return tag_ == other.tag(); }
        template<typename U>
        bool operator!=(const TrackedAllocator<U>& other) const { return !(*this == other); }

    private:
        static constexpr size_t kAlignment = 64;

        std::string tag_;
    };

private:
    MemoryManager() = default;

    mutable std::mutex mutex_;
    std::atomic<size_t> total_allocated_{0};
    std::atomic<size_t> peak_usage_{0};
    std::atomic<size_t> memory_limit_{static_cast<size_t>(2) * 1024 * 1024 * 1024}; // 2GB default
    std::unordered_map<std::string, size_t> allocations_;
};

} // namespace sound_hazard
