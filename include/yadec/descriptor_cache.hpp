#pragma once

/// @file descriptor_cache.hpp
/// @author Aleksandr Loshkarev
/// @brief Lazily built, never invalidated table of Target Descriptors.
///
/// Uses std::shared_mutex for shared/exclusive access:
///   - Lookups of published descriptors take a shared lock
///   - Builds are serialized by a separate mutex, so a type is built once
///   - A finished descriptor graph is published under a unique lock
///
/// Descriptors live as long as the cache. The process-wide instance from
/// global() lives until program exit.

#include "descriptor.hpp"
#include "reflect.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

namespace yadec {

/// @brief Cache of descriptors keyed by C++ type.
///
/// Usage example:
/// @code
///   yadec::DescriptorCache cache;
///   const yadec::Descriptor& d = cache.get<Item>();
///   // d.shape == yadec::Shape::Record
/// @endcode
class DescriptorCache {
public:
    DescriptorCache() = default;

    // Non-copyable (mutex is not copyable; descriptors are referenced by address)
    DescriptorCache(const DescriptorCache&) = delete;
    DescriptorCache& operator=(const DescriptorCache&) = delete;

    /// @brief Descriptor for T, building it (and every type it reaches) on first use.
    /// @throws UnsupportedTypeError if a record schema is malformed.
    template <typename T>
    const Descriptor& get() {
        const std::type_index key(typeid(T));
        if (const Descriptor* d = find(key)) return *d;

        std::lock_guard<std::mutex> build_lock(build_mutex_);
        // Another thread may have published T while this one waited.
        if (const Descriptor* d = find(key)) return *d;

        DescriptorBuilder builder([this](std::type_index k) { return find(k); });
        const Descriptor* built = builder.resolve<T>();
        auto pending = builder.take_pending();

        std::unique_lock lock(mutex_);
        for (auto& entry : pending) {
            entries_.emplace(entry.first, std::move(entry.second));
        }
        return *built;
    }

    /// @brief Whether a descriptor for T has been published.
    template <typename T>
    [[nodiscard]] bool contains() const {
        return find(std::type_index(typeid(T))) != nullptr;
    }

    /// @brief Number of published descriptors.
    [[nodiscard]] size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    /// @brief The process-wide default cache used by the decoders.
    static DescriptorCache& global() {
        static DescriptorCache instance;
        return instance;
    }

private:
    const Descriptor* find(std::type_index key) const {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(key);
        return it == entries_.end() ? nullptr : it->second.get();
    }

    mutable std::shared_mutex mutex_;
    std::mutex build_mutex_;
    std::unordered_map<std::type_index, std::unique_ptr<Descriptor>> entries_;
};

} // namespace yadec
