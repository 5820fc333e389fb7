#pragma once

#include <camrig/controllable.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

namespace camrig {

class ControlRegistry;

// Stable index into a ControlRegistry. Only the registry hands out valid
// handles; a default-constructed one is invalid.
template <typename T>
class ControlHandle {
public:
    static constexpr std::uint32_t kInvalid = std::numeric_limits<std::uint32_t>::max();

    ControlHandle() = default;

    [[nodiscard]] bool valid() const { return index_ != kInvalid; }
    [[nodiscard]] std::uint32_t index() const { return index_; }

private:
    friend class ControlRegistry;

    explicit ControlHandle(std::uint32_t index) : index_(index) {}

    std::uint32_t index_ = kInvalid;
};

namespace detail {

struct ControlSlot {
    std::shared_ptr<Controllable> control;
    std::mutex mutex;
    std::atomic<bool> poisoned{false}; // set while holding mutex, read without it
};

} // namespace detail

// Arena of controllables, each behind its own lock.
// The frame loop reaches entries through dispatch(); everything else goes
// through with(). Entries are never removed, so handles stay valid.
//
// Thread safety: add/emplace/with/snapshot are safe from any thread.
// No lock is held across two entries.
class ControlRegistry {
public:
    using Snapshot = std::vector<std::shared_ptr<detail::ControlSlot>>;

    ControlRegistry() = default;
    ControlRegistry(const ControlRegistry&) = delete;
    ControlRegistry& operator=(const ControlRegistry&) = delete;

    template <typename T>
    ControlHandle<T> add(std::shared_ptr<T> control) {
        static_assert(std::is_base_of_v<Controllable, T>, "T must derive from Controllable");
        auto slot = std::make_shared<detail::ControlSlot>();
        slot->control = std::move(control);
        return ControlHandle<T>{insert(std::move(slot))};
    }

    template <typename T, typename... Args>
    ControlHandle<T> emplace(Args&&... args) {
        return add(std::make_shared<T>(std::forward<Args>(args)...));
    }

    // Lock the entry (blocking) and call fn(T&).
    // Returns false for an invalid handle, a poisoned entry, or an entry that
    // is not a T (a handle from another registry).
    // If fn throws, the entry is poisoned and the exception propagates.
    template <typename T, typename F>
    bool with(ControlHandle<T> handle, F&& fn) {
        auto slot = find(handle.index_);
        if (!slot) return false;

        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->poisoned) return false;

        T* control = dynamic_cast<T*>(slot->control.get());
        if (!control) return false;

        try {
            std::forward<F>(fn)(*control);
        } catch (...) {
            slot->poisoned = true;
            throw;
        }
        return true;
    }

    [[nodiscard]] std::size_t size() const;

    // Entries registered so far, in registration order. Entries added after
    // the snapshot is taken are not part of it.
    [[nodiscard]] Snapshot snapshot() const;

    // Call fn on each entry in order. A poisoned entry is skipped silently and
    // a contended one is skipped for this call. An entry whose call throws is
    // poisoned and skipped from then on. Returns the number of entries fn ran
    // on to completion.
    static std::size_t dispatch(const Snapshot& entries,
                                const std::function<void(Controllable&)>& fn);

private:
    std::uint32_t insert(std::shared_ptr<detail::ControlSlot> slot);
    [[nodiscard]] std::shared_ptr<detail::ControlSlot> find(std::uint32_t index) const;

    mutable std::mutex mutex_;
    Snapshot slots_;
};

} // namespace camrig
