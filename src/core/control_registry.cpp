#include <camrig/control_registry.hpp>

#include <cstdio>

namespace camrig {

std::uint32_t ControlRegistry::insert(std::shared_ptr<detail::ControlSlot> slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.push_back(std::move(slot));
    return static_cast<std::uint32_t>(slots_.size() - 1);
}

std::shared_ptr<detail::ControlSlot> ControlRegistry::find(std::uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= slots_.size()) return nullptr;
    return slots_[index];
}

std::size_t ControlRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

ControlRegistry::Snapshot ControlRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_;
}

std::size_t ControlRegistry::dispatch(const Snapshot& entries,
                                      const std::function<void(Controllable&)>& fn) {
    std::size_t served = 0;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        detail::ControlSlot& slot = *entries[i];
        if (slot.poisoned) continue;

        std::unique_lock<std::mutex> lock(slot.mutex, std::try_to_lock);
        if (!lock.owns_lock()) {
            std::fprintf(stderr, "[camrig] control #%zu is busy, skipped for this dispatch\n", i);
            continue;
        }
        if (slot.poisoned) continue;

        try {
            fn(*slot.control);
            ++served;
        } catch (const std::exception& e) {
            slot.poisoned = true;
            std::fprintf(stderr, "[camrig] control #%zu threw (%s), it will be skipped from now on\n",
                         i, e.what());
        } catch (...) {
            slot.poisoned = true;
            std::fprintf(stderr, "[camrig] control #%zu threw a non-standard exception, "
                                 "it will be skipped from now on\n", i);
        }
    }
    return served;
}

} // namespace camrig
