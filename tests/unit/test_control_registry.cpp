#include "fake_backend.hpp"

#include <camrig/control_registry.hpp>

#include <cassert>
#include <condition_variable>
#include <cstdio>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

class Counter final : public camrig::Controllable {
public:
    int mouse = 0;
    int keyboard = 0;
    int input = 0;

    void onMouse(const camrig::MouseEvent&, double) override { ++mouse; }
    void onKeyboard(const camrig::KeyEvent&, double) override { ++keyboard; }
    void onInput(const camrig::Backend&, double) override { ++input; }
};

class Faulty final : public camrig::Controllable {
public:
    int calls = 0;

    void onMouse(const camrig::MouseEvent&, double) override {}
    void onKeyboard(const camrig::KeyEvent&, double) override {}
    void onInput(const camrig::Backend&, double) override {
        ++calls;
        throw std::runtime_error("faulty control");
    }
};

} // namespace

static void testHandles() {
    camrig::ControlRegistry registry;
    assert(registry.size() == 0);

    auto a = registry.emplace<Counter>();
    auto shared = std::make_shared<Counter>();
    auto b = registry.add(shared);

    assert(a.valid() && b.valid());
    assert(a.index() == 0);
    assert(b.index() == 1);
    assert(registry.size() == 2);

    bool ran = registry.with(b, [](Counter& c) { c.mouse = 7; });
    assert(ran);
    assert(shared->mouse == 7); // same instance, reachable from outside

    camrig::ControlHandle<Counter> invalid;
    assert(!invalid.valid());
    assert(!registry.with(invalid, [](Counter&) { assert(false); }));

    camrig::ControlRegistry larger;
    for (int i = 0; i < 42; ++i) larger.emplace<Counter>();
    auto outOfRange = larger.emplace<Counter>();
    assert(outOfRange.index() == 42);
    assert(!registry.with(outOfRange, [](Counter&) { assert(false); }));
}

static void testHandleFromOtherRegistryWithWrongType() {
    // Slot 0 holds a Counter here and a Faulty in `other`.
    camrig::ControlRegistry registry;
    auto counter = registry.emplace<Counter>();

    camrig::ControlRegistry other;
    auto faulty = other.emplace<Faulty>();
    assert(faulty.index() == counter.index());

    assert(!registry.with(faulty, [](Faulty& f) { f.calls = 99; }));

    // The Counter was not touched and is still reachable.
    int mouse = -1;
    assert(registry.with(counter, [&](Counter& c) { mouse = c.mouse; }));
    assert(mouse == 0);
}

static void testDispatchOrderAndSnapshot() {
    camrig::ControlRegistry registry;
    std::vector<int> order;

    class Tagged final : public camrig::Controllable {
    public:
        Tagged(int tag, std::vector<int>& out) : tag_(tag), out_(out) {}
        void onMouse(const camrig::MouseEvent&, double) override {}
        void onKeyboard(const camrig::KeyEvent&, double) override {}
        void onInput(const camrig::Backend&, double) override { out_.push_back(tag_); }

    private:
        int tag_;
        std::vector<int>& out_;
    };

    registry.emplace<Tagged>(1, order);
    registry.emplace<Tagged>(2, order);
    auto snap = registry.snapshot();
    registry.emplace<Tagged>(3, order);

    FakeBackend backend;
    auto callInput = [&](camrig::Controllable& c) { c.onInput(backend, 0.0); };

    std::size_t served = camrig::ControlRegistry::dispatch(snap, callInput);
    assert(served == 2);
    assert((order == std::vector<int>{1, 2}));

    order.clear();
    served = camrig::ControlRegistry::dispatch(registry.snapshot(), callInput);
    assert(served == 3);
    assert((order == std::vector<int>{1, 2, 3}));
}

static void testPoisonedControlIsSkipped() {
    camrig::ControlRegistry registry;
    auto faulty = registry.emplace<Faulty>();
    auto counter = registry.emplace<Counter>();

    FakeBackend backend;
    auto callInput = [&](camrig::Controllable& c) { c.onInput(backend, 0.0); };

    // The throwing control does not stop the ones after it.
    std::size_t served = camrig::ControlRegistry::dispatch(registry.snapshot(), callInput);
    assert(served == 1);
    served = camrig::ControlRegistry::dispatch(registry.snapshot(), callInput);
    assert(served == 1);

    int input = 0;
    assert(registry.with(counter, [&](Counter& c) { input = c.input; }));
    assert(input == 2);

    // Poisoned: never called again, not reachable through with().
    assert(!registry.with(faulty, [](Faulty&) { assert(false); }));
}

static void testNonStandardThrowIsPoisoned() {
    class ThrowsInt final : public camrig::Controllable {
    public:
        void onMouse(const camrig::MouseEvent&, double) override {}
        void onKeyboard(const camrig::KeyEvent&, double) override {}
        void onInput(const camrig::Backend&, double) override { throw 42; }
    };

    camrig::ControlRegistry registry;
    auto thrower = registry.emplace<ThrowsInt>();
    auto counter = registry.emplace<Counter>();

    FakeBackend backend;
    auto callInput = [&](camrig::Controllable& c) { c.onInput(backend, 0.0); };

    std::size_t served = camrig::ControlRegistry::dispatch(registry.snapshot(), callInput);
    assert(served == 1);
    served = camrig::ControlRegistry::dispatch(registry.snapshot(), callInput);
    assert(served == 1);

    int input = 0;
    assert(registry.with(counter, [&](Counter& c) { input = c.input; }));
    assert(input == 2);
    assert(!registry.with(thrower, [](ThrowsInt&) { assert(false); }));
}

static void testWithPoisonsOnThrow() {
    camrig::ControlRegistry registry;
    auto counter = registry.emplace<Counter>();

    bool caught = false;
    try {
        registry.with(counter, [](Counter&) { throw std::runtime_error("tooling bug"); });
    } catch (const std::runtime_error& e) {
        caught = true;
        assert(std::string(e.what()) == "tooling bug");
    }
    assert(caught);

    FakeBackend backend;
    std::size_t served = camrig::ControlRegistry::dispatch(
        registry.snapshot(), [&](camrig::Controllable& c) { c.onInput(backend, 0.0); });
    assert(served == 0);
}

static void testContendedControlIsSkipped() {
    camrig::ControlRegistry registry;
    auto held = registry.emplace<Counter>();
    auto idle = registry.emplace<Counter>();

    std::mutex m;
    std::condition_variable cv;
    bool locked = false;
    bool release = false;

    // Another thread holds the first control's lock, e.g. a diagnostics tool.
    std::thread tool([&] {
        registry.with(held, [&](Counter&) {
            std::unique_lock<std::mutex> lk(m);
            locked = true;
            cv.notify_all();
            cv.wait(lk, [&] { return release; });
        });
    });

    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait(lk, [&] { return locked; });
    }

    FakeBackend backend;
    std::size_t served = camrig::ControlRegistry::dispatch(
        registry.snapshot(), [&](camrig::Controllable& c) { c.onInput(backend, 0.0); });
    assert(served == 1);

    {
        std::lock_guard<std::mutex> lk(m);
        release = true;
    }
    cv.notify_all();
    tool.join();

    int heldInput = -1;
    int idleInput = -1;
    assert(registry.with(held, [&](Counter& c) { heldInput = c.input; }));
    assert(registry.with(idle, [&](Counter& c) { idleInput = c.input; }));
    assert(heldInput == 0);
    assert(idleInput == 1);

    // Not poisoned: served normally once the lock is free.
    served = camrig::ControlRegistry::dispatch(
        registry.snapshot(), [&](camrig::Controllable& c) { c.onInput(backend, 0.0); });
    assert(served == 2);
}

int main() {
    testHandles();
    testDispatchOrderAndSnapshot();
    testHandleFromOtherRegistryWithWrongType();
    testPoisonedControlIsSkipped();
    testNonStandardThrowIsPoisoned();
    testWithPoisonsOnThrow();
    testContendedControlIsSkipped();

    std::printf("all control registry tests passed\n");
    return 0;
}
