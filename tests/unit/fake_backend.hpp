#pragma once

// Scriptable Backend for headless tests. Events pushed with push() are
// visible to the next tick; events pushed with pushPending() only after the
// loop pumps.

#include <camrig/backend.hpp>

#include <array>
#include <cstdint>
#include <deque>
#include <set>
#include <string>
#include <vector>

class FakeBackend final : public camrig::Backend {
public:
    std::deque<camrig::Event> queue;
    std::deque<camrig::Event> pending;
    std::set<camrig::Key> heldKeys;
    std::set<camrig::MouseButton> heldButtons;

    double now = 0.0;
    bool closeFlag = false;
    camrig::Size size{800, 600};
    camrig::Size viewport{};
    int swaps = 0;
    int pumps = 0;
    int clears = 0;
    std::array<float, 4> lastClear{};

    // Optional step log shared with test controllables.
    std::vector<std::string>* journal = nullptr;

    bool pollEvent(camrig::Event& event) override {
        if (queue.empty()) return false;
        event = queue.front();
        queue.pop_front();
        note("event");
        return true;
    }

    bool shouldClose() const override { return closeFlag; }
    void setShouldClose(bool close) override { closeFlag = close; }

    camrig::Action keyState(camrig::Key key) const override {
        return heldKeys.count(key) != 0 ? camrig::Action::Press : camrig::Action::Release;
    }

    camrig::Action mouseButtonState(camrig::MouseButton button) const override {
        return heldButtons.count(button) != 0 ? camrig::Action::Press : camrig::Action::Release;
    }

    double time() const override { return now; }

    void swapBuffers() override {
        ++swaps;
        note("swap");
    }

    void pumpEvents() override {
        ++pumps;
        while (!pending.empty()) {
            queue.push_back(pending.front());
            pending.pop_front();
        }
        note("pump");
    }

    camrig::Size pixelSize() const override { return size; }
    void setViewport(camrig::Size s) override { viewport = s; }

    void clear(float r, float g, float b, float a) override {
        ++clears;
        lastClear = {r, g, b, a};
        note("clear");
    }

    void push(const camrig::Event& e) { queue.push_back(e); }
    void pushPending(const camrig::Event& e) { pending.push_back(e); }

    void note(const char* step) {
        if (journal) journal->push_back(step);
    }

    static camrig::Event motion(float x, float y) {
        camrig::Event e;
        e.type = camrig::EventType::MouseMotion;
        e.mouseX = x;
        e.mouseY = y;
        return e;
    }

    static camrig::Event wheel(float dx, float dy) {
        camrig::Event e;
        e.type = camrig::EventType::MouseWheel;
        e.wheelX = dx;
        e.wheelY = dy;
        return e;
    }

    static camrig::Event key(camrig::Key k, camrig::Action action, int scancode = 0) {
        camrig::Event e;
        e.type = camrig::EventType::Key;
        e.keyCode = k;
        e.scancode = scancode;
        e.action = action;
        return e;
    }

    static camrig::Event button(camrig::MouseButton b, camrig::Action action) {
        camrig::Event e;
        e.type = camrig::EventType::MouseButton;
        e.button = b;
        e.action = action;
        return e;
    }

    static camrig::Event resized(std::uint32_t w, std::uint32_t h) {
        camrig::Event e;
        e.type = camrig::EventType::Resized;
        e.size = {w, h};
        return e;
    }

    static camrig::Event of(camrig::EventType type) {
        camrig::Event e;
        e.type = type;
        return e;
    }
};
