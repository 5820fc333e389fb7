#include <camrig/result.hpp>

#include <cassert>
#ifndef CAMRIG_ENABLE_EXCEPTIONS
#define CAMRIG_ENABLE_EXCEPTIONS 1
#endif
#if CAMRIG_ENABLE_EXCEPTIONS
#include <stdexcept>
#endif
#include <memory>
#include <string>

int main() {
    // Ok result
    {
        camrig::Result<int> r = 42;
        assert(r.ok());
        assert(r);
        assert(r.value() == 42);
    }

    // Error result
    {
        camrig::Result<int> r = camrig::Error{"create window", "no display"};
        assert(!r.ok());
        assert(!r);
        assert(r.error().operation == "create window");
        assert(r.error().message == "no display");
    }

    // Move-only value, as with App and Window
    {
        camrig::Result<std::unique_ptr<int>> r = std::make_unique<int>(5);
        assert(r.ok());
        std::unique_ptr<int> p = std::move(r).value();
        assert(p && *p == 5);
    }

    // Returned from function
    {
        auto make = [](bool succeed) -> camrig::Result<int> {
            if (succeed)
                return 7;
            return camrig::Error{"test op", "nope"};
        };

        auto good = make(true);
        auto bad = make(false);
        assert(good.ok() && good.value() == 7);
        assert(!bad.ok() && bad.error().message == "nope");
    }

    // Result<void>
    {
        camrig::Result<void> ok;
        assert(ok.ok());

        camrig::Result<void> bad = camrig::Error{"set window title", "window gone"};
        assert(!bad);
        assert(bad.error().operation == "set window title");
    }

    // orThrow on success
    {
        auto make = []() -> camrig::Result<int> { return 99; };
        int val = make().orThrow();
        assert(val == 99);

        camrig::Result<void> r;
        std::move(r).orThrow();
    }

#if CAMRIG_ENABLE_EXCEPTIONS
    // orThrow on error
    {
        auto make = []() -> camrig::Result<int> { return camrig::Error{"initialize SDL", "boom"}; };
        bool caught = false;
        try {
            (void)make().orThrow();
        } catch (const std::runtime_error& e) {
            caught = true;
            std::string msg = e.what();
            assert(msg.find("initialize SDL") != std::string::npos);
            assert(msg.find("boom") != std::string::npos);
        }
        assert(caught);
    }

    {
        camrig::Result<void> r = camrig::Error{"create OpenGL context", "failed"};
        bool caught = false;
        try {
            std::move(r).orThrow();
        } catch (const std::runtime_error& e) {
            caught = true;
            assert(std::string(e.what()).find("create OpenGL context") != std::string::npos);
        }
        assert(caught);
    }
#endif

    return 0;
}
