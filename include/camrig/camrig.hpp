#pragma once

// Convenience header -- includes the whole public API.

#include <camrig/app.hpp>
#include <camrig/backend.hpp>
#include <camrig/camera.hpp>
#include <camrig/control_registry.hpp>
#include <camrig/controllable.hpp>
#include <camrig/error.hpp>
#include <camrig/frame_loop.hpp>
#include <camrig/input.hpp>
#include <camrig/result.hpp>
#include <camrig/window.hpp>
