#pragma once
// Viewidgets utilities
// Unified access to the widget models, their drawing and the panel helpers

// Models
#include "model/common.hpp"
#include "model/scheduler.hpp"
#include "model/shapes.hpp"
#include "model/json_options.hpp"
#include "model/dial.hpp"
#include "model/led.hpp"
#include "model/digit.hpp"

// Graphics
#include "graphics/color.hpp"
#include "graphics/drawing.hpp"

// UI
#include "ui/displays.hpp"
#include "ui/layout.hpp"
