#pragma once
#include <rack.hpp>
#include <nanovg.h>

using namespace rack;

extern Plugin* pluginInstance;

#include "utilities.hpp"

extern Model* modelViewidgets;
