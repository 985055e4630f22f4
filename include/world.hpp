#pragma once

#include "scene.hpp"

// Ground, a diffuse center sphere, a hollow glass sphere on the left and a
// polished metal sphere on the right.
Scene buildDefaultWorld();
