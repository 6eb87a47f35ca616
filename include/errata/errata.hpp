#pragma once

// Umbrella header for the errata status container.

#include "errata/error.hpp"
#include "errata/classification.hpp"
#include "errata/value.hpp"
#include "errata/context.hpp"
#include "errata/status.hpp"
#include "errata/render.hpp"
#include "errata/wire/codec.hpp"
#include "errata/wire/frame.hpp"
