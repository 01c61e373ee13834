#pragma once

// Main public API - include all headers
#include "uule/uule_constants.hpp"
#include "uule/decode_error.hpp"
#include "uule/decode_options.hpp"
#include "uule/latlong.hpp"
#include "uule/uulev1.hpp"
#include "uule/uulev2.hpp"

namespace uule {}
