#pragma once

// Umbrella header of the deadsimple library.

#include "deadsimple/http-method.hpp"         // IWYU pragma: export
#include "deadsimple/json-serializer.hpp"     // IWYU pragma: export
#include "deadsimple/log.hpp"                 // IWYU pragma: export
#include "deadsimple/request.hpp"             // IWYU pragma: export
#include "deadsimple/response.hpp"            // IWYU pragma: export
#include "deadsimple/router.hpp"              // IWYU pragma: export
#include "deadsimple/shared-state.hpp"        // IWYU pragma: export
#include "deadsimple/signal-handler.hpp"      // IWYU pragma: export
#include "deadsimple/web-service-config.hpp"  // IWYU pragma: export
#include "deadsimple/web-service.hpp"         // IWYU pragma: export
