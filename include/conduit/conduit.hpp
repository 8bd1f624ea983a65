// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Public API                                                        ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "conduit/config.hpp"
#include "conduit/status.hpp"
#include "conduit/unit.hpp"
#include "conduit/request.hpp"
#include "conduit/stream.hpp"
#include "conduit/handler.hpp"
#include "conduit/pipeline.hpp"
#include "conduit/registry.hpp"
#include "conduit/mediator.hpp"
#include "conduit/logger.hpp"
#include "conduit/validator.hpp"
#include "conduit/cache_store.hpp"

#include "conduit/behaviors/performance_logging.hpp"
#include "conduit/behaviors/validation.hpp"
#include "conduit/behaviors/caching.hpp"
