#pragma once

#include "autoalloc/api/factory.hpp"
#include "autoalloc/api/status.hpp"
#include "autoalloc/api/version.hpp"
#include "autoalloc/json/i_json.hpp"
#include "autoalloc/log/log_manager.hpp"
#include "autoalloc/log/log_types.hpp"
#include "autoalloc/memory/i_global_allocator.hpp"
#include "autoalloc/memory/iallocator.hpp"
#include "autoalloc/selection/hardware_snapshot.hpp"
#include "autoalloc/selection/introspection.hpp"
#include "autoalloc/selection/platform_profile.hpp"
#include "autoalloc/selection/selection_policy.hpp"
