#pragma once

#include <cstdint>

#include "autoalloc/api/export.hpp"

namespace autoalloc {
namespace memory {
class IAllocator;
}
}  // namespace autoalloc

extern "C" {

// Return packed API version to allow runtime ABI compatibility checks.
AUTOALLOC_API std::uint32_t autoalloc_get_api_version();

// Numeric AllocatorType of the process-wide binding. Binds on first call.
AUTOALLOC_API std::uint32_t autoalloc_bound_allocator_type();

// Create a standalone instance of one backend, independent of the binding.
// `type` is a numeric AllocatorType. Returns NULL when that backend is not
// compiled into this build.
AUTOALLOC_API autoalloc::memory::IAllocator* autoalloc_create_allocator(std::uint32_t type);

// Destroy an allocator created by autoalloc_create_allocator.
AUTOALLOC_API void autoalloc_destroy_allocator(autoalloc::memory::IAllocator* allocator);

}
