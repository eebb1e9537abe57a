#pragma once

#include "autoalloc/memory/iallocator.hpp"

namespace autoalloc {
namespace memory {

// Creates a standalone backend instance owned by the caller (Release() to
// destroy). Works for any backend compiled into the library, whether or not
// the selection policy could bind it. kUnsupported otherwise.
api::Result<IAllocator*> CreateBackend(AllocatorType type);

}  // namespace memory
}  // namespace autoalloc
