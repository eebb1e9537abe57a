#pragma once

#include <cstddef>

namespace autoalloc {
namespace memory {

// Thin wrappers over the platform C allocator. None of them allocates on its own.
void* NativeAlignedAlloc(std::size_t size, std::size_t alignment);
void NativeAlignedFree(void* ptr);

// Usable size of a block from NativeAlignedAlloc, or 0 where the platform
// offers no query.
std::size_t NativeUsableSize(void* ptr);

// Zero memory in a way the optimizer may not drop.
void SecureZero(void* ptr, std::size_t size);

}  // namespace memory
}  // namespace autoalloc
