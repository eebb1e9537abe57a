#include "autoalloc/api/factory.hpp"

#include "autoalloc/api/version.hpp"
#include "autoalloc/memory/i_global_allocator.hpp"
#include "memory/backend_registry.hpp"

extern "C" {

std::uint32_t autoalloc_get_api_version() { return autoalloc::api::kApiVersion; }

std::uint32_t autoalloc_bound_allocator_type() {
  return static_cast<std::uint32_t>(autoalloc::memory::GlobalAllocator::BoundType());
}

autoalloc::memory::IAllocator* autoalloc_create_allocator(std::uint32_t type) {
  if (type >= static_cast<std::uint32_t>(autoalloc::memory::kAllocatorTypeCount)) {
    return NULL;
  }
  autoalloc::api::Result<autoalloc::memory::IAllocator*> created =
      autoalloc::memory::CreateBackend(static_cast<autoalloc::memory::AllocatorType>(type));
  return created.ok() ? created.value() : NULL;
}

void autoalloc_destroy_allocator(autoalloc::memory::IAllocator* allocator) {
  if (allocator != NULL) {
    allocator->Release();
  }
}

}
