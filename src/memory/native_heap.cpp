#include "memory/native_heap.hpp"

#include <cstdlib>

#if defined(_WIN32)
#include <malloc.h>
#elif defined(__APPLE__)
#include <malloc/malloc.h>
#elif defined(__FreeBSD__)
#include <malloc_np.h>
#elif defined(__linux__) || defined(__ANDROID__) || defined(__EMSCRIPTEN__)
#include <malloc.h>
#define AUTOALLOC_HAS_MALLOC_USABLE_SIZE 1
#endif

namespace autoalloc {
namespace memory {

void* NativeAlignedAlloc(std::size_t size, std::size_t alignment) {
#if defined(_WIN32)
  return _aligned_malloc(size, alignment);
#else
  void* ptr = NULL;
  if (posix_memalign(&ptr, alignment, size) != 0) {
    return NULL;
  }
  return ptr;
#endif
}

void NativeAlignedFree(void* ptr) {
  if (ptr == NULL) return;
#if defined(_WIN32)
  _aligned_free(ptr);
#else
  std::free(ptr);
#endif
}

std::size_t NativeUsableSize(void* ptr) {
  if (ptr == NULL) return 0;
#if defined(__APPLE__)
  return malloc_size(ptr);
#elif defined(__FreeBSD__) || defined(AUTOALLOC_HAS_MALLOC_USABLE_SIZE)
  return malloc_usable_size(ptr);
#else
  // _aligned_msize needs the original alignment, which is not tracked.
  return 0;
#endif
}

void SecureZero(void* ptr, std::size_t size) {
  volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
  while (size-- > 0) {
    *p++ = 0;
  }
}

}  // namespace memory
}  // namespace autoalloc
