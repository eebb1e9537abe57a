#include "autoalloc/selection/platform_profile.hpp"

#include "autoalloc/selection/platform_defines.hpp"

namespace autoalloc {
namespace selection {

namespace {

OsFamily CompiledOsFamily() {
#if AUTOALLOC_OS_NO_HEAP
  return OsFamily::kEmbedded;
#elif AUTOALLOC_OS_WEB
  return OsFamily::kWeb;
#elif AUTOALLOC_OS_ANDROID || AUTOALLOC_OS_IOS
  return OsFamily::kMobile;
#elif AUTOALLOC_OS_BSD
  return OsFamily::kBsdLike;
#elif AUTOALLOC_OS_SOLARIS
  return OsFamily::kSolarisLike;
#elif AUTOALLOC_OS_LINUX || AUTOALLOC_OS_WINDOWS || AUTOALLOC_OS_MACOS
  return OsFamily::kDesktop;
#else
  return OsFamily::kUnknown;
#endif
}

const char* CompiledOsName() {
#if AUTOALLOC_OS_NO_HEAP
  return "none";
#elif defined(__EMSCRIPTEN__)
  return "emscripten";
#elif defined(__wasi__)
  return "wasi";
#elif AUTOALLOC_OS_WEB
  return "unknown";
#elif AUTOALLOC_OS_ANDROID
  return "android";
#elif AUTOALLOC_OS_IOS
  return "ios";
#elif AUTOALLOC_OS_MACOS
  return "macos";
#elif AUTOALLOC_OS_LINUX
  return "linux";
#elif AUTOALLOC_OS_WINDOWS
  return "windows";
#elif defined(__FreeBSD__)
  return "freebsd";
#elif defined(__NetBSD__)
  return "netbsd";
#elif defined(__OpenBSD__)
  return "openbsd";
#elif defined(__DragonFly__)
  return "dragonfly";
#elif defined(__illumos__)
  return "illumos";
#elif AUTOALLOC_OS_SOLARIS
  return "solaris";
#else
  return "unknown";
#endif
}

}  // namespace

const char* OsFamilyName(OsFamily family) {
  switch (family) {
    case OsFamily::kDesktop:
      return "desktop";
    case OsFamily::kMobile:
      return "mobile";
    case OsFamily::kBsdLike:
      return "bsd-like";
    case OsFamily::kSolarisLike:
      return "solaris-like";
    case OsFamily::kWeb:
      return "web";
    case OsFamily::kEmbedded:
      return "embedded";
    default:
      return "unknown";
  }
}

PlatformProfile ResolveProfile() {
  PlatformProfile profile;
  profile.os_family = CompiledOsFamily();
  profile.os = CompiledOsName();
  profile.arch = AUTOALLOC_ARCH_NAME;
  profile.build_mode = AUTOALLOC_BUILD_RELEASE ? BuildMode::kRelease : BuildMode::kDebug;
  profile.is_wasm = AUTOALLOC_OS_WEB != 0;
  profile.is_no_heap_os = AUTOALLOC_OS_NO_HEAP != 0;
#if defined(AUTOALLOC_SECURE_MODE)
  profile.secure_mode = true;
#endif

  profile.available_backends.Insert(memory::AllocatorType::kSystem);
#if defined(AUTOALLOC_ENABLE_MIMALLOC_BACKEND) || defined(AUTOALLOC_ENABLE_TBBMALLOC_BACKEND)
  profile.available_backends.Insert(memory::AllocatorType::kHighPerformanceGeneral);
#endif
  if (profile.os_family == OsFamily::kMobile || profile.secure_mode) {
    profile.available_backends.Insert(memory::AllocatorType::kPlatformSecureNative);
  }
#if defined(AUTOALLOC_ENABLE_EMBEDDED_HEAP)
  profile.available_backends.Insert(memory::AllocatorType::kEmbeddedHeap);
#endif
  if (profile.is_no_heap_os) {
    profile.available_backends.Insert(memory::AllocatorType::kEmbeddedHeap);
  }
  return profile;
}

}  // namespace selection
}  // namespace autoalloc
