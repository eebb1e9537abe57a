#pragma once

// Preprocessor-only target detection. Every flag is defined as 0 or 1.

// OS
#if defined(_WIN32) || defined(_WIN64)
#define AUTOALLOC_OS_WINDOWS 1
#else
#define AUTOALLOC_OS_WINDOWS 0
#endif

#if defined(__ANDROID__)
#define AUTOALLOC_OS_ANDROID 1
#else
#define AUTOALLOC_OS_ANDROID 0
#endif

#if defined(__linux__) && !defined(__ANDROID__)
#define AUTOALLOC_OS_LINUX 1
#else
#define AUTOALLOC_OS_LINUX 0
#endif

#if defined(__APPLE__) && defined(__MACH__)
#include <TargetConditionals.h>
#if defined(TARGET_OS_IPHONE) && TARGET_OS_IPHONE
#define AUTOALLOC_OS_IOS 1
#define AUTOALLOC_OS_MACOS 0
#else
#define AUTOALLOC_OS_IOS 0
#define AUTOALLOC_OS_MACOS 1
#endif
#else
#define AUTOALLOC_OS_IOS 0
#define AUTOALLOC_OS_MACOS 0
#endif

#if defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__) || defined(__DragonFly__)
#define AUTOALLOC_OS_BSD 1
#else
#define AUTOALLOC_OS_BSD 0
#endif

#if defined(__sun) && defined(__SVR4)
#define AUTOALLOC_OS_SOLARIS 1
#else
#define AUTOALLOC_OS_SOLARIS 0
#endif

#if defined(__EMSCRIPTEN__) || defined(__wasi__) || defined(__wasm__)
#define AUTOALLOC_OS_WEB 1
#else
#define AUTOALLOC_OS_WEB 0
#endif

#if defined(AUTOALLOC_TARGET_NO_HEAP_OS) || (defined(__STDC_HOSTED__) && __STDC_HOSTED__ == 0)
#define AUTOALLOC_OS_NO_HEAP 1
#else
#define AUTOALLOC_OS_NO_HEAP 0
#endif

// Architecture
#if defined(_M_X64) || defined(__x86_64__)
#define AUTOALLOC_ARCH_NAME "x86_64"
#elif defined(_M_IX86) || defined(__i386__)
#define AUTOALLOC_ARCH_NAME "x86"
#elif defined(__aarch64__) || defined(_M_ARM64)
#define AUTOALLOC_ARCH_NAME "aarch64"
#elif defined(__arm__) || defined(_M_ARM)
#define AUTOALLOC_ARCH_NAME "arm"
#define AUTOALLOC_ARCH_ARM 1
#elif defined(__riscv) && defined(__riscv_xlen) && __riscv_xlen == 64
#define AUTOALLOC_ARCH_NAME "riscv64"
#define AUTOALLOC_ARCH_RISCV64 1
#elif defined(__riscv)
#define AUTOALLOC_ARCH_NAME "riscv32"
#define AUTOALLOC_ARCH_RISCV32 1
#elif defined(__wasm64__)
#define AUTOALLOC_ARCH_NAME "wasm64"
#elif defined(__wasm32__) || defined(__wasm__)
#define AUTOALLOC_ARCH_NAME "wasm32"
#elif defined(__powerpc64__) || defined(__ppc64__)
#define AUTOALLOC_ARCH_NAME "powerpc64"
#elif defined(__XTENSA__) || defined(__xtensa__)
#define AUTOALLOC_ARCH_NAME "xtensa"
#define AUTOALLOC_ARCH_XTENSA 1
#elif defined(__AVR__) || defined(__AVR_ARCH__)
#define AUTOALLOC_ARCH_NAME "avr"
#define AUTOALLOC_ARCH_AVR 1
#elif defined(__MSP430__) || defined(__msp430__)
#define AUTOALLOC_ARCH_NAME "msp430"
#define AUTOALLOC_ARCH_MSP430 1
#else
#define AUTOALLOC_ARCH_NAME "unknown"
#endif

#ifndef AUTOALLOC_ARCH_ARM
#define AUTOALLOC_ARCH_ARM 0
#endif
#ifndef AUTOALLOC_ARCH_RISCV64
#define AUTOALLOC_ARCH_RISCV64 0
#endif
#ifndef AUTOALLOC_ARCH_RISCV32
#define AUTOALLOC_ARCH_RISCV32 0
#endif
#ifndef AUTOALLOC_ARCH_XTENSA
#define AUTOALLOC_ARCH_XTENSA 0
#endif
#ifndef AUTOALLOC_ARCH_AVR
#define AUTOALLOC_ARCH_AVR 0
#endif
#ifndef AUTOALLOC_ARCH_MSP430
#define AUTOALLOC_ARCH_MSP430 0
#endif

// Embedded arena size in bytes, a fraction of the RAM typical for the part.
#ifndef AUTOALLOC_EMBEDDED_HEAP_SIZE
#if AUTOALLOC_ARCH_AVR
#define AUTOALLOC_EMBEDDED_HEAP_SIZE 512
#elif AUTOALLOC_ARCH_MSP430
#define AUTOALLOC_EMBEDDED_HEAP_SIZE 256
#elif AUTOALLOC_ARCH_RISCV32
#define AUTOALLOC_EMBEDDED_HEAP_SIZE 2048
#elif AUTOALLOC_ARCH_RISCV64 || AUTOALLOC_ARCH_XTENSA
#define AUTOALLOC_EMBEDDED_HEAP_SIZE 4096
#elif AUTOALLOC_ARCH_ARM
#define AUTOALLOC_EMBEDDED_HEAP_SIZE 1024
#else
#define AUTOALLOC_EMBEDDED_HEAP_SIZE 2048
#endif
#endif

// Release unless a debug profile is forced or NDEBUG is absent.
#if defined(AUTOALLOC_BUILD_PROFILE_RELEASE)
#define AUTOALLOC_BUILD_RELEASE 1
#elif defined(AUTOALLOC_BUILD_PROFILE_DEBUG)
#define AUTOALLOC_BUILD_RELEASE 0
#elif defined(NDEBUG)
#define AUTOALLOC_BUILD_RELEASE 1
#else
#define AUTOALLOC_BUILD_RELEASE 0
#endif
