#include "autoalloc/autoalloc.hpp"

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <new>
#include <string>
#include <vector>

namespace {

// Keeps the optimizer from eliding a new/delete pair.
void* volatile g_escape = NULL;

}  // namespace

bool TestNewIsServedByBoundBackend() {
  const autoalloc::memory::AllocatorStats before = autoalloc::memory::GlobalAllocator::CurrentStats();
  int* value = new int(42);
  g_escape = value;
  const autoalloc::memory::AllocatorStats during = autoalloc::memory::GlobalAllocator::CurrentStats();
  delete value;
  const autoalloc::memory::AllocatorStats after = autoalloc::memory::GlobalAllocator::CurrentStats();
  return autoalloc::memory::GlobalAllocator::IsBound() && during.alloc_count > before.alloc_count &&
         after.free_count > during.free_count;
}

bool TestArrayAndNothrowForms() {
  const autoalloc::memory::AllocatorStats before = autoalloc::memory::GlobalAllocator::CurrentStats();
  char* buffer = new char[256];
  g_escape = buffer;
  buffer[255] = 'x';
  delete[] buffer;

  double* d = new (std::nothrow) double(1.5);
  g_escape = d;
  if (d == NULL || *d != 1.5) return false;
  delete d;

  const autoalloc::memory::AllocatorStats after = autoalloc::memory::GlobalAllocator::CurrentStats();
  return after.alloc_count - before.alloc_count >= 2 && after.free_count - before.free_count >= 2;
}

bool TestNewAlignment() {
  std::unique_ptr<long double> p(new long double(2.0L));
  g_escape = p.get();
  return (reinterpret_cast<std::uintptr_t>(p.get()) % alignof(std::max_align_t)) == 0;
}

bool TestStandardContainers() {
  std::vector<std::string> words;
  for (int i = 0; i < 1000; ++i) {
    words.push_back(std::string("allocation number ") + std::to_string(i));
  }
  return words.size() == 1000 && words[999] == "allocation number 999";
}

bool TestBindingReportedOnce() {
  const autoalloc::selection::AllocatorInfo& info = autoalloc::selection::GetAllocatorInfo();
  return info.allocator_type == autoalloc::memory::GlobalAllocator::BoundType() &&
         autoalloc::selection::HardwareProbeInvocations() == 1;
}

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"new_is_served_by_bound_backend", TestNewIsServedByBoundBackend},
      {"array_and_nothrow_forms", TestArrayAndNothrowForms},
      {"new_alignment", TestNewAlignment},
      {"standard_containers", TestStandardContainers},
      {"binding_reported_once", TestBindingReportedOnce},
  };

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(tests) / sizeof(tests[0]); ++i) {
    std::printf("[RUN ] %s\n", tests[i].name);
    std::fflush(stdout);
    bool ok = tests[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << tests[i].name << "\n";
    std::fflush(stdout);
    if (!ok) ++failed;
  }

  return failed == 0 ? 0 : 1;
}
