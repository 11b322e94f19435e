//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#include "alloc_counter.h"

#include <atomic>
#include <cstdlib>
#include <new>

namespace {

std::atomic<uint64_t> alloc_calls(0);
std::atomic<uint64_t> alloc_bytes(0);

void* counted_alloc(std::size_t size)
{
  if (size == 0)
    size = 1;

  for (;;) {
    if (void* p = std::malloc(size)) {
      alloc_calls.fetch_add(1, std::memory_order_relaxed);
      alloc_bytes.fetch_add(size, std::memory_order_relaxed);
      return p;
    }

    std::new_handler handler = std::get_new_handler();
    if (!handler)
      throw std::bad_alloc();

    handler();
  }
}

void* counted_alloc_nothrow(std::size_t size) noexcept
{
  try {
    return counted_alloc(size);
  } catch (const std::bad_alloc&) {
    return nullptr;
  }
}

} // anonymous namespace

void* operator new(std::size_t size)
{
  return counted_alloc(size);
}

void* operator new[](std::size_t size)
{
  return counted_alloc(size);
}

void* operator new(std::size_t size, const std::nothrow_t&) noexcept
{
  return counted_alloc_nothrow(size);
}

void* operator new[](std::size_t size, const std::nothrow_t&) noexcept
{
  return counted_alloc_nothrow(size);
}

void operator delete(void* p) noexcept
{
  std::free(p);
}

void operator delete[](void* p) noexcept
{
  std::free(p);
}

void operator delete(void* p, std::size_t) noexcept
{
  std::free(p);
}

void operator delete[](void* p, std::size_t) noexcept
{
  std::free(p);
}

void operator delete(void* p, const std::nothrow_t&) noexcept
{
  std::free(p);
}

void operator delete[](void* p, const std::nothrow_t&) noexcept
{
  std::free(p);
}

namespace splitbench {
namespace alloc_counter {

uint64_t allocation_calls()
{
  return alloc_calls.load(std::memory_order_relaxed);
}

uint64_t allocated_bytes()
{
  return alloc_bytes.load(std::memory_order_relaxed);
}

} // namespace alloc_counter
} // namespace splitbench
