#pragma once
#include "types.hpp"

// Small-object heap backing kstd::vector in freestanding builds.
// The embedding kernel defines both members and the ALLOCATOR instance;
// alloc returns nullptr when the heap is exhausted.
class Allocator {
public:
	void* alloc(usize size);
	void free(void* ptr, usize size);
};

extern Allocator ALLOCATOR;
