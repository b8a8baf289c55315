#pragma once

#ifdef TESTING
#include <cstring>
#else
#include "cstddef.hpp"

// Provided weakly by cstring.cpp, an embedder with optimized versions overrides them.
extern "C" {
	void* memcpy(void* __restrict dest, const void* __restrict src, size_t size);
	void* memset(void* __restrict dest, int ch, size_t size);
}

#define memcpy __builtin_memcpy
#define memset __builtin_memset
#endif
