#include "cstring.hpp"

#undef memcpy
#undef memset

extern "C" {
	[[gnu::weak]] void* memcpy(void* __restrict dest, const void* __restrict src, size_t size) {
		auto* dest_ptr = static_cast<unsigned char*>(dest);
		auto* src_ptr = static_cast<const unsigned char*>(src);
		for (; size; --size) {
			*dest_ptr++ = *src_ptr++;
		}
		return dest;
	}

	[[gnu::weak]] void* memset(void* __restrict dest, int ch, size_t size) {
		auto* dest_ptr = static_cast<unsigned char*>(dest);
		auto c = static_cast<unsigned char>(ch);
		for (; size; --size) {
			*dest_ptr++ = c;
		}
		return dest;
	}
}
