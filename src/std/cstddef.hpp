#pragma once
#include <stddef.h>

namespace kstd {
	using nullptr_t = decltype(nullptr);
	using size_t = ::size_t;
}
