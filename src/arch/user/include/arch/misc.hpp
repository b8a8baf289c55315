#pragma once
#include "types.hpp"
#include <stdlib.h>

// Hosted build: there are no interrupts to mask, only the flag the kernel code observes.
extern bool IRQS_ENABLED;

static inline bool arch_enable_irqs(bool enable) {
	auto old = IRQS_ENABLED;
	IRQS_ENABLED = enable;
	return old;
}

static inline void arch_spin_hint() {
#if defined(__x86_64__)
	__builtin_ia32_pause();
#endif
}

static inline void arch_hlt() {
	abort();
}
