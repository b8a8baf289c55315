#pragma once
#include "types.hpp"

static inline void arch_hlt() {
	asm volatile("hlt");
}

static inline void arch_spin_hint() {
	__builtin_ia32_pause();
}

static inline bool arch_enable_irqs(bool enable) {
	u64 old;
	asm volatile("pushfq; pop %0" : "=rm"(old));
	if (enable) {
		asm volatile("sti" : : : "memory");
	}
	else {
		asm volatile("cli" : : : "memory");
	}

	// rflags.IF
	return old & 1 << 9;
}
