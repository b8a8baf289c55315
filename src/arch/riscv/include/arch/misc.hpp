#pragma once
#include "types.hpp"

static inline void arch_hlt() {
	asm volatile("wfi");
}

static inline void arch_spin_hint() {
	// pause (Zihintpause), a fence hint on harts without the extension
	asm volatile(".insn i 0x0F, 0, x0, x0, 0x010");
}

static inline bool arch_enable_irqs(bool enable) {
	u64 old;

	// sstatus.SIE
	if (enable) {
		asm volatile("csrrsi %0, sstatus, 2" : "=r"(old) : : "memory");
	}
	else {
		asm volatile("csrrci %0, sstatus, 2" : "=r"(old) : : "memory");
	}

	return old & 1 << 1;
}
