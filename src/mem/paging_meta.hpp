#pragma once
#include "types.hpp"

namespace mmukit {
	enum class VaLayout {
		// bits above VA_MAX_BITS - 1 replicate bit VA_MAX_BITS - 1 (x86_64, riscv)
		SignExtended,
		// bits above VA_MAX_BITS are all zero or all one, selecting one of two roots (aarch64).
		// A table only sees the low VA_MAX_BITS, so both halves index the same root slots
		// and traversal reports the low half address.
		SplitHalves
	};

	template<usize Levels, usize PaBits, usize VaBits, VaLayout Layout>
	struct PagingMeta {
		static_assert(Levels >= 2 && Levels <= 5);
		static_assert(VaBits >= 1 && VaBits <= 64);
		static_assert(PaBits <= 64);

		static constexpr usize LEVELS = Levels;
		static constexpr usize PA_MAX_BITS = PaBits;
		static constexpr usize VA_MAX_BITS = VaBits;
		static constexpr u64 PA_MAX_ADDR = PaBits == 64 ? ~u64 {0} : (u64 {1} << (PaBits % 64)) - 1;

		static constexpr bool paddr_is_valid(u64 paddr) {
			return paddr <= PA_MAX_ADDR;
		}

		static constexpr bool vaddr_is_valid(u64 vaddr) {
			if constexpr (VaBits == 64) {
				return true;
			}
			else if constexpr (Layout == VaLayout::SignExtended) {
				constexpr u64 top_mask = ~u64 {0} << (VaBits - 1);
				auto top = vaddr & top_mask;
				return top == 0 || top == top_mask;
			}
			else {
				constexpr u64 top_mask = ~u64 {0} << VaBits;
				auto top = vaddr & top_mask;
				return top == 0 || top == top_mask;
			}
		}

		// Rebuilds the architectural form of an address assembled from table indices.
		static constexpr u64 canonicalize(u64 vaddr) {
			if constexpr (VaBits == 64 || Layout == VaLayout::SplitHalves) {
				return vaddr;
			}
			else {
				constexpr u64 top_mask = ~u64 {0} << (VaBits - 1);
				if (vaddr & u64 {1} << (VaBits - 1)) {
					return vaddr | top_mask;
				}
				return vaddr & ~top_mask;
			}
		}
	};
}
