#pragma once
#include "mem/paging.hpp"
#include "mem/paging_meta.hpp"

namespace mmukit {
	// 4K granule, 4 levels, 48-bit output and input addresses.
	// One table is loaded into either TTBR0_EL1 or TTBR1_EL1, 0x1000 and 0xFFFF000000001000
	// are the same slot of it. Kernel and user halves need separate tables.
	struct Aarch64Meta : PagingMeta<4, 48, 48, VaLayout::SplitHalves> {};

	// The MAIR value the embedder is expected to program, indexed by the attr field:
	// 0 = Device-nGnRnE, 1 = Normal write-back, 2 = Normal non-cacheable.
	constexpr u64 AARCH64_MAIR = 0x00 | 0xFF << 8 | 0x44 << 16;

	class Aarch64Pte {
	public:
		constexpr Aarch64Pte() = default;

		static constexpr Aarch64Pte new_page(u64 paddr, PageFlags flags, bool is_huge) {
			u64 bits = (paddr & PAGE_ADDR_MASK) | from_flags(flags);
			if (!is_huge) {
				bits |= FLAG_NON_BLOCK;
			}
			return Aarch64Pte {bits};
		}

		static constexpr Aarch64Pte new_table(u64 paddr) {
			return Aarch64Pte {(paddr & PAGE_ADDR_MASK) | FLAG_VALID | FLAG_NON_BLOCK};
		}

		[[nodiscard]] constexpr u64 paddr() const {
			return bits & PAGE_ADDR_MASK;
		}

		constexpr void set_paddr(u64 paddr) {
			bits = (bits & ~PAGE_ADDR_MASK) | (paddr & PAGE_ADDR_MASK);
		}

		[[nodiscard]] constexpr PageFlags flags() const {
			auto flags = PageFlags::None;
			if (bits & FLAG_VALID) {
				flags |= PageFlags::Read;
			}
			if (!(bits & FLAG_AP_RO)) {
				flags |= PageFlags::Write;
			}

			if (bits & FLAG_AP_EL0) {
				flags |= PageFlags::User;
				if (!(bits & FLAG_UXN)) {
					flags |= PageFlags::Execute;
				}
			}
			else if (!(bits & FLAG_PXN)) {
				flags |= PageFlags::Execute;
			}

			auto attr = (bits & ATTR_MASK) >> ATTR_SHIFT;
			if (attr == ATTR_DEVICE) {
				flags |= PageFlags::Device;
			}
			else if (attr == ATTR_NON_CACHEABLE) {
				flags |= PageFlags::Uncached;
			}
			return flags;
		}

		constexpr void set_flags(PageFlags flags, bool is_huge) {
			bits = (bits & PAGE_ADDR_MASK) | from_flags(flags);
			if (!is_huge) {
				bits |= FLAG_NON_BLOCK;
			}
		}

		[[nodiscard]] constexpr bool is_unused() const {
			return bits == 0;
		}

		[[nodiscard]] constexpr bool is_present() const {
			return bits & FLAG_VALID;
		}

		// only meaningful above the last level, where a block descriptor has bit 1 clear
		[[nodiscard]] constexpr bool is_huge() const {
			return !(bits & FLAG_NON_BLOCK);
		}

		constexpr void clear() {
			bits = 0;
		}

	private:
		constexpr explicit Aarch64Pte(u64 bits) : bits {bits} {}

		static constexpr u64 FLAG_VALID = 1;
		static constexpr u64 FLAG_NON_BLOCK = 1 << 1;
		static constexpr u64 ATTR_SHIFT = 2;
		static constexpr u64 ATTR_MASK = 0b111 << ATTR_SHIFT;
		static constexpr u64 FLAG_AP_EL0 = 1 << 6;
		static constexpr u64 FLAG_AP_RO = 1 << 7;
		static constexpr u64 FLAG_INNER_SHAREABLE = 0b11 << 8;
		static constexpr u64 FLAG_ACCESS = 1 << 10;
		static constexpr u64 FLAG_PXN = 1ULL << 53;
		static constexpr u64 FLAG_UXN = 1ULL << 54;

		static constexpr u64 ATTR_DEVICE = 0;
		static constexpr u64 ATTR_NORMAL = 1;
		static constexpr u64 ATTR_NON_CACHEABLE = 2;

		static constexpr u64 PAGE_ADDR_MASK = 0x0000FFFFFFFFF000;

		static constexpr u64 from_flags(PageFlags flags) {
			u64 real_flags = FLAG_ACCESS | FLAG_INNER_SHAREABLE;
			if (flags & PageFlags::Read) {
				real_flags |= FLAG_VALID;
			}
			if (!(flags & PageFlags::Write)) {
				real_flags |= FLAG_AP_RO;
			}

			// EL1 may never execute memory that EL0 can write to
			if (flags & PageFlags::User) {
				real_flags |= FLAG_AP_EL0 | FLAG_PXN;
				if (!(flags & PageFlags::Execute)) {
					real_flags |= FLAG_UXN;
				}
			}
			else {
				real_flags |= FLAG_UXN;
				if (!(flags & PageFlags::Execute)) {
					real_flags |= FLAG_PXN;
				}
			}

			u64 attr;
			if (flags & PageFlags::Device) {
				attr = ATTR_DEVICE;
			}
			else if (flags & PageFlags::Uncached) {
				attr = ATTR_NON_CACHEABLE;
			}
			else {
				attr = ATTR_NORMAL;
			}
			return real_flags | attr << ATTR_SHIFT;
		}

		u64 bits {};
	};

	static_assert(sizeof(Aarch64Pte) == sizeof(u64));
}
