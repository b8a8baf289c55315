#pragma once
#include "mem/paging.hpp"
#include "mem/paging_meta.hpp"

namespace mmukit {
	// 4-level paging, 48-bit canonical virtual addresses
	struct X86Meta : PagingMeta<4, 52, 48, VaLayout::SignExtended> {};

	class X86Pte {
	public:
		constexpr X86Pte() = default;

		static constexpr X86Pte new_page(u64 paddr, PageFlags flags, bool is_huge) {
			u64 bits = (paddr & PAGE_ADDR_MASK) | FLAG_ACCESSED | from_flags(flags);
			if (is_huge) {
				bits |= FLAG_HUGE;
			}
			return X86Pte {bits};
		}

		static constexpr X86Pte new_table(u64 paddr) {
			return X86Pte {(paddr & PAGE_ADDR_MASK) | FLAG_PRESENT | FLAG_RW | FLAG_USER};
		}

		[[nodiscard]] constexpr u64 paddr() const {
			return bits & PAGE_ADDR_MASK;
		}

		constexpr void set_paddr(u64 paddr) {
			bits = (bits & ~PAGE_ADDR_MASK) | (paddr & PAGE_ADDR_MASK);
		}

		[[nodiscard]] constexpr PageFlags flags() const {
			auto flags = PageFlags::None;
			if (bits & FLAG_PRESENT) {
				flags |= PageFlags::Read;
			}
			if (bits & FLAG_RW) {
				flags |= PageFlags::Write;
			}
			if (!(bits & FLAG_NX)) {
				flags |= PageFlags::Execute;
			}
			if (bits & FLAG_USER) {
				flags |= PageFlags::User;
			}

			if ((bits & FLAG_CD) && (bits & FLAG_WT)) {
				flags |= PageFlags::Device;
			}
			else if (bits & FLAG_CD) {
				flags |= PageFlags::Uncached;
			}
			return flags;
		}

		constexpr void set_flags(PageFlags flags, bool is_huge) {
			bits = (bits & PAGE_ADDR_MASK) | FLAG_ACCESSED | from_flags(flags);
			if (is_huge) {
				bits |= FLAG_HUGE;
			}
		}

		[[nodiscard]] constexpr bool is_unused() const {
			return bits == 0;
		}

		[[nodiscard]] constexpr bool is_present() const {
			return bits & FLAG_PRESENT;
		}

		[[nodiscard]] constexpr bool is_huge() const {
			return bits & FLAG_HUGE;
		}

		constexpr void clear() {
			bits = 0;
		}

	private:
		constexpr explicit X86Pte(u64 bits) : bits {bits} {}

		static constexpr u64 FLAG_PRESENT = 0b1;
		static constexpr u64 FLAG_RW = 1U << 1;
		static constexpr u64 FLAG_USER = 1U << 2;
		static constexpr u64 FLAG_WT = 1U << 3;
		static constexpr u64 FLAG_CD = 1U << 4;
		static constexpr u64 FLAG_ACCESSED = 1U << 5;
		static constexpr u64 FLAG_HUGE = 1U << 7;
		static constexpr u64 FLAG_NX = 1ULL << 63;

		static constexpr u64 PAGE_ADDR_MASK = 0x000FFFFFFFFFF000;

		static constexpr u64 from_flags(PageFlags flags) {
			u64 real_flags = 0;
			if (flags & PageFlags::Read) {
				real_flags |= FLAG_PRESENT;
			}
			if (flags & PageFlags::Write) {
				real_flags |= FLAG_RW;
			}
			if (!(flags & PageFlags::Execute)) {
				real_flags |= FLAG_NX;
			}
			if (flags & PageFlags::User) {
				real_flags |= FLAG_USER;
			}

			if (flags & PageFlags::Device) {
				real_flags |= FLAG_WT | FLAG_CD;
			}
			else if (flags & PageFlags::Uncached) {
				real_flags |= FLAG_CD;
			}
			return real_flags;
		}

		u64 bits {};
	};

	static_assert(sizeof(X86Pte) == sizeof(u64));
}
