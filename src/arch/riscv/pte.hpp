#pragma once
#include "mem/paging.hpp"
#include "mem/paging_meta.hpp"

namespace mmukit {
	struct Sv39Meta : PagingMeta<3, 56, 39, VaLayout::SignExtended> {};
	struct Sv48Meta : PagingMeta<4, 56, 48, VaLayout::SignExtended> {};

	// Shared by Sv39 and Sv48, memory types use Svpbmt.
	class RiscvPte {
	public:
		constexpr RiscvPte() = default;

		static constexpr RiscvPte new_page(u64 paddr, PageFlags flags, bool is_huge) {
			u64 bits = ppn_bits(paddr) | FLAG_ACCESSED | FLAG_DIRTY | from_flags(flags);
			if (is_huge) {
				bits |= FLAG_HUGE;
			}
			return RiscvPte {bits};
		}

		static constexpr RiscvPte new_table(u64 paddr) {
			return RiscvPte {ppn_bits(paddr) | FLAG_VALID};
		}

		[[nodiscard]] constexpr u64 paddr() const {
			return (bits & PPN_MASK) >> PPN_SHIFT << 12;
		}

		constexpr void set_paddr(u64 paddr) {
			bits = (bits & ~PPN_MASK) | ppn_bits(paddr);
		}

		[[nodiscard]] constexpr PageFlags flags() const {
			auto flags = PageFlags::None;
			if (bits & FLAG_READ) {
				flags |= PageFlags::Read;
			}
			if (bits & FLAG_WRITE) {
				flags |= PageFlags::Write;
			}
			if (bits & FLAG_EXEC) {
				flags |= PageFlags::Execute;
			}
			if (bits & FLAG_USER) {
				flags |= PageFlags::User;
			}

			auto pbmt = bits & PBMT_MASK;
			if (pbmt == PBMT_IO) {
				flags |= PageFlags::Device;
			}
			else if (pbmt == PBMT_NC) {
				flags |= PageFlags::Uncached;
			}
			return flags;
		}

		constexpr void set_flags(PageFlags flags, bool is_huge) {
			bits = (bits & PPN_MASK) | FLAG_ACCESSED | FLAG_DIRTY | from_flags(flags);
			if (is_huge) {
				bits |= FLAG_HUGE;
			}
		}

		[[nodiscard]] constexpr bool is_unused() const {
			return bits == 0;
		}

		[[nodiscard]] constexpr bool is_present() const {
			return bits & FLAG_VALID;
		}

		// the hardware tells leaves apart by R/W/X, software keeps a marker so that
		// leaves without permissions are still recognized
		[[nodiscard]] constexpr bool is_huge() const {
			return bits & FLAG_HUGE;
		}

		constexpr void clear() {
			bits = 0;
		}

	private:
		constexpr explicit RiscvPte(u64 bits) : bits {bits} {}

		static constexpr u64 FLAG_VALID = 1;
		static constexpr u64 FLAG_READ = 1 << 1;
		static constexpr u64 FLAG_WRITE = 1 << 2;
		static constexpr u64 FLAG_EXEC = 1 << 3;
		static constexpr u64 FLAG_USER = 1 << 4;
		static constexpr u64 FLAG_ACCESSED = 1 << 6;
		static constexpr u64 FLAG_DIRTY = 1 << 7;
		static constexpr u64 FLAG_HUGE = 1 << 8;

		static constexpr u64 PPN_SHIFT = 10;
		static constexpr u64 PPN_MASK = 0xFFFFFFFFFFFULL << PPN_SHIFT;

		static constexpr u64 PBMT_NC = 1ULL << 61;
		static constexpr u64 PBMT_IO = 2ULL << 61;
		static constexpr u64 PBMT_MASK = 3ULL << 61;

		static constexpr u64 ppn_bits(u64 paddr) {
			return (paddr >> 12 << PPN_SHIFT) & PPN_MASK;
		}

		static constexpr u64 from_flags(PageFlags flags) {
			u64 real_flags = 0;
			if (flags & (PageFlags::Read | PageFlags::Execute)) {
				real_flags |= FLAG_VALID;
			}
			if (flags & PageFlags::Read) {
				real_flags |= FLAG_READ;
			}
			if (flags & PageFlags::Write) {
				real_flags |= FLAG_WRITE;
			}
			if (flags & PageFlags::Execute) {
				real_flags |= FLAG_EXEC;
			}
			if (flags & PageFlags::User) {
				real_flags |= FLAG_USER;
			}

			if (flags & PageFlags::Device) {
				real_flags |= PBMT_IO;
			}
			else if (flags & PageFlags::Uncached) {
				real_flags |= PBMT_NC;
			}
			return real_flags;
		}

		u64 bits {};
	};

	static_assert(sizeof(RiscvPte) == sizeof(u64));
}
