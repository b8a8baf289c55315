#include "arch/x86/pte.hpp"
#include "arch/aarch64/pte.hpp"
#include "arch/riscv/pte.hpp"
#include <gtest/gtest.h>

using namespace mmukit;

namespace {
	// Device and Uncached are exclusive, every other combination is a valid input
	bool valid_flags(PageFlags flags) {
		return !((flags & PageFlags::Device) && (flags & PageFlags::Uncached));
	}

	PageFlags flags_from_bits(u32 bits) {
		return static_cast<PageFlags>(bits);
	}

	template<typename Pte>
	void check_round_trip(u64 max_paddr) {
		const u64 addrs[] {0, 0x1000, 0x200000, 0x40000000, 0x123456789000 & max_paddr, max_paddr & ~u64 {0xFFF}};
		for (u64 addr : addrs) {
			for (u32 bits = 0; bits < 64; ++bits) {
				auto flags = flags_from_bits(bits);
				if (!valid_flags(flags)) {
					continue;
				}
				for (bool huge : {false, true}) {
					auto pte = Pte::new_page(addr, flags, huge);
					EXPECT_EQ(pte.paddr(), addr);
					EXPECT_EQ(pte.flags(), flags) << "flags " << bits;
					EXPECT_EQ(pte.is_huge(), huge);
					EXPECT_FALSE(pte.is_unused());
				}
			}

			auto table = Pte::new_table(addr);
			EXPECT_EQ(table.paddr(), addr);
			EXPECT_TRUE(table.is_present());
			EXPECT_FALSE(table.is_huge());
			EXPECT_FALSE(table.is_unused());
		}
	}

	template<typename Pte>
	void check_mutators() {
		auto pte = Pte::new_page(0x5000, PageFlags::Read | PageFlags::Write, false);
		pte.set_flags(PageFlags::Read | PageFlags::Execute | PageFlags::User, true);
		EXPECT_EQ(pte.paddr(), 0x5000);
		EXPECT_EQ(pte.flags(), PageFlags::Read | PageFlags::Execute | PageFlags::User);
		EXPECT_TRUE(pte.is_huge());

		pte.set_paddr(0x200000);
		EXPECT_EQ(pte.paddr(), 0x200000);
		EXPECT_EQ(pte.flags(), PageFlags::Read | PageFlags::Execute | PageFlags::User);
		EXPECT_TRUE(pte.is_huge());

		pte.clear();
		EXPECT_TRUE(pte.is_unused());
		EXPECT_FALSE(pte.is_present());
		EXPECT_TRUE(Pte {}.is_unused());
	}
}

TEST(pte, x86_round_trip) {
	check_round_trip<X86Pte>(X86Meta::PA_MAX_ADDR);
	check_mutators<X86Pte>();
}

TEST(pte, aarch64_round_trip) {
	check_round_trip<Aarch64Pte>(Aarch64Meta::PA_MAX_ADDR);
	check_mutators<Aarch64Pte>();
}

TEST(pte, riscv_round_trip) {
	check_round_trip<RiscvPte>(Sv39Meta::PA_MAX_ADDR);
	check_mutators<RiscvPte>();
}

TEST(pte, device_wins_over_uncached) {
	auto both = PageFlags::Read | PageFlags::Device | PageFlags::Uncached;
	EXPECT_EQ(X86Pte::new_page(0, both, false).flags(), PageFlags::Read | PageFlags::Device);
	EXPECT_EQ(Aarch64Pte::new_page(0, both, false).flags(), PageFlags::Read | PageFlags::Device);
	EXPECT_EQ(RiscvPte::new_page(0, both, false).flags(), PageFlags::Read | PageFlags::Device);
}

TEST(pte, presence_follows_access) {
	EXPECT_TRUE(X86Pte::new_page(0x1000, PageFlags::Read, false).is_present());
	EXPECT_FALSE(X86Pte::new_page(0x1000, PageFlags::None, false).is_present());
	EXPECT_TRUE(Aarch64Pte::new_page(0x1000, PageFlags::Read, false).is_present());
	EXPECT_FALSE(Aarch64Pte::new_page(0x1000, PageFlags::Write, false).is_present());
	EXPECT_TRUE(RiscvPte::new_page(0x1000, PageFlags::Execute, false).is_present());
	EXPECT_FALSE(RiscvPte::new_page(0x1000, PageFlags::Write, false).is_present());
}

TEST(meta, x86_canonical_addresses) {
	EXPECT_EQ(X86Meta::LEVELS, 4);
	EXPECT_EQ(X86Meta::PA_MAX_ADDR, 0xFFFFFFFFFFFFF);
	EXPECT_TRUE(X86Meta::vaddr_is_valid(0));
	EXPECT_TRUE(X86Meta::vaddr_is_valid(0x00007FFFFFFFF000));
	EXPECT_FALSE(X86Meta::vaddr_is_valid(0x0000800000000000));
	EXPECT_TRUE(X86Meta::vaddr_is_valid(0xFFFF800000000000));
	EXPECT_FALSE(X86Meta::vaddr_is_valid(0xFFFF7FFFFFFFF000));
	EXPECT_EQ(X86Meta::canonicalize(0x0000800000000000), 0xFFFF800000000000);
	EXPECT_EQ(X86Meta::canonicalize(0x00007FFFFFFFF000), 0x00007FFFFFFFF000);
	EXPECT_TRUE(X86Meta::paddr_is_valid(0xFFFFFFFFFF000));
	EXPECT_FALSE(X86Meta::paddr_is_valid(0x10000000000000));
}

TEST(meta, aarch64_split_halves) {
	EXPECT_EQ(Aarch64Meta::PA_MAX_ADDR, 0xFFFFFFFFFFFF);
	EXPECT_TRUE(Aarch64Meta::vaddr_is_valid(0x0000FFFFFFFFF000));
	EXPECT_TRUE(Aarch64Meta::vaddr_is_valid(0xFFFF000000000000));
	EXPECT_FALSE(Aarch64Meta::vaddr_is_valid(0x0001000000000000));
	EXPECT_FALSE(Aarch64Meta::vaddr_is_valid(0xFFFE000000000000));
	EXPECT_EQ(Aarch64Meta::canonicalize(0x0000800000000000), 0x0000800000000000);
	EXPECT_FALSE(Aarch64Meta::paddr_is_valid(0x1000000000000));
	// device, normal write-back, normal non-cacheable
	EXPECT_EQ(AARCH64_MAIR, 0x44FF00);
}

TEST(meta, riscv_widths) {
	EXPECT_EQ(Sv39Meta::LEVELS, 3);
	EXPECT_EQ(Sv48Meta::LEVELS, 4);
	EXPECT_EQ(Sv39Meta::PA_MAX_ADDR, 0xFFFFFFFFFFFFFF);

	EXPECT_TRUE(Sv39Meta::vaddr_is_valid(0x3FFFFFF000));
	EXPECT_FALSE(Sv39Meta::vaddr_is_valid(0x4000000000));
	EXPECT_TRUE(Sv39Meta::vaddr_is_valid(0xFFFFFFC000000000));
	EXPECT_EQ(Sv39Meta::canonicalize(0x4000000000), 0xFFFFFFC000000000);

	EXPECT_TRUE(Sv48Meta::vaddr_is_valid(0x00007FFFFFFFF000));
	EXPECT_FALSE(Sv48Meta::vaddr_is_valid(0x0000800000000000));
}

TEST(meta, page_sizes) {
	EXPECT_EQ(page_size_bytes(PageSize::Size2M), 0x200000);
	EXPECT_FALSE(is_huge(PageSize::Size4K));
	EXPECT_TRUE(is_huge(PageSize::Size1G));
	EXPECT_TRUE(is_aligned(0x40000000, PageSize::Size1G));
	EXPECT_FALSE(is_aligned(0x40001000, PageSize::Size2M));
	EXPECT_EQ(align_down(0x40201234, PageSize::Size2M), 0x40200000);
	EXPECT_EQ(to_str(PagingError::MappedToHugePage), "mapped to huge page");
	EXPECT_EQ(to_str(PageSize::Size1G), "1G");
}
