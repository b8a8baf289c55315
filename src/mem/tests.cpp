#include "mem/page_table.hpp"
#include "mem/sim_phys.hpp"
#include "arch/x86/pte.hpp"
#include "arch/aarch64/pte.hpp"
#include "arch/riscv/pte.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace mmukit;

namespace {
	template<typename M, typename P>
	struct Arch {
		using Meta = M;
		using Pte = P;
	};

	constexpr auto RW = PageFlags::Read | PageFlags::Write;
	constexpr u64 GIB = 0x40000000;
	constexpr u64 MIB2 = 0x200000;

	struct Leaf {
		u64 virt;
		Mapping mapping;
	};
}

template<typename A>
class PageTableTest : public ::testing::Test {
protected:
	using Meta = typename A::Meta;
	using Table = PageTable<typename A::Meta, typename A::Pte, SimPhys::Handle>;

	void SetUp() override {
		auto created = Table::create(phys.handle());
		ASSERT_TRUE(created.has_value());
		table = std::move(created).value();
	}

	std::vector<Leaf> leaves() {
		std::vector<Leaf> result;
		table->for_each_mapping([&](u64 virt, const Mapping& mapping) {
			result.push_back({virt, mapping});
		});
		return result;
	}

	SimPhys phys {};
	kstd::optional<Table> table {};
};

using Archs = ::testing::Types<
	Arch<X86Meta, X86Pte>,
	Arch<Aarch64Meta, Aarch64Pte>,
	Arch<Sv39Meta, RiscvPte>,
	Arch<Sv48Meta, RiscvPte>>;
TYPED_TEST_SUITE(PageTableTest, Archs);

TYPED_TEST(PageTableTest, map_query_unmap) {
	auto& table = *this->table;
	ASSERT_TRUE(table.map(0x1000, 0x80000, PageSize::Size4K, RW).has_value());

	auto mapping = table.query(0x1000);
	ASSERT_TRUE(mapping.has_value());
	EXPECT_EQ(mapping->phys, 0x80000);
	EXPECT_EQ(mapping->flags, RW);
	EXPECT_EQ(mapping->size, PageSize::Size4K);

	auto unmapped = table.unmap(0x1000);
	ASSERT_TRUE(unmapped.has_value());
	EXPECT_EQ(unmapped->first, 0x80000);
	EXPECT_EQ(unmapped->second, PageSize::Size4K);

	auto gone = table.query(0x1000);
	ASSERT_FALSE(gone.has_value());
	EXPECT_EQ(gone.error(), PagingError::NotMapped);
}

TYPED_TEST(PageTableTest, query_returns_what_was_mapped) {
	auto& table = *this->table;
	const PageFlags flag_sets[] {
		PageFlags::Read,
		RW,
		PageFlags::Read | PageFlags::Execute | PageFlags::User,
		RW | PageFlags::Device,
		PageFlags::Read | PageFlags::Uncached
	};

	u64 virt = 4 * GIB;
	for (auto size : {PageSize::Size4K, PageSize::Size2M, PageSize::Size1G}) {
		for (auto flags : flag_sets) {
			u64 phys = virt / 2;
			ASSERT_TRUE(table.map(virt, phys, size, flags).has_value());

			auto mapping = table.query(virt);
			ASSERT_TRUE(mapping.has_value());
			EXPECT_EQ(mapping->phys, phys);
			EXPECT_EQ(mapping->flags, flags);
			EXPECT_EQ(mapping->size, size);
			virt += 2 * GIB;
		}
	}
}

TYPED_TEST(PageTableTest, query_ignores_page_offset) {
	auto& table = *this->table;
	ASSERT_TRUE(table.map(0x5000, 0x9000, PageSize::Size4K, RW).has_value());
	auto mapping = table.query(0x5ABC);
	ASSERT_TRUE(mapping.has_value());
	EXPECT_EQ(mapping->phys, 0x9000);
}

TYPED_TEST(PageTableTest, unmap_twice_is_not_mapped) {
	auto& table = *this->table;
	ASSERT_TRUE(table.map(MIB2, 4 * MIB2, PageSize::Size2M, RW).has_value());
	ASSERT_TRUE(table.unmap(MIB2).has_value());

	auto again = table.unmap(MIB2);
	ASSERT_FALSE(again.has_value());
	EXPECT_EQ(again.error(), PagingError::NotMapped);
}

TYPED_TEST(PageTableTest, no_double_mapping) {
	auto& table = *this->table;
	ASSERT_TRUE(table.map(0x3000, 0x7000, PageSize::Size4K, PageFlags::Read).has_value());

	auto second = table.map(0x3000, 0x8000, PageSize::Size4K, RW);
	ASSERT_FALSE(second.has_value());
	EXPECT_EQ(second.error(), PagingError::AlreadyMapped);

	auto mapping = table.query(0x3000);
	ASSERT_TRUE(mapping.has_value());
	EXPECT_EQ(mapping->phys, 0x7000);
	EXPECT_EQ(mapping->flags, PageFlags::Read);
}

TYPED_TEST(PageTableTest, huge_page_over_small_pages_is_already_mapped) {
	auto& table = *this->table;
	ASSERT_TRUE(table.map(MIB2 + 0x1000, 0x1000, PageSize::Size4K, RW).has_value());

	auto huge = table.map(MIB2, MIB2, PageSize::Size2M, RW);
	ASSERT_FALSE(huge.has_value());
	EXPECT_EQ(huge.error(), PagingError::AlreadyMapped);
}

TYPED_TEST(PageTableTest, alignment_is_checked_before_allocating) {
	using Meta = typename TestFixture::Meta;
	auto& table = *this->table;
	auto allocated = this->phys.allocated();

	auto bad_virt = table.map(MIB2 + 0x1000, 2 * MIB2, PageSize::Size2M, RW);
	ASSERT_FALSE(bad_virt.has_value());
	EXPECT_EQ(bad_virt.error(), PagingError::NotAligned);

	auto bad_phys = table.map(MIB2, MIB2 + 0x1000, PageSize::Size2M, RW);
	ASSERT_FALSE(bad_phys.has_value());
	EXPECT_EQ(bad_phys.error(), PagingError::NotAligned);

	auto bad_canonical = table.map(u64 {1} << Meta::VA_MAX_BITS, 0, PageSize::Size2M, RW);
	ASSERT_FALSE(bad_canonical.has_value());
	EXPECT_EQ(bad_canonical.error(), PagingError::NotAligned);

	auto bad_paddr = table.map(0, Meta::PA_MAX_ADDR + 1, PageSize::Size4K, RW);
	ASSERT_FALSE(bad_paddr.has_value());
	EXPECT_EQ(bad_paddr.error(), PagingError::NotAligned);

	EXPECT_EQ(this->phys.allocated(), allocated);
	EXPECT_EQ(table.table_frame_count(), 0);
}

TYPED_TEST(PageTableTest, interior_of_huge_page) {
	auto& table = *this->table;
	ASSERT_TRUE(table.map(MIB2, 8 * MIB2, PageSize::Size2M, RW).has_value());

	auto query = table.query(MIB2 + 0x1000);
	ASSERT_FALSE(query.has_value());
	EXPECT_EQ(query.error(), PagingError::MappedToHugePage);

	auto unmap = table.unmap(MIB2 + 0x1000);
	ASSERT_FALSE(unmap.has_value());
	EXPECT_EQ(unmap.error(), PagingError::MappedToHugePage);

	auto protect = table.protect(MIB2 + 0x1000, PageFlags::Read);
	ASSERT_FALSE(protect.has_value());
	EXPECT_EQ(protect.error(), PagingError::MappedToHugePage);

	auto small = table.map(MIB2 + 0x1000, 0x1000, PageSize::Size4K, RW);
	ASSERT_FALSE(small.has_value());
	EXPECT_EQ(small.error(), PagingError::MappedToHugePage);

	auto mapping = table.query(MIB2);
	ASSERT_TRUE(mapping.has_value());
	EXPECT_EQ(mapping->size, PageSize::Size2M);
	EXPECT_EQ(mapping->phys, 8 * MIB2);
}

TYPED_TEST(PageTableTest, translate_inside_pages) {
	auto& table = *this->table;
	ASSERT_TRUE(table.map(0x1000, 0x80000, PageSize::Size4K, RW).has_value());
	ASSERT_TRUE(table.map(MIB2, 8 * MIB2, PageSize::Size2M, RW).has_value());

	auto small = table.translate(0x1234);
	ASSERT_TRUE(small.has_value());
	EXPECT_EQ(small.value(), 0x80234);

	auto huge = table.translate(MIB2 + 0x12345);
	ASSERT_TRUE(huge.has_value());
	EXPECT_EQ(huge.value(), 8 * MIB2 + 0x12345);

	auto missing = table.translate(0x3000);
	ASSERT_FALSE(missing.has_value());
	EXPECT_EQ(missing.error(), PagingError::NotMapped);
}

TYPED_TEST(PageTableTest, protect_keeps_address_and_size) {
	auto& table = *this->table;
	ASSERT_TRUE(table.map(GIB, 2 * GIB, PageSize::Size1G, RW).has_value());

	auto size = table.protect(GIB, PageFlags::Read | PageFlags::Execute);
	ASSERT_TRUE(size.has_value());
	EXPECT_EQ(size.value(), PageSize::Size1G);

	auto mapping = table.query(GIB);
	ASSERT_TRUE(mapping.has_value());
	EXPECT_EQ(mapping->phys, 2 * GIB);
	EXPECT_EQ(mapping->flags, PageFlags::Read | PageFlags::Execute);
	EXPECT_EQ(mapping->size, PageSize::Size1G);

	auto missing = table.protect(4 * GIB, PageFlags::Read);
	ASSERT_FALSE(missing.has_value());
	EXPECT_EQ(missing.error(), PagingError::NotMapped);
}

TYPED_TEST(PageTableTest, teardown_releases_tables_only) {
	using Meta = typename TestFixture::Meta;
	auto& table = *this->table;
	ASSERT_TRUE(table.map(0x1000, 0x80000, PageSize::Size4K, RW).has_value());
	ASSERT_TRUE(table.map(0x2000, 0x81000, PageSize::Size4K, RW).has_value());
	ASSERT_TRUE(table.map(GIB, 0x82000, PageSize::Size4K, RW).has_value());
	ASSERT_TRUE(table.map(GIB + MIB2, MIB2, PageSize::Size2M, RW).has_value());

	// one chain below the root for the first page, a new 1G slot for the third
	usize tables = Meta::LEVELS - 1 + 2;
	EXPECT_EQ(table.table_frame_count(), tables);
	EXPECT_EQ(this->phys.allocated(), tables + 1);

	this->table.reset();
	EXPECT_EQ(this->phys.released(), tables + 1);
	EXPECT_EQ(this->phys.live(), 0);
	EXPECT_EQ(this->phys.foreign_releases(), 0);
}

TYPED_TEST(PageTableTest, map_region_prefers_large_pages) {
	auto& table = *this->table;
	ASSERT_TRUE(table.map_region(2 * GIB, 4 * GIB, 2 * GIB, RW).has_value());

	auto leaves = this->leaves();
	ASSERT_EQ(leaves.size(), 2);
	EXPECT_EQ(leaves[0].virt, 2 * GIB);
	EXPECT_EQ(leaves[0].mapping.size, PageSize::Size1G);
	EXPECT_EQ(leaves[1].virt, 3 * GIB);
	EXPECT_EQ(leaves[1].mapping.phys, 5 * GIB);
}

TYPED_TEST(PageTableTest, map_region_mixes_sizes) {
	auto& table = *this->table;
	ASSERT_TRUE(table.map_region(MIB2 - 0x1000, MIB2 - 0x1000, MIB2 + 0x2000, RW).has_value());

	auto leaves = this->leaves();
	ASSERT_EQ(leaves.size(), 3);
	EXPECT_EQ(leaves[0].mapping.size, PageSize::Size4K);
	EXPECT_EQ(leaves[1].virt, MIB2);
	EXPECT_EQ(leaves[1].mapping.size, PageSize::Size2M);
	EXPECT_EQ(leaves[2].virt, 2 * MIB2);
	EXPECT_EQ(leaves[2].mapping.size, PageSize::Size4K);
}

TYPED_TEST(PageTableTest, map_region_without_huge_pages) {
	auto& table = *this->table;
	ASSERT_TRUE(table.map_region(MIB2, MIB2, MIB2, RW, false).has_value());
	EXPECT_EQ(this->leaves().size(), MIB2 / PAGE_SIZE);

	auto unaligned = table.map_region(0x1800, 0x1000, 0x1000, RW);
	ASSERT_FALSE(unaligned.has_value());
	EXPECT_EQ(unaligned.error(), PagingError::NotAligned);
}

TYPED_TEST(PageTableTest, map_region_stops_at_first_failure) {
	auto& table = *this->table;
	ASSERT_TRUE(table.map(0x3000, 0x100000, PageSize::Size4K, PageFlags::Read).has_value());

	auto status = table.map_region(0, 0, 0x5000, RW);
	ASSERT_FALSE(status.has_value());
	EXPECT_EQ(status.error(), PagingError::AlreadyMapped);

	EXPECT_TRUE(table.query(0x0).has_value());
	EXPECT_TRUE(table.query(0x2000).has_value());
	EXPECT_EQ(table.query(0x3000)->phys, 0x100000);
	EXPECT_EQ(table.query(0x4000).error(), PagingError::NotMapped);
}

TYPED_TEST(PageTableTest, unmap_region) {
	auto& table = *this->table;
	ASSERT_TRUE(table.map_region(MIB2, MIB2, MIB2 + 0x1000, RW).has_value());

	// the huge page reaches past the end of the range
	auto partial = table.unmap_region(MIB2, 0x1000);
	ASSERT_FALSE(partial.has_value());
	EXPECT_EQ(partial.error(), PagingError::MappedToHugePage);
	EXPECT_TRUE(table.query(MIB2).has_value());

	ASSERT_TRUE(table.unmap_region(MIB2, MIB2 + 0x1000).has_value());
	EXPECT_TRUE(this->leaves().empty());

	auto hole = table.unmap_region(MIB2, 0x1000);
	ASSERT_FALSE(hole.has_value());
	EXPECT_EQ(hole.error(), PagingError::NotMapped);
}

TYPED_TEST(PageTableTest, protect_region) {
	auto& table = *this->table;
	ASSERT_TRUE(table.map_region(0, 0, MIB2 + 0x3000, RW).has_value());
	ASSERT_TRUE(table.protect_region(0, MIB2 + 0x3000, PageFlags::Read | PageFlags::User).has_value());

	for (const auto& leaf : this->leaves()) {
		EXPECT_EQ(leaf.mapping.flags, PageFlags::Read | PageFlags::User);
	}

	auto missing = table.protect_region(MIB2 + 0x3000, 0x1000, PageFlags::Read);
	ASSERT_FALSE(missing.has_value());
	EXPECT_EQ(missing.error(), PagingError::NotMapped);
}

TYPED_TEST(PageTableTest, running_out_of_memory) {
	auto& table = *this->table;
	auto before = this->phys.allocated();
	this->phys.fail_after(1);

	auto status = table.map(0x1000, 0x1000, PageSize::Size4K, RW);
	ASSERT_FALSE(status.has_value());
	EXPECT_EQ(status.error(), PagingError::NoMemory);
	// the table created before the failure stays linked and tracked
	EXPECT_EQ(table.table_frame_count(), 1);
	EXPECT_EQ(this->phys.allocated(), before + 1);
	EXPECT_EQ(table.query(0x1000).error(), PagingError::NotMapped);

	this->phys.fail_after(16);
	ASSERT_TRUE(table.map(0x1000, 0x1000, PageSize::Size4K, RW).has_value());

	this->table.reset();
	EXPECT_EQ(this->phys.live(), 0);
}

TYPED_TEST(PageTableTest, create_without_memory) {
	SimPhys phys {};
	phys.fail_after(0);

	auto created = TestFixture::Table::create(phys.handle());
	ASSERT_FALSE(created.has_value());
	EXPECT_EQ(created.error(), PagingError::NoMemory);
	EXPECT_EQ(phys.allocated(), 0);
}

TYPED_TEST(PageTableTest, mappings_are_reported_canonical) {
	using Meta = typename TestFixture::Meta;
	auto& table = *this->table;
	u64 high = Meta::canonicalize(u64 {1} << (Meta::VA_MAX_BITS - 1));
	ASSERT_TRUE(table.map(high, 0x5000, PageSize::Size4K, PageFlags::Read).has_value());
	ASSERT_TRUE(table.map(0x1000, 0x6000, PageSize::Size4K, PageFlags::Read).has_value());

	auto leaves = this->leaves();
	ASSERT_EQ(leaves.size(), 2);
	EXPECT_EQ(leaves[0].virt, 0x1000);
	EXPECT_EQ(leaves[1].virt, high);
	EXPECT_EQ(leaves[1].mapping.phys, 0x5000);
}

TYPED_TEST(PageTableTest, copy_from_shares_tables) {
	using Meta = typename TestFixture::Meta;
	auto& kernel = *this->table;
	u64 high = Meta::canonicalize(u64 {1} << (Meta::VA_MAX_BITS - 1));
	ASSERT_TRUE(kernel.map(high, 0x5000, PageSize::Size4K, RW).has_value());
	auto kernel_frames = this->phys.live();

	{
		auto created = TestFixture::Table::create(this->phys.handle());
		ASSERT_TRUE(created.has_value());
		auto& user = created.value();

		u64 span = u64 {1} << (Meta::VA_MAX_BITS - 1);
		ASSERT_TRUE(user.copy_from(kernel, high, span).has_value());
		EXPECT_EQ(user.table_frame_count(), 0);

		auto mapping = user.query(high);
		ASSERT_TRUE(mapping.has_value());
		EXPECT_EQ(mapping->phys, 0x5000);

		auto again = user.copy_from(kernel, high, span);
		ASSERT_FALSE(again.has_value());
		EXPECT_EQ(again.error(), PagingError::AlreadyMapped);
	}

	// only the user root went away
	EXPECT_EQ(this->phys.live(), kernel_frames);
	EXPECT_TRUE(kernel.query(high).has_value());
}

TYPED_TEST(PageTableTest, copy_from_rejects_wrapping_range) {
	using Meta = typename TestFixture::Meta;
	auto& kernel = *this->table;
	u64 high = Meta::canonicalize(u64 {1} << (Meta::VA_MAX_BITS - 1));
	ASSERT_TRUE(kernel.map(high, 0x5000, PageSize::Size4K, RW).has_value());
	ASSERT_TRUE(kernel.map(0x1000, 0x6000, PageSize::Size4K, RW).has_value());

	auto created = TestFixture::Table::create(this->phys.handle());
	ASSERT_TRUE(created.has_value());
	auto& user = created.value();
	ASSERT_TRUE(user.map(0x2000, 0x7000, PageSize::Size4K, RW).has_value());

	// ends one page past the top of the address space, back at 0xFFF
	auto status = user.copy_from(kernel, high, 0 - high + 0x1000);
	ASSERT_FALSE(status.has_value());
	EXPECT_EQ(status.error(), PagingError::NotAligned);

	EXPECT_FALSE(user.query(high).has_value());
	EXPECT_FALSE(user.query(0x1000).has_value());
	EXPECT_EQ(user.query(0x2000)->phys, 0x7000);
	EXPECT_EQ(kernel.query(high)->phys, 0x5000);
	EXPECT_EQ(kernel.query(0x1000)->phys, 0x6000);
}

TYPED_TEST(PageTableTest, shared_entries_are_read_only) {
	using Meta = typename TestFixture::Meta;
	auto& kernel = *this->table;
	u64 high = Meta::canonicalize(u64 {1} << (Meta::VA_MAX_BITS - 1));
	ASSERT_TRUE(kernel.map(high, 0x5000, PageSize::Size4K, RW).has_value());
	auto kernel_tables = kernel.table_frame_count();

	{
		auto created = TestFixture::Table::create(this->phys.handle());
		ASSERT_TRUE(created.has_value());
		auto& user = created.value();
		ASSERT_TRUE(user.copy_from(kernel, high, PAGE_SIZE).has_value());
		auto allocated = this->phys.allocated();

		auto mapped = user.map(high + MIB2, 0x400000, PageSize::Size4K, RW);
		ASSERT_FALSE(mapped.has_value());
		EXPECT_EQ(mapped.error(), PagingError::AlreadyMapped);
		auto region = user.map_region(high + MIB2, 0x400000, 0x2000, RW);
		ASSERT_FALSE(region.has_value());
		EXPECT_EQ(region.error(), PagingError::AlreadyMapped);
		EXPECT_EQ(this->phys.allocated(), allocated);
		EXPECT_EQ(user.table_frame_count(), 0);

		EXPECT_EQ(user.unmap(high).error(), PagingError::AlreadyMapped);
		EXPECT_EQ(user.protect(high, PageFlags::Read).error(), PagingError::AlreadyMapped);
		EXPECT_EQ(user.unmap_region(high, PAGE_SIZE).error(), PagingError::AlreadyMapped);
		EXPECT_EQ(user.protect_region(high, PAGE_SIZE, PageFlags::Read).error(), PagingError::AlreadyMapped);

		// reads still go through the shared tables
		EXPECT_EQ(user.translate(high + 0x10).value(), 0x5010);
		std::vector<u64> seen;
		user.for_each_mapping([&](u64 virt, const Mapping&) {
			seen.push_back(virt);
		});
		ASSERT_EQ(seen.size(), 1);
		EXPECT_EQ(seen[0], high);

		// slots outside of the shared entries stay writable
		ASSERT_TRUE(user.map(0x1000, 0x6000, PageSize::Size4K, RW).has_value());
	}

	auto mapping = kernel.query(high);
	ASSERT_TRUE(mapping.has_value());
	EXPECT_EQ(mapping->phys, 0x5000);
	EXPECT_EQ(mapping->flags, RW);
	EXPECT_EQ(kernel.table_frame_count(), kernel_tables);
	EXPECT_FALSE(kernel.query(high + MIB2).has_value());
	EXPECT_TRUE(kernel.map(high + MIB2, 0x400000, PageSize::Size4K, RW).has_value());
	EXPECT_EQ(this->phys.foreign_releases(), 0);
}

TYPED_TEST(PageTableTest, moved_table_keeps_shared_entries_read_only) {
	using Meta = typename TestFixture::Meta;
	auto& kernel = *this->table;
	u64 high = Meta::canonicalize(u64 {1} << (Meta::VA_MAX_BITS - 1));
	ASSERT_TRUE(kernel.map(high, 0x5000, PageSize::Size4K, RW).has_value());

	auto created = TestFixture::Table::create(this->phys.handle());
	ASSERT_TRUE(created.has_value());
	ASSERT_TRUE(created.value().copy_from(kernel, high, PAGE_SIZE).has_value());

	typename TestFixture::Table user {std::move(created).value()};
	EXPECT_EQ(user.unmap(high).error(), PagingError::AlreadyMapped);
	EXPECT_EQ(user.map(high + MIB2, 0x400000, PageSize::Size4K, RW).error(), PagingError::AlreadyMapped);
}

TYPED_TEST(PageTableTest, regions_wrapping_the_address_space_are_rejected) {
	auto& table = *this->table;
	constexpr u64 TOP = 0xFFFFFFFFFFFFF000;
	auto allocated = this->phys.allocated();

	auto mapped = table.map_region(TOP, 0x1000, 0x2000, RW);
	ASSERT_FALSE(mapped.has_value());
	EXPECT_EQ(mapped.error(), PagingError::NotAligned);
	EXPECT_EQ(table.query(TOP).error(), PagingError::NotMapped);
	EXPECT_EQ(table.query(0).error(), PagingError::NotMapped);
	EXPECT_EQ(this->phys.allocated(), allocated);

	auto phys_wraps = table.map_region(0x1000, TOP, 0x2000, RW);
	ASSERT_FALSE(phys_wraps.has_value());
	EXPECT_EQ(phys_wraps.error(), PagingError::NotAligned);

	ASSERT_TRUE(table.map(0, 0x1000, PageSize::Size4K, RW).has_value());
	EXPECT_EQ(table.unmap_region(TOP, 0x2000).error(), PagingError::NotAligned);
	EXPECT_EQ(table.protect_region(TOP, 0x2000, PageFlags::Read).error(), PagingError::NotAligned);
	auto mapping = table.query(0);
	ASSERT_TRUE(mapping.has_value());
	EXPECT_EQ(mapping->flags, RW);
}

TYPED_TEST(PageTableTest, full_frame_list_leaks_nothing) {
	auto& table = *this->table;
	auto allocated = this->phys.allocated();

	ALLOCATOR.fail_after(0);
	auto status = table.map(0x1000, 0x80000, PageSize::Size4K, RW);
	ALLOCATOR.clear_limit();

	ASSERT_FALSE(status.has_value());
	EXPECT_EQ(status.error(), PagingError::NoMemory);
	EXPECT_EQ(this->phys.allocated(), allocated);
	EXPECT_EQ(table.table_frame_count(), 0);
	EXPECT_FALSE(table.query(0x1000).has_value());

	ASSERT_TRUE(table.map(0x1000, 0x80000, PageSize::Size4K, RW).has_value());
	EXPECT_EQ(table.table_frame_count(), this->phys.live() - 1);
}

TYPED_TEST(PageTableTest, move_transfers_ownership) {
	auto& table = *this->table;
	ASSERT_TRUE(table.map(0x1000, 0x80000, PageSize::Size4K, RW).has_value());
	auto root = table.root_paddr();
	auto live = this->phys.live();

	{
		typename TestFixture::Table moved {std::move(table)};
		EXPECT_EQ(moved.root_paddr(), root);
		EXPECT_TRUE(moved.query(0x1000).has_value());
	}
	EXPECT_EQ(this->phys.released(), live);

	this->table.reset();
	EXPECT_EQ(this->phys.released(), live);
	EXPECT_EQ(this->phys.foreign_releases(), 0);
}

namespace {
	struct StringSink : public LogSink {
		void write(kstd::string_view str) override {
			out.append(str.data(), str.size());
		}

		std::string out;
	};
}

TEST(page_table, aarch64_halves_share_root_slots) {
	SimPhys phys {};
	auto created = PageTable<Aarch64Meta, Aarch64Pte, SimPhys::Handle>::create(phys.handle());
	ASSERT_TRUE(created.has_value());
	auto& table = created.value();
	ASSERT_TRUE(table.map(0xFFFF000000001000, 0x5000, PageSize::Size4K, RW).has_value());

	auto low = table.query(0x1000);
	ASSERT_TRUE(low.has_value());
	EXPECT_EQ(low->phys, 0x5000);
	EXPECT_EQ(table.map(0x1000, 0x6000, PageSize::Size4K, RW).error(), PagingError::AlreadyMapped);

	std::vector<u64> seen;
	table.for_each_mapping([&](u64 virt, const Mapping&) {
		seen.push_back(virt);
	});
	ASSERT_EQ(seen.size(), 1);
	EXPECT_EQ(seen[0], 0x1000);

	// low half into the high half, the last root index lies below the first
	auto other = PageTable<Aarch64Meta, Aarch64Pte, SimPhys::Handle>::create(phys.handle());
	ASSERT_TRUE(other.has_value());
	auto copied = other.value().copy_from(table, 0x0000800000000000, 0xFFFF000000001000 - 0x0000800000000000);
	ASSERT_FALSE(copied.has_value());
	EXPECT_EQ(copied.error(), PagingError::NotAligned);
}

TEST(page_table, dump_lists_mappings) {
	SimPhys phys {};
	auto created = PageTable<X86Meta, X86Pte, SimPhys::Handle>::create(phys.handle());
	ASSERT_TRUE(created.has_value());
	auto& table = created.value();
	ASSERT_TRUE(table.map(0xFFFF800000200000, 0x400000, PageSize::Size2M, RW | PageFlags::Device).has_value());

	StringSink sink {};
	LOG.lock()->register_sink(&sink);
	sink.out.clear();
	table.dump();
	LOG.lock()->unregister_sink(&sink);

	EXPECT_NE(sink.out.find("FFFF800000200000 -> 0000000000400000 2M rw-- device"), std::string::npos) << sink.out;
}
