#pragma once
#include "types.hpp"
#include "concepts.hpp"
#include "cstring.hpp"
#include "optional.hpp"
#include "utility.hpp"
#include "vector.hpp"
#include "stdio.hpp"
#include "mem/paging.hpp"

namespace mmukit {
	template<typename M>
	concept PagingMetaData = requires(u64 addr) {
		requires M::LEVELS >= 2 && M::LEVELS <= 5;
		// 512 entry tables with a 4K base page
		requires PAGE_SHIFT + 9 * M::LEVELS == M::VA_MAX_BITS;
		{ M::paddr_is_valid(addr) } -> kstd::same_as<bool>;
		{ M::vaddr_is_valid(addr) } -> kstd::same_as<bool>;
		{ M::canonicalize(addr) } -> kstd::same_as<u64>;
	};

	template<typename P>
	concept PageTableEntry = sizeof(P) == sizeof(u64) && kstd::is_trivially_copyable_v<P> &&
		requires(P pte, const P& const_pte, u64 addr, PageFlags flags, bool huge) {
		{ P::new_page(addr, flags, huge) } -> kstd::same_as<P>;
		{ P::new_table(addr) } -> kstd::same_as<P>;
		{ const_pte.paddr() } -> kstd::same_as<u64>;
		{ const_pte.flags() } -> kstd::same_as<PageFlags>;
		{ const_pte.is_unused() } -> kstd::same_as<bool>;
		{ const_pte.is_present() } -> kstd::same_as<bool>;
		{ const_pte.is_huge() } -> kstd::same_as<bool>;
		pte.set_paddr(addr);
		pte.set_flags(flags, huge);
		pte.clear();
	};

	// alloc_frame returns a zeroed 4K frame, phys_to_virt an address through which it is accessible.
	template<typename P>
	concept PhysProvider = requires(P provider, usize phys) {
		{ provider.alloc_frame() } -> kstd::same_as<kstd::optional<usize>>;
		provider.dealloc_frame(phys);
		{ provider.phys_to_virt(phys) } -> kstd::same_as<usize>;
	};

	struct Mapping {
		u64 phys;
		PageFlags flags;
		PageSize size;
	};

	/// Multi-level page table owning its root and every intermediate table it allocates.
	/// Leaf targets belong to the caller and are never freed.
	/// Not synchronized, the caller serializes access and invalidates the tlb.
	template<PagingMetaData Meta, PageTableEntry Pte, PhysProvider Provider>
	class PageTable {
	public:
		static constexpr usize ENTRIES = PAGE_SIZE / sizeof(Pte);

		static PagingResult<PageTable> create(Provider provider) {
			auto root = provider.alloc_frame();
			if (!root) {
				return fail(PagingError::NoMemory);
			}
			memset(reinterpret_cast<void*>(provider.phys_to_virt(*root)), 0, PAGE_SIZE);
			return PageTable {std::move(provider), *root};
		}

		PageTable(PageTable&& other)
			: provider {std::move(other.provider)}, root {other.root},
			table_frames {std::move(other.table_frames)}, owns_root {other.owns_root} {
			memcpy(shared_roots, other.shared_roots, sizeof(shared_roots));
			memset(other.shared_roots, 0, sizeof(other.shared_roots));
			other.root = 0;
			other.owns_root = false;
		}

		PageTable& operator=(PageTable&& other) {
			if (this == &other) {
				return *this;
			}
			release();
			provider = std::move(other.provider);
			root = other.root;
			table_frames = std::move(other.table_frames);
			owns_root = other.owns_root;
			memcpy(shared_roots, other.shared_roots, sizeof(shared_roots));
			memset(other.shared_roots, 0, sizeof(other.shared_roots));
			other.root = 0;
			other.owns_root = false;
			return *this;
		}

		PageTable(const PageTable&) = delete;
		PageTable& operator=(const PageTable&) = delete;

		~PageTable() {
			release();
		}

		static constexpr bool supports(PageSize size) {
			return huge_depth(size) < Meta::LEVELS;
		}

		PagingResult<void> map(u64 virt, u64 phys, PageSize size, PageFlags flags) {
			if (!supports(size) || !is_aligned(virt, size) || !is_aligned(phys, size) ||
				!Meta::vaddr_is_valid(virt) || !Meta::paddr_is_valid(phys)) {
				return fail(PagingError::NotAligned);
			}
			// tables below a shared entry belong to the table it was copied from
			if (is_shared(virt)) {
				return fail(PagingError::AlreadyMapped);
			}

			auto target = leaf_level(size);
			auto* table = table_at(root);
			for (usize level = 0; level < target; ++level) {
				auto& entry = table[index_at(virt, level)];
				if (entry.is_unused()) {
					auto frame = alloc_table();
					if (!frame) {
						return fail(PagingError::NoMemory);
					}
					entry = Pte::new_table(*frame);
				}
				else if (is_leaf(entry, level)) {
					return fail(PagingError::MappedToHugePage);
				}
				table = table_at(entry.paddr());
			}

			auto& entry = table[index_at(virt, target)];
			if (!entry.is_unused()) {
				return fail(PagingError::AlreadyMapped);
			}
			entry = Pte::new_page(phys, flags, is_huge(size));
			return {};
		}

		/// Maps [virt, virt + size) to [phys, phys + size), using the largest page that fits at each step
		/// (only 4K pages if allow_huge is false). Stops at the first failure, pages mapped before it stay mapped.
		PagingResult<void> map_region(u64 virt, u64 phys, u64 size, PageFlags flags, bool allow_huge = true) {
			if (!is_aligned(virt, PageSize::Size4K) || !is_aligned(phys, PageSize::Size4K) ||
				!is_aligned(size, PageSize::Size4K) || wraps(virt, size) || wraps(phys, size)) {
				return fail(PagingError::NotAligned);
			}

			for (u64 offset = 0; offset < size;) {
				auto page_size = PageSize::Size4K;
				if (allow_huge) {
					page_size = largest_fit(virt + offset, phys + offset, size - offset);
				}

				auto status = map(virt + offset, phys + offset, page_size, flags);
				if (!status) {
					return status;
				}
				offset += page_size_bytes(page_size);
			}
			return {};
		}

		PagingResult<kstd::pair<u64, PageSize>> unmap(u64 virt) {
			auto slot = find_owned_mapping(virt);
			if (!slot) {
				return slot.error();
			}

			auto phys = slot->entry->paddr();
			slot->entry->clear();
			return kstd::pair<u64, PageSize> {phys, slot->size};
		}

		/// Unmaps every page in [virt, virt + size), stopping at the first failure.
		/// A huge page reaching outside of the range is not split and fails with MappedToHugePage.
		PagingResult<void> unmap_region(u64 virt, u64 size) {
			if (!is_aligned(virt, PageSize::Size4K) || !is_aligned(size, PageSize::Size4K) || wraps(virt, size)) {
				return fail(PagingError::NotAligned);
			}

			for (u64 offset = 0; offset < size;) {
				auto slot = find_region_mapping(virt + offset, size - offset);
				if (!slot) {
					return slot.error();
				}
				slot->entry->clear();
				offset += page_size_bytes(slot->size);
			}
			return {};
		}

		PagingResult<Mapping> query(u64 virt) {
			auto slot = find_mapping(virt);
			if (!slot) {
				return slot.error();
			}
			return Mapping {slot->entry->paddr(), slot->entry->flags(), slot->size};
		}

		PagingResult<PageSize> protect(u64 virt, PageFlags flags) {
			auto slot = find_owned_mapping(virt);
			if (!slot) {
				return slot.error();
			}
			slot->entry->set_flags(flags, is_huge(slot->size));
			return slot->size;
		}

		PagingResult<void> protect_region(u64 virt, u64 size, PageFlags flags) {
			if (!is_aligned(virt, PageSize::Size4K) || !is_aligned(size, PageSize::Size4K) || wraps(virt, size)) {
				return fail(PagingError::NotAligned);
			}

			for (u64 offset = 0; offset < size;) {
				auto slot = find_region_mapping(virt + offset, size - offset);
				if (!slot) {
					return slot.error();
				}
				slot->entry->set_flags(flags, is_huge(slot->size));
				offset += page_size_bytes(slot->size);
			}
			return {};
		}

		/// Translates any address inside a mapping, including ones inside of huge pages.
		PagingResult<u64> translate(u64 virt) {
			auto slot = find_leaf(virt);
			if (!slot) {
				return slot.error();
			}
			return slot->entry->paddr() + (virt & (page_size_bytes(slot->size) - 1));
		}

		/// Calls fn(virt, mapping) for every leaf in ascending table order,
		/// virtual addresses are reported in their canonical form.
		template<typename F>
		void for_each_mapping(F fn) {
			visit(root, 0, 0, fn);
		}

		/// Shares the top level entries covering [virt, virt + size) with other, eg. a kernel half.
		/// The shared tables stay owned by other, which has to outlive this table.
		/// Shared entries are read only through this table, map/unmap/protect below them
		/// fail with AlreadyMapped.
		PagingResult<void> copy_from(PageTable& other, u64 virt, u64 size) {
			if (!size || !is_aligned(virt, PageSize::Size4K) || !is_aligned(size, PageSize::Size4K) ||
				wraps(virt, size) || !Meta::vaddr_is_valid(virt) || !Meta::vaddr_is_valid(virt + size - 1)) {
				return fail(PagingError::NotAligned);
			}

			auto first = index_at(virt, 0);
			auto last = index_at(virt + size - 1, 0);
			if (last < first) {
				return fail(PagingError::NotAligned);
			}
			auto* table = table_at(root);
			auto* other_table = other.table_at(other.root);

			for (usize i = first; i <= last; ++i) {
				if (!table[i].is_unused()) {
					return fail(PagingError::AlreadyMapped);
				}
			}
			memcpy(table + first, other_table + first, (last - first + 1) * sizeof(Pte));
			for (usize i = first; i <= last; ++i) {
				shared_roots[i / 64] |= u64 {1} << (i % 64);
			}
			return {};
		}

		void dump() {
			println("page table at 0x", Fmt::Hex, root, Fmt::Reset, " (", table_frames.size(), " tables)");
			for_each_mapping([](u64 virt, const Mapping& mapping) {
				println(
					Fmt::Hex, zero_pad(16), virt, " -> ", zero_pad(16), mapping.phys, Fmt::Reset,
					" ", to_str(mapping.size), " ",
					(mapping.flags & PageFlags::Read) ? "r" : "-",
					(mapping.flags & PageFlags::Write) ? "w" : "-",
					(mapping.flags & PageFlags::Execute) ? "x" : "-",
					(mapping.flags & PageFlags::User) ? "u" : "-",
					(mapping.flags & PageFlags::Device) ? " device" : "",
					(mapping.flags & PageFlags::Uncached) ? " uncached" : "");
			});
		}

		[[nodiscard]] u64 root_paddr() const {
			return root;
		}

		// intermediate tables, the root not included
		[[nodiscard]] usize table_frame_count() const {
			return table_frames.size();
		}

	private:
		PageTable(Provider provider, u64 root) : provider {std::move(provider)}, root {root}, owns_root {true} {}

		struct Slot {
			Pte* entry;
			PageSize size;
		};

		static constexpr usize index_at(u64 virt, usize level) {
			return virt >> (PAGE_SHIFT + 9 * (Meta::LEVELS - 1 - level)) & (ENTRIES - 1);
		}

		static constexpr usize leaf_level(PageSize size) {
			return Meta::LEVELS - 1 - huge_depth(size);
		}

		static constexpr PageSize size_at(usize level) {
			switch (Meta::LEVELS - 1 - level) {
				case 0:
					return PageSize::Size4K;
				case 1:
					return PageSize::Size2M;
				default:
					return PageSize::Size1G;
			}
		}

		// levels that can hold huge leaves
		static constexpr bool is_huge_level(usize level) {
			auto depth = Meta::LEVELS - 1 - level;
			return depth == 1 || depth == 2;
		}

		static constexpr bool is_leaf(const Pte& entry, usize level) {
			return level == Meta::LEVELS - 1 || (is_huge_level(level) && entry.is_huge());
		}

		static constexpr PageSize largest_fit(u64 virt, u64 phys, u64 remaining) {
			constexpr PageSize HUGE_SIZES[] {PageSize::Size1G, PageSize::Size2M};
			for (auto size : HUGE_SIZES) {
				if (supports(size) && is_aligned(virt, size) && is_aligned(phys, size) &&
					remaining >= page_size_bytes(size)) {
					return size;
				}
			}
			return PageSize::Size4K;
		}

		// [start, start + size) runs past the end of the address space
		static constexpr bool wraps(u64 start, u64 size) {
			return size && start + (size - 1) < start;
		}

		[[nodiscard]] bool is_shared(u64 virt) const {
			auto index = index_at(virt, 0);
			return shared_roots[index / 64] & u64 {1} << (index % 64);
		}

		static PagingError fail(PagingError error) {
#ifdef CONFIG_PAGING_TRACE
			println("[paging]: ", to_str(error));
#endif
			return error;
		}

		Pte* table_at(u64 phys) {
			return reinterpret_cast<Pte*>(provider.phys_to_virt(phys));
		}

		kstd::optional<u64> alloc_table() {
			// reserve first so that a full list never leaks the frame
			if (!table_frames.try_reserve(1)) {
				return {};
			}
			auto frame = provider.alloc_frame();
			if (!frame) {
				return {};
			}
			memset(reinterpret_cast<void*>(provider.phys_to_virt(*frame)), 0, PAGE_SIZE);
			table_frames.push(u64 {*frame});

#ifdef CONFIG_PAGING_TRACE
			println("[paging]: new table 0x", Fmt::Hex, *frame, Fmt::Reset);
#endif
			return u64 {*frame};
		}

		// first leaf on the path of virt, huge or not
		PagingResult<Slot> find_leaf(u64 virt) {
			if (!Meta::vaddr_is_valid(virt)) {
				return PagingError::NotMapped;
			}

			auto* table = table_at(root);
			for (usize level = 0; level < Meta::LEVELS; ++level) {
				auto& entry = table[index_at(virt, level)];
				if (entry.is_unused()) {
					return PagingError::NotMapped;
				}
				if (is_leaf(entry, level)) {
					return Slot {&entry, size_at(level)};
				}
				table = table_at(entry.paddr());
			}
			kstd::unreachable();
		}

		// the leaf mapping the page at virt, ignoring the offset inside of a 4K page
		PagingResult<Slot> find_mapping(u64 virt) {
			auto slot = find_leaf(virt);
			if (slot && !is_aligned(align_down(virt, PageSize::Size4K), slot->size)) {
				return fail(PagingError::MappedToHugePage);
			}
			return slot;
		}

		// like find_mapping, for leaves this table may modify
		PagingResult<Slot> find_owned_mapping(u64 virt) {
			auto slot = find_mapping(virt);
			if (slot && is_shared(virt)) {
				return fail(PagingError::AlreadyMapped);
			}
			return slot;
		}

		PagingResult<Slot> find_region_mapping(u64 virt, u64 remaining) {
			auto slot = find_owned_mapping(virt);
			if (slot && page_size_bytes(slot->size) > remaining) {
				return fail(PagingError::MappedToHugePage);
			}
			return slot;
		}

		template<typename F>
		void visit(u64 table_phys, usize level, u64 base, F& fn) {
			auto* table = table_at(table_phys);
			for (usize i = 0; i < ENTRIES; ++i) {
				auto& entry = table[i];
				if (entry.is_unused()) {
					continue;
				}

				u64 virt = base | u64 {i} << (PAGE_SHIFT + 9 * (Meta::LEVELS - 1 - level));
				if (is_leaf(entry, level)) {
					fn(Meta::canonicalize(virt), Mapping {entry.paddr(), entry.flags(), size_at(level)});
				}
				else {
					visit(entry.paddr(), level + 1, virt, fn);
				}
			}
		}

		void release() {
			for (auto frame : table_frames) {
				provider.dealloc_frame(frame);
			}
			table_frames.clear();
			memset(shared_roots, 0, sizeof(shared_roots));
			if (owns_root) {
				provider.dealloc_frame(root);
				owns_root = false;
			}
		}

		Provider provider;
		u64 root {};
		kstd::vector<u64> table_frames {};
		// root entries copied from another table, never followed for modification
		u64 shared_roots[ENTRIES / 64] {};
		bool owns_root {};
	};
}
