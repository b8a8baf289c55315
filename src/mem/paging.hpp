#pragma once
#include "types.hpp"
#include "expected.hpp"
#include "string_view.hpp"
#include "utils/flags_enum.hpp"

namespace mmukit {
	constexpr usize PAGE_SIZE = 0x1000;
	constexpr usize PAGE_SHIFT = 12;

	// Architecture neutral mapping attributes, each encoding translates them to its own bits.
	// Device and Uncached are exclusive, Device wins when both are given.
	enum class PageFlags : u32 {
		None,
		Read = 1 << 0,
		Write = 1 << 1,
		Execute = 1 << 2,
		User = 1 << 3,
		Device = 1 << 4,
		Uncached = 1 << 5
	};

	FLAGS_ENUM(PageFlags);

	enum class PageSize : u64 {
		Size4K = 0x1000,
		Size2M = 0x200000,
		Size1G = 0x40000000
	};

	constexpr u64 page_size_bytes(PageSize size) {
		return static_cast<u64>(size);
	}

	constexpr bool is_huge(PageSize size) {
		return size != PageSize::Size4K;
	}

	// number of table levels a leaf of this size sits above the last level
	constexpr usize huge_depth(PageSize size) {
		switch (size) {
			case PageSize::Size4K:
				return 0;
			case PageSize::Size2M:
				return 1;
			case PageSize::Size1G:
				return 2;
		}
		kstd::unreachable();
	}

	constexpr bool is_aligned(u64 addr, PageSize size) {
		return !(addr & (page_size_bytes(size) - 1));
	}

	constexpr u64 align_down(u64 addr, PageSize size) {
		return addr & ~(page_size_bytes(size) - 1);
	}

	enum class PagingError {
		NoMemory,
		NotAligned,
		NotMapped,
		AlreadyMapped,
		MappedToHugePage
	};

	template<typename T>
	using PagingResult = kstd::expected<T, PagingError>;

	constexpr kstd::string_view to_str(PagingError error) {
		switch (error) {
			case PagingError::NoMemory:
				return "no memory";
			case PagingError::NotAligned:
				return "not aligned";
			case PagingError::NotMapped:
				return "not mapped";
			case PagingError::AlreadyMapped:
				return "already mapped";
			case PagingError::MappedToHugePage:
				return "mapped to huge page";
		}
		kstd::unreachable();
	}

	constexpr kstd::string_view to_str(PageSize size) {
		switch (size) {
			case PageSize::Size4K:
				return "4K";
			case PageSize::Size2M:
				return "2M";
			case PageSize::Size1G:
				return "1G";
		}
		kstd::unreachable();
	}
}
