#pragma once
#include "types.hpp"
#include "optional.hpp"
#include "mem/paging.hpp"
#include <vector>

namespace mmukit {
	/// Physical memory simulated with host memory for the hosted build.
	/// Frames are handed out from a fixed window starting at BASE.
	class SimPhys {
	public:
		static constexpr usize BASE = 0x40000000;

		explicit SimPhys(usize frame_count = 1024);
		~SimPhys();

		SimPhys(const SimPhys&) = delete;
		SimPhys& operator=(const SimPhys&) = delete;

		kstd::optional<usize> alloc_frame();
		void dealloc_frame(usize phys);
		[[nodiscard]] usize phys_to_virt(usize phys) const;

		// every allocation after the next `count` ones fails
		void fail_after(usize count);

		[[nodiscard]] bool owns(usize phys) const;

		[[nodiscard]] usize allocated() const {
			return alloc_count;
		}
		[[nodiscard]] usize released() const {
			return release_count;
		}
		[[nodiscard]] usize live() const {
			return alloc_count - release_count;
		}
		// releases of frames that were never handed out, eg. leaf targets
		[[nodiscard]] usize foreign_releases() const {
			return foreign_count;
		}

		// the provider a page table stores by value
		struct Handle {
			SimPhys* phys;

			kstd::optional<usize> alloc_frame() {
				return phys->alloc_frame();
			}
			void dealloc_frame(usize addr) {
				phys->dealloc_frame(addr);
			}
			usize phys_to_virt(usize addr) {
				return phys->phys_to_virt(addr);
			}
		};

		Handle handle() {
			return Handle {this};
		}

	private:
		u8* mem;
		usize frame_count;
		std::vector<usize> free_frames;
		std::vector<bool> used;
		usize alloc_count {};
		usize release_count {};
		usize foreign_count {};
		usize allocs_left {};
		bool limited {};
	};
}
