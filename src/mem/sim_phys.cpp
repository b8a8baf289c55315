#include "sim_phys.hpp"
#include "cstring.hpp"
#include <cstdlib>

namespace mmukit {
	SimPhys::SimPhys(usize frame_count)
		: mem {static_cast<u8*>(aligned_alloc(PAGE_SIZE, frame_count * PAGE_SIZE))},
		frame_count {frame_count}, used(frame_count, false) {
		// popped from the back, so the lowest frames go out first
		for (usize i = frame_count; i > 0; --i) {
			free_frames.push_back(BASE + (i - 1) * PAGE_SIZE);
		}
	}

	SimPhys::~SimPhys() {
		free(mem);
	}

	kstd::optional<usize> SimPhys::alloc_frame() {
		if (limited) {
			if (!allocs_left) {
				return {};
			}
			--allocs_left;
		}
		if (free_frames.empty()) {
			return {};
		}

		usize phys = free_frames.back();
		free_frames.pop_back();
		used[(phys - BASE) / PAGE_SIZE] = true;
		memset(reinterpret_cast<void*>(phys_to_virt(phys)), 0, PAGE_SIZE);
		++alloc_count;
		return phys;
	}

	void SimPhys::dealloc_frame(usize phys) {
		if (!owns(phys) || !used[(phys - BASE) / PAGE_SIZE]) {
			++foreign_count;
			return;
		}
		used[(phys - BASE) / PAGE_SIZE] = false;
		free_frames.push_back(phys);
		++release_count;
	}

	usize SimPhys::phys_to_virt(usize phys) const {
		return reinterpret_cast<usize>(mem) + (phys - BASE);
	}

	void SimPhys::fail_after(usize count) {
		limited = true;
		allocs_left = count;
	}

	bool SimPhys::owns(usize phys) const {
		return phys >= BASE && phys < BASE + frame_count * PAGE_SIZE && !(phys & (PAGE_SIZE - 1));
	}
}
