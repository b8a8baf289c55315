#pragma once
#include "algorithm.hpp"
#include "cstddef.hpp"
#include "type_traits.hpp"

#ifdef TESTING
#include "types.hpp"
#include <cstdlib>
#include <cassert>
#include <cstring>

class Allocator {
public:
	void* alloc(usize size) {
		if (limited) {
			if (!allocs_left) {
				return nullptr;
			}
			--allocs_left;
		}

		void* ptr = malloc(size + 8);
		if (!ptr) {
			return nullptr;
		}
		*static_cast<u64*>(ptr) = size;

		return static_cast<char*>(ptr) + 8;
	}

	void free(void* ptr, usize size) {
		if (!ptr) {
			return;
		}

		ptr = static_cast<char*>(ptr) - 8;
		auto real_size = *static_cast<u64*>(ptr);
		assert(size == real_size);
		::free(ptr);
	}

	// lets the next count allocations succeed and fails every one after them
	void fail_after(usize count) {
		allocs_left = count;
		limited = true;
	}

	void clear_limit() {
		limited = false;
	}

private:
	usize allocs_left {};
	bool limited {};
};
inline Allocator ALLOCATOR {};

#else
#include "mem/malloc.hpp"
#include "new.hpp"
#include "cstring.hpp"
#include "assert.hpp"
#endif

#include "utility.hpp"

namespace kstd {
	template<typename T>
	class vector {
	private:
		static constexpr bool is_copyable = is_trivially_copyable_v<T>;

	public:
		constexpr vector() = default;
		constexpr vector(vector&& other) {
			_data = other._data;
			_size = other._size;
			_cap = other._cap;
			other._data = nullptr;
			other._size = 0;
			other._cap = 0;
		}
		vector(const vector&) = delete;

		vector& operator=(vector&& other) {
			if (&other == this) {
				return *this;
			}

			destroy();
			_data = other._data;
			_size = other._size;
			_cap = other._cap;
			other._data = nullptr;
			other._size = 0;
			other._cap = 0;
			return *this;
		}

		vector& operator=(const vector&) = delete;

		[[nodiscard]] constexpr size_t size() const {
			return _size;
		}

		[[nodiscard]] constexpr size_t capacity() const {
			return _cap;
		}

		void push(T&& value) {
			reserve(1);
			new (&_data[_size++]) T {std::move(value)};
		}

		// Makes room for `amount` more elements, returns false if the allocator is exhausted.
		[[nodiscard]] bool try_reserve(size_t amount) {
			if (_size + amount <= _cap) {
				return true;
			}

			auto new_cap = max(_cap < 8 ? 8 : (_cap + _cap / 2), _size + amount);
			auto* new_data = static_cast<T*>(ALLOCATOR.alloc(new_cap * sizeof(T)));
			if (!new_data) {
				return false;
			}

			if constexpr (is_copyable) {
				if (_size) {
					memcpy(new_data, _data, _size * sizeof(T));
				}
			}
			else {
				for (size_t i = 0; i < _size; ++i) {
					new (&new_data[i]) T {std::move(_data[i])};
				}
				for (size_t i = 0; i < _size; ++i) {
					_data[i].~T();
				}
			}

			if (_cap) {
				ALLOCATOR.free(_data, _cap * sizeof(T));
			}
			_data = new_data;
			_cap = new_cap;
			return true;
		}

		void reserve(size_t amount) {
			bool success = try_reserve(amount);
			assert(success);
		}

		constexpr T* begin() {
			return _data;
		}

		constexpr T* end() {
			return _data + _size;
		}

		void clear() {
			for (size_t i = 0; i < _size; ++i) {
				_data[i].~T();
			}
			_size = 0;
		}

		~vector() {
			destroy();
		}

	private:
		void destroy() {
			clear();
			if (_cap) {
				ALLOCATOR.free(_data, _cap * sizeof(T));
			}
			_data = nullptr;
			_cap = 0;
		}

		T* _data {};
		size_t _size {};
		size_t _cap {};
	};
}
