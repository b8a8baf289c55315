#pragma once
#include "cstddef.hpp"

namespace kstd {
	template<typename T>
	class basic_string_view {
	public:
		using const_iterator = const T*;

		constexpr basic_string_view() noexcept = default;
		constexpr basic_string_view(const T* s, size_t size) : _ptr {s}, _size {size} {}
		constexpr basic_string_view(const T* s) : _ptr {s}, _size {const_strlen(s)} {} // NOLINT(*-explicit-constructor)
		constexpr basic_string_view(kstd::nullptr_t) = delete;

		[[nodiscard]] constexpr const_iterator begin() const noexcept {
			return _ptr;
		}
		[[nodiscard]] constexpr const_iterator end() const noexcept {
			return _ptr + _size;
		}

		[[nodiscard]] constexpr const T& operator[](size_t index) const {
			return _ptr[index];
		}

		[[nodiscard]] constexpr const T* data() const {
			return _ptr;
		}

		[[nodiscard]] constexpr size_t size() const {
			return _size;
		}

		[[nodiscard]] constexpr bool is_empty() const {
			return _size == 0;
		}

		[[nodiscard]] constexpr bool operator==(basic_string_view other) const noexcept {
			if (_size != other._size) {
				return false;
			}
			for (size_t i = 0; i < _size; ++i) {
				if (_ptr[i] != other._ptr[i]) {
					return false;
				}
			}
			return true;
		}

	private:
		static constexpr size_t const_strlen(const T* s) {
			size_t len = 0;
			while (*s++) ++len;
			return len;
		}

		const T* _ptr {};
		size_t _size {};
	};

	using string_view = basic_string_view<char>;
}
