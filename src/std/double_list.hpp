#pragma once

struct DoubleListHook {
	void* prev {};
	void* next {};
};

// Intrusive list, nodes are linked through the hook member and never owned.
template<typename T, DoubleListHook (T::*Hook)>
class DoubleList {
public:
	class Iterator {
	public:
		constexpr bool operator!=(const Iterator& other) const {
			return ptr != other.ptr;
		}

		// the next node is read up front so that the current one may unlink itself
		constexpr Iterator& operator++() {
			ptr = next;
			if (ptr) {
				next = static_cast<T*>((ptr->*Hook).next);
			}
			return *this;
		}

		constexpr T& operator*() {
			return *ptr;
		}

	private:
		constexpr explicit Iterator(T* ptr) : ptr {ptr}, next {ptr ? static_cast<T*>((ptr->*Hook).next) : nullptr} {}

		T* ptr;
		T* next;
		friend class DoubleList;
	};

	constexpr void push(T* value) {
		(value->*Hook).prev = _end;
		(value->*Hook).next = nullptr;
		if (_end) {
			(_end->*Hook).next = value;
		}
		else {
			root = value;
		}
		_end = value;
	}

	constexpr void remove(T* value) {
		auto prev = static_cast<T*>((value->*Hook).prev);
		auto next = static_cast<T*>((value->*Hook).next);
		if (prev) {
			(prev->*Hook).next = next;
		}
		else {
			root = next;
		}
		if (next) {
			(next->*Hook).prev = prev;
		}
		else {
			_end = prev;
		}
		(value->*Hook).prev = nullptr;
		(value->*Hook).next = nullptr;
	}

	[[nodiscard]] constexpr bool is_empty() const {
		return !root;
	}

	[[nodiscard]] constexpr Iterator begin() {
		return Iterator {root};
	}

	[[nodiscard]] constexpr Iterator end() {
		return Iterator {nullptr};
	}

private:
	T* root {};
	T* _end {};
};
