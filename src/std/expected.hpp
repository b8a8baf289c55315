#pragma once
#include "type_traits.hpp"
#include "utility.hpp"
#include "new.hpp"

namespace kstd {
	template<typename E>
	struct unexpected {
		E value;
	};

	template<typename T, typename E>
	class expected {
	public:
		constexpr expected(T&& value) // NOLINT(*-explicit-constructor)
			: data {.value {std::move(value)}}, success {true} {}
		constexpr expected(const T& value)  // NOLINT(*-explicit-constructor)
			: data {.value {value}}, success {true} {}
		constexpr expected(E&& error) // NOLINT(*-explicit-constructor)
			: data {.error {std::move(error)}}, success {false} {}
		constexpr expected(const E& error)  // NOLINT(*-explicit-constructor)
			: data {.error {error}}, success {false} {}
		constexpr expected(unexpected<E> error)  // NOLINT(*-explicit-constructor)
			: data {.error {std::move(error.value)}}, success {false} {}

		constexpr expected(expected&& other) : data {.dummy {}}, success {other.success} {
			if (success) {
				new (&data.value) T {std::move(other.data.value)};
			}
			else {
				new (&data.error) E {std::move(other.data.error)};
			}
		}

		expected(const expected&) = delete;
		expected& operator=(const expected&) = delete;
		expected& operator=(expected&&) = delete;

		constexpr T& value() & {
			return data.value;
		}
		constexpr const T& value() const & {
			return data.value;
		}

		constexpr T&& value() && {
			return std::move(data.value);
		}

		constexpr T* operator->() {
			return &data.value;
		}
		constexpr const T* operator->() const {
			return &data.value;
		}

		constexpr E& error() & {
			return data.error;
		}
		constexpr const E& error() const & {
			return data.error;
		}
		constexpr E&& error() && {
			return std::move(data.error);
		}

		[[nodiscard]] constexpr bool has_value() const {
			return success;
		}

		constexpr explicit operator bool() const {
			return success;
		}

		constexpr ~expected() {
			if (success) {
				data.value.~T();
			}
			else {
				data.error.~E();
			}
		}

	private:
		union Data {
			constexpr ~Data() {}

			char dummy;
			T value;
			E error;
		} data;
		bool success;
	};

	template<typename E>
	class expected<void, E> {
	public:
		constexpr expected() : data {.dummy {}}, success {true} {}
		constexpr expected(E&& error) // NOLINT(*-explicit-constructor)
			: data {.error {std::move(error)}}, success {false} {}
		constexpr expected(const E& error)  // NOLINT(*-explicit-constructor)
			: data {.error {error}}, success {false} {}
		constexpr expected(unexpected<E> error)  // NOLINT(*-explicit-constructor)
			: data {.error {std::move(error.value)}}, success {false} {}

		constexpr expected(expected&& other) : data {.dummy {}}, success {other.success} {
			if (!success) {
				new (&data.error) E {std::move(other.data.error)};
			}
		}

		expected(const expected&) = delete;
		expected& operator=(const expected&) = delete;
		expected& operator=(expected&&) = delete;

		constexpr E& error() & {
			return data.error;
		}
		constexpr const E& error() const & {
			return data.error;
		}
		constexpr E&& error() && {
			return std::move(data.error);
		}

		[[nodiscard]] constexpr bool has_value() const {
			return success;
		}

		constexpr explicit operator bool() const {
			return success;
		}

		constexpr ~expected() {
			if (!success) {
				data.error.~E();
			}
		}

	private:
		union Data {
			constexpr ~Data() {}

			char dummy;
			E error;
		} data;
		bool success;
	};
}
