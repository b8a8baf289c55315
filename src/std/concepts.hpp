#pragma once
#include "type_traits.hpp"

namespace kstd {
	namespace __detail {
		template<typename T, typename U>
		concept same_helper = is_same_v<T, U>;
	}

	template<typename T, typename U>
	concept same_as = __detail::same_helper<T, U> && __detail::same_helper<U, T>;
}
