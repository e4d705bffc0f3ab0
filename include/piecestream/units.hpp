/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_UNITS_HPP_INCLUDED
#define PIECESTREAM_UNITS_HPP_INCLUDED

#include <cstddef>
#include <cstdint>
#include <functional>
#include <type_traits>

#include "piecestream/config.hpp"

#if PIECESTREAM_USE_IOSTREAM
#include <ostream>
#endif

namespace piecestream { namespace aux {

	// an integer that only converts to and from its underlying type
	// explicitly. Two strong_typedefs with different tags don't mix
	template <typename T, typename Tag>
	struct strong_typedef
	{
		static_assert(std::is_integral<T>::value, "strong_typedef wraps integers");

		using underlying_type = T;

		strong_typedef() noexcept = default;
		constexpr explicit strong_typedef(T const v) noexcept : m_val(v) {}
		constexpr explicit operator T() const noexcept { return m_val; }

		friend constexpr bool operator==(strong_typedef a, strong_typedef b) noexcept { return a.m_val == b.m_val; }
		friend constexpr bool operator!=(strong_typedef a, strong_typedef b) noexcept { return a.m_val != b.m_val; }
		friend constexpr bool operator<(strong_typedef a, strong_typedef b) noexcept { return a.m_val < b.m_val; }
		friend constexpr bool operator>(strong_typedef a, strong_typedef b) noexcept { return a.m_val > b.m_val; }
		friend constexpr bool operator<=(strong_typedef a, strong_typedef b) noexcept { return a.m_val <= b.m_val; }
		friend constexpr bool operator>=(strong_typedef a, strong_typedef b) noexcept { return a.m_val >= b.m_val; }

		strong_typedef& operator++() noexcept
		{
			++m_val;
			return *this;
		}

	private:
		T m_val;
	};

	template <typename T, typename Tag>
	constexpr strong_typedef<T, Tag> next(strong_typedef<T, Tag> const v) noexcept
	{ return strong_typedef<T, Tag>(static_cast<T>(static_cast<T>(v) + 1)); }

#if PIECESTREAM_USE_IOSTREAM
	// the unary + makes 8 bit types print as numbers
	template <typename T, typename Tag>
	std::ostream& operator<<(std::ostream& os, strong_typedef<T, Tag> const v)
	{ return os << +static_cast<T>(v); }
#endif

	struct piece_index_tag;
	struct owner_id_tag;

} // namespace aux

	// index of a piece within the content of one transfer
	using piece_index_t = aux::strong_typedef<std::int32_t, aux::piece_index_tag>;

	// identifies one cache owner (one transfer) in the global memory budget
	using owner_id_t = aux::strong_typedef<std::uint32_t, aux::owner_id_tag>;

} // namespace piecestream

namespace std {

	template <typename T, typename Tag>
	struct hash<piecestream::aux::strong_typedef<T, Tag>>
	{
		std::size_t operator()(piecestream::aux::strong_typedef<T, Tag> const v) const noexcept
		{ return std::hash<T>{}(static_cast<T>(v)); }
	};
}

#endif // PIECESTREAM_UNITS_HPP_INCLUDED
