/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_FLAGS_HPP_INCLUDED
#define PIECESTREAM_FLAGS_HPP_INCLUDED

#include <cstdint>
#include <type_traits>

#include "piecestream/config.hpp"

#if PIECESTREAM_USE_IOSTREAM
#include <ostream>
#endif

namespace piecestream {

	// the index of a single bit, used to spell flag constants as ``3_bit``
	struct bit_t
	{
		explicit constexpr bit_t(int const idx) : index(idx) {}
		int index;
	};

	constexpr bit_t operator "" _bit(unsigned long long int const b)
	{ return bit_t{static_cast<int>(b)}; }

namespace flags {

	// a set of bit flags. Each Tag is a distinct type, so masks meant for
	// different purposes can't be combined by accident
	template <typename T, typename Tag>
	struct bitfield_flag
	{
		static_assert(std::is_unsigned<T>::value, "flags must be unsigned");

		using underlying_type = T;

		constexpr bitfield_flag() noexcept : m_val(0) {}
		explicit constexpr bitfield_flag(T const val) noexcept : m_val(val) {}
		constexpr bitfield_flag(bit_t const bit) noexcept
			: m_val(static_cast<T>(T{1} << bit.index)) {}

		static constexpr bitfield_flag all() noexcept
		{ return bitfield_flag(static_cast<T>(~T{0})); }

		explicit constexpr operator T() const noexcept { return m_val; }
		explicit constexpr operator bool() const noexcept { return m_val != 0; }

		// true if any of the bits in ``f`` is set
		constexpr bool any_of(bitfield_flag const f) const noexcept
		{ return (m_val & f.m_val) != 0; }

		constexpr bool operator==(bitfield_flag const f) const noexcept { return m_val == f.m_val; }
		constexpr bool operator!=(bitfield_flag const f) const noexcept { return m_val != f.m_val; }

		constexpr friend bitfield_flag operator|(bitfield_flag const a, bitfield_flag const b) noexcept
		{ return bitfield_flag(static_cast<T>(a.m_val | b.m_val)); }
		constexpr friend bitfield_flag operator&(bitfield_flag const a, bitfield_flag const b) noexcept
		{ return bitfield_flag(static_cast<T>(a.m_val & b.m_val)); }

		bitfield_flag& operator|=(bitfield_flag const f) noexcept
		{
			m_val = static_cast<T>(m_val | f.m_val);
			return *this;
		}

#if PIECESTREAM_USE_IOSTREAM
		friend std::ostream& operator<<(std::ostream& os, bitfield_flag const f)
		{
			std::ios_base::fmtflags const old = os.flags();
			os << "0x" << std::hex << static_cast<std::uint64_t>(f.m_val);
			os.flags(old);
			return os;
		}
#endif

	private:
		T m_val;
	};
}
}

#endif // PIECESTREAM_FLAGS_HPP_INCLUDED
