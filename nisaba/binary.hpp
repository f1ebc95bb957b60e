#pragma once

#include <bit>
#include <cstdint>

#include "error.hpp"

namespace nisaba {

// Fixed width integers and IEEE-754 values in binary form. All of these
// work on complete input: a short buffer is an eof error, never a request
// for more bytes.

__extension__ typedef unsigned __int128 uint128;
__extension__ typedef __int128 int128;

enum class endianness {
	big,
	little,
	native,
};

// Most significant byte first
template <typename Uint>
result <bytes, Uint> be_uint(bytes in, size_t bound)
{
	if (in.size() < bound)
		return error <bytes> { in, error_kind::eof };

	Uint value = 0;

	// Single bytes are assigned, shifting them by 8 is pointless
	if (bound > 1) {
		for (size_t k = 0; k < bound; k++)
			value = static_cast <Uint> ((value << 8) + in[k]);
	} else {
		value = in[0];
	}

	return done <bytes, Uint> { drop(in, bound), value };
}

// Least significant byte first
template <typename Uint>
result <bytes, Uint> le_uint(bytes in, size_t bound)
{
	if (in.size() < bound)
		return error <bytes> { in, error_kind::eof };

	Uint value = 0;
	for (size_t k = 0; k < bound; k++)
		value = static_cast <Uint> (value + (static_cast <Uint> (in[k]) << (8 * k)));

	return done <bytes, Uint> { drop(in, bound), value };
}

// Same bits, other type
template <typename To, typename From>
result <bytes, To> reinterpret(const result <bytes, From> &r)
{
	if (!r.ok())
		return r.template forward <To> ();

	return done <bytes, To> { r.remaining(), std::bit_cast <To> (r.value()) };
}

// There is no 24 bit type to reinterpret into, so bit 23 is copied into the
// top byte by hand
inline result <bytes, std::int32_t> sign_extend_24(const result <bytes, std::uint32_t> &r)
{
	if (!r.ok())
		return r.template forward <std::int32_t> ();

	std::uint32_t x = r.value();
	if (x & 0x800000)
		x |= 0xFF000000;

	return done <bytes, std::int32_t> { r.remaining(), std::bit_cast <std::int32_t> (x) };
}

/////////////////
// Big endian  //
/////////////////

inline result <bytes, std::uint8_t> be_u8(bytes in)
{
	return be_uint <std::uint8_t> (in, 1);
}

inline result <bytes, std::uint16_t> be_u16(bytes in)
{
	return be_uint <std::uint16_t> (in, 2);
}

// Three bytes in a 32 bit container, top byte zero
inline result <bytes, std::uint32_t> be_u24(bytes in)
{
	return be_uint <std::uint32_t> (in, 3);
}

inline result <bytes, std::uint32_t> be_u32(bytes in)
{
	return be_uint <std::uint32_t> (in, 4);
}

inline result <bytes, std::uint64_t> be_u64(bytes in)
{
	return be_uint <std::uint64_t> (in, 8);
}

inline result <bytes, uint128> be_u128(bytes in)
{
	return be_uint <uint128> (in, 16);
}

inline result <bytes, std::int8_t> be_i8(bytes in)
{
	return reinterpret <std::int8_t> (be_u8(in));
}

inline result <bytes, std::int16_t> be_i16(bytes in)
{
	return reinterpret <std::int16_t> (be_u16(in));
}

inline result <bytes, std::int32_t> be_i24(bytes in)
{
	return sign_extend_24(be_u24(in));
}

inline result <bytes, std::int32_t> be_i32(bytes in)
{
	return reinterpret <std::int32_t> (be_u32(in));
}

inline result <bytes, std::int64_t> be_i64(bytes in)
{
	return reinterpret <std::int64_t> (be_u64(in));
}

inline result <bytes, int128> be_i128(bytes in)
{
	return reinterpret <int128> (be_u128(in));
}

inline result <bytes, float> be_f32(bytes in)
{
	return reinterpret <float> (be_u32(in));
}

inline result <bytes, double> be_f64(bytes in)
{
	return reinterpret <double> (be_u64(in));
}

///////////////////
// Little endian //
///////////////////

inline result <bytes, std::uint8_t> le_u8(bytes in)
{
	return le_uint <std::uint8_t> (in, 1);
}

inline result <bytes, std::uint16_t> le_u16(bytes in)
{
	return le_uint <std::uint16_t> (in, 2);
}

inline result <bytes, std::uint32_t> le_u24(bytes in)
{
	return le_uint <std::uint32_t> (in, 3);
}

inline result <bytes, std::uint32_t> le_u32(bytes in)
{
	return le_uint <std::uint32_t> (in, 4);
}

inline result <bytes, std::uint64_t> le_u64(bytes in)
{
	return le_uint <std::uint64_t> (in, 8);
}

inline result <bytes, uint128> le_u128(bytes in)
{
	return le_uint <uint128> (in, 16);
}

// A single byte has no order, both names decode the same way
inline result <bytes, std::int8_t> le_i8(bytes in)
{
	return be_i8(in);
}

inline result <bytes, std::int16_t> le_i16(bytes in)
{
	return reinterpret <std::int16_t> (le_u16(in));
}

inline result <bytes, std::int32_t> le_i24(bytes in)
{
	return sign_extend_24(le_u24(in));
}

inline result <bytes, std::int32_t> le_i32(bytes in)
{
	return reinterpret <std::int32_t> (le_u32(in));
}

inline result <bytes, std::int64_t> le_i64(bytes in)
{
	return reinterpret <std::int64_t> (le_u64(in));
}

inline result <bytes, int128> le_i128(bytes in)
{
	return reinterpret <int128> (le_u128(in));
}

inline result <bytes, float> le_f32(bytes in)
{
	return reinterpret <float> (le_u32(in));
}

inline result <bytes, double> le_f64(bytes in)
{
	return reinterpret <double> (le_u64(in));
}

////////////////////////
// Order independent  //
////////////////////////

inline result <bytes, std::uint8_t> u8(bytes in)
{
	if (in.empty())
		return error <bytes> { in, error_kind::eof };

	return done <bytes, std::uint8_t> { drop(in, 1), in[0] };
}

inline result <bytes, std::int8_t> i8(bytes in)
{
	return reinterpret <std::int8_t> (u8(in));
}

//////////////////////////
// Endianness selection //
//////////////////////////

template <typename T>
using decoder = result <bytes, T> (*)(bytes);

// Picked once per call, the caller applies the decoder to its input
template <typename T>
decoder <T> by_endianness(endianness order, decoder <T> big, decoder <T> little)
{
	switch (order) {
	case endianness::big:
		return big;
	case endianness::little:
		return little;
	case endianness::native:
		break;
	}

	if constexpr (std::endian::native == std::endian::big)
		return big;
	else
		return little;
}

inline decoder <std::uint16_t> u16(endianness order)
{
	return by_endianness <std::uint16_t> (order, be_u16, le_u16);
}

inline decoder <std::uint32_t> u24(endianness order)
{
	return by_endianness <std::uint32_t> (order, be_u24, le_u24);
}

inline decoder <std::uint32_t> u32(endianness order)
{
	return by_endianness <std::uint32_t> (order, be_u32, le_u32);
}

inline decoder <std::uint64_t> u64(endianness order)
{
	return by_endianness <std::uint64_t> (order, be_u64, le_u64);
}

inline decoder <uint128> u128(endianness order)
{
	return by_endianness <uint128> (order, be_u128, le_u128);
}

inline decoder <std::int16_t> i16(endianness order)
{
	return by_endianness <std::int16_t> (order, be_i16, le_i16);
}

inline decoder <std::int32_t> i24(endianness order)
{
	return by_endianness <std::int32_t> (order, be_i24, le_i24);
}

inline decoder <std::int32_t> i32(endianness order)
{
	return by_endianness <std::int32_t> (order, be_i32, le_i32);
}

inline decoder <std::int64_t> i64(endianness order)
{
	return by_endianness <std::int64_t> (order, be_i64, le_i64);
}

inline decoder <int128> i128(endianness order)
{
	return by_endianness <int128> (order, be_i128, le_i128);
}

inline decoder <float> f32(endianness order)
{
	return by_endianness <float> (order, be_f32, le_f32);
}

inline decoder <double> f64(endianness order)
{
	return by_endianness <double> (order, be_f64, le_f64);
}

} // namespace nisaba
