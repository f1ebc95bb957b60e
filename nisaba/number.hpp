#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <system_error>

#include <fast_float/fast_float.h>

#include "character.hpp"

namespace nisaba {

// Up to 8 hexadecimal digits; further digits are left in the input
template <input I>
result <I, std::uint32_t> hex_u32(I in)
{
	size_t n = 0;
	while (n < in.size() && is_hex_digit(at(in, n)))
		n++;

	if (n == 0)
		return error <I> { in, error_kind::is_a };

	// Do not parse more than 8 characters for a u32
	size_t used = std::min <size_t> (n, 8);

	std::uint32_t value = 0;
	for (size_t k = 0; k < used; k++)
		value |= nibble(at(in, used - 1 - k)) << (4 * k);

	return done <I, std::uint32_t> { drop(in, used), value };
}

// Grammar of floating point literals:
//
//	[+-] (digits [. [digits]] | . digits) [(e|E) [+-] digits]
//
// Once the exponent marker is seen its digits are mandatory.
namespace literal {

constexpr auto sign_char = alt <character <'+'>, character <'-'>>;

constexpr auto mantissa = alt <
	map <sequence <digit1, opt <sequence <character <'.'>, opt <digit1>>>>, discard {}>,
	map <sequence <character <'.'>, digit1>, discard {}>
>;

constexpr auto exponent = sequence <
	alt <character <'e'>, character <'E'>>,
	opt <sign_char>,
	cut <digit1>
>;

constexpr auto floating = recognize <sequence <opt <sign_char>, mantissa, opt <exponent>>>;

// Any failure of the literal, even a committed one, is reported as a
// floating error at the start; the special values are tried in order
constexpr auto floating_or_exceptions = alt <
	relabel <floating, error_kind::floating>,
	relabel <tag_no_case <"nan">, error_kind::floating>,
	relabel <tag_no_case <"inf">, error_kind::floating>,
	relabel <tag_no_case <"infinity">, error_kind::floating>
>;

} // namespace literal

// Span of a floating point literal, without converting it
template <input I>
result <I, I> recognize_float(I in)
{
	return literal::floating(in);
}

// Span of a floating point literal or of nan, inf and infinity in any case
template <input I>
result <I, I> recognize_float_or_exceptions(I in)
{
	return literal::floating_or_exceptions(in);
}

// Pieces of a floating point literal; the integer part has its leading
// zeroes removed and the fraction its trailing ones
template <input I>
struct float_parts {
	// False only for an explicit '-'
	bool positive;
	I integer;
	I fraction;
	std::int32_t exponent;
};

// Manual decomposition, for conversion backends that build the value from
// its digits instead of reparsing text
template <input I>
result <I, float_parts <I>> recognize_float_parts(I in)
{
	auto s = sign(in);
	bool positive = s.value();
	I i = s.remaining();

	size_t z = 0;
	while (z < i.size() && at(i, z) == '0')
		z++;

	I zeroes = take(i, z);
	i = drop(i, z);

	size_t d = 0;
	while (d < i.size() && is_digit(at(i, d)))
		d++;

	I whole = take(i, d);
	i = drop(i, d);

	// Keep the last zero if the integer part is only zeroes
	if (whole.empty() && !zeroes.empty())
		whole = drop(zeroes, zeroes.size() - 1);

	I fraction = take(i, 0);
	if (!i.empty() && at(i, 0) == '.') {
		i = drop(i, 1);

		// Count digits, and the zeroes trailing them
		size_t zero_count = 0;
		size_t position = 0;
		while (position < i.size() && is_digit(at(i, position))) {
			if (at(i, position) == '0')
				zero_count++;
			else
				zero_count = 0;

			position++;
		}

		size_t index;
		if (zero_count == 0)
			index = position;
		else if (zero_count == position)
			index = position - zero_count + 1;
		else
			index = position - zero_count;

		fraction = take(i, index);
		i = drop(i, position);
	}

	if (whole.empty() && fraction.empty())
		return error <I> { in, error_kind::floating };

	std::int32_t exponent = 0;
	if (!i.empty() && (at(i, 0) == 'e' || at(i, 0) == 'E')) {
		auto e = cut <integer <std::int32_t>> (drop(i, 1));
		if (!e.ok())
			return e.template forward <float_parts <I>> ();

		exponent = e.value();
		i = e.remaining();
	}

	return done <I, float_parts <I>> { i, float_parts <I> { positive, whole, fraction, exponent } };
}

// Floating point number in text form, converted with fast_float
template <std::floating_point Floating, input I>
result <I, Floating> floating(I in)
{
	auto r = recognize_float_or_exceptions(in);
	if (!r.ok())
		return r.template forward <Floating> ();

	text span = as_chars(r.value());

	// fast_float does not take an explicit '+'
	if (!span.empty() && span.front() == '+')
		span.remove_prefix(1);

	const char *first = span.data();
	const char *last = span.data() + span.size();

	Floating value = 0;
	fast_float::from_chars_result parsed = fast_float::from_chars(first, last, value);

	// Out of range still yields the rounded value (zero or infinity)
	bool converted = (parsed.ec == std::errc() || parsed.ec == std::errc::result_out_of_range)
		&& parsed.ptr == last;

	if (!converted)
		return error <I> { r.remaining(), error_kind::floating };

	return done <I, Floating> { r.remaining(), value };
}

} // namespace nisaba
