#pragma once

#include <charconv>
#include <concepts>
#include <system_error>

#include "combinators.hpp"

namespace nisaba {

// Exactly the character C
template <char C>
struct character_parser {
	template <input I>
	result <I, char> operator()(I in) const {
		if (in.empty() || at(in, 0) != C)
			return error <I> { in, error_kind::character };

		return done <I, char> { drop(in, 1), C };
	}
};

// One or more decimal digits
struct digit1_parser {
	template <input I>
	result <I, I> operator()(I in) const {
		size_t n = 0;
		while (n < in.size() && is_digit(at(in, n)))
			n++;

		if (n == 0)
			return error <I> { in, error_kind::digit };

		return done <I, I> { drop(in, n), take(in, n) };
	}
};

// Literal string, optionally compared without regard to ASCII case
template <cstring s, bool fold>
struct tag_parser {
	template <input I>
	result <I, I> operator()(I in) const {
		constexpr size_t n = s.size();
		if (in.size() < n)
			return error <I> { in, error_kind::tag };

		for (size_t k = 0; k < n; k++) {
			char c = at(in, k);
			bool same = fold ? to_lower(c) == to_lower(s.value[k]) : c == s.value[k];
			if (!same)
				return error <I> { in, error_kind::tag };
		}

		return done <I, I> { drop(in, n), take(in, n) };
	}
};

// Optional leading '+' or '-'; true unless the sign was '-'
struct sign_parser {
	template <input I>
	result <I, bool> operator()(I in) const {
		if (!in.empty() && at(in, 0) == '-')
			return done <I, bool> { drop(in, 1), false };
		if (!in.empty() && at(in, 0) == '+')
			return done <I, bool> { drop(in, 1), true };

		return done <I, bool> { in, true };
	}
};

// Decimal integer in text form; signed types accept a leading sign
template <std::integral Integer>
requires (!std::same_as <Integer, bool>)
struct integer_parser {
	template <input I>
	result <I, Integer> operator()(I in) const {
		size_t start = 0;
		bool negative = false;
		if constexpr (std::is_signed_v <Integer>) {
			if (!in.empty() && (at(in, 0) == '+' || at(in, 0) == '-')) {
				negative = (at(in, 0) == '-');
				start = 1;
			}
		}

		size_t j = start;
		while (j < in.size() && is_digit(at(in, j)))
			j++;

		if (j == start)
			return error <I> { in, error_kind::digit };

		// from_chars takes '-' but not '+'
		text chars = as_chars(in);
		const char *first = chars.data() + (negative ? start - 1 : start);
		const char *last = chars.data() + j;

		Integer value = 0;
		auto parsed = std::from_chars(first, last, value);
		if (parsed.ec != std::errc() || parsed.ptr != last) {
			// Overflow or other error: not a number of this width
			return error <I> { in, error_kind::digit };
		}

		return done <I, Integer> { drop(in, j), value };
	}
};

template <char C>
constexpr character_parser <C> character {};

constexpr digit1_parser digit1 {};

template <cstring s>
constexpr tag_parser <s, false> tag {};

template <cstring s>
constexpr tag_parser <s, true> tag_no_case {};

constexpr sign_parser sign {};

template <std::integral Integer>
requires (!std::same_as <Integer, bool>)
constexpr integer_parser <Integer> integer {};

} // namespace nisaba
