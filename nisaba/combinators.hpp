#pragma once

#include <tuple>
#include <type_traits>
#include <utility>

#include <bestd/optional.hpp>
#include <bestd/tuple.hpp>

#include "debugger.hpp"

namespace nisaba {

// Parsers are stateless objects with a templated call operator, so that they
// can be composed at compile time as template arguments:
//
//	recognize <sequence <opt <character <'-'>>, digit1>>
//
// Every parser maps an input to a result <I, T> and never copies the input.

template <typename T, typename... Rest>
constexpr bool all_same = (sizeof...(Rest) == 0) || (std::is_same_v <T, Rest> && ...);

// Value type produced by parser p on input I
template <auto p, input I>
using output_t = typename decltype(p(std::declval <I> ()))::value_type;

// Reserved type for no values
template <size_t = 0>
struct null {};

// Throws away whatever a parser produced
struct discard {
	template <typename T>
	null <> operator()(const T &) const {
		return {};
	}
};

// Options of parsers, the first success wins
template <auto ... ps>
struct alt_group {
	template <input I, auto p, auto ... rest>
	static auto step(const I &in) {
		auto r = p(in);

		// Failures are final, only plain errors move on to the next option
		if constexpr (sizeof...(rest) > 0) {
			if (r.is_error())
				return step <I, rest...> (in);
		}

		return r;
	}

	template <input I>
	requires all_same <output_t <ps, I>...>
	auto operator()(I in) const {
		return step <I, ps...> (in);
	}
};

// Possibility of parser
template <auto p>
struct opt_group {
	template <input I>
	auto operator()(I in) const {
		using T = bestd::optional <output_t <p, I>>;

		auto r = p(in);
		if (r.ok())
			return result <I, T> (done <I, T> { r.remaining(), T(r.value()) });
		if (r.is_error())
			return result <I, T> (done <I, T> { in, std::nullopt });

		return r.template forward <T> ();
	}
};

// Sequences of parsers
template <auto ... ps>
struct sequence_group {
	template <input I>
	using output = bestd::tuple <output_t <ps, I>...>;

	template <size_t N, input I, auto p, auto ... rest>
	static result <I, null <>> step(output <I> &out, const I &in) {
		auto r = p(in);
		if (!r.ok())
			return r.template forward <null <>> ();

		std::get <N> (out) = r.value();

		if constexpr (sizeof...(rest) > 0)
			return step <N + 1, I, rest...> (out, r.remaining());

		return done <I, null <>> { r.remaining(), {} };
	}

	template <input I>
	result <I, output <I>> operator()(I in) const {
		output <I> out;

		auto r = step <0, I, ps...> (out, in);
		if (!r.ok())
			return r.template forward <output <I>> ();

		return done <I, output <I>> { r.remaining(), out };
	}
};

// Span consumed by a parser, instead of its value
template <auto p>
struct recognize_group {
	template <input I>
	result <I, I> operator()(I in) const {
		auto r = p(in);
		if (!r.ok())
			return r.template forward <I> ();

		return done <I, I> { r.remaining(), take(in, offset(in, r.remaining())) };
	}
};

// Commit point: errors past here are not backtracked
template <auto p>
struct cut_group {
	template <input I>
	auto operator()(I in) const {
		auto r = p(in);
		if (r.is_error()) {
			const auto &e = r.template as <error <I>> ();
			return decltype(r)(failure <I> { e.input, e.kind });
		}

		return r;
	}
};

template <auto p, auto f>
struct map_group {
	template <input I>
	auto operator()(I in) const {
		using T = std::decay_t <decltype(f(std::declval <output_t <p, I>> ()))>;

		auto r = p(in);
		if (!r.ok())
			return r.template forward <T> ();

		return result <I, T> (done <I, T> { r.remaining(), f(r.value()) });
	}
};

// Collapses any error or failure of p into kind, reported at the start of
// the attempt; the severity is kept
template <auto p, error_kind kind>
struct relabel_group {
	template <input I>
	auto operator()(I in) const {
		auto r = p(in);
		if (r.is_error())
			return decltype(r)(error <I> { in, kind });
		if (r.is_failure())
			return decltype(r)(failure <I> { in, kind });

		return r;
	}
};

template <auto p, cstring name, bool silence>
struct debug_group {
	template <input I>
	auto operator()(I in) const {
		debugger_head <name, silence> (in);
		auto r = p(in);
		debugger_tail(r);
		return r;
	}
};

template <auto ... ps>
constexpr alt_group <ps...> alt {};

template <auto p>
constexpr opt_group <p> opt {};

template <auto ... ps>
constexpr sequence_group <ps...> sequence {};

template <auto p>
constexpr recognize_group <p> recognize {};

template <auto p>
constexpr cut_group <p> cut {};

template <auto p, auto f>
constexpr map_group <p, f> map {};

template <auto p, error_kind kind>
constexpr relabel_group <p, kind> relabel {};

template <auto p, cstring name, bool silence = false>
constexpr debug_group <p, name, silence> debug {};

} // namespace nisaba
