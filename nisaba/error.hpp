#pragma once

#include <string>

#include <bestd/variant.hpp>

#include "input.hpp"

namespace nisaba {

// What a parser expected when it gave up
enum class error_kind {
	tag,
	character,
	digit,
	is_a,
	eof,
	floating,
};

inline const char *to_string(error_kind kind)
{
	switch (kind) {
	case error_kind::tag:
		return "tag";
	case error_kind::character:
		return "character";
	case error_kind::digit:
		return "digit";
	case error_kind::is_a:
		return "hexadecimal digit";
	case error_kind::eof:
		return "more input";
	case error_kind::floating:
		return "floating point number";
	}

	return "?";
}

// Successful parse: the unconsumed suffix and the produced value
template <input I, typename T>
struct done {
	I remaining;
	T value;
};

// Recoverable error, alternatives may still be tried
template <input I>
struct error {
	I input;
	error_kind kind;
};

// Non-recoverable error raised past a commit point (see cut)
template <input I>
struct failure {
	I input;
	error_kind kind;
};

// Never produced by the complete-input parsers
struct incomplete {
	size_t needed;
};

template <input I, typename T>
struct result : bestd::variant <done <I, T>, error <I>, failure <I>, incomplete> {
	using Super = bestd::variant <done <I, T>, error <I>, failure <I>, incomplete>;
	using Super::Super;

	using input_type = I;
	using value_type = T;

	bool ok() const {
		return this->template is <done <I, T>> ();
	}

	bool is_error() const {
		return this->template is <error <I>> ();
	}

	bool is_failure() const {
		return this->template is <failure <I>> ();
	}

	bool is_incomplete() const {
		return this->template is <incomplete> ();
	}

	const T &value() const {
		return this->template as <done <I, T>> ().value;
	}

	I remaining() const {
		return this->template as <done <I, T>> ().remaining;
	}

	// Kind and position of an error or failure
	error_kind kind() const {
		if (is_failure())
			return this->template as <failure <I>> ().kind;

		return this->template as <error <I>> ().kind;
	}

	I where() const {
		if (is_failure())
			return this->template as <failure <I>> ().input;

		return this->template as <error <I>> ().input;
	}

	// Re-type an unsuccessful result without touching its payload
	template <typename U>
	result <I, U> forward() const {
		if (is_error())
			return this->template as <error <I>> ();
		if (is_failure())
			return this->template as <failure <I>> ();

		return this->template as <incomplete> ();
	}
};

// Human readable report, positions counted from the start of original
template <input I, typename T>
std::string describe(const I &original, const result <I, T> &r)
{
	if (r.ok())
		return "parsed " + std::to_string(offset(original, r.remaining())) + " items";

	if (r.is_incomplete())
		return "needs " + std::to_string(r.template as <incomplete> ().needed) + " more items";

	std::string severity = r.is_failure() ? "failure" : "error";
	return severity + ": expected " + to_string(r.kind())
		+ " at offset " + std::to_string(offset(original, r.where()));
}

} // namespace nisaba
