#pragma once

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

#include "error.hpp"

namespace nisaba {

// Compile-time string, usable as a template argument
template <size_t N>
struct cstring {
	char value[N];

	constexpr cstring(const char (&str)[N]) {
		std::copy_n(str, N, value);
	}

	constexpr size_t size() const {
		return N - 1;
	}
};

// Tracing the parsing process, per thread
inline thread_local bool debugger_enabled = false;
inline thread_local uint32_t debugger_nesting = 0;
inline thread_local std::optional <uint32_t> debugger_silenced;

inline void debugger(bool b)
{
	debugger_enabled = b;
}

inline std::string debugger_indents(uint32_t nesting)
{
	std::string indents(4 * nesting, ' ');
	for (uint32_t i = 0; i < nesting; i++)
		indents[4 * i] = '|';

	return indents;
}

template <cstring name, bool silence, input I>
void debugger_head(const I &in)
{
	if (!debugger_enabled)
		return;

	debugger_nesting++;
	if (!debugger_silenced) {
		std::string indents = debugger_indents(debugger_nesting - 1);
		printf("%s[%s @%zu left]%c",
			indents.c_str(),
			name.value, in.size(),
			silence ? ' ' : '\n');

		if constexpr (silence)
			debugger_silenced = debugger_nesting;
	}
}

template <input I, typename T>
void debugger_tail(const result <I, T> &r)
{
	if (!debugger_enabled)
		return;

	bool display = false;
	bool outnow = false;
	if (!debugger_silenced) {
		display = true;
	} else if (debugger_nesting <= debugger_silenced.value()) {
		debugger_silenced.reset();
		display = true;
		outnow = true;
	}

	debugger_nesting--;
	if (display) {
		std::string indents = debugger_indents(debugger_nesting);
		std::string actual = outnow ? "" : indents;

		if (r.ok()) {
			printf("%s[passed @%zu left]\n",
				actual.c_str(),
				r.remaining().size());
		} else if (r.is_incomplete()) {
			printf("%s[incomplete]\n", actual.c_str());
		} else {
			printf("%s[%s: expected %s @%zu left]\n",
				actual.c_str(),
				r.is_failure() ? "failure" : "failed",
				to_string(r.kind()),
				r.where().size());
		}
	}
}

} // namespace nisaba
