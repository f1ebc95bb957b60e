#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace nisaba {

// Borrowed views over the input; parsers hand back narrower views, never copies
using bytes = std::span <const std::uint8_t>;
using text = std::string_view;

template <typename I>
concept input = std::same_as <I, bytes> || std::same_as <I, text>;

template <typename I>
concept byte_input = std::same_as <I, bytes>;

// Prefix of n items
inline bytes take(bytes in, size_t n)
{
	return in.first(n);
}

inline text take(text in, size_t n)
{
	return in.substr(0, n);
}

// Everything after the first n items
inline bytes drop(bytes in, size_t n)
{
	return in.subspan(n);
}

inline text drop(text in, size_t n)
{
	return in.substr(n);
}

// Items seen as characters, for the text parsers
inline char at(bytes in, size_t k)
{
	return static_cast <char> (in[k]);
}

inline char at(text in, size_t k)
{
	return in[k];
}

inline text as_chars(bytes in)
{
	return text(reinterpret_cast <const char *> (in.data()), in.size());
}

inline text as_chars(text in)
{
	return in;
}

inline bytes to_bytes(text in)
{
	return bytes(reinterpret_cast <const std::uint8_t *> (in.data()), in.size());
}

// Number of items consumed between an input and one of its suffixes
template <input I>
size_t offset(const I &original, const I &remaining)
{
	return original.size() - remaining.size();
}

// Character classes, ASCII only
inline bool is_digit(char c)
{
	return c >= '0' && c <= '9';
}

inline bool is_hex_digit(char c)
{
	return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

inline std::uint32_t nibble(char c)
{
	if (is_digit(c))
		return c - '0';
	if (c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	if (c >= 'A' && c <= 'F')
		return c - 'A' + 10;

	return 0;
}

inline char to_lower(char c)
{
	if (c >= 'A' && c <= 'Z')
		return c - 'A' + 'a';

	return c;
}

} // namespace nisaba
