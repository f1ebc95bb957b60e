#include "test_input.hpp"

#include <cmath>

#include <boost/test/unit_test.hpp>

using namespace nisaba;
using test::view;
using test::same;

BOOST_AUTO_TEST_CASE(be_u16_leaves_rest)
{
	std::vector <std::uint8_t> input = { 0x00, 0x03, 0x61, 0x62 };
	auto r = be_u16(view(input));
	BOOST_REQUIRE(r.ok());
	BOOST_CHECK_EQUAL(0x0003u, r.value());
	BOOST_CHECK(same(r.remaining(), { 0x61, 0x62 }));

	// The rest is a view into the same buffer
	BOOST_CHECK(r.remaining().data() == input.data() + 2);
}

BOOST_AUTO_TEST_CASE(le_u16_reverses_bytes)
{
	std::vector <std::uint8_t> input = { 0x00, 0x03 };
	auto r = le_u16(view(input));
	BOOST_REQUIRE(r.ok());
	BOOST_CHECK_EQUAL(0x0300u, r.value());
	BOOST_CHECK(r.remaining().empty());
}

BOOST_AUTO_TEST_CASE(unsigned_widths)
{
	std::vector <std::uint8_t> input = {
		0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
		0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
	};

	BOOST_CHECK_EQUAL(0x00u, be_u8(view(input)).value());
	BOOST_CHECK_EQUAL(0x000102u, be_u24(view(input)).value());
	BOOST_CHECK_EQUAL(0x00010203u, be_u32(view(input)).value());
	BOOST_CHECK_EQUAL(0x0001020304050607ull, be_u64(view(input)).value());

	BOOST_CHECK_EQUAL(0x00u, le_u8(view(input)).value());
	BOOST_CHECK_EQUAL(0x020100u, le_u24(view(input)).value());
	BOOST_CHECK_EQUAL(0x03020100u, le_u32(view(input)).value());
	BOOST_CHECK_EQUAL(0x0706050403020100ull, le_u64(view(input)).value());

	uint128 half = 0x0001020304050607ull;
	BOOST_CHECK_EQUAL((half << 64) | half, be_u128(view(input)).value());

	uint128 reversed = 0x0706050403020100ull;
	BOOST_CHECK_EQUAL((reversed << 64) | reversed, le_u128(view(input)).value());

	BOOST_CHECK(be_u128(view(input)).remaining().empty());
	BOOST_CHECK(same(be_u24(view(input)).remaining(), {
		0x03, 0x04, 0x05, 0x06, 0x07,
		0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
	}));
}

BOOST_AUTO_TEST_CASE(u24_keeps_top_byte_zero)
{
	std::vector <std::uint8_t> input = { 0x12, 0x34, 0x56 };
	BOOST_CHECK_EQUAL(1193046u, be_u24(view(input)).value());

	std::vector <std::uint8_t> little = { 0x56, 0x34, 0x12 };
	BOOST_CHECK_EQUAL(1193046u, le_u24(view(little)).value());

	std::vector <std::uint8_t> high = { 0xFF, 0xFF, 0xFF };
	BOOST_CHECK_EQUAL(0x00FFFFFFu, be_u24(view(high)).value());
}

BOOST_AUTO_TEST_CASE(signed_bytes)
{
	for (auto decode : { be_i8, le_i8, i8 }) {
		std::vector <std::uint8_t> zero = { 0x00 };
		std::vector <std::uint8_t> max = { 0x7f };
		std::vector <std::uint8_t> minus_one = { 0xff };
		std::vector <std::uint8_t> min = { 0x80 };

		BOOST_CHECK_EQUAL(0, decode(view(zero)).value());
		BOOST_CHECK_EQUAL(127, decode(view(max)).value());
		BOOST_CHECK_EQUAL(-1, decode(view(minus_one)).value());
		BOOST_CHECK_EQUAL(-128, decode(view(min)).value());
	}
}

BOOST_AUTO_TEST_CASE(signed_is_reinterpreted)
{
	std::vector <std::uint8_t> max16 = { 0x7f, 0xff };
	std::vector <std::uint8_t> min16 = { 0x80, 0x00 };
	BOOST_CHECK_EQUAL(32767, be_i16(view(max16)).value());
	BOOST_CHECK_EQUAL(-32768, be_i16(view(min16)).value());
	BOOST_CHECK_EQUAL(-129, le_i16(view(max16)).value());

	std::vector <std::uint8_t> min32 = { 0x80, 0x00, 0x00, 0x00 };
	BOOST_CHECK_EQUAL(INT32_MIN, be_i32(view(min32)).value());
	BOOST_CHECK_EQUAL(128, le_i32(view(min32)).value());

	std::vector <std::uint8_t> ones(8, 0xff);
	BOOST_CHECK_EQUAL(-1, be_i64(view(ones)).value());
	BOOST_CHECK_EQUAL(-1, le_i64(view(ones)).value());

	std::vector <std::uint8_t> max128(16, 0xff);
	max128[0] = 0x7f;
	int128 expected = static_cast <int128> (~uint128(0) >> 1);
	BOOST_CHECK_EQUAL(expected, be_i128(view(max128)).value());
	BOOST_CHECK_EQUAL(int128(-129), le_i128(view(max128)).value());
}

BOOST_AUTO_TEST_CASE(i24_sign_extension)
{
	std::vector <std::uint8_t> minus_one = { 0xFF, 0xFF, 0xFF };
	std::vector <std::uint8_t> big = { 0xFF, 0x00, 0x00 };
	std::vector <std::uint8_t> mixed = { 0xED, 0xCB, 0xAA };
	std::vector <std::uint8_t> positive = { 0x7F, 0xFF, 0xFF };

	BOOST_CHECK_EQUAL(-1, be_i24(view(minus_one)).value());
	BOOST_CHECK_EQUAL(-65536, be_i24(view(big)).value());
	BOOST_CHECK_EQUAL(-1193046, be_i24(view(mixed)).value());
	BOOST_CHECK_EQUAL(8388607, be_i24(view(positive)).value());

	std::vector <std::uint8_t> little = { 0x00, 0x00, 0xFF };
	std::vector <std::uint8_t> little_mixed = { 0xAA, 0xCB, 0xED };
	BOOST_CHECK_EQUAL(-1, le_i24(view(minus_one)).value());
	BOOST_CHECK_EQUAL(-65536, le_i24(view(little)).value());
	BOOST_CHECK_EQUAL(-1193046, le_i24(view(little_mixed)).value());

	// Only the high bit of the last byte matters for little endian
	BOOST_CHECK_EQUAL(0xFF, le_i24(view(big)).value());
}

BOOST_AUTO_TEST_CASE(ieee754_bits)
{
	std::vector <std::uint8_t> big32 = { 0x4d, 0x31, 0x1f, 0xd8 };
	std::vector <std::uint8_t> little32 = { 0xd8, 0x1f, 0x31, 0x4d };
	BOOST_CHECK_EQUAL(185728392.0f, be_f32(view(big32)).value());
	BOOST_CHECK_EQUAL(185728392.0f, le_f32(view(little32)).value());

	std::vector <std::uint8_t> big64 = { 0x41, 0xa6, 0x23, 0xfb, 0x10, 0x00, 0x00, 0x00 };
	std::vector <std::uint8_t> little64 = { 0x00, 0x00, 0x00, 0x10, 0xfb, 0x23, 0xa6, 0x41 };
	BOOST_CHECK_EQUAL(185728392.0, be_f64(view(big64)).value());
	BOOST_CHECK_EQUAL(185728392.0, le_f64(view(little64)).value());

	std::vector <std::uint8_t> zero(8, 0x00);
	BOOST_CHECK_EQUAL(0.0f, be_f32(view(zero)).value());
	BOOST_CHECK_EQUAL(0.0, le_f64(view(zero)).value());

	// Bits are taken as they are, a NaN stays a NaN
	std::vector <std::uint8_t> nan = { 0x7f, 0xc0, 0x00, 0x00 };
	BOOST_CHECK(std::isnan(be_f32(view(nan)).value()));
}

BOOST_AUTO_TEST_CASE(short_input_is_eof)
{
	std::vector <std::uint8_t> buffer = {
		0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08,
		0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f,
	};

	auto check = [&](auto decode, size_t width) {
		for (size_t n = 0; n < width; n++) {
			bytes in = bytes(buffer.data(), n);
			auto r = decode(in);
			BOOST_REQUIRE(r.is_error());
			BOOST_CHECK_EQUAL(error_kind::eof, r.kind());
			BOOST_CHECK(r.where().data() == in.data());
			BOOST_CHECK_EQUAL(n, r.where().size());
		}
	};

	check(u8, 1);
	check(i8, 1);
	check(be_u8, 1);
	check(le_i8, 1);
	check(be_u16, 2);
	check(le_i16, 2);
	check(be_u24, 3);
	check(le_i24, 3);
	check(be_i32, 4);
	check(le_f32, 4);
	check(be_f64, 8);
	check(le_u64, 8);
	check(be_i128, 16);
	check(le_u128, 16);
}

BOOST_AUTO_TEST_CASE(single_byte_decoders_agree)
{
	std::vector <std::uint8_t> input = { 0x00, 0x03, 0x61 };
	auto plain = u8(view(input));
	BOOST_REQUIRE(plain.ok());
	BOOST_CHECK_EQUAL(0u, plain.value());
	BOOST_CHECK(same(plain.remaining(), { 0x03, 0x61 }));

	for (std::uint8_t byte = 0; byte < 0xff; byte++) {
		std::vector <std::uint8_t> one = { byte };
		BOOST_CHECK_EQUAL(u8(view(one)).value(), be_u8(view(one)).value());
		BOOST_CHECK_EQUAL(be_u8(view(one)).value(), le_u8(view(one)).value());
		BOOST_CHECK_EQUAL(be_i8(view(one)).value(), le_i8(view(one)).value());
	}
}
