/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * test_amounts.cpp
*/

#include <gtest/gtest.h>

#include <talib.h>
#include <amounts.h>

#include <random>

static string format_ok(const amtint_t& amount, unsigned decimals)
{
	string s;
	EXPECT_EQ(amount_format(amount, decimals, s), AMOUNT_OK);
	return s;
}

static amtint_t parse_ok(const string& s, unsigned decimals)
{
	amtint_t amount;
	EXPECT_EQ(amount_parse(s, decimals, amount), AMOUNT_OK) << s;
	return amount;
}

static amtint_t multiply_ok(const amtint_t& amount, const string& factor)
{
	amtint_t result;
	EXPECT_EQ(amount_multiply(amount, factor, result), AMOUNT_OK) << factor;
	return result;
}

TEST(AmountFormat, InsertsDecimalPoint)
{
	EXPECT_EQ(format_ok(1234, 2), "12.34");
	EXPECT_EQ(format_ok(5, 2), "0.05");
	EXPECT_EQ(format_ok(12, 2), "0.12");
	EXPECT_EQ(format_ok(100, 2), "1.00");
	EXPECT_EQ(format_ok(0, 2), "0.00");
	EXPECT_EQ(format_ok(1, 18), "0.000000000000000001");
}

TEST(AmountFormat, ZeroDecimalsHasNoPoint)
{
	EXPECT_EQ(format_ok(123, 0), "123");
	EXPECT_EQ(format_ok(0, 0), "0");
}

TEST(AmountFormat, LargeAmount)
{
	amtint_t amount("123456789012345678901234567890");

	EXPECT_EQ(format_ok(amount, 18), "123456789012.345678901234567890");
	EXPECT_EQ(format_ok(amount, 40), "0.0000000000123456789012345678901234567890");
}

TEST(AmountFormat, RejectsNegative)
{
	string s = "unchanged";

	EXPECT_EQ(amount_format(-1, 2, s), AMOUNT_NEGATIVE);
	EXPECT_TRUE(s.empty());
}

TEST(AmountParse, Basic)
{
	EXPECT_EQ(parse_ok("12.34", 2), 1234);
	EXPECT_EQ(parse_ok("0.05", 2), 5);
	EXPECT_EQ(parse_ok("1", 2), 100);
	EXPECT_EQ(parse_ok("1.5", 3), 1500);
	EXPECT_EQ(parse_ok("0", 18), 0);
	EXPECT_EQ(parse_ok("0.000", 3), 0);
	EXPECT_EQ(parse_ok("123", 0), 123);
	EXPECT_EQ(parse_ok("1.000000000000000001", 18), amtint_t("1000000000000000001"));
}

TEST(AmountParse, PrecisionOverflow)
{
	amtint_t amount;

	EXPECT_EQ(amount_parse("1.2345", 2, amount), AMOUNT_PRECISION_OVERFLOW);
	EXPECT_EQ(amount_parse("0.5", 0, amount), AMOUNT_PRECISION_OVERFLOW);
	EXPECT_EQ(amount_parse("1.10", 1, amount), AMOUNT_PRECISION_OVERFLOW);
}

TEST(AmountParse, InvalidFormat)
{
	const char *bad[] = { "", ".", "01", "00", "1.", ".5", "-1", "+1", "1e5", " 1", "1 ", "1.2.3", "1,000", "abc", "0x10" };

	for (auto s : bad)
	{
		amtint_t amount = 7;
		EXPECT_EQ(amount_parse(s, 4, amount), AMOUNT_INVALID_FORMAT) << s;
		EXPECT_EQ(amount, 0) << s;
	}
}

TEST(AmountParse, RoundTrip)
{
	std::mt19937_64 rng(20250101);
	std::uniform_int_distribution<int> digit(0, 9);
	std::uniform_int_distribution<int> length(1, 30);

	for (unsigned d = 0; d <= 18; ++d)
	{
		EXPECT_EQ(parse_ok(format_ok(0, d), d), 0);

		for (unsigned i = 0; i < 200; ++i)
		{
			string digits(1, (char)('1' + digit(rng) % 9));
			auto len = length(rng);
			while ((int)digits.length() < len)
				digits.push_back((char)('0' + digit(rng)));

			amtint_t amount(digits);

			EXPECT_EQ(parse_ok(format_ok(amount, d), d), amount) << digits << " decimals " << d;
		}
	}
}

TEST(AmountMultiply, ExactProducts)
{
	EXPECT_EQ(multiply_ok(100, "0.5"), 50);
	EXPECT_EQ(multiply_ok(7, "2"), 14);
	EXPECT_EQ(multiply_ok(10, "1.50"), 15);
	EXPECT_EQ(multiply_ok(7, "2.0"), 14);
	EXPECT_EQ(multiply_ok(7, "2."), 14);
	EXPECT_EQ(multiply_ok(40, ".25"), 10);
	EXPECT_EQ(multiply_ok(1234, "0"), 0);
	EXPECT_EQ(multiply_ok(0, "3.5"), 0);
	EXPECT_EQ(multiply_ok(amtint_t("1000000000000000000000000"), "0.000001"), amtint_t("1000000000000000000"));
}

TEST(AmountMultiply, TruncatesTowardZero)
{
	EXPECT_EQ(multiply_ok(3, "0.333333333333333333"), 0);
	EXPECT_EQ(multiply_ok(2, "0.75"), 1);
	EXPECT_EQ(multiply_ok(999, "0.001"), 0);
	EXPECT_EQ(multiply_ok(1999, "0.001"), 1);
}

TEST(AmountMultiply, TrimsWhitespace)
{
	EXPECT_EQ(multiply_ok(100, " 1.5 "), 150);
}

TEST(AmountMultiply, InvalidFactor)
{
	const char *bad[] = { "", " ", ".", "-1", "-0.5", "1.2.3", "1e3", "abc", "1,5" };

	for (auto f : bad)
	{
		amtint_t result = 9;
		EXPECT_EQ(amount_multiply(100, f, result), AMOUNT_INVALID_FORMAT) << f;
		EXPECT_EQ(result, 0) << f;
	}
}

TEST(AmountMultiply, RejectsNegativeAmount)
{
	amtint_t result;

	EXPECT_EQ(amount_multiply(-5, "2", result), AMOUNT_NEGATIVE);
}

TEST(AmountConvert, IntegerString)
{
	amtint_t amount;

	EXPECT_EQ(amount_from_integer_string("000123", amount), AMOUNT_OK);
	EXPECT_EQ(amount, 123);
	EXPECT_EQ(amount_from_integer_string("0", amount), AMOUNT_OK);
	EXPECT_EQ(amount, 0);
	EXPECT_EQ(amount_from_integer_string("", amount), AMOUNT_INVALID_FORMAT);
	EXPECT_EQ(amount_from_integer_string("1.0", amount), AMOUNT_INVALID_FORMAT);
	EXPECT_EQ(amount_from_integer_string("-1", amount), AMOUNT_INVALID_FORMAT);
}

TEST(AmountConvert, Hex)
{
	amtint_t amount;

	EXPECT_EQ(amount_from_hex("0xff", amount), AMOUNT_OK);
	EXPECT_EQ(amount, 255);
	EXPECT_EQ(amount_from_hex("0X0de0b6b3a7640000", amount), AMOUNT_OK);
	EXPECT_EQ(amount, amtint_t("1000000000000000000"));
	EXPECT_EQ(amount_from_hex("10", amount), AMOUNT_OK);
	EXPECT_EQ(amount, 16);
	EXPECT_EQ(amount_from_hex("0x", amount), AMOUNT_INVALID_FORMAT);
	EXPECT_EQ(amount_from_hex("0xg1", amount), AMOUNT_INVALID_FORMAT);
	EXPECT_EQ(amount_from_hex("", amount), AMOUNT_INVALID_FORMAT);
}

TEST(AmountErrors, CheckThrows)
{
	EXPECT_NO_THROW(amount_check(AMOUNT_OK));

	try
	{
		amount_check(AMOUNT_PRECISION_OVERFLOW, "price");
		FAIL() << "no exception";
	}
	catch (const Amount_Exception& e)
	{
		EXPECT_EQ(e.code, AMOUNT_PRECISION_OVERFLOW);
		EXPECT_EQ(string(e.what()), string("price: ") + amount_error_string(AMOUNT_PRECISION_OVERFLOW));
	}
}
