/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * amounts.h
*/

#pragma once

#include <exception>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>
namespace mp = boost::multiprecision;

typedef mp::cpp_int amtint_t;

#define AMOUNT_DECIMALS_MAX		255

enum AmountErrorCode
{
	AMOUNT_OK					=  0,
	AMOUNT_INVALID_FORMAT		= -1,	// text does not match the required grammar
	AMOUNT_PRECISION_OVERFLOW	= -2,	// more fractional digits than the decimals count allows
	AMOUNT_NEGATIVE				= -3	// negative amount where a magnitude is required
};

class Amount_Exception : public std::exception
{
public:
	const int code;
	const std::string msg;

	Amount_Exception(int c, const std::string& m)
	:	code(c),
		msg(m)
	{ }

	const char* what() const noexcept
	{
		return msg.c_str();
	}
};

extern bool g_trace_amounts;

const char* amount_error_string(int rc);

// throws Amount_Exception if rc is not AMOUNT_OK
void amount_check(int rc, const std::string& context = std::string());

/*
	Scaled-integer codec

	amount_format renders amount with the given number of implied fractional
	digits, e.g. (1234, 2) -> "12.34", (5, 2) -> "0.05".  When decimals is 0
	the result has no decimal point, e.g. (123, 0) -> "123".

	amount_parse is the exact inverse.  The text must be an unsigned decimal
	number in canonical form: "0" or a digit string without leading zeros,
	optionally followed by "." and at least one digit.  A fractional part
	longer than decimals is rejected with AMOUNT_PRECISION_OVERFLOW; it is
	never truncated.
*/

int amount_format(const amtint_t& amount, unsigned decimals, std::string& s);
int amount_parse(const std::string& s, unsigned decimals, amtint_t& amount);

/*
	Fixed-point multiply

	result = (amount * F) / 10^k where the factor literal is F with its
	decimal point removed and k is the count of digits after the point.
	The division truncates toward zero.  The factor must be an unsigned
	decimal literal; anything else returns AMOUNT_INVALID_FORMAT.
*/

int amount_multiply(const amtint_t& amount, const std::string& factor, amtint_t& result);

int amount_from_integer_string(const std::string& s, amtint_t& amount);
int amount_from_hex(const std::string& s, amtint_t& amount);
