/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * amtfloat.cpp
*/

#include "talib.h"
#include "amtfloat.h"

#include <cmath>

#define TRACE_AMTFLOAT	(g_trace_amounts)

static const double chunk_weight = 1E15;

// digit strings of at most 15 chars convert exactly
static double chunk_to_double(const string& digits, size_t pos, size_t len)
{
	uint64_t v = 0;

	for (size_t i = pos; i < pos + len; ++i)
		v = v * 10 + (digits[i] - '0');

	return (double)v;
}

double amount_approximate(const amtint_t& amount, double factor)
{
	if (amount.is_zero() || factor == 0)
		return 0;

	bool neg = (amount < 0);
	auto digits = (neg ? amtint_t(-amount) : amount).str();

	// sum from the least significant chunk up, so the small terms are added first

	double result = 0;
	double weight = 1;

	for (size_t end = digits.length(); end > 0; )
	{
		auto start = (end > AMOUNT_FLOAT_CHUNK_DIGITS ? end - AMOUNT_FLOAT_CHUNK_DIGITS : 0);

		auto chunk = chunk_to_double(digits, start, end - start);

		if (chunk)
			result += chunk * weight * factor;	// weight may have overflowed to inf

		if (TRACE_AMTFLOAT) BOOST_LOG_TRIVIAL(trace) << "amount_approximate chunk " << digits.substr(start, end - start) << " weight " << weight << " sum " << result;

		weight *= chunk_weight;
		end = start;
	}

	return neg ? -result : result;
}

double amount_magnitude(const amtint_t& amount)
{
	if (amount.is_zero())
		return 0;

	bool neg = (amount < 0);
	auto digits = (neg ? amtint_t(-amount) : amount).str();

	double result;

	if (digits.length() <= AMOUNT_FLOAT_CHUNK_DIGITS)
		result = chunk_to_double(digits, 0, digits.length());
	else
	{
		auto dropped = digits.length() - AMOUNT_FLOAT_CHUNK_DIGITS;

		result = chunk_to_double(digits, 0, AMOUNT_FLOAT_CHUNK_DIGITS) * pow(10.0, (double)dropped);
	}

	if (TRACE_AMTFLOAT) BOOST_LOG_TRIVIAL(trace) << "amount_magnitude " << amount << " digits " << digits.length() << " result " << result;

	return neg ? -result : result;
}
