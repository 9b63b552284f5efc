/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * amtfloat.h
*/

#pragma once

#include "amounts.h"

// 15 decimal digits always fit exactly in a double (10^15 < 2^53)
#define AMOUNT_FLOAT_CHUNK_DIGITS	15

/*
	Approximate conversions of an amount to double, for display and ordering
	only.  Neither result is exact and neither may be used for settlement.

	amount_approximate:
		Splits the decimal digits of amount into 15 digit chunks aligned from
		the least significant digit, converts each chunk exactly, and sums
		chunk * 10^(15 * position) * factor.  Every digit contributes.  The
		relative error is within one double epsilon per chunk.

	amount_magnitude:
		Coarser and cheaper.  Keeps only the leading 15 significant digits and
		scales them by the power of ten of the discarded digits, which are
		ignored.  Do not use where amount_approximate precision is needed.

	Both return 0 for a zero amount and accept a negative amount, in which
	case the result is negated.
*/

double amount_approximate(const amtint_t& amount, double factor = 1.0);
double amount_magnitude(const amtint_t& amount);
