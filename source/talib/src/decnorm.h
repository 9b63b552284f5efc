/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * decnorm.h
*/

#pragma once

#include <string>

#define DECIMAL_INTEGER_DIGITS_MAX		9
#define DECIMAL_FRACTION_DIGITS_MAX		18

/*
	Cleans up a decimal number while it is being typed.

	Drops every char except digits and '.', drops leading zeros (but a value
	of only zeros and no '.' becomes "0"; "0.00" is kept so that "0.05" can
	still be typed), keeps only the first '.', puts a "0" in front
	of a leading '.', and truncates to 9 integer digits and 18 fraction digits.
	Empty input gives empty output.  When final is set, a trailing '.' is
	also removed.  Never fails.
*/

std::string decimal_normalize(const std::string& raw, bool final = false);
