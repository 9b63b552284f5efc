/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * decnorm.cpp
*/

#include "talib.h"
#include "decnorm.h"

string decimal_normalize(const string& raw, bool final)
{
	if (raw.empty())
		return string();

	// keep only digits and dots

	string s;
	s.reserve(raw.length());

	for (auto c : raw)
	{
		if ((c >= '0' && c <= '9') || c == '.')
			s.push_back(c);
	}

	if (s.empty())
		return s;

	if (s.find_first_not_of('0') == string::npos)
		return "0";

	s.erase(0, s.find_first_not_of('0'));

	// keep only the first dot

	auto dec = s.find('.');
	if (dec != string::npos)
	{
		auto tail = s.substr(dec + 1);
		tail.erase(remove(tail.begin(), tail.end(), '.'), tail.end());
		s.erase(dec + 1);
		s += tail;
	}

	if (dec == 0)
	{
		s.insert(0, 1, '0');
		dec = 1;
	}

	if (dec == string::npos)
	{
		if (s.length() > DECIMAL_INTEGER_DIGITS_MAX)
			s.erase(DECIMAL_INTEGER_DIGITS_MAX);
	}
	else
	{
		auto whole = s.substr(0, dec);
		auto frac = s.substr(dec + 1);

		if (whole.length() > DECIMAL_INTEGER_DIGITS_MAX)
			whole.erase(DECIMAL_INTEGER_DIGITS_MAX);

		if (frac.length() > DECIMAL_FRACTION_DIGITS_MAX)
			frac.erase(DECIMAL_FRACTION_DIGITS_MAX);

		s = whole + "." + frac;

		if (final && frac.empty())
			s.erase(s.length() - 1);
	}

	return s;
}
