/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * TAutil.cpp
*/

#include "TAdef.h"
#include "TAutil.h"

const char* yesno(int val)
{
	return val ? "yes" : "no";
}

string trim_whitespace(const string& str)
{
	static const char *ws = " \t\r\n\f\v";

	auto start = str.find_first_not_of(ws);
	if (start == string::npos)
		return string();

	auto end = str.find_last_not_of(ws);

	return str.substr(start, end - start + 1);
}

// true if every char from start onward appears in allowed
bool all_chars_in(const string& str, const char *allowed, size_t start)
{
	return str.find_first_not_of(allowed, start) == string::npos;
}
