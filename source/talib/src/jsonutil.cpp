/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * jsonutil.cpp
*/

/*
	Numeric Parameter Format
	------------------------

	Amounts may be given as a JSON string or a JSON integer.
	As a string, an amount is either a sequence of one or more [0-9] characters,
	or "0x" or "0X" followed by one or more [0-9], [a-f] or [A-F] characters.
	Where a signed amount is allowed, a leading "-" may precede either form.

	Amounts that do not fit in a 64-bit JSON integer must be given as strings,
	since JSON readers convert such numbers to floating point.

	Unsigned parameters such as "decimals" may be a JSON string of [0-9] characters
	or a non-negative JSON integer.

	Floating point parameters such as "factor" may be a JSON number, or a JSON
	string of decimal digits with an optional sign, decimal point and exponent.
	Hex floats, "inf" and "nan" are not accepted.
*/

#include "talib.h"
#include "jsonutil.h"

#include <cmath>

string json_escape(const string& str)
{
	auto s = str;

	for (unsigned i = 0; i < s.length(); ++i)
	{
		auto c = s[i];

		if (c == '"')	s.replace(i++, 1, "\\\"");
		if (c == '\\')	s.replace(i++, 1, "\\\\");
		if (c == '\b')	s.replace(i++, 1, "\\b");
		if (c == '\f')	s.replace(i++, 1, "\\f");
		if (c == '\n')	s.replace(i++, 1, "\\n");
		if (c == '\r')	s.replace(i++, 1, "\\r");
		if (c == '\t')	s.replace(i++, 1, "\\t");
	}

	return s;
}

TARESULT copy_error_to_output(const string& fn, const string& error, char *output, const uint32_t outsize, TARESULT rc)
{
	if (output && outsize)
	{
		size_t eol = fn.copy(output, outsize - 1);

		if (eol)
		{
			eol += string(" ").copy(output + eol, outsize - eol - 1);
		}

		eol += error.copy(output + eol, outsize - eol - 1);

		output[eol] = 0;
	}

	return rc;
}

TARESULT copy_result_to_output(const string& fn, const string& result, char *output, const uint32_t outsize)
{
	if (result.size() < outsize)
		return copy_error_to_output(string(), result, output, outsize, 0);
	else
		return error_buffer_overflow(fn, output, outsize, result.size() + 1);
}

TARESULT error_buffer_overflow(const string& fn, char *output, const uint32_t outsize, const unsigned need)
{
	if (need)
		return copy_error_to_output(fn, string("error: output buffer overflow (need ") + to_string(need) + " bytes)", output, outsize, 1);
	else
		return copy_error_to_output(fn, "error: output buffer overflow", output, outsize, 1);
}

TARESULT error_unexpected_key(const string& fn, const string& key, char *output, const uint32_t outsize)
{
	return copy_error_to_output(fn, string("error: unexpected value \"") + json_escape(key) + "\"", output, outsize);
}

TARESULT error_missing_key(const string& fn, const string& key, char *output, const uint32_t outsize)
{
	return copy_error_to_output(fn, string("error: missing required value \"") + json_escape(key) + "\"", output, outsize);
}

TARESULT error_invalid_value(const string& fn, const string& key, char *output, const uint32_t outsize)
{
	return copy_error_to_output(fn, string("error: invalid value for key \"") + key + "\"", output, outsize);
}

TARESULT error_value_range(const string& fn, const string& key, unsigned maxval, char *output, const uint32_t outsize)
{
	return copy_error_to_output(fn, string("error: value of \"" + key + "\" larger than ") + to_string(maxval), output, outsize);
}

TARESULT error_amount(const string& fn, const string& key, int rc, char *output, const uint32_t outsize)
{
	return copy_error_to_output(fn, string("error: value of \"") + key + "\": " + amount_error_string(rc), output, outsize);
}

TARESULT parse_amount_value(const string& fn, const string& key, const Json::Value& value, bool allow_signed, amtint_t& amount, char *output, const uint32_t outsize)
{
	string sval;

	if (value.isString())
		sval = value.asString();
	else if (value.type() == Json::intValue)
		sval = to_string(value.asInt64());
	else if (value.type() == Json::uintValue)
		sval = to_string(value.asUInt64());
	else
		return error_invalid_value(fn, key, output, outsize);

	bool negative = false;

	if (allow_signed && sval.length() > 1 && sval[0] == '-')
	{
		negative = true;
		sval.erase(0, 1);
	}

	int rc;

	if (sval.length() > 1 && sval[0] == '0' && (sval[1] == 'x' || sval[1] == 'X'))
		rc = amount_from_hex(sval, amount);
	else
		rc = amount_from_integer_string(sval, amount);

	if (rc)
	{
		if (!allow_signed && !sval.empty() && sval[0] == '-')
			return error_amount(fn, key, AMOUNT_NEGATIVE, output, outsize);

		return error_amount(fn, key, rc, output, outsize);
	}

	if (negative)
		amount = -amount;

	return 0;
}

TARESULT parse_unsigned_value(const string& fn, const string& key, const Json::Value& value, unsigned maxval, unsigned& val, char *output, const uint32_t outsize)
{
	amtint_t bigval;

	auto rc = parse_amount_value(fn, key, value, false, bigval, output, outsize);
	if (rc) return rc;

	if (bigval > maxval)
		return error_value_range(fn, key, maxval, output, outsize);

	val = bigval.convert_to<unsigned>();

	return 0;
}

TARESULT parse_double_value(const string& fn, const string& key, const Json::Value& value, double& val, char *output, const uint32_t outsize)
{
	if (value.isNumeric())
	{
		val = value.asDouble();

		return 0;
	}

	if (!value.isString())
		return error_invalid_value(fn, key, output, outsize);

	auto sval = trim_whitespace(value.asString());
	if (sval.empty() || !all_chars_in(sval, "0123456789.eE+-"))
		return error_invalid_value(fn, key, output, outsize);

	char *end = NULL;
	val = strtod(sval.c_str(), &end);

	if (!end || *end || !std::isfinite(val))
		return error_invalid_value(fn, key, output, outsize);

	return 0;
}

TARESULT parse_string_value(const string& fn, const string& key, const Json::Value& value, string& val, char *output, const uint32_t outsize)
{
	if (!value.isString())
		return error_invalid_value(fn, key, output, outsize);

	val = value.asString();

	return 0;
}

TARESULT parse_bool_value(const string& fn, const string& key, const Json::Value& value, bool& val, char *output, const uint32_t outsize)
{
	if (value.isBool())
		val = value.asBool();
	else if (value.isInt64() && (value.asInt64() == 0 || value.asInt64() == 1))
		val = (value.asInt64() != 0);
	else
		return error_invalid_value(fn, key, output, outsize);

	return 0;
}

string json_double(double val)
{
	if (std::isnan(val))
		return "null";

	if (std::isinf(val))
		return val > 0 ? "\"inf\"" : "\"-inf\"";

	ostringstream os;
	os.precision(17);
	os << val;

	return os.str();
}
