/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * amounts.cpp
*/

#include "talib.h"
#include "amounts.h"

bool g_trace_amounts;

#define TRACE_AMOUNTS	(g_trace_amounts)

static const char *decimal_digits = "0123456789";
static const char *hex_digits = "0123456789abcdefABCDEF";

const char* amount_error_string(int rc)
{
	switch (rc)
	{
	case AMOUNT_OK:
		return "ok";
	case AMOUNT_INVALID_FORMAT:
		return "invalid number format";
	case AMOUNT_PRECISION_OVERFLOW:
		return "too many digits after the decimal point";
	case AMOUNT_NEGATIVE:
		return "amount may not be negative";
	default:
		return "unknown error";
	}
}

void amount_check(int rc, const string& context)
{
	if (rc == AMOUNT_OK)
		return;

	if (context.empty())
		throw Amount_Exception(rc, amount_error_string(rc));

	throw Amount_Exception(rc, context + ": " + amount_error_string(rc));
}

static amtint_t power_of_ten(unsigned n)
{
	static const amtint_t ten(10);

	return mp::pow(ten, n);
}

// cpp_int reads a leading 0 as octal, so leading zeros are skipped here
static amtint_t digits_to_amount(const string& digits)
{
	auto start = digits.find_first_not_of('0');
	if (start == string::npos)
		return amtint_t(0);

	return amtint_t(digits.substr(start));
}

int amount_from_integer_string(const string& s, amtint_t& amount)
{
	amount = 0;

	if (s.empty() || !all_chars_in(s, decimal_digits))
		return AMOUNT_INVALID_FORMAT;

	amount = digits_to_amount(s);

	return AMOUNT_OK;
}

int amount_from_hex(const string& s, amtint_t& amount)
{
	amount = 0;

	size_t start = 0;
	if (s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
		start = 2;

	if (start >= s.length() || !all_chars_in(s, hex_digits, start))
		return AMOUNT_INVALID_FORMAT;

	amount = amtint_t("0x" + s.substr(start));

	if (TRACE_AMOUNTS) BOOST_LOG_TRIVIAL(trace) << "amount_from_hex " << s << " = " << amount;

	return AMOUNT_OK;
}

int amount_format(const amtint_t& amount, unsigned decimals, string& s)
{
	s.clear();

	if (amount < 0)
		return AMOUNT_NEGATIVE;

	auto digits = amount.str();

	if (digits.length() < decimals)
		digits.insert(0, decimals - digits.length(), '0');

	auto insert_pos = digits.length() - decimals;

	if (!decimals)
		s = digits;
	else if (!insert_pos)
		s = "0." + digits;
	else
		s = digits.substr(0, insert_pos) + "." + digits.substr(insert_pos);

	if (TRACE_AMOUNTS) BOOST_LOG_TRIVIAL(trace) << "amount_format amount " << amount << " decimals " << decimals << " result " << s;

	return AMOUNT_OK;
}

// "0" or [1-9][0-9]*, then optionally "." followed by [0-9]+
static bool is_canonical_decimal(const string& s, size_t& dec)
{
	dec = s.find('.');

	auto whole_len = (dec == string::npos ? s.length() : dec);

	if (!whole_len)
		return false;

	if (s[0] == '0' && whole_len > 1)
		return false;

	for (size_t i = 0; i < whole_len; ++i)
	{
		if (s[i] < '0' || s[i] > '9')
			return false;
	}

	if (dec == string::npos)
		return true;

	if (dec + 1 >= s.length())
		return false;

	return all_chars_in(s, decimal_digits, dec + 1);
}

int amount_parse(const string& s, unsigned decimals, amtint_t& amount)
{
	amount = 0;

	size_t dec;
	if (!is_canonical_decimal(s, dec))
	{
		if (TRACE_AMOUNTS) BOOST_LOG_TRIVIAL(trace) << "amount_parse invalid format \"" << s << "\"";

		return AMOUNT_INVALID_FORMAT;
	}

	string whole, frac;

	if (dec == string::npos)
		whole = s;
	else
	{
		whole = s.substr(0, dec);
		frac = s.substr(dec + 1);
	}

	if (frac.length() > decimals)
	{
		if (TRACE_AMOUNTS) BOOST_LOG_TRIVIAL(trace) << "amount_parse \"" << s << "\" has " << frac.length() << " fraction digits; decimals " << decimals;

		return AMOUNT_PRECISION_OVERFLOW;
	}

	frac.append(decimals - frac.length(), '0');

	amount = digits_to_amount(whole + frac);

	if (TRACE_AMOUNTS) BOOST_LOG_TRIVIAL(trace) << "amount_parse \"" << s << "\" decimals " << decimals << " amount " << amount;

	return AMOUNT_OK;
}

int amount_multiply(const amtint_t& amount, const string& factor, amtint_t& result)
{
	result = 0;

	if (amount < 0)
		return AMOUNT_NEGATIVE;

	auto f = trim_whitespace(factor);

	if (f.empty() || !all_chars_in(f, "0123456789."))
		return AMOUNT_INVALID_FORMAT;

	auto dec = f.find('.');
	if (dec != string::npos)
	{
		if (f.find('.', dec + 1) != string::npos)
			return AMOUNT_INVALID_FORMAT;

		if (f.length() == 1)
			return AMOUNT_INVALID_FORMAT;

		// zeros at the end of the fraction don't change the product

		auto z = f.find_last_not_of('0');
		f.erase(z + 1);

		if (f.back() == '.')
		{
			f.pop_back();
			dec = string::npos;
		}
	}

	unsigned scale = 0;

	if (dec != string::npos)
	{
		scale = f.length() - dec - 1;
		f.erase(dec, 1);
	}

	auto fval = digits_to_amount(f);

	result = amount * fval;

	if (scale)
		result /= power_of_ten(scale);	// truncates toward zero

	if (TRACE_AMOUNTS) BOOST_LOG_TRIVIAL(trace) << "amount_multiply amount " << amount << " factor " << factor << " scaled factor " << fval << " scale " << scale << " result " << result;

	return AMOUNT_OK;
}
