/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * amounts-json.cpp
*/

#include "talib.h"
#include "jsonapi.h"
#include "jsonutil.h"
#include "amounts.h"
#include "amtfloat.h"
#include "decnorm.h"

TARESULT decimal_normalize_json(const string& fn, Json::Value& root, char *output, const uint32_t outsize)
{
	string key;
	Json::Value value;

	string raw;
	bool final = false;

	key = "value";
	if (!root.removeMember(key, &value))
		return error_missing_key(fn, key, output, outsize);
	auto rc = parse_string_value(fn, key, value, raw, output, outsize);
	if (rc) return rc;

	key = "final";
	if (root.removeMember(key, &value))
	{
		rc = parse_bool_value(fn, key, value, final, output, outsize);
		if (rc) return rc;
	}

	if (!root.empty())
		return error_unexpected_key(fn, root.begin().name(), output, outsize);

	auto result = decimal_normalize(raw, final);

	ostringstream os;
	os << "{\"value\":\"" << result << "\"}";

	return copy_result_to_output(fn, os.str(), output, outsize);
}

TARESULT amount_format_json(const string& fn, Json::Value& root, char *output, const uint32_t outsize)
{
	string key;
	Json::Value value;

	amtint_t amount;
	unsigned decimals;

	key = "amount";
	if (!root.removeMember(key, &value))
		return error_missing_key(fn, key, output, outsize);
	auto rc = parse_amount_value(fn, key, value, false, amount, output, outsize);
	if (rc) return rc;

	key = "decimals";
	if (!root.removeMember(key, &value))
		return error_missing_key(fn, key, output, outsize);
	rc = parse_unsigned_value(fn, key, value, AMOUNT_DECIMALS_MAX, decimals, output, outsize);
	if (rc) return rc;

	if (!root.empty())
		return error_unexpected_key(fn, root.begin().name(), output, outsize);

	string s;
	rc = amount_format(amount, decimals, s);
	if (rc)
		return error_amount(fn, "amount", rc, output, outsize);

	ostringstream os;
	os << "{\"value\":\"" << s << "\"}";

	return copy_result_to_output(fn, os.str(), output, outsize);
}

TARESULT amount_parse_json(const string& fn, Json::Value& root, char *output, const uint32_t outsize)
{
	string key;
	Json::Value value;

	string text;
	unsigned decimals;

	key = "value";
	if (!root.removeMember(key, &value))
		return error_missing_key(fn, key, output, outsize);
	auto rc = parse_string_value(fn, key, value, text, output, outsize);
	if (rc) return rc;

	key = "decimals";
	if (!root.removeMember(key, &value))
		return error_missing_key(fn, key, output, outsize);
	rc = parse_unsigned_value(fn, key, value, AMOUNT_DECIMALS_MAX, decimals, output, outsize);
	if (rc) return rc;

	if (!root.empty())
		return error_unexpected_key(fn, root.begin().name(), output, outsize);

	amtint_t amount;
	rc = amount_parse(text, decimals, amount);
	if (rc)
		return error_amount(fn, "value", rc, output, outsize);

	ostringstream os;
	os << "{\"amount\":\"" << amount << "\"}";

	return copy_result_to_output(fn, os.str(), output, outsize);
}

TARESULT amount_multiply_json(const string& fn, Json::Value& root, char *output, const uint32_t outsize)
{
	string key;
	Json::Value value;

	amtint_t amount;
	string factor;

	key = "amount";
	if (!root.removeMember(key, &value))
		return error_missing_key(fn, key, output, outsize);
	auto rc = parse_amount_value(fn, key, value, false, amount, output, outsize);
	if (rc) return rc;

	key = "factor";
	if (!root.removeMember(key, &value))
		return error_missing_key(fn, key, output, outsize);
	rc = parse_string_value(fn, key, value, factor, output, outsize);
	if (rc) return rc;

	if (!root.empty())
		return error_unexpected_key(fn, root.begin().name(), output, outsize);

	amtint_t result;
	rc = amount_multiply(amount, factor, result);
	if (rc)
		return error_amount(fn, "factor", rc, output, outsize);

	ostringstream os;
	os << "{\"amount\":\"" << result << "\"}";

	return copy_result_to_output(fn, os.str(), output, outsize);
}

TARESULT amount_approximate_json(const string& fn, Json::Value& root, char *output, const uint32_t outsize)
{
	string key;
	Json::Value value;

	amtint_t amount;
	double factor = 1;

	key = "amount";
	if (!root.removeMember(key, &value))
		return error_missing_key(fn, key, output, outsize);
	auto rc = parse_amount_value(fn, key, value, true, amount, output, outsize);
	if (rc) return rc;

	key = "factor";
	if (root.removeMember(key, &value))
	{
		rc = parse_double_value(fn, key, value, factor, output, outsize);
		if (rc) return rc;
	}

	if (!root.empty())
		return error_unexpected_key(fn, root.begin().name(), output, outsize);

	auto result = amount_approximate(amount, factor);

	ostringstream os;
	os << "{\"approximate\":" << json_double(result) << "}";

	return copy_result_to_output(fn, os.str(), output, outsize);
}

TARESULT amount_magnitude_json(const string& fn, Json::Value& root, char *output, const uint32_t outsize)
{
	string key;
	Json::Value value;

	amtint_t amount;

	key = "amount";
	if (!root.removeMember(key, &value))
		return error_missing_key(fn, key, output, outsize);
	auto rc = parse_amount_value(fn, key, value, true, amount, output, outsize);
	if (rc) return rc;

	if (!root.empty())
		return error_unexpected_key(fn, root.begin().name(), output, outsize);

	auto result = amount_magnitude(amount);

	ostringstream os;
	os << "{\"approximate\":" << json_double(result) << "}";

	return copy_result_to_output(fn, os.str(), output, outsize);
}
