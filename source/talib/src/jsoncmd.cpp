/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * jsoncmd.cpp
*/

#include "talib.h"

#include <jsoncpp/json/json.h>

#include "jsonapi.h"
#include "jsonutil.h"

bool g_trace_jsoncmd;

static TARESULT json_cmd(const string& fn, const char *json, char *output, const uint32_t outsize)
{
	TAASSERT(json);
	TAASSERT(output);
	TAASSERT(outsize > 0);

	output[0] = 0;

	if (g_trace_jsoncmd) BOOST_LOG_TRIVIAL(debug) << fn << " " << json;

	Json::CharReaderBuilder builder;
	Json::CharReaderBuilder::strictMode(&builder.settings_);
	Json::Value root;
	string errs;

	unique_ptr<Json::CharReader> reader(builder.newCharReader());

	bool rc;

	try
	{
		rc = reader->parse(json, json + strlen(json), &root, &errs);
	}
	catch (const exception& e)
	{
		errs = e.what();
		rc = false;
	}

	if (!rc)
		return copy_error_to_output(fn, string("error: ") + errs, output, outsize);

	if (!root.isObject() || root.size() != 1)
		return copy_error_to_output(fn, "error: json root must contain exactly one object", output, outsize);

	auto it = root.begin();
	auto key = it.name();
	Json::Value params = *it;

	if (!params.isObject())
		return copy_error_to_output(fn, string("error: parameters of \"") + json_escape(key) + "\" must be an object", output, outsize);

	if (key == "decimal-normalize")
		return decimal_normalize_json(key, params, output, outsize);

	if (key == "amount-format")
		return amount_format_json(key, params, output, outsize);

	if (key == "amount-parse")
		return amount_parse_json(key, params, output, outsize);

	if (key == "amount-multiply")
		return amount_multiply_json(key, params, output, outsize);

	if (key == "amount-approximate")
		return amount_approximate_json(key, params, output, outsize);

	if (key == "amount-magnitude")
		return amount_magnitude_json(key, params, output, outsize);

	return copy_error_to_output(fn, string("error: unrecognized command \"") + json_escape(key) + "\"", output, outsize);
}

TAAPI TAAmount_JsonCmd(const char *json, char *output, const uint32_t outsize)
{
	static const string fn("TAAmount_JsonCmd");

	TARESULT rc;
	string what;

	try
	{
		rc = json_cmd(fn, json, output, outsize);

		if (g_trace_jsoncmd) BOOST_LOG_TRIVIAL(debug) << fn << " result " << rc << " " << (output ? output : "");

		return rc;
	}
	catch (const exception& e)
	{
		what = e.what();
	}

	BOOST_LOG_TRIVIAL(error) << fn << " exception " << what;

	if (!output || !outsize)
		return -1;

	return copy_error_to_output(fn, "error: " + what, output, outsize);
}
