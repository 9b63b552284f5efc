/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * jsonutil.h
*/

#pragma once

#include "TAapi.h"
#include "amounts.h"

#include <jsoncpp/json/json.h>

string json_escape(const string& str);

TARESULT copy_error_to_output(const string& fn, const string& error, char *output, const uint32_t outsize, TARESULT rc = -1);
TARESULT copy_result_to_output(const string& fn, const string& result, char *output, const uint32_t outsize);
TARESULT error_buffer_overflow(const string& fn, char *output, const uint32_t outsize, const unsigned need = 0);
TARESULT error_unexpected_key(const string& fn, const string& key, char *output, const uint32_t outsize);
TARESULT error_missing_key(const string& fn, const string& key, char *output, const uint32_t outsize);
TARESULT error_invalid_value(const string& fn, const string& key, char *output, const uint32_t outsize);
TARESULT error_value_range(const string& fn, const string& key, unsigned maxval, char *output, const uint32_t outsize);
TARESULT error_amount(const string& fn, const string& key, int rc, char *output, const uint32_t outsize);

TARESULT parse_amount_value(const string& fn, const string& key, const Json::Value& value, bool allow_signed, amtint_t& amount, char *output, const uint32_t outsize);
TARESULT parse_unsigned_value(const string& fn, const string& key, const Json::Value& value, unsigned maxval, unsigned& val, char *output, const uint32_t outsize);
TARESULT parse_double_value(const string& fn, const string& key, const Json::Value& value, double& val, char *output, const uint32_t outsize);
TARESULT parse_string_value(const string& fn, const string& key, const Json::Value& value, string& val, char *output, const uint32_t outsize);
TARESULT parse_bool_value(const string& fn, const string& key, const Json::Value& value, bool& val, char *output, const uint32_t outsize);

string json_double(double val);
