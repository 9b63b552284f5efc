/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * jsonapi.h
*/

#pragma once

#include "TAapi.h"

#include <jsoncpp/json/json.h>

extern bool g_trace_jsoncmd;

TARESULT decimal_normalize_json(const string& fn, Json::Value& root, char *output, const uint32_t outsize);
TARESULT amount_format_json(const string& fn, Json::Value& root, char *output, const uint32_t outsize);
TARESULT amount_parse_json(const string& fn, Json::Value& root, char *output, const uint32_t outsize);
TARESULT amount_multiply_json(const string& fn, Json::Value& root, char *output, const uint32_t outsize);
TARESULT amount_approximate_json(const string& fn, Json::Value& root, char *output, const uint32_t outsize);
TARESULT amount_magnitude_json(const string& fn, Json::Value& root, char *output, const uint32_t outsize);
