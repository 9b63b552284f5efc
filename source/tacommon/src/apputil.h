/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * apputil.h
*/

#pragma once

#include <string>

#define TRACE_LEVEL_MAX		6

void set_trace_level(int level);
const char* trace_level_name(int level);
