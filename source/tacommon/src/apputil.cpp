/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * apputil.cpp
*/

#include "TAdef.h"
#include "TAboost.hpp"
#include "apputil.h"

// level 0 = no output, 1 = fatal only ... 6 = everything including trace
void set_trace_level(int level)
{
	boost::log::core::get()->set_filter(boost::log::trivial::severity > (((int)(fatal)) - level));
}

const char* trace_level_name(int level)
{
	static const char *names[TRACE_LEVEL_MAX + 1] = { "none", "fatal", "errors", "warnings", "info", "debug", "trace" };

	if (level < 0)
		return names[0];

	if (level > TRACE_LEVEL_MAX)
		return names[TRACE_LEVEL_MAX];

	return names[level];
}
