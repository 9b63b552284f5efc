/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * TAassert.cpp
*/

#include "TAdef.h"
#include "TAboost.hpp"
#include "TAassert.h"

#include <thread>

static string assert_thread_id()
{
	ostringstream os;
	os << this_thread::get_id();
	return os.str();
}

void __taassert(const char *msg, const char *file, int line)
{
	ostringstream os;
	os << "error thread " << assert_thread_id() << " assert(" << msg << ") false at " << file << ":" << line;

	BOOST_LOG_TRIVIAL(error) << os.str();

	throw runtime_error(os.str());
}
