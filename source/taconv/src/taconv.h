/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * taconv.h
*/

#pragma once

#define TAAPPNAME	"TokenAmount Converter"
#define TAVERSION	 "1.00"
#define TAEXENAME	"taconv"

#define DEFAULT_DECIMALS			18
#define DEFAULT_OUTPUT_BUFFER		4096
#define OUTPUT_BUFFER_MIN			64
#define OUTPUT_BUFFER_MAX			(16*1024*1024)

#include <TAdef.h>
#include <TAboost.hpp>
#include <apputil.h>

#include <boost/program_options/variables_map.hpp>

DECLARE_EXTERN struct global_params_struct
{
	boost::program_options::variables_map config_options;

	bool	interactive;

	int		default_decimals;
	int		output_buffer_size;

	int		trace_level;
	bool	trace_amounts;
	bool	trace_jsoncmd;

} g_params;
