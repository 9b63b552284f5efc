/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * TAapi.h
*/

#ifndef TAAPI_H_
#define TAAPI_H_

#include <cstdint>

#ifndef TARESULT
#define TARESULT std::int32_t
#endif

#ifndef TAAPI
#ifdef TA_DLL_IMPORTS
#define TAAPI extern "C" TARESULT
#else
#define TAAPI TARESULT
#endif // TA_DLL_IMPORTS
#endif // TAAPI

/*
	Executes one JSON command, e.g. {"amount-format":{"amount":"1234","decimals":2}}

	On success, returns 0 and writes the JSON result to output.
	On failure, writes an error message to output and returns 1 if the output
	buffer was too small, or -1 for any other error.
*/

TAAPI TAAmount_JsonCmd(const char *json, char *output, const std::uint32_t outsize);

#endif
