/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * talib.h
*/

#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <memory>
#include <algorithm>
#include <iostream>
#include <sstream>

#include <TAutil.h>
#include <TAassert.h>
#include <TAboost.hpp>

using namespace std;

#define TARESULT std::int32_t

#ifdef TA_DLL_EXPORTS
#define TAAPI extern "C" TARESULT
#else
#define TAAPI TARESULT
#endif // TA_DLL_EXPORTS

#include "TAapi.h"
