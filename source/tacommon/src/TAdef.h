/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * TAdef.h
*/

#pragma once

#ifdef DECLARE_EXTERN
#define DECLARING_EXTERN
#else
#define DECLARE_EXTERN extern
#endif

#include <cstdlib>
#include <cstdint>
#include <limits>
#include <climits>
#include <string>
#include <cstring>
#include <array>
#include <vector>
#include <algorithm>
#include <sstream>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <mutex>
#include <exception>
#include <stdexcept>
#include <utility>
#include <memory>

using namespace std;

#define DEFAULT_TRACE_LEVEL		3

#include <boost/version.hpp>

#include "TAutil.h"
#include "TAassert.h"
