/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * params.cpp
*/

#define DECLARE_EXTERN

#include "taconv.h"
