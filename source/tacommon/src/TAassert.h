/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * TAassert.h
*/

#pragma once

#define TAASSERT(x) ((void)( (x)||(__taassert(#x, __FILE__, __LINE__),0) ))

extern void __taassert(const char *msg, const char *file, int line);
