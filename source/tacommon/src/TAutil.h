/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * TAutil.h
*/

#pragma once

#include <string>
#include <cstdint>

#define STRINGIFY_QUOTER(x) #x
#define STRINGIFY(x) STRINGIFY_QUOTER(x)

const char* yesno(int val);

std::string trim_whitespace(const std::string& str);
bool all_chars_in(const std::string& str, const char *allowed, std::size_t start = 0);
