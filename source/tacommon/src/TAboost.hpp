/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * TAboost.hpp
*/

#pragma once

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>

using namespace boost::log::trivial;
