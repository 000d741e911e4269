// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_TOOL_HPP
#define LSYSGEN_TOOL_HPP

#include "tool/GeneratorTool.hpp"
#include "tool/GrammarLoader.hpp"
#include "tool/JsonGenerationCodec.hpp"
#include "tool/JsonWeightLoader.hpp"
#include "tool/StatisticsListener.hpp"
#include "tool/Tool.hpp"

#endif // LSYSGEN_TOOL_HPP
