// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_RUNTIME_HPP
#define LSYSGEN_RUNTIME_HPP

#include "runtime/DefaultModel.hpp"
#include "runtime/Derivation.hpp"
#include "runtime/Engine.hpp"
#include "runtime/Grammar.hpp"
#include "runtime/GrammarBuilder.hpp"
#include "runtime/Listener.hpp"
#include "runtime/Model.hpp"
#include "runtime/Serializer.hpp"
#include "runtime/Symbol.hpp"
#include "runtime/WeightedModel.hpp"

#endif // LSYSGEN_RUNTIME_HPP
