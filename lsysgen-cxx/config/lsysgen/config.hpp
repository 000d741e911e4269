// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_VERSION
#define LSYSGEN_VERSION "0.0 (unknown)"
#endif

// Model class instantiated by the tools. A custom model is compiled in with
// -DLSYSGEN_MODEL=ns::MyModel -DLSYSGEN_MODEL_INCLUDE=path/MyModel.hpp
#ifndef LSYSGEN_MODEL
#define LSYSGEN_MODEL lsysgen::runtime::DefaultModel
#endif

// Cap on the expansion steps when deriving to a fixed point.
#ifndef LSYSGEN_MAX_GENERATIONS
#define LSYSGEN_MAX_GENERATIONS 64
#endif

#define LSYSGEN_STRFY_INTERNAL(MACRO) #MACRO
#define LSYSGEN_STRFY(MACRO) LSYSGEN_STRFY_INTERNAL(MACRO)

#ifdef LSYSGEN_MODEL_INCLUDE
#include LSYSGEN_STRFY(LSYSGEN_MODEL_INCLUDE)
#endif
