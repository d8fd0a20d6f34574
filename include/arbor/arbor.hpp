#pragma once

// Single entry point for the arbor library: tensors, graph construction,
// scan, compilation and profiling hooks.

#include "arbor/config.hpp"
#include "arbor/dtype.hpp"
#include "arbor/error.hpp"
#include "arbor/function.hpp"
#include "arbor/log.hpp"
#include "arbor/ops.hpp"
#include "arbor/profile.hpp"
#include "arbor/scan/scan.hpp"
#include "arbor/shape.hpp"
#include "arbor/tensor.hpp"
