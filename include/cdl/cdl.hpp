#pragma once

/** \file cdl.hpp
 *  \brief Umbrella header for the Constraint Definition Language engine.
 */

#include "cdl/aggregation_state.hpp"
#include "cdl/clock.hpp"
#include "cdl/constraint.hpp"
#include "cdl/duration.hpp"
#include "cdl/error.hpp"
#include "cdl/evaluator.hpp"
#include "cdl/halt_checker.hpp"
#include "cdl/operators.hpp"
#include "cdl/parser.hpp"
#include "cdl/value.hpp"
#include "cdl/verify.hpp"
