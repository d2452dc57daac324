// ============================================================================
// unionkit/unionkit.hpp - Main Include Header
// ============================================================================
//
// This convenience header includes the complete unionkit library.
// For smaller builds, include individual headers as needed.
//
// USAGE:
// ------
//   #include <unionkit/unionkit.hpp>
//   using namespace unionkit;
//
// ============================================================================

#pragma once

// Errors
#include "unionkit/core/check.hpp"
#include "unionkit/core/error.hpp"
#include "unionkit/core/error_builder.hpp"

// Value types
#include "unionkit/core/invoke.hpp"
#include "unionkit/core/option.hpp"
#include "unionkit/core/result.hpp"

// Deferred validation
#include "unionkit/core/checks.hpp"
#include "unionkit/core/ensure_builder.hpp"
#include "unionkit/core/filter_builder.hpp"

// Composition
#include "unionkit/core/collections.hpp"
#include "unionkit/core/combinators.hpp"

// Identifiers
#include "unionkit/core/guid.hpp"
