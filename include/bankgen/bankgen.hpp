#pragma once

/// Convenience umbrella header for the bankgen library.

#include <bankgen/config/config.hpp>
#include <bankgen/core/error.hpp>
#include <bankgen/generator/synthetic_row_source.hpp>
#include <bankgen/materialize/batch.hpp>
#include <bankgen/materialize/materializer.hpp>
#include <bankgen/reconcile/reconciler.hpp>
#include <bankgen/schema/schema.hpp>
#include <bankgen/storage/session.hpp>
