#pragma once

/// Convenience umbrella header for the Sieve library.

#include <sieve/clean/table_cleaner.hpp>
#include <sieve/core/column.hpp>
#include <sieve/core/error.hpp>
#include <sieve/core/table.hpp>
#include <sieve/stats/array.hpp>
#include <sieve/stats/reduce.hpp>
#include <sieve/stats/sequence.hpp>
