#pragma once

#include "duckdb.hpp"

namespace duckdb {
namespace changecase {

// Register case transformation scalar functions
void RegisterCaseTransformFunctions(ExtensionLoader &loader);

} // namespace changecase
} // namespace duckdb
