#pragma once

#include "llvm/Support/JSON.h"
#include <string>
#include <vector>

namespace tsfilter {

/// Every string value inside \p Cart, depth-first. Objects are walked in
/// sorted key order and arrays in index order; keys themselves, numbers,
/// booleans and null contribute nothing.
std::vector<std::string> collectStringLiterals(const llvm::json::Value &Cart);

} // namespace tsfilter
