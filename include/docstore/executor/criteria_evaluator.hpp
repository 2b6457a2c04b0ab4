#pragma once

#include "docstore/catalog/value.hpp"
#include "docstore/executor/operation.hpp"

#include <span>

namespace docstore::executor {

// Never throws: operands that cannot be compared make the condition false.
[[nodiscard]] bool evaluate_condition(const catalog::Row& row, const CriteriaCondition& condition);

// Conjunction of every condition; an empty list matches all rows.
[[nodiscard]] bool matches_criteria(const catalog::Row& row, std::span<const CriteriaCondition> criteria);

// Ordering used by select: nulls sort first, numbers numerically, everything
// else by string form. Returns <0, 0 or >0.
[[nodiscard]] int compare_for_sort(const catalog::Value* lhs, const catalog::Value* rhs);

}  // namespace docstore::executor
