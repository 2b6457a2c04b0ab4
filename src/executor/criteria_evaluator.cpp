#include "docstore/executor/criteria_evaluator.hpp"

#include <algorithm>
#include <cctype>

namespace docstore::executor {

namespace {

using catalog::Value;

bool ordered_compare(const Value* candidate, const Value& operand, ComparisonOperator op)
{
    if (candidate == nullptr || candidate->is_null() || operand.is_null()) {
        return false;
    }
    const auto left = catalog::to_number(*candidate);
    const auto right = catalog::to_number(operand);
    if (!left || !right) {
        return false;
    }

    switch (op) {
    case ComparisonOperator::Gt:
        return *left > *right;
    case ComparisonOperator::Gte:
        return *left >= *right;
    case ComparisonOperator::Lt:
        return *left < *right;
    case ComparisonOperator::Lte:
        return *left <= *right;
    default:
        return false;
    }
}

bool contains_ignore_case(std::string_view haystack, std::string_view needle)
{
    const auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char lhs, char rhs) {
        return std::tolower(static_cast<unsigned char>(lhs)) == std::tolower(static_cast<unsigned char>(rhs));
    });
    return it != haystack.end() || needle.empty();
}

bool contains_match(const Value* candidate, const Value& operand)
{
    if (candidate == nullptr || candidate->is_null() || operand.is_null()) {
        return false;
    }
    return contains_ignore_case(catalog::to_display_string(*candidate), catalog::to_display_string(operand));
}

bool membership_match(const Value* candidate, const Value& operand)
{
    if (!operand.is_array()) {
        return false;
    }
    const auto& entries = operand.as_array();
    return std::any_of(entries.begin(), entries.end(), [candidate](const Value& entry) {
        return catalog::loose_equals(candidate, &entry);
    });
}

}  // namespace

bool evaluate_condition(const catalog::Row& row, const CriteriaCondition& condition)
{
    const auto it = row.find(condition.column);
    const Value* candidate = it == row.end() ? nullptr : &it->second;

    switch (condition.op) {
    case ComparisonOperator::Eq:
        return catalog::loose_equals(candidate, &condition.value);
    case ComparisonOperator::Neq:
        return !catalog::loose_equals(candidate, &condition.value);
    case ComparisonOperator::Gt:
    case ComparisonOperator::Gte:
    case ComparisonOperator::Lt:
    case ComparisonOperator::Lte:
        return ordered_compare(candidate, condition.value, condition.op);
    case ComparisonOperator::Contains:
        return contains_match(candidate, condition.value);
    case ComparisonOperator::In:
        return membership_match(candidate, condition.value);
    default:
        return false;
    }
}

bool matches_criteria(const catalog::Row& row, std::span<const CriteriaCondition> criteria)
{
    return std::all_of(criteria.begin(), criteria.end(), [&row](const CriteriaCondition& condition) {
        return evaluate_condition(row, condition);
    });
}

int compare_for_sort(const catalog::Value* lhs, const catalog::Value* rhs)
{
    const bool lhs_null = lhs == nullptr || lhs->is_null();
    const bool rhs_null = rhs == nullptr || rhs->is_null();
    if (lhs_null || rhs_null) {
        if (lhs_null && rhs_null) {
            return 0;
        }
        return lhs_null ? -1 : 1;
    }

    if (lhs->is_number() && rhs->is_number()) {
        const auto left = lhs->as_number();
        const auto right = rhs->as_number();
        if (left < right) {
            return -1;
        }
        return left > right ? 1 : 0;
    }

    const auto left = catalog::to_display_string(*lhs);
    const auto right = catalog::to_display_string(*rhs);
    const auto order = left.compare(right);
    if (order < 0) {
        return -1;
    }
    return order > 0 ? 1 : 0;
}

}  // namespace docstore::executor
