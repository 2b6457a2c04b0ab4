#include "docstore/executor/criteria_evaluator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using docstore::catalog::Row;
using docstore::catalog::Value;
using docstore::catalog::ValueArray;
using docstore::executor::ComparisonOperator;
using docstore::executor::CriteriaCondition;

namespace {

Row sample_row()
{
    return Row{{"id", Value{7}}, {"name", Value{"Grace Hopper"}}, {"age", Value{"85"}}, {"active", Value{true}}, {"note", Value{}}};
}

CriteriaCondition condition(std::string column, ComparisonOperator op, Value value)
{
    return CriteriaCondition{std::move(column), op, std::move(value)};
}

}  // namespace

TEST_CASE("Equality uses loose comparison")
{
    const auto row = sample_row();

    CHECK(docstore::executor::evaluate_condition(row, condition("id", ComparisonOperator::Eq, Value{"7"})));
    CHECK(docstore::executor::evaluate_condition(row, condition("note", ComparisonOperator::Eq, Value{})));
    CHECK(docstore::executor::evaluate_condition(row, condition("missing", ComparisonOperator::Eq, Value{})));
    CHECK_FALSE(docstore::executor::evaluate_condition(row, condition("id", ComparisonOperator::Eq, Value{8})));
    CHECK(docstore::executor::evaluate_condition(row, condition("id", ComparisonOperator::Neq, Value{8})));
}

TEST_CASE("Ordered comparisons coerce numeric strings")
{
    const auto row = sample_row();

    CHECK(docstore::executor::evaluate_condition(row, condition("age", ComparisonOperator::Gt, Value{80})));
    CHECK(docstore::executor::evaluate_condition(row, condition("age", ComparisonOperator::Gte, Value{85})));
    CHECK(docstore::executor::evaluate_condition(row, condition("id", ComparisonOperator::Lt, Value{"10"})));
    CHECK(docstore::executor::evaluate_condition(row, condition("id", ComparisonOperator::Lte, Value{7})));
    CHECK_FALSE(docstore::executor::evaluate_condition(row, condition("name", ComparisonOperator::Gt, Value{1})));
    CHECK_FALSE(docstore::executor::evaluate_condition(row, condition("note", ComparisonOperator::Lt, Value{1})));
}

TEST_CASE("Contains matches substrings case-insensitively")
{
    const auto row = sample_row();

    CHECK(docstore::executor::evaluate_condition(row, condition("name", ComparisonOperator::Contains, Value{"hopper"})));
    CHECK(docstore::executor::evaluate_condition(row, condition("id", ComparisonOperator::Contains, Value{"7"})));
    CHECK_FALSE(docstore::executor::evaluate_condition(row, condition("name", ComparisonOperator::Contains, Value{"lovelace"})));
    CHECK_FALSE(docstore::executor::evaluate_condition(row, condition("note", ComparisonOperator::Contains, Value{"x"})));
    CHECK_FALSE(docstore::executor::evaluate_condition(row, condition("missing", ComparisonOperator::Contains, Value{""})));
}

TEST_CASE("In requires an array operand")
{
    const auto row = sample_row();

    const Value ids{ValueArray{Value{1}, Value{"7"}}};
    CHECK(docstore::executor::evaluate_condition(row, condition("id", ComparisonOperator::In, ids)));
    CHECK_FALSE(docstore::executor::evaluate_condition(row, condition("id", ComparisonOperator::In, Value{ValueArray{Value{2}}})));
    CHECK_FALSE(docstore::executor::evaluate_condition(row, condition("id", ComparisonOperator::In, Value{7})));
}

TEST_CASE("Criteria lists are conjunctions")
{
    const auto row = sample_row();

    const std::vector<CriteriaCondition> empty{};
    CHECK(docstore::executor::matches_criteria(row, empty));

    const std::vector<CriteriaCondition> both{
        condition("id", ComparisonOperator::Eq, Value{7}),
        condition("active", ComparisonOperator::Eq, Value{true})};
    CHECK(docstore::executor::matches_criteria(row, both));

    const std::vector<CriteriaCondition> one_fails{
        condition("id", ComparisonOperator::Eq, Value{7}),
        condition("active", ComparisonOperator::Eq, Value{false})};
    CHECK_FALSE(docstore::executor::matches_criteria(row, one_fails));
}

TEST_CASE("compare_for_sort orders nulls first")
{
    const Value null_value{};
    const Value one{1};
    const Value ten{10};
    const Value apple{"apple"};
    const Value banana{"banana"};

    CHECK(docstore::executor::compare_for_sort(&null_value, &one) < 0);
    CHECK(docstore::executor::compare_for_sort(&one, nullptr) > 0);
    CHECK(docstore::executor::compare_for_sort(nullptr, &null_value) == 0);
    CHECK(docstore::executor::compare_for_sort(&one, &ten) < 0);
    CHECK(docstore::executor::compare_for_sort(&banana, &apple) > 0);
    CHECK(docstore::executor::compare_for_sort(&apple, &apple) == 0);
}
