// File: include/ts/core/trials/trial_expression.hpp
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "ts/core/status.hpp"
#include "ts/core/trials/trial.hpp"
#include "ts/core/value.hpp"

namespace ts {

// Small side-effect free expression over trial enhancements, parsed once.
//
// Grammar, loosest binding first:
//   or       := and (("or" | "||" | "|") and)*
//   and      := not (("and" | "&&" | "&") not)*
//   not      := ("not" | "!") not | compare
//   compare  := additive (("<" | "<=" | ">" | ">=" | "==" | "!=") additive)*
//   additive := term (("+" | "-") term)*
//   term     := unary (("*" | "/" | "%") unary)*
//   unary    := ("-" | "+") unary | primary
//   primary  := number | 'string' | "string" | True | False | None
//             | true | false | null | identifier | "(" or ")"
//
// Identifiers name trial enhancements. Unknown names, type mismatches and
// division by zero are evaluation errors.
class TrialExpression {
 public:
  static Result<TrialExpression> parse(std::string_view expression, Value default_value = Value());

  // Evaluation errors are logged and yield default_value().
  [[nodiscard]] Value evaluate(const Trial& trial) const;

  [[nodiscard]] Result<Value> try_evaluate(const ValueMap& variables) const;

  [[nodiscard]] const std::string& expression() const noexcept { return expression_; }
  [[nodiscard]] const Value& default_value() const noexcept { return default_value_; }

  struct Node;

 private:
  TrialExpression(std::string expression, std::shared_ptr<const Node> root, Value default_value);

  std::string expression_;
  std::shared_ptr<const Node> root_;
  Value default_value_;
};

}  // namespace ts
