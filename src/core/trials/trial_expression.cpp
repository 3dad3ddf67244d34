// File: src/core/trials/trial_expression.cpp
#include "ts/core/trials/trial_expression.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <utility>
#include <vector>

#include "ts/core/log.hpp"

namespace ts {

// -----------------------------
// AST
// -----------------------------

struct TrialExpression::Node {
  enum class Kind { kLiteral, kVariable, kUnary, kBinary };
  enum class Op {
    kNeg, kPos, kNot,
    kOr, kAnd,
    kLt, kLe, kGt, kGe, kEq, kNe,
    kAdd, kSub, kMul, kDiv, kMod,
  };

  Kind kind{Kind::kLiteral};
  Value literal;
  std::string name;
  Op op{Op::kAdd};
  std::shared_ptr<const Node> lhs;
  std::shared_ptr<const Node> rhs;
};

namespace {

using Node = TrialExpression::Node;
using Op = Node::Op;
using NodePtr = std::shared_ptr<const Node>;
using NodeResult = Result<NodePtr>;
using ValueResult = Result<Value>;

NodePtr make_literal(Value v) {
  auto n = std::make_shared<Node>();
  n->kind = Node::Kind::kLiteral;
  n->literal = std::move(v);
  return n;
}

NodePtr make_variable(std::string name) {
  auto n = std::make_shared<Node>();
  n->kind = Node::Kind::kVariable;
  n->name = std::move(name);
  return n;
}

NodePtr make_unary(Op op, NodePtr operand) {
  auto n = std::make_shared<Node>();
  n->kind = Node::Kind::kUnary;
  n->op = op;
  n->lhs = std::move(operand);
  return n;
}

NodePtr make_binary(Op op, NodePtr lhs, NodePtr rhs) {
  auto n = std::make_shared<Node>();
  n->kind = Node::Kind::kBinary;
  n->op = op;
  n->lhs = std::move(lhs);
  n->rhs = std::move(rhs);
  return n;
}

// -----------------------------
// Tokens
// -----------------------------

struct Token {
  enum class Type { kNumber, kString, kIdent, kSymbol, kEnd };

  Type type{Type::kEnd};
  std::string text;
  Value value;
  std::size_t pos{0};
};

bool is_ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

Result<std::vector<Token>> tokenize(std::string_view src) {
  using R = Result<std::vector<Token>>;
  std::vector<Token> out;
  std::size_t i = 0;
  while (i < src.size()) {
    const char c = src[i];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
      continue;
    }

    Token t;
    t.pos = i;

    if (std::isdigit(static_cast<unsigned char>(c)) ||
        (c == '.' && i + 1 < src.size() && std::isdigit(static_cast<unsigned char>(src[i + 1])))) {
      std::size_t j = i;
      bool is_float = false;
      while (j < src.size() && std::isdigit(static_cast<unsigned char>(src[j]))) ++j;
      if (j < src.size() && src[j] == '.') {
        is_float = true;
        ++j;
        while (j < src.size() && std::isdigit(static_cast<unsigned char>(src[j]))) ++j;
      }
      if (j < src.size() && (src[j] == 'e' || src[j] == 'E')) {
        std::size_t k = j + 1;
        if (k < src.size() && (src[k] == '+' || src[k] == '-')) ++k;
        if (k < src.size() && std::isdigit(static_cast<unsigned char>(src[k]))) {
          is_float = true;
          j = k;
          while (j < src.size() && std::isdigit(static_cast<unsigned char>(src[j]))) ++j;
        }
      }
      t.type = Token::Type::kNumber;
      t.text = std::string(src.substr(i, j - i));
      if (is_float) {
        t.value = Value(std::strtod(t.text.c_str(), nullptr));
      } else {
        t.value = Value(static_cast<std::int64_t>(std::strtoll(t.text.c_str(), nullptr, 10)));
      }
      out.push_back(std::move(t));
      i = j;
      continue;
    }

    if (c == '"' || c == '\'') {
      std::string s;
      std::size_t j = i + 1;
      bool closed = false;
      while (j < src.size()) {
        const char d = src[j];
        if (d == c) {
          closed = true;
          ++j;
          break;
        }
        if (d == '\\' && j + 1 < src.size()) {
          const char e = src[j + 1];
          switch (e) {
            case 'n': s.push_back('\n'); break;
            case 't': s.push_back('\t'); break;
            default: s.push_back(e); break;
          }
          j += 2;
          continue;
        }
        s.push_back(d);
        ++j;
      }
      if (!closed) return R::err(Status::parse_error("unterminated string at " + std::to_string(i)));
      t.type = Token::Type::kString;
      t.text = std::string(src.substr(i, j - i));
      t.value = Value(std::move(s));
      out.push_back(std::move(t));
      i = j;
      continue;
    }

    if (is_ident_start(c)) {
      std::size_t j = i;
      while (j < src.size() && is_ident_char(src[j])) ++j;
      t.type = Token::Type::kIdent;
      t.text = std::string(src.substr(i, j - i));
      out.push_back(std::move(t));
      i = j;
      continue;
    }

    static const char* const kTwoChar[] = {"<=", ">=", "==", "!=", "&&", "||"};
    bool matched = false;
    if (i + 1 < src.size()) {
      for (const char* sym : kTwoChar) {
        if (src[i] == sym[0] && src[i + 1] == sym[1]) {
          t.type = Token::Type::kSymbol;
          t.text = sym;
          matched = true;
          break;
        }
      }
    }
    if (!matched) {
      static const std::string_view kOneChar = "<>+-*/%()!&|";
      if (kOneChar.find(c) == std::string_view::npos) {
        return R::err(Status::parse_error("unexpected '" + std::string(1, c) + "' at " + std::to_string(i)));
      }
      t.type = Token::Type::kSymbol;
      t.text = std::string(1, c);
    }
    i += t.text.size();
    out.push_back(std::move(t));
  }

  Token end;
  end.type = Token::Type::kEnd;
  end.pos = src.size();
  out.push_back(std::move(end));
  return R::ok(std::move(out));
}

// -----------------------------
// Parser
// -----------------------------

class Parser {
 public:
  explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

  NodeResult parse() {
    auto root = parse_or();
    if (!root.ok()) return root;
    if (peek().type != Token::Type::kEnd) return error_at(peek(), "unexpected trailing input");
    return root;
  }

 private:
  const Token& peek() const { return tokens_[idx_]; }
  void advance() {
    if (idx_ + 1 < tokens_.size()) ++idx_;
  }

  bool accept(std::initializer_list<const char*> texts, Token::Type type = Token::Type::kSymbol) {
    const Token& t = peek();
    if (t.type != type) return false;
    for (const char* s : texts) {
      if (t.text == s) {
        advance();
        return true;
      }
    }
    return false;
  }

  bool accept_keyword(std::initializer_list<const char*> words) { return accept(words, Token::Type::kIdent); }

  static NodeResult error_at(const Token& t, const std::string& what) {
    const std::string near = t.type == Token::Type::kEnd ? "end of input" : "'" + t.text + "'";
    return NodeResult::err(Status::parse_error(what + " near " + near + " at " + std::to_string(t.pos)));
  }

  NodeResult parse_or() {
    auto lhs = parse_and();
    if (!lhs.ok()) return lhs;
    NodePtr node = lhs.take_value();
    while (accept_keyword({"or"}) || accept({"||", "|"})) {
      auto rhs = parse_and();
      if (!rhs.ok()) return rhs;
      node = make_binary(Op::kOr, node, rhs.take_value());
    }
    return NodeResult::ok(node);
  }

  NodeResult parse_and() {
    auto lhs = parse_not();
    if (!lhs.ok()) return lhs;
    NodePtr node = lhs.take_value();
    while (accept_keyword({"and"}) || accept({"&&", "&"})) {
      auto rhs = parse_not();
      if (!rhs.ok()) return rhs;
      node = make_binary(Op::kAnd, node, rhs.take_value());
    }
    return NodeResult::ok(node);
  }

  NodeResult parse_not() {
    if (accept_keyword({"not"}) || accept({"!"})) {
      auto operand = parse_not();
      if (!operand.ok()) return operand;
      return NodeResult::ok(make_unary(Op::kNot, operand.take_value()));
    }
    return parse_compare();
  }

  NodeResult parse_compare() {
    auto lhs = parse_additive();
    if (!lhs.ok()) return lhs;
    NodePtr node = lhs.take_value();
    while (true) {
      Op op;
      if (accept({"<="})) op = Op::kLe;
      else if (accept({">="})) op = Op::kGe;
      else if (accept({"<"})) op = Op::kLt;
      else if (accept({">"})) op = Op::kGt;
      else if (accept({"=="})) op = Op::kEq;
      else if (accept({"!="})) op = Op::kNe;
      else break;
      auto rhs = parse_additive();
      if (!rhs.ok()) return rhs;
      node = make_binary(op, node, rhs.take_value());
    }
    return NodeResult::ok(node);
  }

  NodeResult parse_additive() {
    auto lhs = parse_term();
    if (!lhs.ok()) return lhs;
    NodePtr node = lhs.take_value();
    while (true) {
      Op op;
      if (accept({"+"})) op = Op::kAdd;
      else if (accept({"-"})) op = Op::kSub;
      else break;
      auto rhs = parse_term();
      if (!rhs.ok()) return rhs;
      node = make_binary(op, node, rhs.take_value());
    }
    return NodeResult::ok(node);
  }

  NodeResult parse_term() {
    auto lhs = parse_unary();
    if (!lhs.ok()) return lhs;
    NodePtr node = lhs.take_value();
    while (true) {
      Op op;
      if (accept({"*"})) op = Op::kMul;
      else if (accept({"/"})) op = Op::kDiv;
      else if (accept({"%"})) op = Op::kMod;
      else break;
      auto rhs = parse_unary();
      if (!rhs.ok()) return rhs;
      node = make_binary(op, node, rhs.take_value());
    }
    return NodeResult::ok(node);
  }

  NodeResult parse_unary() {
    Op op;
    if (accept({"-"})) op = Op::kNeg;
    else if (accept({"+"})) op = Op::kPos;
    else return parse_primary();

    auto operand = parse_unary();
    if (!operand.ok()) return operand;
    return NodeResult::ok(make_unary(op, operand.take_value()));
  }

  NodeResult parse_primary() {
    const Token& t = peek();
    switch (t.type) {
      case Token::Type::kNumber:
      case Token::Type::kString: {
        Value v = t.value;
        advance();
        return NodeResult::ok(make_literal(std::move(v)));
      }
      case Token::Type::kIdent: {
        const std::string word = t.text;
        if (word == "and" || word == "or" || word == "not") return error_at(t, "expected a value");
        advance();
        if (word == "True" || word == "true") return NodeResult::ok(make_literal(Value(true)));
        if (word == "False" || word == "false") return NodeResult::ok(make_literal(Value(false)));
        if (word == "None" || word == "null") return NodeResult::ok(make_literal(Value()));
        return NodeResult::ok(make_variable(word));
      }
      case Token::Type::kSymbol:
        if (t.text == "(") {
          advance();
          auto inner = parse_or();
          if (!inner.ok()) return inner;
          if (!accept({")"})) return error_at(peek(), "expected ')'");
          return inner;
        }
        return error_at(t, "expected a value");
      case Token::Type::kEnd:
        break;
    }
    return error_at(t, "expected a value");
  }

  std::vector<Token> tokens_;
  std::size_t idx_{0};
};

// -----------------------------
// Evaluation
// -----------------------------

const char* op_name(Op op) {
  switch (op) {
    case Op::kNeg: return "-";
    case Op::kPos: return "+";
    case Op::kNot: return "not";
    case Op::kOr: return "or";
    case Op::kAnd: return "and";
    case Op::kLt: return "<";
    case Op::kLe: return "<=";
    case Op::kGt: return ">";
    case Op::kGe: return ">=";
    case Op::kEq: return "==";
    case Op::kNe: return "!=";
    case Op::kAdd: return "+";
    case Op::kSub: return "-";
    case Op::kMul: return "*";
    case Op::kDiv: return "/";
    case Op::kMod: return "%";
  }
  return "?";
}

ValueResult type_error(Op op, const Value& a, const Value& b) {
  return ValueResult::err(Status::invalid_argument(std::string("unsupported operands for ") + op_name(op) + ": " +
                                                   a.to_string() + ", " + b.to_string()));
}

ValueResult compare(Op op, const Value& a, const Value& b) {
  if (op == Op::kEq) return ValueResult::ok(Value(a == b));
  if (op == Op::kNe) return ValueResult::ok(Value(a != b));

  int cmp = 0;
  if (a.is_number() && b.is_number()) {
    const double x = a.as_double();
    const double y = b.as_double();
    cmp = x < y ? -1 : (x > y ? 1 : 0);
  } else if (a.is_string() && b.is_string()) {
    cmp = a.as_string().compare(b.as_string());
  } else {
    return type_error(op, a, b);
  }

  switch (op) {
    case Op::kLt: return ValueResult::ok(Value(cmp < 0));
    case Op::kLe: return ValueResult::ok(Value(cmp <= 0));
    case Op::kGt: return ValueResult::ok(Value(cmp > 0));
    case Op::kGe: return ValueResult::ok(Value(cmp >= 0));
    default: return type_error(op, a, b);
  }
}

ValueResult arithmetic(Op op, const Value& a, const Value& b) {
  if (op == Op::kAdd && a.is_string() && b.is_string()) {
    return ValueResult::ok(Value(a.as_string() + b.as_string()));
  }
  if (op == Op::kAdd && a.is_list() && b.is_list()) {
    Value::List joined = a.as_list();
    joined.insert(joined.end(), b.as_list().begin(), b.as_list().end());
    return ValueResult::ok(Value(std::move(joined)));
  }
  if (!a.is_number() || !b.is_number()) return type_error(op, a, b);

  if ((op == Op::kDiv || op == Op::kMod) && b.as_double() == 0.0) {
    return ValueResult::err(Status::invalid_argument("division by zero"));
  }

  if (a.is_int() && b.is_int() && op != Op::kDiv) {
    const std::int64_t x = a.as_int();
    const std::int64_t y = b.as_int();
    std::int64_t r = 0;
    switch (op) {
      case Op::kAdd:
        if (!__builtin_add_overflow(x, y, &r)) return ValueResult::ok(Value(r));
        break;
      case Op::kSub:
        if (!__builtin_sub_overflow(x, y, &r)) return ValueResult::ok(Value(r));
        break;
      case Op::kMul:
        if (!__builtin_mul_overflow(x, y, &r)) return ValueResult::ok(Value(r));
        break;
      case Op::kMod: {
        // Result takes the sign of the divisor.
        if (y == -1) return ValueResult::ok(Value(std::int64_t{0}));
        r = x % y;
        if (r != 0 && ((r < 0) != (y < 0))) r += y;
        return ValueResult::ok(Value(r));
      }
      default: return type_error(op, a, b);
    }
    // Out of int64 range: continue in double.
  }

  const double x = a.as_double();
  const double y = b.as_double();
  switch (op) {
    case Op::kAdd: return ValueResult::ok(Value(x + y));
    case Op::kSub: return ValueResult::ok(Value(x - y));
    case Op::kMul: return ValueResult::ok(Value(x * y));
    case Op::kDiv: return ValueResult::ok(Value(x / y));
    case Op::kMod: {
      double r = std::fmod(x, y);
      if (r != 0.0 && ((r < 0.0) != (y < 0.0))) r += y;
      return ValueResult::ok(Value(r));
    }
    default: return type_error(op, a, b);
  }
}

ValueResult eval(const Node& n, const ValueMap& vars) {
  switch (n.kind) {
    case Node::Kind::kLiteral:
      return ValueResult::ok(n.literal);

    case Node::Kind::kVariable: {
      const auto it = vars.find(n.name);
      if (it == vars.end()) return ValueResult::err(Status::not_found("name '" + n.name + "' is not defined"));
      return ValueResult::ok(it->second);
    }

    case Node::Kind::kUnary: {
      auto operand = eval(*n.lhs, vars);
      if (!operand.ok()) return operand;
      const Value& v = operand.value();
      if (n.op == Op::kNot) return ValueResult::ok(Value(!v.truthy()));
      if (v.is_int()) {
        const std::int64_t i = v.as_int();
        if (n.op != Op::kNeg) return ValueResult::ok(v);
        if (i == std::numeric_limits<std::int64_t>::min()) return ValueResult::ok(Value(-static_cast<double>(i)));
        return ValueResult::ok(Value(-i));
      }
      if (v.is_double()) return ValueResult::ok(Value(n.op == Op::kNeg ? -v.as_double() : v.as_double()));
      return ValueResult::err(
          Status::invalid_argument(std::string("bad operand for unary ") + op_name(n.op) + ": " + v.to_string()));
    }

    case Node::Kind::kBinary: {
      auto lhs = eval(*n.lhs, vars);
      if (!lhs.ok()) return lhs;

      if (n.op == Op::kAnd || n.op == Op::kOr) {
        // The operand that decides the result is the result.
        const bool l = lhs.value().truthy();
        if ((n.op == Op::kAnd) != l) return lhs;
        return eval(*n.rhs, vars);
      }

      auto rhs = eval(*n.rhs, vars);
      if (!rhs.ok()) return rhs;

      switch (n.op) {
        case Op::kLt:
        case Op::kLe:
        case Op::kGt:
        case Op::kGe:
        case Op::kEq:
        case Op::kNe:
          return compare(n.op, lhs.value(), rhs.value());
        default:
          return arithmetic(n.op, lhs.value(), rhs.value());
      }
    }
  }
  return ValueResult::err(Status::internal("bad expression node"));
}

}  // namespace

TrialExpression::TrialExpression(std::string expression, std::shared_ptr<const Node> root, Value default_value)
    : expression_(std::move(expression)), root_(std::move(root)), default_value_(std::move(default_value)) {}

Result<TrialExpression> TrialExpression::parse(std::string_view expression, Value default_value) {
  auto tokens = tokenize(expression);
  if (!tokens.ok()) {
    return Result<TrialExpression>::err(
        Status::parse_error("bad expression \"" + std::string(expression) + "\": " + tokens.status().message()));
  }

  Parser parser(tokens.take_value());
  auto root = parser.parse();
  if (!root.ok()) {
    return Result<TrialExpression>::err(
        Status::parse_error("bad expression \"" + std::string(expression) + "\": " + root.status().message()));
  }
  return Result<TrialExpression>::ok(
      TrialExpression(std::string(expression), root.take_value(), std::move(default_value)));
}

Result<Value> TrialExpression::try_evaluate(const ValueMap& variables) const {
  return eval(*root_, variables);
}

Value TrialExpression::evaluate(const Trial& trial) const {
  auto r = try_evaluate(trial.enhancements);
  if (!r.ok()) {
    log::error("Error evaluating \"{}\": {}", expression_, r.status().to_string());
    log::warn("Using default value {} for \"{}\"", default_value_.to_string(), expression_);
    return default_value_;
  }
  return r.take_value();
}

}  // namespace ts
