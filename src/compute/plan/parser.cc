/*
 * Copyright 2018- The Pixie Authors.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "src/compute/plan/parser.h"

#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/escaping.h>
#include <absl/strings/numbers.h>
#include <absl/strings/substitute.h>

#include "src/compute/plan/plan_error.h"
#include "src/shared/types/types.h"

namespace dp {
namespace compute {
namespace plan {

namespace {

enum class TokenType { kOpenParen, kCloseParen, kOpenBracket, kCloseBracket, kAtom, kString, kEnd };

struct Token {
  TokenType type = TokenType::kEnd;
  // Unescaped contents for strings.
  std::string text;
  int64_t line = 0;
  int64_t column = 0;
};

bool IsAtomChar(char c) {
  return absl::ascii_isalnum(c) || c == '_' || c == '#' || c == '-' || c == '+' || c == '.';
}

class Lexer {
 public:
  explicit Lexer(std::string_view text) : text_(text) {}

  StatusOr<std::vector<Token>> Tokenize() {
    std::vector<Token> tokens;
    while (true) {
      SkipSpaceAndComments();
      Token token;
      token.line = line_;
      token.column = column_;
      if (pos_ >= text_.size()) {
        tokens.push_back(std::move(token));
        return tokens;
      }
      char c = text_[pos_];
      switch (c) {
        case '(':
          token.type = TokenType::kOpenParen;
          break;
        case ')':
          token.type = TokenType::kCloseParen;
          break;
        case '[':
          token.type = TokenType::kOpenBracket;
          break;
        case ']':
          token.type = TokenType::kCloseBracket;
          break;
        case '"': {
          DP_ASSIGN_OR_RETURN(token.text, ReadString());
          token.type = TokenType::kString;
          tokens.push_back(std::move(token));
          continue;
        }
        default:
          if (!IsAtomChar(c)) {
            std::string bad(1, c);
            return PlanErrorStatus(planpb::PARSE_ERROR, LineColErrorContext(line_, column_, bad),
                                   "$0:$1: unexpected character '$2'", line_, column_, bad);
          }
          token.type = TokenType::kAtom;
          while (pos_ < text_.size() && IsAtomChar(text_[pos_])) {
            token.text.push_back(text_[pos_]);
            Advance();
          }
          tokens.push_back(std::move(token));
          continue;
      }
      token.text = std::string(1, c);
      Advance();
      tokens.push_back(std::move(token));
    }
  }

 private:
  void Advance() {
    if (text_[pos_] == '\n') {
      ++line_;
      column_ = 1;
    } else {
      ++column_;
    }
    ++pos_;
  }

  void SkipSpaceAndComments() {
    while (pos_ < text_.size()) {
      if (text_[pos_] == ';') {
        while (pos_ < text_.size() && text_[pos_] != '\n') {
          Advance();
        }
      } else if (absl::ascii_isspace(text_[pos_])) {
        Advance();
      } else {
        return;
      }
    }
  }

  StatusOr<std::string> ReadString() {
    int64_t line = line_;
    int64_t column = column_;
    Advance();
    std::string raw;
    while (pos_ < text_.size() && text_[pos_] != '"') {
      if (text_[pos_] == '\\' && pos_ + 1 < text_.size()) {
        raw.push_back(text_[pos_]);
        Advance();
      }
      raw.push_back(text_[pos_]);
      Advance();
    }
    if (pos_ >= text_.size()) {
      return PlanErrorStatus(planpb::PARSE_ERROR, LineColErrorContext(line, column, "\""),
                             "$0:$1: unterminated string", line, column);
    }
    Advance();
    std::string unescaped;
    std::string error;
    if (!absl::CUnescape(raw, &unescaped, &error)) {
      return PlanErrorStatus(planpb::PARSE_ERROR, LineColErrorContext(line, column, raw),
                             "$0:$1: bad string literal: $2", line, column, error);
    }
    return unescaped;
  }

  std::string_view text_;
  size_t pos_ = 0;
  int64_t line_ = 1;
  int64_t column_ = 1;
};

class Parser {
 public:
  explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

  StatusOr<planpb::PlanRequest> ParseRequest() {
    planpb::PlanRequest request;
    while (Peek().type != TokenType::kEnd) {
      DP_RETURN_IF_ERROR(ParseForm(request.add_forms()));
    }
    return request;
  }

 private:
  const Token& Peek() const { return tokens_[pos_]; }
  const Token& Next() {
    const Token& token = tokens_[pos_];
    if (token.type != TokenType::kEnd) {
      ++pos_;
    }
    return token;
  }

  bool PeekAtom(std::string_view text) const {
    return Peek().type == TokenType::kAtom && Peek().text == text;
  }

  template <typename... Args>
  Status ErrorAt(const Token& token, std::string_view format, Args... args) const {
    std::string where = token.type == TokenType::kEnd ? "end of input" : token.text;
    return PlanErrorStatus(planpb::PARSE_ERROR,
                           LineColErrorContext(token.line, token.column, token.text),
                           "$0:$1: $2 (at '$3')", token.line, token.column,
                           absl::Substitute(format, args...), where);
  }

  Status Expect(TokenType type, std::string_view what) {
    const Token& token = Next();
    if (token.type != type) {
      return ErrorAt(token, "expected $0", what);
    }
    return Status::OK();
  }

  StatusOr<std::string> ParseName() {
    const Token& token = Next();
    if (token.type != TokenType::kAtom) {
      return ErrorAt(token, "expected a name");
    }
    return token.text;
  }

  StatusOr<int64_t> ParseInteger() {
    const Token& token = Next();
    int64_t value;
    if (token.type != TokenType::kAtom || !absl::SimpleAtoi(token.text, &value)) {
      return ErrorAt(token, "expected an integer");
    }
    return value;
  }

  StatusOr<int64_t> ParseColumn() {
    const Token& token = Next();
    int64_t value;
    if (token.type != TokenType::kAtom || token.text.size() < 2 || token.text[0] != '#' ||
        !absl::SimpleAtoi(token.text.substr(1), &value)) {
      return ErrorAt(token, "expected a column reference like #0");
    }
    return value;
  }

  StatusOr<types::DataType> ParseType() {
    const Token& token = Next();
    auto type = types::ParseDataType(token.text);
    if (token.type != TokenType::kAtom || !type.ok()) {
      return ErrorAt(token, "expected a type");
    }
    return type.ConsumeValueOrDie();
  }

  // Parses `[ELEM ...]`, calling parse_elem once per element.
  template <typename ParseElemFn>
  Status ParseList(ParseElemFn parse_elem) {
    DP_RETURN_IF_ERROR(Expect(TokenType::kOpenBracket, "'['"));
    while (Peek().type != TokenType::kCloseBracket) {
      if (Peek().type == TokenType::kEnd) {
        return ErrorAt(Peek(), "unterminated list");
      }
      DP_RETURN_IF_ERROR(parse_elem());
    }
    Next();
    return Status::OK();
  }

  Status ParseColumnList(planpb::ColumnList* out) {
    return ParseList([&]() -> Status {
      DP_ASSIGN_OR_RETURN(int64_t column, ParseColumn());
      out->add_columns(column);
      return Status::OK();
    });
  }

  Status ParseForm(planpb::Form* form) {
    if (Peek().type != TokenType::kOpenParen) {
      return ErrorAt(Peek(), "expected '('");
    }
    const Token& head = tokens_[pos_ + 1];
    if (head.type == TokenType::kAtom && head.text == "defsource") {
      pos_ += 2;
      auto* source = form->mutable_source();
      DP_ASSIGN_OR_RETURN(*source->mutable_name(), ParseName());
      DP_RETURN_IF_ERROR(ParseList([&]() -> Status {
        DP_ASSIGN_OR_RETURN(types::DataType type, ParseType());
        source->add_column_types(type);
        return Status::OK();
      }));
      return Expect(TokenType::kCloseParen, "')'");
    }
    auto* result = form->mutable_result();
    if (head.type == TokenType::kAtom && head.text == "defview") {
      pos_ += 2;
      DP_ASSIGN_OR_RETURN(*result->mutable_name(), ParseName());
      DP_RETURN_IF_ERROR(ParseRelation(result->mutable_expr()));
      return Expect(TokenType::kCloseParen, "')'");
    }
    return ParseRelation(result->mutable_expr());
  }

  Status ParseRelations(google::protobuf::RepeatedPtrField<planpb::RelationExpr>* out) {
    return ParseList([&]() { return ParseRelation(out->Add()); });
  }

  Status ParseScalars(google::protobuf::RepeatedPtrField<planpb::ScalarExpr>* out) {
    return ParseList([&]() { return ParseScalar(out->Add()); });
  }

  Status ParseRelation(planpb::RelationExpr* expr) {
    DP_RETURN_IF_ERROR(Expect(TokenType::kOpenParen, "'(' starting a relational form"));
    const Token& op = Next();
    if (op.type != TokenType::kAtom) {
      return ErrorAt(op, "expected an operator");
    }
    if (op.text == "constant") {
      auto* constant = expr->mutable_constant();
      DP_RETURN_IF_ERROR(ParseList([&]() -> Status {
        return ParseScalars(constant->add_rows()->mutable_values());
      }));
      DP_RETURN_IF_ERROR(ParseList([&]() -> Status {
        DP_ASSIGN_OR_RETURN(types::DataType type, ParseType());
        constant->add_column_types(type);
        return Status::OK();
      }));
    } else if (op.text == "get") {
      DP_ASSIGN_OR_RETURN(*expr->mutable_get()->mutable_name(), ParseName());
    } else if (op.text == "let") {
      auto* let = expr->mutable_let();
      DP_ASSIGN_OR_RETURN(*let->mutable_name(), ParseName());
      DP_RETURN_IF_ERROR(ParseRelation(let->mutable_value()));
      DP_RETURN_IF_ERROR(ParseRelation(let->mutable_body()));
    } else if (op.text == "map") {
      DP_RETURN_IF_ERROR(ParseRelation(expr->mutable_map()->mutable_input()));
      DP_RETURN_IF_ERROR(ParseScalars(expr->mutable_map()->mutable_exprs()));
    } else if (op.text == "filter") {
      DP_RETURN_IF_ERROR(ParseRelation(expr->mutable_filter()->mutable_input()));
      DP_RETURN_IF_ERROR(ParseScalars(expr->mutable_filter()->mutable_predicates()));
    } else if (op.text == "project") {
      auto* project = expr->mutable_project();
      DP_RETURN_IF_ERROR(ParseRelation(project->mutable_input()));
      DP_RETURN_IF_ERROR(ParseList([&]() -> Status {
        DP_ASSIGN_OR_RETURN(int64_t column, ParseColumn());
        project->add_outputs(column);
        return Status::OK();
      }));
    } else if (op.text == "arrange_by") {
      auto* arrange = expr->mutable_arrange_by();
      DP_RETURN_IF_ERROR(ParseRelation(arrange->mutable_input()));
      DP_RETURN_IF_ERROR(ParseList([&]() { return ParseColumnList(arrange->add_keys()); }));
    } else if (op.text == "join") {
      DP_RETURN_IF_ERROR(ParseJoin(expr->mutable_join()));
    } else if (op.text == "reduce" || op.text == "distinct") {
      auto* reduce = expr->mutable_reduce();
      DP_RETURN_IF_ERROR(ParseRelation(reduce->mutable_input()));
      DP_RETURN_IF_ERROR(ParseScalars(reduce->mutable_group_key()));
      if (op.text == "reduce") {
        DP_RETURN_IF_ERROR(ParseList([&]() { return ParseAggregate(reduce->add_aggregates()); }));
      }
    } else if (op.text == "top_k") {
      DP_RETURN_IF_ERROR(ParseTopK(expr->mutable_top_k()));
    } else if (op.text == "union") {
      DP_RETURN_IF_ERROR(ParseRelations(expr->mutable_union_all()->mutable_inputs()));
    } else if (op.text == "negate") {
      DP_RETURN_IF_ERROR(ParseRelation(expr->mutable_negate()->mutable_input()));
    } else if (op.text == "threshold") {
      DP_RETURN_IF_ERROR(ParseRelation(expr->mutable_threshold()->mutable_input()));
    } else {
      return ErrorAt(op, "unknown relational operator");
    }
    return Expect(TokenType::kCloseParen, "')'");
  }

  Status ParseJoin(planpb::JoinExpr* join) {
    DP_RETURN_IF_ERROR(ParseRelations(join->mutable_inputs()));
    DP_RETURN_IF_ERROR(ParseList([&]() { return ParseColumnList(join->add_equivalences()); }));
    if (Peek().type == TokenType::kCloseParen) {
      return Status::OK();
    }
    if (PeekAtom("none")) {
      Next();
    } else {
      DP_RETURN_IF_ERROR(ParseColumnList(join->mutable_demand()));
    }
    if (Peek().type == TokenType::kCloseParen) {
      return Status::OK();
    }
    auto* implementation = join->mutable_implementation();
    if (PeekAtom("unplanned")) {
      Next();
      implementation->mutable_unplanned();
      return Status::OK();
    }
    DP_RETURN_IF_ERROR(Expect(TokenType::kOpenParen, "'unplanned' or '(delta_query ...)'"));
    if (!PeekAtom("delta_query")) {
      return ErrorAt(Peek(), "expected 'delta_query'");
    }
    Next();
    auto* delta = implementation->mutable_delta_query();
    DP_RETURN_IF_ERROR(ParseList([&]() {
      auto* rule = delta->add_rules();
      return ParseList([&]() -> Status {
        auto* step = rule->add_steps();
        DP_RETURN_IF_ERROR(Expect(TokenType::kOpenParen, "'(' starting a delta step"));
        DP_ASSIGN_OR_RETURN(int64_t input, ParseInteger());
        step->set_input(input);
        DP_RETURN_IF_ERROR(ParseList([&]() -> Status {
          DP_ASSIGN_OR_RETURN(int64_t column, ParseColumn());
          step->add_key(column);
          return Status::OK();
        }));
        return Expect(TokenType::kCloseParen, "')'");
      });
    }));
    return Expect(TokenType::kCloseParen, "')'");
  }

  // (FN #n) or (FN #n distinct)
  Status ParseAggregate(planpb::AggregateExpr* agg) {
    DP_RETURN_IF_ERROR(Expect(TokenType::kOpenParen, "'(' starting an aggregate"));
    DP_ASSIGN_OR_RETURN(*agg->mutable_function(), ParseName());
    DP_ASSIGN_OR_RETURN(int64_t column, ParseColumn());
    agg->set_column(column);
    if (PeekAtom("distinct")) {
      Next();
      agg->set_distinct(true);
    }
    return Expect(TokenType::kCloseParen, "')'");
  }

  Status ParseTopK(planpb::TopKExpr* top_k) {
    DP_RETURN_IF_ERROR(ParseRelation(top_k->mutable_input()));
    DP_RETURN_IF_ERROR(ParseList([&]() -> Status {
      DP_ASSIGN_OR_RETURN(int64_t column, ParseColumn());
      top_k->add_group_key(column);
      return Status::OK();
    }));
    DP_RETURN_IF_ERROR(ParseList([&]() -> Status {
      DP_RETURN_IF_ERROR(Expect(TokenType::kOpenParen, "'(' starting an order key"));
      auto* key = top_k->add_order();
      DP_ASSIGN_OR_RETURN(int64_t column, ParseColumn());
      key->set_column(column);
      if (PeekAtom("desc")) {
        key->set_descending(true);
        Next();
      } else if (PeekAtom("asc")) {
        Next();
      }
      return Expect(TokenType::kCloseParen, "')'");
    }));
    if (Peek().type == TokenType::kCloseParen) {
      return Status::OK();
    }
    if (PeekAtom("none")) {
      Next();
    } else {
      DP_ASSIGN_OR_RETURN(int64_t limit, ParseInteger());
      top_k->set_limit(limit);
    }
    if (Peek().type == TokenType::kCloseParen) {
      return Status::OK();
    }
    DP_ASSIGN_OR_RETURN(int64_t offset, ParseInteger());
    top_k->set_offset(offset);
    return Status::OK();
  }

  Status ParseScalar(planpb::ScalarExpr* expr) {
    const Token& token = Next();
    switch (token.type) {
      case TokenType::kString: {
        auto* literal = expr->mutable_literal();
        literal->set_type(types::DataType::STRING);
        literal->set_string_value(token.text);
        return Status::OK();
      }
      case TokenType::kAtom:
        return ParseAtomScalar(token, expr);
      case TokenType::kOpenParen:
        return ParseScalarForm(expr);
      default:
        return ErrorAt(token, "expected a scalar expression");
    }
  }

  Status ParseAtomScalar(const Token& token, planpb::ScalarExpr* expr) {
    const std::string& text = token.text;
    if (text[0] == '#') {
      --pos_;
      DP_ASSIGN_OR_RETURN(int64_t column, ParseColumn());
      expr->mutable_column()->set_index(column);
      return Status::OK();
    }
    auto* literal = expr->mutable_literal();
    if (text == "true" || text == "false") {
      literal->set_type(types::DataType::BOOLEAN);
      literal->set_bool_value(text == "true");
      return Status::OK();
    }
    int64_t int_value;
    if (absl::SimpleAtoi(text, &int_value)) {
      literal->set_type(types::DataType::INT64);
      literal->set_int64_value(int_value);
      return Status::OK();
    }
    double float_value;
    if (text.find_first_of(".eE") != std::string::npos && absl::SimpleAtod(text, &float_value)) {
      literal->set_type(types::DataType::FLOAT64);
      literal->set_float64_value(float_value);
      return Status::OK();
    }
    return ErrorAt(token, "expected a scalar expression");
  }

  // The part of a parenthesized scalar after '('.
  Status ParseScalarForm(planpb::ScalarExpr* expr) {
    const Token& head = Next();
    if (head.type != TokenType::kAtom) {
      return ErrorAt(head, "expected a scalar form");
    }
    if (head.text == "int32") {
      const Token& token = Peek();
      DP_ASSIGN_OR_RETURN(int64_t value, ParseInteger());
      if (value < std::numeric_limits<int32_t>::min() ||
          value > std::numeric_limits<int32_t>::max()) {
        return ErrorAt(token, "int32 literal out of range");
      }
      auto* literal = expr->mutable_literal();
      literal->set_type(types::DataType::INT32);
      literal->set_int32_value(static_cast<int32_t>(value));
    } else if (head.text == "null") {
      DP_ASSIGN_OR_RETURN(types::DataType type, ParseType());
      auto* literal = expr->mutable_literal();
      literal->set_type(type);
      literal->set_is_null(true);
    } else if (head.text == "call_unary" || head.text == "call_binary") {
      auto* call = expr->mutable_call();
      DP_ASSIGN_OR_RETURN(*call->mutable_function(), ParseName());
      int num_args = head.text == "call_unary" ? 1 : 2;
      for (int i = 0; i < num_args; ++i) {
        DP_RETURN_IF_ERROR(ParseScalar(call->add_args()));
      }
    } else if (head.text == "call_variadic") {
      auto* call = expr->mutable_call();
      DP_ASSIGN_OR_RETURN(*call->mutable_function(), ParseName());
      DP_RETURN_IF_ERROR(ParseScalars(call->mutable_args()));
    } else {
      return ErrorAt(head, "unknown scalar form");
    }
    return Expect(TokenType::kCloseParen, "')'");
  }

  std::vector<Token> tokens_;
  size_t pos_ = 0;
};

}  // namespace

StatusOr<planpb::PlanRequest> ParseRequest(std::string_view text) {
  Lexer lexer(text);
  DP_ASSIGN_OR_RETURN(std::vector<Token> tokens, lexer.Tokenize());
  Parser parser(std::move(tokens));
  return parser.ParseRequest();
}

}  // namespace plan
}  // namespace compute
}  // namespace dp
