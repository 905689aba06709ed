// reactc/syntax/parser.cpp - Recursive-descent parser for TypeScript + JSX modules
#include "reactc/syntax/parser.hpp"

#include <string>
#include <utility>

namespace reactc::syntax
{
namespace
{

[[nodiscard]] std::string_view strip_quotes(std::string_view text) noexcept
{
  if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'')) {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

[[nodiscard]] bool is_gt_like(TokenKind k) noexcept
{
  return k == TokenKind::Gt || k == TokenKind::GtEq || k == TokenKind::GtGt ||
         k == TokenKind::GtGtGt || k == TokenKind::GtGtEq || k == TokenKind::GtGtGtEq;
}

[[nodiscard]] AssignOp to_assign_op(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::PlusEq:
      return AssignOp::AddAssign;
    case TokenKind::MinusEq:
      return AssignOp::SubAssign;
    case TokenKind::StarEq:
      return AssignOp::MulAssign;
    case TokenKind::SlashEq:
      return AssignOp::DivAssign;
    case TokenKind::PercentEq:
      return AssignOp::ModAssign;
    case TokenKind::StarStarEq:
      return AssignOp::ExpAssign;
    case TokenKind::LtLtEq:
      return AssignOp::ShlAssign;
    case TokenKind::GtGtEq:
      return AssignOp::ShrAssign;
    case TokenKind::GtGtGtEq:
      return AssignOp::UShrAssign;
    case TokenKind::AmpEq:
      return AssignOp::BitAndAssign;
    case TokenKind::PipeEq:
      return AssignOp::BitOrAssign;
    case TokenKind::CaretEq:
      return AssignOp::BitXorAssign;
    case TokenKind::AmpAmpEq:
      return AssignOp::AndAssign;
    case TokenKind::PipePipeEq:
      return AssignOp::OrAssign;
    case TokenKind::QuestionQuestionEq:
      return AssignOp::NullishAssign;
    default:
      return AssignOp::Assign;
  }
}

[[nodiscard]] BinaryOp to_binary_op(const Token & t) noexcept
{
  switch (t.kind) {
    case TokenKind::Plus:
      return BinaryOp::Add;
    case TokenKind::Minus:
      return BinaryOp::Sub;
    case TokenKind::Star:
      return BinaryOp::Mul;
    case TokenKind::Slash:
      return BinaryOp::Div;
    case TokenKind::Percent:
      return BinaryOp::Mod;
    case TokenKind::StarStar:
      return BinaryOp::Exp;
    case TokenKind::EqEq:
      return BinaryOp::Eq;
    case TokenKind::BangEq:
      return BinaryOp::Ne;
    case TokenKind::EqEqEq:
      return BinaryOp::StrictEq;
    case TokenKind::BangEqEq:
      return BinaryOp::StrictNe;
    case TokenKind::Lt:
      return BinaryOp::Lt;
    case TokenKind::LtEq:
      return BinaryOp::Le;
    case TokenKind::Gt:
      return BinaryOp::Gt;
    case TokenKind::GtEq:
      return BinaryOp::Ge;
    case TokenKind::LtLt:
      return BinaryOp::Shl;
    case TokenKind::GtGt:
      return BinaryOp::Shr;
    case TokenKind::GtGtGt:
      return BinaryOp::UShr;
    case TokenKind::Amp:
      return BinaryOp::BitAnd;
    case TokenKind::Pipe:
      return BinaryOp::BitOr;
    case TokenKind::Caret:
      return BinaryOp::BitXor;
    case TokenKind::AmpAmp:
      return BinaryOp::LogicalAnd;
    case TokenKind::PipePipe:
      return BinaryOp::LogicalOr;
    case TokenKind::QuestionQuestion:
      return BinaryOp::Nullish;
    default:
      return t.is_word("in") ? BinaryOp::In : BinaryOp::InstanceOf;
  }
}

/// A '/' after one of these tokens ends an operand, so it divides.
[[nodiscard]] bool slash_is_division_after(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Identifier:
    case TokenKind::PrivateName:
    case TokenKind::NumericLiteral:
    case TokenKind::BigIntLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::RegexLiteral:
    case TokenKind::NoSubstitutionTemplate:
    case TokenKind::TemplateTail:
    case TokenKind::RParen:
    case TokenKind::RBracket:
    case TokenKind::RBrace:
    case TokenKind::PlusPlus:
    case TokenKind::MinusMinus:
      return true;
    default:
      return false;
  }
}

/// Tokens that can never appear inside a type argument list.
[[nodiscard]] bool ends_type_argument_scan(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
    case TokenKind::Semicolon:
    case TokenKind::AmpAmp:
    case TokenKind::PipePipe:
    case TokenKind::QuestionQuestion:
    case TokenKind::RParen:
    case TokenKind::RBracket:
    case TokenKind::RBrace:
    case TokenKind::Plus:
    case TokenKind::PlusPlus:
    case TokenKind::MinusMinus:
    case TokenKind::Star:
    case TokenKind::Slash:
    case TokenKind::Percent:
    case TokenKind::Bang:
    case TokenKind::EqEq:
    case TokenKind::EqEqEq:
    case TokenKind::BangEq:
    case TokenKind::BangEqEq:
    case TokenKind::LtEq:
    case TokenKind::Unknown:
      return true;
    default:
      return is_assignment_op(k) && k != TokenKind::Eq;
  }
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

Parser::Parser(AstContext & ast, const SourceFile & source, DiagnosticBag & diags)
: ast_(ast), source_(source), diags_(diags), lexer_(source.content())
{
  tok_ = lexer_.next();
}

Token Parser::peek_token() const
{
  Lexer copy = lexer_;
  return copy.next();
}

Token Parser::advance()
{
  const Token t = tok_;
  if (!at_eof()) {
    prev_end_ = t.range.end;
    tok_ = lexer_.next();
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::match_word(std::string_view w)
{
  if (at_word(w)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }
  error_at(tok_, std::string("expected ") + std::string(what));
  return false;
}

void Parser::consume_semicolon()
{
  if (match(TokenKind::Semicolon)) {
    return;
  }
  // Automatic semicolon insertion.
  if (at(TokenKind::RBrace) || at_eof() || tok_.newline_before) {
    return;
  }
  error_at(tok_, "expected ';'");
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  if (speculating_ > 0) {
    spec_failed_ = true;
    return;
  }
  if (t.range.start == last_error_pos_ || error_count_ >= k_max_errors) {
    return;
  }
  last_error_pos_ = t.range.start;
  ++error_count_;
  diags_.report_error(t.range, std::string(msg)).with_code(diag_codes::k_parse_error);
}

void Parser::synchronize()
{
  TokenKind last = tok_.kind;
  advance();
  while (!at_eof()) {
    if (last == TokenKind::Semicolon || at(TokenKind::RBrace) || tok_.newline_before) {
      return;
    }
    if (at(TokenKind::LBrace) || at(TokenKind::LParen) || at(TokenKind::LBracket)) {
      last = TokenKind::RBrace;
      skip_balanced();
      continue;
    }
    last = tok_.kind;
    advance();
  }
}

void Parser::restore(const State & s)
{
  lexer_.reset(s.lexer_pos);
  tok_ = s.tok;
  prev_end_ = s.prev_end;
}

bool Parser::at_identifier() const noexcept
{
  return at(TokenKind::Identifier) && !is_reserved_word(tok_.text);
}

bool Parser::at_property_name() const noexcept
{
  return at(TokenKind::Identifier) || at(TokenKind::PrivateName) ||
         at(TokenKind::StringLiteral) || at(TokenKind::NumericLiteral) ||
         at(TokenKind::BigIntLiteral) || at(TokenKind::LBracket);
}

bool Parser::at_expression_end() const noexcept
{
  switch (tok_.kind) {
    case TokenKind::RParen:
    case TokenKind::RBracket:
    case TokenKind::RBrace:
    case TokenKind::Comma:
    case TokenKind::Semicolon:
    case TokenKind::Colon:
    case TokenKind::Eof:
    case TokenKind::Arrow:
    case TokenKind::Dot:
    case TokenKind::Eq:
      return true;
    default:
      return false;
  }
}

std::string_view Parser::parse_property_key(SourceRange & range, Expr *& computed)
{
  computed = nullptr;
  if (at(TokenKind::LBracket)) {
    const uint32_t start = tok_.range.start;
    advance();
    const bool saved_in = allow_in_;
    allow_in_ = true;
    computed = parse_assignment();
    allow_in_ = saved_in;
    expect(TokenKind::RBracket, "']'");
    range = range_from(start);
    return {};
  }
  if (at_property_name()) {
    const Token t = advance();
    range = t.range;
    return t.is(TokenKind::StringLiteral) ? strip_quotes(t.text) : t.text;
  }
  error_at(tok_, "expected property name");
  range = {tok_.range.start, tok_.range.start};
  return {};
}

// ============================================================================
// Program and statements
// ============================================================================

Program * Parser::parse_program()
{
  std::vector<Stmt *> body;
  while (!at_eof()) {
    const uint32_t before = tok_.range.start;
    if (Stmt * s = parse_statement()) {
      body.push_back(s);
    }
    if (tok_.range.start == before && !at_eof()) {
      error_at(tok_, std::string("unexpected ") + std::string(to_string(tok_.kind)));
      synchronize();
    }
  }
  return ast_.create<Program>(ast_.copy_to_arena(body), SourceRange{0, source_.size()});
}

std::vector<Stmt *> Parser::parse_statement_list()
{
  std::vector<Stmt *> body;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const uint32_t before = tok_.range.start;
    if (Stmt * s = parse_statement()) {
      body.push_back(s);
    }
    if (tok_.range.start == before && !at_eof() && !at(TokenKind::RBrace)) {
      error_at(tok_, std::string("unexpected ") + std::string(to_string(tok_.kind)));
      synchronize();
    }
  }
  return body;
}

BlockStmt * Parser::parse_block()
{
  const uint32_t start = tok_.range.start;
  expect(TokenKind::LBrace, "'{'");
  auto body = parse_statement_list();
  expect(TokenKind::RBrace, "'}'");
  return ast_.create<BlockStmt>(ast_.copy_to_arena(body), range_from(start));
}

bool Parser::at_type_decl_start(TypeDeclKind & kind) const
{
  if (!at(TokenKind::Identifier)) {
    return false;
  }
  const Token next = peek_token();
  const bool name_follows =
    !next.newline_before && (next.is(TokenKind::Identifier) || next.is(TokenKind::StringLiteral));

  if (at_word("interface") && name_follows) {
    kind = TypeDeclKind::Interface;
    return true;
  }
  if (at_word("type") && name_follows && next.is(TokenKind::Identifier)) {
    kind = TypeDeclKind::TypeAlias;
    return true;
  }
  if (at_word("enum")) {
    kind = TypeDeclKind::Enum;
    return true;
  }
  if (at_word("declare") && !next.newline_before && next.is(TokenKind::Identifier)) {
    kind = TypeDeclKind::Declare;
    return true;
  }
  if ((at_word("namespace") || at_word("module")) && name_follows) {
    kind = TypeDeclKind::Namespace;
    return true;
  }
  if (at_word("global") && next.is(TokenKind::LBrace)) {
    kind = TypeDeclKind::Namespace;
    return true;
  }
  return false;
}

Stmt * Parser::parse_statement()
{
  skip_decorators();

  if (at(TokenKind::LBrace)) {
    return parse_block();
  }
  if (at(TokenKind::Semicolon)) {
    const Token t = advance();
    return ast_.create<EmptyStmt>(t.range);
  }
  if (!at(TokenKind::Identifier)) {
    return parse_expression_statement();
  }

  const uint32_t start = tok_.range.start;
  const Token next = peek_token();

  if (at_word("var")) {
    return parse_var_stmt(false);
  }
  if (at_word("const")) {
    if (next.is_word("enum")) {
      advance();
      Stmt * decl = parse_type_decl(TypeDeclKind::Enum);
      decl->range_ = range_from(start);
      return decl;
    }
    return parse_var_stmt(false);
  }
  if (
    at_word("let") && (next.is(TokenKind::LBracket) || next.is(TokenKind::LBrace) ||
                       (next.is(TokenKind::Identifier) && !is_reserved_word(next.text)))) {
    return parse_var_stmt(false);
  }
  if (at_word("function")) {
    return parse_function_decl(start, false, false);
  }
  if (at_word("async") && next.is_word("function") && !next.newline_before) {
    advance();
    return parse_function_decl(start, true, false);
  }
  if (at_word("class")) {
    return parse_class_decl(false);
  }
  if (at_word("abstract") && next.is_word("class") && !next.newline_before) {
    advance();
    Stmt * decl = parse_class_decl(false);
    decl->range_ = range_from(start);
    return decl;
  }
  if (at_word("if")) {
    return parse_if();
  }
  if (at_word("for")) {
    return parse_for();
  }
  if (at_word("while")) {
    return parse_while();
  }
  if (at_word("do")) {
    return parse_do_while();
  }
  if (at_word("return")) {
    return parse_return();
  }
  if (at_word("break")) {
    return parse_jump(JumpKind::Break);
  }
  if (at_word("continue")) {
    return parse_jump(JumpKind::Continue);
  }
  if (at_word("debugger")) {
    return parse_jump(JumpKind::Debugger);
  }
  if (at_word("throw")) {
    return parse_throw();
  }
  if (at_word("try")) {
    return parse_try();
  }
  if (at_word("switch")) {
    return parse_switch();
  }
  if (at_word("import") && !next.is(TokenKind::LParen) && !next.is(TokenKind::Dot)) {
    return parse_import();
  }
  if (at_word("export")) {
    return parse_export();
  }

  TypeDeclKind type_kind{};
  if (at_type_decl_start(type_kind)) {
    return parse_type_decl(type_kind);
  }

  if (at_identifier() && next.is(TokenKind::Colon)) {
    const Token label = advance();
    advance();  // ':'
    Stmt * body = parse_statement();
    return ast_.create<LabeledStmt>(label.text, body, range_from(start));
  }

  return parse_expression_statement();
}

Stmt * Parser::parse_expression_statement()
{
  const uint32_t start = tok_.range.start;
  Expr * e = parse_expression();
  consume_semicolon();
  return ast_.create<ExprStmt>(e, range_from(start));
}

VarStmt * Parser::parse_var_stmt(bool in_for)
{
  const uint32_t start = tok_.range.start;
  const Token kw = advance();
  VarKind kind = VarKind::Var;
  if (kw.is_word("let")) {
    kind = VarKind::Let;
  } else if (kw.is_word("const")) {
    kind = VarKind::Const;
  }

  const bool saved_in = allow_in_;
  allow_in_ = !in_for;

  std::vector<VarDeclarator *> decls;
  do {
    const uint32_t dstart = tok_.range.start;
    Pattern * target = parse_binding_target();
    match(TokenKind::Bang);  // definite assignment assertion
    skip_type_annotation_opt();
    Expr * init = nullptr;
    if (match(TokenKind::Eq)) {
      init = parse_assignment();
    }
    decls.push_back(ast_.create<VarDeclarator>(target, init, range_from(dstart)));
  } while (match(TokenKind::Comma));

  allow_in_ = saved_in;
  if (!in_for) {
    consume_semicolon();
  }
  return ast_.create<VarStmt>(kind, ast_.copy_to_arena(decls), kw.range, range_from(start));
}

FunctionDecl * Parser::parse_function_decl(uint32_t start, bool is_async, bool name_optional)
{
  advance();  // 'function'
  const bool is_generator = match(TokenKind::Star);

  std::string_view name;
  SourceRange name_range;
  if (at_identifier()) {
    const Token t = advance();
    name = t.text;
    name_range = t.range;
  } else if (!name_optional) {
    error_at(tok_, "expected function name");
  }

  FunctionData fn = parse_function_rest(name, name_range, is_async, is_generator);
  return ast_.create<FunctionDecl>(fn, range_from(start));
}

FunctionData Parser::parse_function_rest(
  std::string_view name, SourceRange name_range, bool is_async, bool is_generator)
{
  FunctionData fn;
  fn.name = name;
  fn.name_range = name_range;
  fn.is_async = is_async;
  fn.is_generator = is_generator;

  if (at(TokenKind::Lt)) {
    skip_type_params_or_args();
  }
  SourceRange params_range;
  auto params = parse_params(params_range);
  fn.params = ast_.copy_to_arena(params);
  fn.params_range = params_range;
  skip_type_annotation_opt();

  if (at(TokenKind::LBrace)) {
    fn.body = parse_function_body(is_async, is_generator);
  } else {
    // Overload signature or ambient declaration.
    consume_semicolon();
  }
  return fn;
}

AstNode * Parser::parse_function_body(bool is_async, bool is_generator)
{
  const bool saved_async = in_async_;
  const bool saved_gen = in_generator_;
  const bool saved_in = allow_in_;
  in_async_ = is_async;
  in_generator_ = is_generator;
  allow_in_ = true;

  BlockStmt * body = parse_block();

  in_async_ = saved_async;
  in_generator_ = saved_gen;
  allow_in_ = saved_in;
  return body;
}

std::vector<Pattern *> Parser::parse_params(SourceRange & params_range)
{
  const uint32_t start = tok_.range.start;
  std::vector<Pattern *> params;
  if (!expect(TokenKind::LParen, "'('")) {
    params_range = {start, start};
    return params;
  }

  const bool saved_in = allow_in_;
  allow_in_ = true;
  while (!at(TokenKind::RParen) && !at_eof()) {
    skip_decorators();
    // Constructor parameter properties.
    while (at_word("public") || at_word("private") || at_word("protected") ||
           at_word("readonly") || at_word("override")) {
      const Token next = peek_token();
      if (!(next.is(TokenKind::Identifier) || next.is(TokenKind::LBrace) ||
            next.is(TokenKind::LBracket))) {
        break;
      }
      advance();
    }

    if (at_word("this")) {
      // `this: Type` parameter is type-only.
      advance();
      skip_type_annotation_opt();
    } else if (at(TokenKind::Ellipsis)) {
      const uint32_t rest_start = tok_.range.start;
      advance();
      Pattern * target = parse_binding_target();
      skip_type_annotation_opt();
      params.push_back(ast_.create<RestElement>(target, range_from(rest_start)));
    } else {
      params.push_back(parse_binding_element());
    }

    if (spec_failed_ || !match(TokenKind::Comma)) {
      break;
    }
  }
  allow_in_ = saved_in;

  expect(TokenKind::RParen, "')'");
  params_range = range_from(start);
  return params;
}

Pattern * Parser::parse_binding_target()
{
  if (at(TokenKind::LBrace)) {
    return parse_object_pattern();
  }
  if (at(TokenKind::LBracket)) {
    return parse_array_pattern();
  }
  if (at_identifier()) {
    const Token t = advance();
    return ast_.create<BindingIdent>(t.text, t.range);
  }
  error_at(tok_, "expected binding name");
  return ast_.create<BindingIdent>(std::string_view{}, SourceRange{tok_.range.start, tok_.range.start});
}

Pattern * Parser::parse_binding_element()
{
  const uint32_t start = tok_.range.start;
  Pattern * target = parse_binding_target();
  match(TokenKind::Question);
  skip_type_annotation_opt();
  if (match(TokenKind::Eq)) {
    Expr * def = parse_assignment();
    return ast_.create<AssignPattern>(target, def, range_from(start));
  }
  return target;
}

Pattern * Parser::parse_object_pattern()
{
  const uint32_t start = tok_.range.start;
  advance();  // '{'

  std::vector<BindingProperty *> props;
  Pattern * rest = nullptr;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    if (at(TokenKind::Ellipsis)) {
      const uint32_t rest_start = tok_.range.start;
      advance();
      Pattern * target = parse_binding_target();
      rest = ast_.create<RestElement>(target, range_from(rest_start));
      match(TokenKind::Comma);
      break;
    }

    const uint32_t prop_start = tok_.range.start;
    const bool ident_key = at_identifier();
    const Token key_tok = tok_;
    SourceRange key_range;
    Expr * computed = nullptr;
    const std::string_view key = parse_property_key(key_range, computed);

    BindingProperty * prop = nullptr;
    if (match(TokenKind::Colon)) {
      Pattern * value = parse_binding_element();
      prop = ast_.create<BindingProperty>(key, key_range, value, range_from(prop_start));
    } else {
      if (!ident_key) {
        error_at(key_tok, "expected ':' in object pattern");
      }
      Pattern * value = ast_.create<BindingIdent>(key, key_range);
      if (match(TokenKind::Eq)) {
        Expr * def = parse_assignment();
        value = ast_.create<AssignPattern>(value, def, range_from(prop_start));
      }
      prop = ast_.create<BindingProperty>(key, key_range, value, range_from(prop_start));
      prop->shorthand = true;
    }
    prop->computed_key = computed;
    props.push_back(prop);

    if (spec_failed_ || !match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::RBrace, "'}'");
  return ast_.create<ObjectPattern>(ast_.copy_to_arena(props), rest, range_from(start));
}

Pattern * Parser::parse_array_pattern()
{
  const uint32_t start = tok_.range.start;
  advance();  // '['

  std::vector<Pattern *> elements;
  Pattern * rest = nullptr;
  while (!at(TokenKind::RBracket) && !at_eof()) {
    if (at(TokenKind::Comma)) {
      advance();
      elements.push_back(nullptr);
      continue;
    }
    if (at(TokenKind::Ellipsis)) {
      const uint32_t rest_start = tok_.range.start;
      advance();
      Pattern * target = parse_binding_target();
      rest = ast_.create<RestElement>(target, range_from(rest_start));
      match(TokenKind::Comma);
      break;
    }
    elements.push_back(parse_binding_element());
    if (spec_failed_) {
      break;
    }
    if (!at(TokenKind::RBracket) && !expect(TokenKind::Comma, "','")) {
      break;
    }
  }
  expect(TokenKind::RBracket, "']'");
  return ast_.create<ArrayPattern>(ast_.copy_to_arena(elements), rest, range_from(start));
}

Stmt * Parser::parse_class_decl(bool name_optional)
{
  const uint32_t start = tok_.range.start;
  advance();  // 'class'

  std::string_view name;
  if (at_identifier() && !at_word("extends") && !at_word("implements")) {
    name = advance().text;
  } else if (!name_optional) {
    error_at(tok_, "expected class name");
  }
  if (at(TokenKind::Lt)) {
    skip_type_params_or_args();
  }

  Expr * heritage = nullptr;
  if (match_word("extends")) {
    const uint32_t hstart = tok_.range.start;
    heritage = parse_call_chain(parse_primary(), hstart, true);
    if (at(TokenKind::Lt)) {
      skip_type_params_or_args();
    }
  }
  if (match_word("implements")) {
    do {
      skip_type();
    } while (match(TokenKind::Comma));
  }
  skip_class_body();
  return ast_.create<ClassDecl>(name, heritage, range_from(start));
}

Stmt * Parser::parse_if()
{
  const uint32_t start = tok_.range.start;
  advance();
  expect(TokenKind::LParen, "'('");
  Expr * test = parse_expression();
  expect(TokenKind::RParen, "')'");
  Stmt * consequent = parse_statement();
  Stmt * alternate = nullptr;
  if (match_word("else")) {
    alternate = parse_statement();
  }
  return ast_.create<IfStmt>(test, consequent, alternate, range_from(start));
}

Stmt * Parser::parse_for()
{
  const uint32_t start = tok_.range.start;
  advance();  // 'for'
  match_word("await");
  expect(TokenKind::LParen, "'('");

  AstNode * init = nullptr;
  if (!at(TokenKind::Semicolon)) {
    const Token next = peek_token();
    const bool is_decl =
      at_word("var") || at_word("const") ||
      (at_word("let") && (next.is(TokenKind::Identifier) || next.is(TokenKind::LBracket) ||
                          next.is(TokenKind::LBrace)));
    if (is_decl) {
      init = parse_var_stmt(true);
    } else {
      const bool saved_in = allow_in_;
      allow_in_ = false;
      init = parse_expression();
      allow_in_ = saved_in;
    }
  }

  if (at_word("of") || at_word("in")) {
    const bool is_of = at_word("of");
    advance();
    Expr * right = is_of ? parse_assignment() : parse_expression();
    expect(TokenKind::RParen, "')'");
    Stmt * body = parse_statement();
    return ast_.create<ForInOfStmt>(init, right, body, is_of, range_from(start));
  }

  expect(TokenKind::Semicolon, "';'");
  Expr * test = at(TokenKind::Semicolon) ? nullptr : parse_expression();
  expect(TokenKind::Semicolon, "';'");
  Expr * update = at(TokenKind::RParen) ? nullptr : parse_expression();
  expect(TokenKind::RParen, "')'");
  Stmt * body = parse_statement();
  return ast_.create<ForStmt>(init, test, update, body, range_from(start));
}

Stmt * Parser::parse_while()
{
  const uint32_t start = tok_.range.start;
  advance();
  expect(TokenKind::LParen, "'('");
  Expr * test = parse_expression();
  expect(TokenKind::RParen, "')'");
  Stmt * body = parse_statement();
  return ast_.create<WhileStmt>(test, body, range_from(start));
}

Stmt * Parser::parse_do_while()
{
  const uint32_t start = tok_.range.start;
  advance();
  Stmt * body = parse_statement();
  if (!match_word("while")) {
    error_at(tok_, "expected 'while'");
  }
  expect(TokenKind::LParen, "'('");
  Expr * test = parse_expression();
  expect(TokenKind::RParen, "')'");
  match(TokenKind::Semicolon);
  return ast_.create<DoWhileStmt>(body, test, range_from(start));
}

Stmt * Parser::parse_return()
{
  const uint32_t start = tok_.range.start;
  advance();
  Expr * argument = nullptr;
  if (!at(TokenKind::Semicolon) && !at(TokenKind::RBrace) && !at_eof() && !tok_.newline_before) {
    argument = parse_expression();
  }
  consume_semicolon();
  return ast_.create<ReturnStmt>(argument, range_from(start));
}

Stmt * Parser::parse_jump(JumpKind kind)
{
  const uint32_t start = tok_.range.start;
  advance();
  std::string_view label;
  if (kind != JumpKind::Debugger && at_identifier() && !tok_.newline_before) {
    label = advance().text;
  }
  consume_semicolon();
  return ast_.create<JumpStmt>(kind, label, range_from(start));
}

Stmt * Parser::parse_throw()
{
  const uint32_t start = tok_.range.start;
  advance();
  Expr * argument = parse_expression();
  consume_semicolon();
  return ast_.create<ThrowStmt>(argument, range_from(start));
}

Stmt * Parser::parse_try()
{
  const uint32_t start = tok_.range.start;
  advance();
  BlockStmt * block = parse_block();

  CatchClause * handler = nullptr;
  if (at_word("catch")) {
    const uint32_t catch_start = tok_.range.start;
    advance();
    Pattern * param = nullptr;
    if (match(TokenKind::LParen)) {
      param = parse_binding_target();
      skip_type_annotation_opt();
      expect(TokenKind::RParen, "')'");
    }
    BlockStmt * body = parse_block();
    handler = ast_.create<CatchClause>(param, body, range_from(catch_start));
  }

  BlockStmt * finalizer = nullptr;
  if (match_word("finally")) {
    finalizer = parse_block();
  }
  if (handler == nullptr && finalizer == nullptr) {
    error_at(tok_, "expected 'catch' or 'finally'");
  }
  return ast_.create<TryStmt>(block, handler, finalizer, range_from(start));
}

Stmt * Parser::parse_switch()
{
  const uint32_t start = tok_.range.start;
  advance();
  expect(TokenKind::LParen, "'('");
  Expr * discriminant = parse_expression();
  expect(TokenKind::RParen, "')'");
  expect(TokenKind::LBrace, "'{'");

  std::vector<SwitchCase *> cases;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const uint32_t case_start = tok_.range.start;
    Expr * test = nullptr;
    if (match_word("case")) {
      test = parse_expression();
    } else if (!match_word("default")) {
      error_at(tok_, "expected 'case' or 'default'");
      synchronize();
      continue;
    }
    expect(TokenKind::Colon, "':'");

    std::vector<Stmt *> body;
    while (!at(TokenKind::RBrace) && !at_word("case") && !at_word("default") && !at_eof()) {
      const uint32_t before = tok_.range.start;
      if (Stmt * s = parse_statement()) {
        body.push_back(s);
      }
      if (tok_.range.start == before) {
        error_at(tok_, std::string("unexpected ") + std::string(to_string(tok_.kind)));
        synchronize();
      }
    }
    cases.push_back(
      ast_.create<SwitchCase>(test, ast_.copy_to_arena(body), range_from(case_start)));
  }
  expect(TokenKind::RBrace, "'}'");
  return ast_.create<SwitchStmt>(discriminant, ast_.copy_to_arena(cases), range_from(start));
}

Stmt * Parser::parse_import()
{
  const uint32_t start = tok_.range.start;
  advance();  // 'import'

  bool type_only = false;
  if (at_word("type")) {
    const Token next = peek_token();
    if (
      (next.is(TokenKind::Identifier) && !next.is_word("from")) || next.is(TokenKind::LBrace) ||
      next.is(TokenKind::Star)) {
      type_only = true;
      advance();
    }
  }

  std::vector<ImportSpecifier *> specs;
  std::string_view module;

  if (at(TokenKind::StringLiteral)) {
    module = strip_quotes(advance().text);
  } else {
    if (at_identifier()) {
      const Token local = advance();
      if (match(TokenKind::Eq)) {
        // import x = require('m') / import x = A.B
        (void)parse_assignment();
        consume_semicolon();
        return ast_.create<ImportDecl>(module, ast_.copy_to_arena(specs), true, range_from(start));
      }
      specs.push_back(
        ast_.create<ImportSpecifier>(ImportKind::Default, "default", local.text, local.range));
      match(TokenKind::Comma);
    }

    if (at(TokenKind::Star)) {
      const uint32_t spec_start = tok_.range.start;
      advance();
      if (!match_word("as")) {
        error_at(tok_, "expected 'as'");
      }
      const Token local = advance();
      specs.push_back(ast_.create<ImportSpecifier>(
        ImportKind::Namespace, "*", local.text, range_from(spec_start)));
    } else if (match(TokenKind::LBrace)) {
      while (!at(TokenKind::RBrace) && !at_eof()) {
        const uint32_t spec_start = tok_.range.start;
        bool spec_type_only = false;
        if (at_word("type")) {
          const Token next = peek_token();
          if (
            (next.is(TokenKind::Identifier) && !next.is_word("as")) ||
            next.is(TokenKind::StringLiteral)) {
            spec_type_only = true;
            advance();
          }
        }
        if (!at(TokenKind::Identifier) && !at(TokenKind::StringLiteral)) {
          error_at(tok_, "expected import name");
          break;
        }
        const Token imported = advance();
        std::string_view local = strip_quotes(imported.text);
        if (match_word("as")) {
          local = advance().text;
        }
        if (!spec_type_only) {
          specs.push_back(ast_.create<ImportSpecifier>(
            ImportKind::Named, strip_quotes(imported.text), local, range_from(spec_start)));
        }
        if (!match(TokenKind::Comma)) {
          break;
        }
      }
      expect(TokenKind::RBrace, "'}'");
    }

    if (!match_word("from")) {
      error_at(tok_, "expected 'from'");
    }
    if (at(TokenKind::StringLiteral)) {
      module = strip_quotes(advance().text);
    } else {
      error_at(tok_, "expected module specifier");
    }
  }

  if ((at_word("with") || at_word("assert")) && !tok_.newline_before) {
    advance();
    if (at(TokenKind::LBrace)) {
      skip_balanced();
    }
  }
  consume_semicolon();
  return ast_.create<ImportDecl>(module, ast_.copy_to_arena(specs), type_only, range_from(start));
}

Stmt * Parser::parse_export()
{
  const uint32_t start = tok_.range.start;
  advance();  // 'export'

  if (match_word("default")) {
    const Token next = peek_token();
    Stmt * decl = nullptr;
    if (at_word("function")) {
      decl = parse_function_decl(tok_.range.start, false, true);
    } else if (at_word("async") && next.is_word("function") && !next.newline_before) {
      const uint32_t fn_start = tok_.range.start;
      advance();
      decl = parse_function_decl(fn_start, true, true);
    } else if (at_word("class")) {
      decl = parse_class_decl(true);
    } else if (at_word("abstract") && next.is_word("class")) {
      advance();
      decl = parse_class_decl(true);
    } else if (at_word("interface")) {
      decl = parse_type_decl(TypeDeclKind::Interface);
    }
    if (decl != nullptr) {
      return ast_.create<ExportDecl>(decl, nullptr, true, range_from(start));
    }
    Expr * e = parse_assignment();
    consume_semicolon();
    return ast_.create<ExportDecl>(nullptr, e, true, range_from(start));
  }

  const Token next = peek_token();
  if (
    at(TokenKind::LBrace) || at(TokenKind::Star) ||
    (at_word("type") && (next.is(TokenKind::LBrace) || next.is(TokenKind::Star)))) {
    // Specifier lists and re-exports are carried as source text.
    match_word("type");
    if (match(TokenKind::Star)) {
      if (match_word("as")) {
        advance();
      }
    } else {
      skip_balanced();
    }
    if (match_word("from")) {
      if (at(TokenKind::StringLiteral)) {
        advance();
      } else {
        error_at(tok_, "expected module specifier");
      }
    }
    if ((at_word("with") || at_word("assert")) && !tok_.newline_before) {
      advance();
      if (at(TokenKind::LBrace)) {
        skip_balanced();
      }
    }
    consume_semicolon();
    return ast_.create<ExportDecl>(nullptr, nullptr, false, range_from(start));
  }

  if (match(TokenKind::Eq)) {
    Expr * e = parse_assignment();
    consume_semicolon();
    return ast_.create<ExportDecl>(nullptr, e, false, range_from(start));
  }

  if (at_word("as") && next.is_word("namespace")) {
    advance();
    advance();
    advance();
    consume_semicolon();
    return ast_.create<ExportDecl>(nullptr, nullptr, false, range_from(start));
  }

  Stmt * decl = parse_statement();
  return ast_.create<ExportDecl>(decl, nullptr, false, range_from(start));
}

Stmt * Parser::parse_type_decl(TypeDeclKind kind)
{
  const uint32_t start = tok_.range.start;
  std::string_view name;

  switch (kind) {
    case TypeDeclKind::Interface: {
      advance();
      name = advance().text;
      if (at(TokenKind::Lt)) {
        skip_type_params_or_args();
      }
      if (match_word("extends")) {
        do {
          skip_type();
        } while (match(TokenKind::Comma));
      }
      if (at(TokenKind::LBrace)) {
        skip_balanced();
      } else {
        error_at(tok_, "expected '{'");
      }
      break;
    }
    case TypeDeclKind::TypeAlias: {
      advance();
      name = advance().text;
      if (at(TokenKind::Lt)) {
        skip_type_params_or_args();
      }
      expect(TokenKind::Eq, "'='");
      skip_type();
      consume_semicolon();
      break;
    }
    case TypeDeclKind::Enum: {
      advance();
      name = advance().text;
      if (at(TokenKind::LBrace)) {
        skip_balanced();
      } else {
        error_at(tok_, "expected '{'");
      }
      break;
    }
    case TypeDeclKind::Namespace: {
      advance();
      if (!at(TokenKind::LBrace)) {
        name = strip_quotes(advance().text);
        while (match(TokenKind::Dot)) {
          advance();
        }
      }
      if (at(TokenKind::LBrace)) {
        skip_balanced();
      } else {
        consume_semicolon();
      }
      break;
    }
    case TypeDeclKind::Declare: {
      advance();
      name = tok_.text;
      bool first = true;
      while (!at_eof()) {
        if (!first && tok_.newline_before) {
          break;
        }
        first = false;
        if (match(TokenKind::Semicolon) || at(TokenKind::RBrace)) {
          break;
        }
        if (at(TokenKind::LBrace) || at(TokenKind::LParen) || at(TokenKind::LBracket)) {
          skip_balanced();
          continue;
        }
        advance();
      }
      break;
    }
  }
  return ast_.create<TypeDeclStmt>(kind, name, range_from(start));
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expression()
{
  const uint32_t start = tok_.range.start;
  Expr * first = parse_assignment();
  if (!at(TokenKind::Comma)) {
    return first;
  }
  std::vector<Expr *> exprs{first};
  while (match(TokenKind::Comma)) {
    exprs.push_back(parse_assignment());
    if (spec_failed_) {
      break;
    }
  }
  return ast_.create<SequenceExpr>(ast_.copy_to_arena(exprs), range_from(start));
}

Expr * Parser::parse_assignment()
{
  const uint32_t start = tok_.range.start;

  if (in_generator_ && at_word("yield")) {
    advance();
    const bool delegate = match(TokenKind::Star);
    Expr * argument = nullptr;
    if (!tok_.newline_before && !at_expression_end()) {
      argument = parse_assignment();
    }
    return ast_.create<YieldExpr>(argument, delegate, range_from(start));
  }

  if (Expr * arrow = try_parse_arrow()) {
    return arrow;
  }

  Expr * lhs = parse_conditional();
  if (is_assignment_op(tok_.kind)) {
    const AssignOp op = to_assign_op(advance().kind);
    Expr * rhs = parse_assignment();
    return ast_.create<AssignExpr>(lhs, op, rhs, range_from(start));
  }
  return lhs;
}

Expr * Parser::try_parse_arrow()
{
  const uint32_t start = tok_.range.start;

  // Parenthesised (or generic) head: parse speculatively and roll back on failure.
  auto speculate = [&](bool is_async) -> Expr * {
    const State saved = save();
    ++speculating_;
    const bool saved_failed = spec_failed_;
    spec_failed_ = false;

    if (is_async) {
      advance();
    }
    if (at(TokenKind::Lt)) {
      skip_type_params_or_args();
    }
    SourceRange params_range;
    std::vector<Pattern *> params;
    if (!spec_failed_ && at(TokenKind::LParen)) {
      params = parse_params(params_range);
    } else {
      spec_failed_ = true;
    }
    if (!spec_failed_ && at(TokenKind::Colon)) {
      advance();
      skip_type();
    }
    const bool ok = !spec_failed_ && at(TokenKind::Arrow) && !tok_.newline_before;

    --speculating_;
    spec_failed_ = saved_failed;
    if (!ok) {
      restore(saved);
      return nullptr;
    }
    return parse_arrow_from_params(start, std::move(params), params_range, is_async);
  };

  if (at(TokenKind::Identifier)) {
    const Token next = peek_token();
    if (next.is(TokenKind::Arrow) && !next.newline_before && at_identifier()) {
      const Token id = advance();
      std::vector<Pattern *> params{ast_.create<BindingIdent>(id.text, id.range)};
      return parse_arrow_from_params(start, std::move(params), id.range, false);
    }
    if (at_word("async") && !next.newline_before) {
      if (next.is(TokenKind::Identifier) && !is_reserved_word(next.text)) {
        const State saved = save();
        advance();
        const Token id = advance();
        if (at(TokenKind::Arrow) && !tok_.newline_before) {
          std::vector<Pattern *> params{ast_.create<BindingIdent>(id.text, id.range)};
          return parse_arrow_from_params(start, std::move(params), id.range, true);
        }
        restore(saved);
      } else if (next.is(TokenKind::LParen) || next.is(TokenKind::Lt)) {
        if (Expr * arrow = speculate(true)) {
          return arrow;
        }
      }
    }
    return nullptr;
  }

  if (at(TokenKind::LParen) || at(TokenKind::Lt)) {
    return speculate(false);
  }
  return nullptr;
}

Expr * Parser::parse_arrow_from_params(
  uint32_t start, std::vector<Pattern *> params, SourceRange params_range, bool is_async)
{
  expect(TokenKind::Arrow, "'=>'");

  FunctionData fn;
  fn.params = ast_.copy_to_arena(params);
  fn.params_range = params_range;
  fn.is_async = is_async;

  if (at(TokenKind::LBrace)) {
    fn.body = parse_function_body(is_async, false);
  } else {
    const bool saved_async = in_async_;
    const bool saved_gen = in_generator_;
    in_async_ = is_async;
    in_generator_ = false;
    fn.body = parse_assignment();
    in_async_ = saved_async;
    in_generator_ = saved_gen;
  }
  return ast_.create<ArrowFunctionExpr>(fn, range_from(start));
}

Expr * Parser::parse_conditional()
{
  const uint32_t start = tok_.range.start;
  Expr * test = parse_binary(0);
  if (!at(TokenKind::Question)) {
    return test;
  }
  advance();
  const bool saved_in = allow_in_;
  allow_in_ = true;
  Expr * consequent = parse_assignment();
  allow_in_ = saved_in;
  expect(TokenKind::Colon, "':'");
  Expr * alternate = parse_assignment();
  return ast_.create<ConditionalExpr>(test, consequent, alternate, range_from(start));
}

int Parser::binary_precedence(const Token & t) const
{
  switch (t.kind) {
    case TokenKind::QuestionQuestion:
      return 1;
    case TokenKind::PipePipe:
      return 2;
    case TokenKind::AmpAmp:
      return 3;
    case TokenKind::Pipe:
      return 4;
    case TokenKind::Caret:
      return 5;
    case TokenKind::Amp:
      return 6;
    case TokenKind::EqEq:
    case TokenKind::BangEq:
    case TokenKind::EqEqEq:
    case TokenKind::BangEqEq:
      return 7;
    case TokenKind::Lt:
    case TokenKind::Gt:
    case TokenKind::LtEq:
    case TokenKind::GtEq:
      return 8;
    case TokenKind::LtLt:
    case TokenKind::GtGt:
    case TokenKind::GtGtGt:
      return 9;
    case TokenKind::Plus:
    case TokenKind::Minus:
      return 10;
    case TokenKind::Star:
    case TokenKind::Slash:
    case TokenKind::Percent:
      return 11;
    case TokenKind::StarStar:
      return 12;
    case TokenKind::Identifier:
      if (t.text == "instanceof") {
        return 8;
      }
      if (t.text == "in") {
        return allow_in_ ? 8 : -1;
      }
      if ((t.text == "as" || t.text == "satisfies") && !t.newline_before) {
        return 8;
      }
      return -1;
    default:
      return -1;
  }
}

Expr * Parser::parse_binary(int min_prec)
{
  const uint32_t start = tok_.range.start;
  Expr * left = parse_unary();

  while (true) {
    const int prec = binary_precedence(tok_);
    if (prec < 0 || prec < min_prec) {
      break;
    }
    const Token op = advance();
    if (op.is_word("as") || op.is_word("satisfies")) {
      if (!match_word("const")) {
        skip_type();
      }
      left = ast_.create<TypeWrapperExpr>(left, range_from(start));
      continue;
    }
    // '**' is right-associative.
    const int next_min = op.is(TokenKind::StarStar) ? prec : prec + 1;
    Expr * right = parse_binary(next_min);
    left = ast_.create<BinaryExpr>(left, to_binary_op(op), right, range_from(start));
  }
  return left;
}

Expr * Parser::parse_unary()
{
  const uint32_t start = tok_.range.start;

  auto unary = [&](UnaryOp op) -> Expr * {
    advance();
    Expr * operand = parse_unary();
    return ast_.create<UnaryExpr>(op, operand, range_from(start));
  };

  switch (tok_.kind) {
    case TokenKind::Bang:
      return unary(UnaryOp::Not);
    case TokenKind::Tilde:
      return unary(UnaryOp::BitNot);
    case TokenKind::Plus:
      return unary(UnaryOp::Plus);
    case TokenKind::Minus:
      return unary(UnaryOp::Minus);
    case TokenKind::PlusPlus:
    case TokenKind::MinusMinus: {
      const bool increment = advance().is(TokenKind::PlusPlus);
      Expr * operand = parse_unary();
      return ast_.create<UpdateExpr>(increment, true, operand, range_from(start));
    }
    case TokenKind::Identifier:
      if (at_word("typeof")) {
        return unary(UnaryOp::Typeof);
      }
      if (at_word("void")) {
        return unary(UnaryOp::Void);
      }
      if (at_word("delete")) {
        return unary(UnaryOp::Delete);
      }
      if (at_word("await")) {
        const Token next = peek_token();
        const bool operand_follows =
          !(next.is(TokenKind::RParen) || next.is(TokenKind::RBracket) ||
            next.is(TokenKind::RBrace) || next.is(TokenKind::Comma) ||
            next.is(TokenKind::Semicolon) || next.is(TokenKind::Colon) ||
            next.is(TokenKind::Eof) || next.is(TokenKind::Arrow) || next.is(TokenKind::Dot) ||
            next.is(TokenKind::Eq));
        if (in_async_ || operand_follows) {
          advance();
          Expr * argument = parse_unary();
          return ast_.create<AwaitExpr>(argument, range_from(start));
        }
      }
      break;
    default:
      break;
  }
  return parse_postfix();
}

Expr * Parser::parse_postfix()
{
  const uint32_t start = tok_.range.start;
  Expr * e = parse_call_chain(parse_primary(), start, true);
  if ((at(TokenKind::PlusPlus) || at(TokenKind::MinusMinus)) && !tok_.newline_before) {
    const bool increment = advance().is(TokenKind::PlusPlus);
    e = ast_.create<UpdateExpr>(increment, false, e, range_from(start));
  }
  return e;
}

Expr * Parser::parse_call_chain(Expr * expr, uint32_t start, bool allow_call)
{
  while (true) {
    if (at(TokenKind::Dot) || at(TokenKind::QuestionDot)) {
      const bool optional = advance().is(TokenKind::QuestionDot);
      if (optional && at(TokenKind::LParen)) {
        auto args = parse_arguments();
        expr = ast_.create<CallExpr>(expr, ast_.copy_to_arena(args), true, range_from(start));
        continue;
      }
      if (optional && at(TokenKind::LBracket)) {
        advance();
        const bool saved_in = allow_in_;
        allow_in_ = true;
        Expr * index = parse_expression();
        allow_in_ = saved_in;
        expect(TokenKind::RBracket, "']'");
        expr = ast_.create<IndexExpr>(expr, index, true, range_from(start));
        continue;
      }
      if (at(TokenKind::Identifier) || at(TokenKind::PrivateName)) {
        const Token prop = advance();
        expr = ast_.create<MemberExpr>(expr, prop.text, prop.range, optional, range_from(start));
        continue;
      }
      error_at(tok_, "expected property name");
      break;
    }
    if (at(TokenKind::LBracket)) {
      advance();
      const bool saved_in = allow_in_;
      allow_in_ = true;
      Expr * index = parse_expression();
      allow_in_ = saved_in;
      expect(TokenKind::RBracket, "']'");
      expr = ast_.create<IndexExpr>(expr, index, false, range_from(start));
      continue;
    }
    if (allow_call && at(TokenKind::LParen)) {
      auto args = parse_arguments();
      expr = ast_.create<CallExpr>(expr, ast_.copy_to_arena(args), false, range_from(start));
      continue;
    }
    if (at(TokenKind::NoSubstitutionTemplate) || at(TokenKind::TemplateHead)) {
      expr = parse_template(expr, start);
      continue;
    }
    if (at(TokenKind::Bang) && !tok_.newline_before) {
      advance();  // non-null assertion
      expr = ast_.create<TypeWrapperExpr>(expr, range_from(start));
      continue;
    }
    if (at(TokenKind::Lt) && try_skip_call_type_args()) {
      // The call (or tagged template) itself is consumed on the next iteration.
      if (!allow_call && at(TokenKind::LParen)) {
        break;
      }
      continue;
    }
    break;
  }
  return expr;
}

std::vector<Expr *> Parser::parse_arguments()
{
  std::vector<Expr *> args;
  expect(TokenKind::LParen, "'('");
  const bool saved_in = allow_in_;
  allow_in_ = true;
  while (!at(TokenKind::RParen) && !at_eof()) {
    if (at(TokenKind::Ellipsis)) {
      const uint32_t spread_start = tok_.range.start;
      advance();
      Expr * argument = parse_assignment();
      args.push_back(ast_.create<SpreadElement>(argument, range_from(spread_start)));
    } else {
      args.push_back(parse_assignment());
    }
    if (spec_failed_ || !match(TokenKind::Comma)) {
      break;
    }
  }
  allow_in_ = saved_in;
  expect(TokenKind::RParen, "')'");
  return args;
}

Expr * Parser::parse_primary()
{
  const uint32_t start = tok_.range.start;
  const Token t = tok_;

  switch (t.kind) {
    case TokenKind::Identifier: {
      if (t.text == "this") {
        advance();
        return ast_.create<ThisExpr>(t.range);
      }
      if (t.text == "super") {
        advance();
        return ast_.create<SuperExpr>(t.range);
      }
      if (t.text == "null") {
        advance();
        return ast_.create<LiteralExpr>(LiteralKind::Null, t.text, t.range);
      }
      if (t.text == "true" || t.text == "false") {
        advance();
        return ast_.create<LiteralExpr>(LiteralKind::Boolean, t.text, t.range);
      }
      if (t.text == "function") {
        return parse_function_expr(start, false);
      }
      if (t.text == "async") {
        const Token next = peek_token();
        if (next.is_word("function") && !next.newline_before) {
          advance();
          return parse_function_expr(start, true);
        }
      }
      if (t.text == "class") {
        return parse_class_expr();
      }
      if (t.text == "new") {
        return parse_new();
      }
      if (t.text == "import") {
        advance();
        if (match(TokenKind::Dot)) {
          advance();  // meta
        }
        return ast_.create<OpaqueExpr>(range_from(start));
      }
      if (is_reserved_word(t.text)) {
        error_at(t, std::string("unexpected keyword '") + std::string(t.text) + "'");
        return ast_.create<MissingExpr>(SourceRange{start, start});
      }
      advance();
      return ast_.create<Identifier>(t.text, t.range);
    }
    case TokenKind::NumericLiteral:
      advance();
      return ast_.create<LiteralExpr>(LiteralKind::Number, t.text, t.range);
    case TokenKind::BigIntLiteral:
      advance();
      return ast_.create<LiteralExpr>(LiteralKind::BigInt, t.text, t.range);
    case TokenKind::StringLiteral:
      advance();
      return ast_.create<LiteralExpr>(LiteralKind::String, t.text, t.range);
    case TokenKind::Slash:
    case TokenKind::SlashEq: {
      tok_ = lexer_.rescan_as_regex(tok_);
      if (!at(TokenKind::RegexLiteral)) {
        error_at(tok_, "unterminated regular expression");
        advance();
        return ast_.create<MissingExpr>(SourceRange{start, start});
      }
      const Token re = advance();
      return ast_.create<LiteralExpr>(LiteralKind::Regex, re.text, re.range);
    }
    case TokenKind::NoSubstitutionTemplate:
    case TokenKind::TemplateHead:
      return parse_template(nullptr, start);
    case TokenKind::LParen: {
      advance();
      const bool saved_in = allow_in_;
      allow_in_ = true;
      Expr * inner = parse_expression();
      allow_in_ = saved_in;
      expect(TokenKind::RParen, "')'");
      return ast_.create<ParenExpr>(inner, range_from(start));
    }
    case TokenKind::LBracket:
      return parse_array_literal();
    case TokenKind::LBrace:
      return parse_object_literal();
    case TokenKind::Lt:
      advance();
      return parse_jsx(start, false);
    case TokenKind::At:
      skip_decorators();
      return parse_primary();
    default:
      error_at(t, "expected expression");
      return ast_.create<MissingExpr>(SourceRange{start, start});
  }
}

Expr * Parser::parse_new()
{
  const uint32_t start = tok_.range.start;
  advance();  // 'new'
  if (match(TokenKind::Dot)) {
    advance();  // target
    return ast_.create<OpaqueExpr>(range_from(start));
  }

  const uint32_t callee_start = tok_.range.start;
  Expr * callee = at_word("new") ? parse_new() : parse_primary();
  callee = parse_call_chain(callee, callee_start, false);

  std::vector<Expr *> args;
  if (at(TokenKind::LParen)) {
    args = parse_arguments();
  }
  return ast_.create<NewExpr>(callee, ast_.copy_to_arena(args), range_from(start));
}

Expr * Parser::parse_function_expr(uint32_t start, bool is_async)
{
  advance();  // 'function'
  const bool is_generator = match(TokenKind::Star);
  std::string_view name;
  SourceRange name_range;
  if (at_identifier()) {
    const Token t = advance();
    name = t.text;
    name_range = t.range;
  }
  FunctionData fn = parse_function_rest(name, name_range, is_async, is_generator);
  return ast_.create<FunctionExpr>(fn, range_from(start));
}

Expr * Parser::parse_class_expr()
{
  const uint32_t start = tok_.range.start;
  advance();  // 'class'
  std::string_view name;
  if (at_identifier() && !at_word("extends") && !at_word("implements")) {
    name = advance().text;
  }
  if (at(TokenKind::Lt)) {
    skip_type_params_or_args();
  }
  Expr * heritage = nullptr;
  if (match_word("extends")) {
    const uint32_t hstart = tok_.range.start;
    heritage = parse_call_chain(parse_primary(), hstart, true);
    if (at(TokenKind::Lt)) {
      skip_type_params_or_args();
    }
  }
  if (match_word("implements")) {
    do {
      skip_type();
    } while (match(TokenKind::Comma));
  }
  skip_class_body();
  return ast_.create<ClassExpr>(name, heritage, range_from(start));
}

Expr * Parser::parse_array_literal()
{
  const uint32_t start = tok_.range.start;
  advance();  // '['
  const bool saved_in = allow_in_;
  allow_in_ = true;

  std::vector<Expr *> elements;
  while (!at(TokenKind::RBracket) && !at_eof()) {
    if (at(TokenKind::Comma)) {
      advance();
      elements.push_back(nullptr);
      continue;
    }
    if (at(TokenKind::Ellipsis)) {
      const uint32_t spread_start = tok_.range.start;
      advance();
      Expr * argument = parse_assignment();
      elements.push_back(ast_.create<SpreadElement>(argument, range_from(spread_start)));
    } else {
      elements.push_back(parse_assignment());
    }
    if (spec_failed_) {
      break;
    }
    if (!at(TokenKind::RBracket) && !expect(TokenKind::Comma, "','")) {
      break;
    }
  }
  allow_in_ = saved_in;
  expect(TokenKind::RBracket, "']'");
  return ast_.create<ArrayLiteralExpr>(ast_.copy_to_arena(elements), range_from(start));
}

Expr * Parser::parse_object_literal()
{
  const uint32_t start = tok_.range.start;
  advance();  // '{'
  const bool saved_in = allow_in_;
  allow_in_ = true;

  std::vector<AstNode *> members;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    members.push_back(parse_object_member());
    if (spec_failed_) {
      break;
    }
    if (!at(TokenKind::RBrace) && !expect(TokenKind::Comma, "','")) {
      break;
    }
  }
  allow_in_ = saved_in;
  expect(TokenKind::RBrace, "'}'");
  return ast_.create<ObjectLiteralExpr>(ast_.copy_to_arena(members), range_from(start));
}

AstNode * Parser::parse_object_member()
{
  const uint32_t start = tok_.range.start;

  if (at(TokenKind::Ellipsis)) {
    advance();
    Expr * argument = parse_assignment();
    return ast_.create<SpreadElement>(argument, range_from(start));
  }

  auto next_is_key = [](const Token & next) {
    return next.is(TokenKind::Identifier) || next.is(TokenKind::StringLiteral) ||
           next.is(TokenKind::NumericLiteral) || next.is(TokenKind::LBracket) ||
           next.is(TokenKind::PrivateName);
  };

  // Accessors: get x() {} / set x(v) {}
  if (at_word("get") || at_word("set")) {
    const Token next = peek_token();
    if (next_is_key(next)) {
      advance();
      SourceRange key_range;
      Expr * computed = nullptr;
      const std::string_view key = parse_property_key(key_range, computed);
      FunctionData fn = parse_function_rest(key, key_range, false, false);
      auto * fe = ast_.create<FunctionExpr>(fn, range_from(key_range.start));
      auto * prop = ast_.create<Property>(key, key_range, computed, fe, range_from(start));
      prop->is_method = true;
      return prop;
    }
  }

  bool is_async = false;
  if (at_word("async")) {
    const Token next = peek_token();
    if (!next.newline_before && (next_is_key(next) || next.is(TokenKind::Star))) {
      advance();
      is_async = true;
    }
  }
  const bool is_generator = match(TokenKind::Star);

  const bool ident_key = at_identifier();
  SourceRange key_range;
  Expr * computed = nullptr;
  const std::string_view key = parse_property_key(key_range, computed);

  if (at(TokenKind::LParen) || at(TokenKind::Lt)) {
    FunctionData fn = parse_function_rest(key, key_range, is_async, is_generator);
    auto * fe = ast_.create<FunctionExpr>(fn, range_from(key_range.start));
    auto * prop = ast_.create<Property>(key, key_range, computed, fe, range_from(start));
    prop->is_method = true;
    return prop;
  }

  if (match(TokenKind::Colon)) {
    Expr * value = parse_assignment();
    return ast_.create<Property>(key, key_range, computed, value, range_from(start));
  }

  if (ident_key) {
    auto * id = ast_.create<Identifier>(key, key_range);
    if (match(TokenKind::Eq)) {
      // Cover grammar for `({ a = 1 } = obj)`.
      Expr * def = parse_assignment();
      auto * assign = ast_.create<AssignExpr>(id, AssignOp::Assign, def, range_from(start));
      return ast_.create<Property>(key, key_range, nullptr, assign, range_from(start));
    }
    return ast_.create<ShorthandProperty>(id, range_from(start));
  }

  error_at(tok_, "expected ':'");
  auto * missing = ast_.create<MissingExpr>(SourceRange{tok_.range.start, tok_.range.start});
  return ast_.create<Property>(key, key_range, computed, missing, range_from(start));
}

Expr * Parser::parse_template(Expr * tag, uint32_t start)
{
  const uint32_t template_start = tok_.range.start;
  std::vector<Expr *> substitutions;

  if (at(TokenKind::NoSubstitutionTemplate)) {
    advance();
  } else {
    advance();  // head
    const bool saved_in = allow_in_;
    allow_in_ = true;
    while (true) {
      substitutions.push_back(parse_expression());
      if (!at(TokenKind::RBrace)) {
        error_at(tok_, "expected '}' in template literal");
        break;
      }
      tok_ = lexer_.rescan_template_continuation(tok_);
      if (at(TokenKind::TemplateMiddle)) {
        advance();
        continue;
      }
      if (at(TokenKind::TemplateTail)) {
        advance();
        break;
      }
      error_at(tok_, "unterminated template literal");
      break;
    }
    allow_in_ = saved_in;
  }

  auto * literal = ast_.create<TemplateLiteralExpr>(
    ast_.copy_to_arena(substitutions), range_from(template_start));
  if (tag != nullptr) {
    return ast_.create<TaggedTemplateExpr>(tag, literal, range_from(start));
  }
  return literal;
}

// ============================================================================
// JSX
// ============================================================================

void Parser::resume_after(uint32_t end)
{
  lexer_.reset(end);
  prev_end_ = end;
  tok_ = lexer_.next();
}

Token Parser::take_jsx_gt()
{
  if (at(TokenKind::Gt)) {
    return tok_;
  }
  if (is_gt_like(tok_.kind)) {
    tok_ = lexer_.rescan_single_gt(tok_);
    return tok_;
  }
  error_at(tok_, "expected '>'");
  Token t = tok_;
  t.kind = TokenKind::Gt;
  t.range = {tok_.range.start, tok_.range.start};
  return t;
}

std::string_view Parser::parse_jsx_name(SourceRange & range)
{
  if (!at(TokenKind::Identifier)) {
    error_at(tok_, "expected JSX name");
    range = {tok_.range.start, tok_.range.start};
    return {};
  }
  const uint32_t start = tok_.range.start;
  tok_ = lexer_.rescan_jsx_identifier(tok_);
  advance();
  while (at(TokenKind::Dot) || at(TokenKind::Colon)) {
    advance();
    if (!at(TokenKind::Identifier)) {
      error_at(tok_, "expected JSX name");
      break;
    }
    tok_ = lexer_.rescan_jsx_identifier(tok_);
    advance();
  }
  range = range_from(start);
  return source_.content().substr(start, prev_end_ - start);
}

AstNode * Parser::parse_jsx_attribute()
{
  const uint32_t start = tok_.range.start;

  if (at(TokenKind::LBrace)) {
    advance();
    expect(TokenKind::Ellipsis, "'...'");
    Expr * argument = parse_assignment();
    expect(TokenKind::RBrace, "'}'");
    return ast_.create<JsxSpreadAttribute>(argument, range_from(start));
  }

  if (!at(TokenKind::Identifier)) {
    error_at(tok_, "expected JSX attribute");
    return nullptr;
  }

  SourceRange name_range;
  const std::string_view name = parse_jsx_name(name_range);

  AstNode * value = nullptr;
  if (match(TokenKind::Eq)) {
    if (!tok_.text.empty() && (tok_.text.front() == '"' || tok_.text.front() == '\'')) {
      tok_ = lexer_.rescan_jsx_string(tok_);
      if (!at(TokenKind::StringLiteral)) {
        error_at(tok_, "unterminated string literal");
      }
      const Token str = advance();
      value = ast_.create<LiteralExpr>(LiteralKind::String, str.text, str.range);
    } else if (at(TokenKind::LBrace)) {
      const uint32_t container_start = tok_.range.start;
      advance();
      Expr * e = nullptr;
      if (!at(TokenKind::RBrace)) {
        const bool saved_in = allow_in_;
        allow_in_ = true;
        e = parse_assignment();
        allow_in_ = saved_in;
      }
      expect(TokenKind::RBrace, "'}'");
      value = ast_.create<JsxExpressionContainer>(e, range_from(container_start));
    } else if (at(TokenKind::Lt)) {
      const uint32_t lt_start = tok_.range.start;
      advance();
      value = parse_jsx(lt_start, false);
    } else {
      error_at(tok_, "expected JSX attribute value");
    }
  }
  return ast_.create<JsxAttribute>(name, name_range, value, range_from(start));
}

Expr * Parser::parse_jsx(uint32_t lt_start, bool in_children)
{
  // Fragment: <>...</>
  if (at(TokenKind::Gt)) {
    uint32_t end = tok_.range.end;
    auto children = parse_jsx_children(tok_.range.end, {}, end);
    auto * fragment =
      ast_.create<JsxFragment>(ast_.copy_to_arena(children), SourceRange{lt_start, end});
    if (!in_children) {
      resume_after(end);
    }
    return fragment;
  }

  SourceRange tag_range;
  const std::string_view tag = parse_jsx_name(tag_range);
  if (at(TokenKind::Lt)) {
    skip_type_params_or_args();
  }
  auto * element = ast_.create<JsxElement>(tag, tag_range, SourceRange{lt_start, lt_start});

  std::vector<AstNode *> attributes;
  while (!is_gt_like(tok_.kind) && !at(TokenKind::Slash) && !at_eof()) {
    AstNode * attr = parse_jsx_attribute();
    if (attr == nullptr) {
      break;
    }
    attributes.push_back(attr);
  }
  element->attributes = ast_.copy_to_arena(attributes);

  if (match(TokenKind::Slash)) {
    const Token gt = take_jsx_gt();
    element->self_closing = true;
    element->range_ = {lt_start, gt.range.end};
    if (!in_children) {
      resume_after(gt.range.end);
    }
    return element;
  }

  const Token gt = take_jsx_gt();
  uint32_t end = gt.range.end;
  auto children = parse_jsx_children(gt.range.end, tag, end);
  element->children = ast_.copy_to_arena(children);
  element->range_ = {lt_start, end};
  if (!in_children) {
    resume_after(end);
  }
  return element;
}

std::vector<AstNode *> Parser::parse_jsx_children(
  uint32_t pos, std::string_view open_tag, uint32_t & end)
{
  std::vector<AstNode *> children;
  while (true) {
    const Token t = lexer_.rescan_jsx_child(pos);

    if (t.is(TokenKind::Eof)) {
      tok_ = t;
      error_at(t, open_tag.empty() ? std::string("unterminated JSX fragment")
                                   : "unterminated JSX element <" + std::string(open_tag) + ">");
      end = pos;
      return children;
    }

    if (t.is(TokenKind::JsxText)) {
      children.push_back(ast_.create<JsxText>(t.text, t.range));
      pos = t.range.end;
      continue;
    }

    if (t.is(TokenKind::LBrace)) {
      tok_ = t;
      advance();
      Expr * e = nullptr;
      const bool saved_in = allow_in_;
      allow_in_ = true;
      if (at(TokenKind::Ellipsis)) {
        const uint32_t spread_start = tok_.range.start;
        advance();
        Expr * argument = parse_expression();
        e = ast_.create<SpreadElement>(argument, range_from(spread_start));
      } else if (!at(TokenKind::RBrace)) {
        e = parse_expression();
      }
      allow_in_ = saved_in;

      if (!at(TokenKind::RBrace)) {
        error_at(tok_, "expected '}' to close JSX expression");
        children.push_back(
          ast_.create<JsxExpressionContainer>(e, SourceRange{t.range.start, prev_end_}));
        pos = (tok_.range.start > t.range.start) ? tok_.range.start : t.range.end;
        if (at_eof()) {
          end = pos;
          return children;
        }
        continue;
      }
      children.push_back(
        ast_.create<JsxExpressionContainer>(e, SourceRange{t.range.start, tok_.range.end}));
      pos = tok_.range.end;
      continue;
    }

    // '<': closing tag or nested element
    tok_ = t;
    advance();
    if (match(TokenKind::Slash)) {
      SourceRange close_range{tok_.range.start, tok_.range.start};
      std::string_view close_name;
      if (!is_gt_like(tok_.kind)) {
        close_name = parse_jsx_name(close_range);
      }
      if (close_name != open_tag) {
        Token close_tok = tok_;
        close_tok.range = close_range;
        error_at(
          close_tok, open_tag.empty() ? std::string("expected '</>' to close fragment")
                                      : "expected '</" + std::string(open_tag) + ">'");
      }
      const Token gt = take_jsx_gt();
      end = gt.range.end;
      return children;
    }

    Expr * child = parse_jsx(t.range.start, true);
    children.push_back(child);
    pos = child->end() > t.range.start ? child->end() : t.range.end;
  }
}

// ============================================================================
// TypeScript skipping
// ============================================================================

void Parser::skip_type_annotation_opt()
{
  if (match(TokenKind::Colon)) {
    skip_type();
  }
}

void Parser::skip_type()
{
  skip_union_type();
  if (at_word("extends") && !tok_.newline_before) {
    // Conditional type: A extends B ? C : D
    advance();
    skip_union_type();
    if (match(TokenKind::Question)) {
      skip_type();
      expect(TokenKind::Colon, "':'");
      skip_type();
    }
  }
}

void Parser::skip_union_type()
{
  if (at(TokenKind::Pipe) || at(TokenKind::Amp)) {
    advance();
  }
  skip_postfix_type();
  while (at(TokenKind::Pipe) || at(TokenKind::Amp)) {
    advance();
    skip_postfix_type();
  }
}

void Parser::skip_postfix_type()
{
  skip_primary_type();
  while (at(TokenKind::LBracket) && !tok_.newline_before) {
    skip_balanced();
  }
  if (at_word("is") && !tok_.newline_before) {
    advance();
    skip_type();
  }
}

void Parser::skip_primary_type()
{
  switch (tok_.kind) {
    case TokenKind::LParen:
      skip_balanced();
      if (match(TokenKind::Arrow)) {
        skip_type();
      }
      return;
    case TokenKind::Lt:
      skip_type_params_or_args();
      if (at(TokenKind::LParen)) {
        skip_balanced();
      }
      if (match(TokenKind::Arrow)) {
        skip_type();
      }
      return;
    case TokenKind::LBrace:
    case TokenKind::LBracket:
    case TokenKind::TemplateHead:
      skip_balanced();
      return;
    case TokenKind::NoSubstitutionTemplate:
    case TokenKind::StringLiteral:
    case TokenKind::NumericLiteral:
    case TokenKind::BigIntLiteral:
      advance();
      return;
    case TokenKind::Minus:
      advance();
      advance();
      return;
    case TokenKind::Identifier:
      break;
    default:
      error_at(tok_, "expected type");
      return;
  }

  if (at_word("typeof")) {
    advance();
    if (at_word("import")) {
      advance();
      if (at(TokenKind::LParen)) {
        skip_balanced();
      }
    } else {
      advance();
    }
    while (match(TokenKind::Dot)) {
      advance();
    }
    if (at(TokenKind::Lt) && !tok_.newline_before) {
      skip_type_params_or_args();
    }
    return;
  }
  if (at_word("keyof") || at_word("readonly") || at_word("unique") || at_word("infer")) {
    const Token next = peek_token();
    if (next.is(TokenKind::Identifier) || next.is(TokenKind::LParen) ||
        next.is(TokenKind::LBracket) || next.is(TokenKind::LBrace)) {
      advance();
      skip_postfix_type();
      return;
    }
  }
  if (at_word("asserts")) {
    const Token next = peek_token();
    if (next.is(TokenKind::Identifier) && !next.newline_before) {
      advance();
      advance();
      if (match_word("is")) {
        skip_type();
      }
      return;
    }
  }
  if (at_word("abstract") && peek_token().is_word("new")) {
    advance();
  }
  if (at_word("new")) {
    advance();
    if (at(TokenKind::Lt)) {
      skip_type_params_or_args();
    }
    if (at(TokenKind::LParen)) {
      skip_balanced();
    }
    if (match(TokenKind::Arrow)) {
      skip_type();
    }
    return;
  }
  if (at_word("import") && peek_token().is(TokenKind::LParen)) {
    advance();
    skip_balanced();
  } else {
    advance();
  }
  while (at(TokenKind::Dot)) {
    advance();
    advance();
  }
  if (at(TokenKind::Lt) && !tok_.newline_before) {
    skip_type_params_or_args();
  }
}

bool Parser::skip_type_params_or_args()
{
  int depth = 0;
  do {
    const TokenKind k = tok_.kind;
    if (k == TokenKind::Lt) {
      ++depth;
      advance();
    } else if (k == TokenKind::Gt) {
      --depth;
      advance();
    } else if (is_gt_like(k)) {
      // `>>` closing two lists, or `>=` in `<T>=...`: consume one '>' at a time.
      tok_ = lexer_.rescan_single_gt(tok_);
      --depth;
      advance();
    } else if (
      k == TokenKind::LParen || k == TokenKind::LBracket || k == TokenKind::LBrace ||
      k == TokenKind::TemplateHead) {
      if (!skip_balanced()) {
        return false;
      }
    } else if (ends_type_argument_scan(k)) {
      error_at(tok_, "expected '>'");
      return false;
    } else {
      advance();
    }
  } while (depth > 0);
  return true;
}

bool Parser::try_skip_call_type_args()
{
  const State saved = save();
  ++speculating_;
  const bool saved_failed = spec_failed_;
  spec_failed_ = false;

  const bool ok = skip_type_params_or_args() && !spec_failed_ &&
                  (at(TokenKind::LParen) || at(TokenKind::NoSubstitutionTemplate) ||
                   at(TokenKind::TemplateHead));

  --speculating_;
  spec_failed_ = saved_failed;
  if (!ok) {
    restore(saved);
  }
  return ok;
}

bool Parser::skip_balanced()
{
  std::vector<TokenKind> stack;
  TokenKind last = TokenKind::Semicolon;
  do {
    const TokenKind k = tok_.kind;
    if (k == TokenKind::Eof) {
      error_at(tok_, "unexpected end of file");
      return false;
    }
    if ((k == TokenKind::Slash || k == TokenKind::SlashEq) && !slash_is_division_after(last)) {
      tok_ = lexer_.rescan_as_regex(tok_);
    }

    switch (tok_.kind) {
      case TokenKind::LParen:
        stack.push_back(TokenKind::RParen);
        break;
      case TokenKind::LBracket:
        stack.push_back(TokenKind::RBracket);
        break;
      case TokenKind::LBrace:
        stack.push_back(TokenKind::RBrace);
        break;
      case TokenKind::TemplateHead:
        stack.push_back(TokenKind::TemplateHead);
        break;
      case TokenKind::RParen:
      case TokenKind::RBracket:
        if (!stack.empty() && stack.back() == tok_.kind) {
          stack.pop_back();
        }
        break;
      case TokenKind::RBrace:
        if (!stack.empty() && stack.back() == TokenKind::TemplateHead) {
          tok_ = lexer_.rescan_template_continuation(tok_);
          if (at(TokenKind::TemplateTail)) {
            stack.pop_back();
          }
        } else if (!stack.empty() && stack.back() == TokenKind::RBrace) {
          stack.pop_back();
        }
        break;
      default:
        break;
    }
    last = tok_.kind;
    advance();
  } while (!stack.empty());
  return true;
}

void Parser::skip_class_body()
{
  if (at(TokenKind::LBrace)) {
    skip_balanced();
  } else {
    error_at(tok_, "expected '{'");
  }
}

void Parser::skip_decorators()
{
  while (at(TokenKind::At)) {
    advance();
    const uint32_t start = tok_.range.start;
    (void)parse_call_chain(parse_primary(), start, true);
  }
}

}  // namespace reactc::syntax
