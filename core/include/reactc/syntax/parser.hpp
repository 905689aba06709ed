// reactc/syntax/parser.hpp - Recursive-descent parser for TypeScript + JSX modules
//
// Produces the reactc AST with exact byte ranges. TypeScript-only syntax
// (annotations, type arguments, interfaces, enums, declare blocks) is
// recognised and skipped: its text stays in the source buffer untouched and
// never reaches the analyses. Class bodies are skipped the same way.
//
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "reactc/ast/ast.hpp"
#include "reactc/ast/ast_context.hpp"
#include "reactc/basic/diagnostic.hpp"
#include "reactc/basic/source_manager.hpp"
#include "reactc/syntax/lexer.hpp"
#include "reactc/syntax/token.hpp"

namespace reactc::syntax
{

class Parser
{
public:
  /// Upper bound on reported syntax errors per file.
  static constexpr size_t k_max_errors = 64;

  Parser(AstContext & ast, const SourceFile & source, DiagnosticBag & diags);

  [[nodiscard]] Program * parse_program();

private:
  // Snapshot used for speculative parsing (arrow heads, call type arguments).
  struct State
  {
    uint32_t lexer_pos;
    Token tok;
    uint32_t prev_end;
  };

  // Token helpers
  [[nodiscard]] bool at(TokenKind k) const noexcept { return tok_.kind == k; }
  [[nodiscard]] bool at_word(std::string_view w) const noexcept { return tok_.is_word(w); }
  [[nodiscard]] bool at_eof() const noexcept { return tok_.kind == TokenKind::Eof; }
  [[nodiscard]] Token peek_token() const;

  Token advance();
  bool match(TokenKind k);
  bool match_word(std::string_view w);
  bool expect(TokenKind k, std::string_view what);
  void consume_semicolon();

  void error_at(const Token & t, std::string_view msg);
  void synchronize();

  [[nodiscard]] State save() const noexcept { return {lexer_.position(), tok_, prev_end_}; }
  void restore(const State & s);
  [[nodiscard]] SourceRange range_from(uint32_t start) const noexcept { return {start, prev_end_}; }

  // Identifiers and names
  [[nodiscard]] bool at_identifier() const noexcept;
  [[nodiscard]] bool at_property_name() const noexcept;
  [[nodiscard]] bool at_expression_end() const noexcept;
  [[nodiscard]] std::string_view parse_property_key(SourceRange & range, Expr *& computed);

  // Statements
  [[nodiscard]] Stmt * parse_statement();
  [[nodiscard]] std::vector<Stmt *> parse_statement_list();
  [[nodiscard]] BlockStmt * parse_block();
  [[nodiscard]] VarStmt * parse_var_stmt(bool in_for);
  [[nodiscard]] FunctionDecl * parse_function_decl(uint32_t start, bool is_async, bool name_optional);
  [[nodiscard]] Stmt * parse_class_decl(bool name_optional);
  [[nodiscard]] Stmt * parse_if();
  [[nodiscard]] Stmt * parse_for();
  [[nodiscard]] Stmt * parse_while();
  [[nodiscard]] Stmt * parse_do_while();
  [[nodiscard]] Stmt * parse_return();
  [[nodiscard]] Stmt * parse_jump(JumpKind kind);
  [[nodiscard]] Stmt * parse_throw();
  [[nodiscard]] Stmt * parse_try();
  [[nodiscard]] Stmt * parse_switch();
  [[nodiscard]] Stmt * parse_import();
  [[nodiscard]] Stmt * parse_export();
  [[nodiscard]] Stmt * parse_type_decl(TypeDeclKind kind);
  [[nodiscard]] Stmt * parse_expression_statement();
  [[nodiscard]] bool at_type_decl_start(TypeDeclKind & kind) const;

  // Functions and patterns
  [[nodiscard]] FunctionData parse_function_rest(
    std::string_view name, SourceRange name_range, bool is_async, bool is_generator);
  [[nodiscard]] std::vector<Pattern *> parse_params(SourceRange & params_range);
  [[nodiscard]] Pattern * parse_binding_target();
  [[nodiscard]] Pattern * parse_binding_element();
  [[nodiscard]] Pattern * parse_object_pattern();
  [[nodiscard]] Pattern * parse_array_pattern();
  [[nodiscard]] AstNode * parse_function_body(bool is_async, bool is_generator);

  // Expressions
  [[nodiscard]] Expr * parse_expression();
  [[nodiscard]] Expr * parse_assignment();
  [[nodiscard]] Expr * try_parse_arrow();
  [[nodiscard]] Expr * parse_arrow_from_params(
    uint32_t start, std::vector<Pattern *> params, SourceRange params_range, bool is_async);
  [[nodiscard]] Expr * parse_conditional();
  [[nodiscard]] Expr * parse_binary(int min_prec);
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_call_chain(Expr * expr, uint32_t start, bool allow_call);
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] Expr * parse_new();
  [[nodiscard]] Expr * parse_array_literal();
  [[nodiscard]] Expr * parse_object_literal();
  [[nodiscard]] AstNode * parse_object_member();
  [[nodiscard]] Expr * parse_template(Expr * tag, uint32_t start);
  [[nodiscard]] Expr * parse_function_expr(uint32_t start, bool is_async);
  [[nodiscard]] Expr * parse_class_expr();
  [[nodiscard]] std::vector<Expr *> parse_arguments();
  [[nodiscard]] int binary_precedence(const Token & t) const;

  // JSX
  [[nodiscard]] Expr * parse_jsx(uint32_t lt_start, bool in_children);
  [[nodiscard]] std::string_view parse_jsx_name(SourceRange & range);
  [[nodiscard]] AstNode * parse_jsx_attribute();
  [[nodiscard]] std::vector<AstNode *> parse_jsx_children(
    uint32_t pos, std::string_view open_tag, uint32_t & end);
  [[nodiscard]] Token take_jsx_gt();
  void resume_after(uint32_t end);

  // TypeScript skipping
  void skip_type_annotation_opt();
  void skip_type();
  void skip_union_type();
  void skip_postfix_type();
  void skip_primary_type();
  bool skip_type_params_or_args();
  bool skip_balanced();
  void skip_class_body();
  void skip_decorators();
  [[nodiscard]] bool try_skip_call_type_args();

  // Members
  AstContext & ast_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  Lexer lexer_;
  Token tok_;
  uint32_t prev_end_ = 0;

  bool allow_in_ = true;
  bool in_async_ = false;
  bool in_generator_ = false;

  int speculating_ = 0;
  bool spec_failed_ = false;
  size_t error_count_ = 0;
  uint32_t last_error_pos_ = SourceRange::k_invalid_offset;
};

}  // namespace reactc::syntax
