// reactc/ast/ast_json.cpp - JSON serialization implementation
//
#include "reactc/ast/ast_json.hpp"

#include <string>

#include "reactc/ast/ast_walk.hpp"

namespace reactc
{
namespace
{

using nlohmann::json;

json j_range(SourceRange r)
{
  if (!r.is_valid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.start}, {"end", r.end}};
}

std::string str(std::string_view s) { return std::string(s); }

void j_function(json & j, const FunctionData & fn)
{
  if (!fn.name.empty()) {
    j["name"] = str(fn.name);
  }
  j["async"] = fn.is_async;
  j["generator"] = fn.is_generator;
  j["paramCount"] = fn.params.size();
  j["expressionBody"] = fn.has_expression_body();
}

/// Attributes that are not child nodes.
void j_attributes(json & j, const AstNode * node)
{
  switch (node->get_kind()) {
    case NodeKind::Identifier:
      j["name"] = str(cast<Identifier>(node)->name);
      break;
    case NodeKind::BindingIdent:
      j["name"] = str(cast<BindingIdent>(node)->name);
      break;
    case NodeKind::Literal:
      j["raw"] = str(cast<LiteralExpr>(node)->raw);
      break;
    case NodeKind::Unary:
      j["op"] = str(to_string(cast<UnaryExpr>(node)->op));
      break;
    case NodeKind::Update: {
      const auto * u = cast<UpdateExpr>(node);
      j["op"] = u->increment ? "++" : "--";
      j["prefix"] = u->prefix;
      break;
    }
    case NodeKind::Binary:
      j["op"] = str(to_string(cast<BinaryExpr>(node)->op));
      break;
    case NodeKind::Assign:
      j["op"] = str(to_string(cast<AssignExpr>(node)->op));
      break;
    case NodeKind::Member: {
      const auto * m = cast<MemberExpr>(node);
      j["property"] = str(m->property);
      j["optional"] = m->optional;
      break;
    }
    case NodeKind::Call:
      j["optional"] = cast<CallExpr>(node)->optional;
      break;
    case NodeKind::FunctionExpr:
      j_function(j, cast<FunctionExpr>(node)->fn);
      break;
    case NodeKind::ArrowFunction:
      j_function(j, cast<ArrowFunctionExpr>(node)->fn);
      break;
    case NodeKind::FunctionDecl:
      j_function(j, cast<FunctionDecl>(node)->fn);
      break;
    case NodeKind::JsxElement: {
      const auto * e = cast<JsxElement>(node);
      j["tag"] = str(e->tag);
      j["component"] = e->is_component();
      break;
    }
    case NodeKind::JsxAttribute:
      j["name"] = str(cast<JsxAttribute>(node)->name);
      break;
    case NodeKind::JsxText:
      j["raw"] = str(cast<JsxText>(node)->raw);
      break;
    case NodeKind::Property:
      j["key"] = str(cast<Property>(node)->key);
      break;
    case NodeKind::BindingProperty:
      j["key"] = str(cast<BindingProperty>(node)->key);
      break;
    case NodeKind::VarStmt:
      j["kind"] = str(to_string(cast<VarStmt>(node)->var_kind));
      break;
    case NodeKind::ClassDecl:
      j["name"] = str(cast<ClassDecl>(node)->name);
      break;
    case NodeKind::Import: {
      const auto * imp = cast<ImportDecl>(node);
      j["module"] = str(imp->module);
      j["typeOnly"] = imp->type_only;
      break;
    }
    case NodeKind::ImportSpecifier: {
      const auto * s = cast<ImportSpecifier>(node);
      j["imported"] = str(s->imported);
      j["local"] = str(s->local);
      break;
    }
    case NodeKind::Export:
      j["default"] = cast<ExportDecl>(node)->is_default;
      break;
    case NodeKind::TypeDecl:
      j["name"] = str(cast<TypeDeclStmt>(node)->name);
      break;
    default:
      break;
  }
}

}  // namespace

json to_json(const AstNode * node)
{
  if (node == nullptr) {
    return nullptr;
  }
  json j{{"type", str(to_string(node->get_kind()))}, {"range", j_range(node->get_range())}};
  j_attributes(j, node);

  json children = json::array();
  for_each_child(node, [&](const AstNode * child) { children.push_back(to_json(child)); });
  if (!children.empty()) {
    j["children"] = std::move(children);
  }
  return j;
}

}  // namespace reactc
