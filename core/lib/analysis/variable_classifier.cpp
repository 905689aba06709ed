// reactc/analysis/variable_classifier.cpp - Reactivity classification of component bindings
#include "reactc/analysis/variable_classifier.hpp"

#include <fmt/format.h>

#include <map>
#include <utility>

#include "reactc/analysis/scope.hpp"

namespace reactc
{

std::vector<PatternBinding> expandable_bindings(const Pattern * pattern)
{
  std::vector<PatternBinding> out;
  if (const auto * obj = dyn_cast<ObjectPattern>(pattern)) {
    if (obj->rest != nullptr) {
      return {};
    }
    for (const BindingProperty * prop : obj->properties) {
      const auto * target = dyn_cast<BindingIdent>(prop->value);
      if (prop->computed_key != nullptr || target == nullptr || prop->key.empty()) {
        return {};
      }
      out.push_back({target->name, std::string(prop->key), false, prop->get_range()});
    }
  } else if (const auto * arr = dyn_cast<ArrayPattern>(pattern)) {
    if (arr->rest != nullptr) {
      return {};
    }
    size_t index = 0;
    for (const Pattern * elem : arr->elements) {
      if (elem != nullptr) {
        const auto * target = dyn_cast<BindingIdent>(elem);
        if (target == nullptr) {
          return {};
        }
        out.push_back({target->name, std::to_string(index), true, target->get_range()});
      }
      ++index;
    }
  }
  return out;
}

bool is_expandable_declaration(const VarStmt & stmt, const VarDeclarator & decl)
{
  return stmt.declarators.size() == 1 && decl.init != nullptr &&
         !expandable_bindings(decl.target).empty();
}

const VariableInfo * find_variable(
  const std::vector<VariableInfo> & variables, std::string_view name) noexcept
{
  for (const auto & v : variables) {
    if (v.name == name) {
      return &v;
    }
  }
  return nullptr;
}

NameSet names_of_kind(const std::vector<VariableInfo> & variables, ReactivityKind kind)
{
  NameSet out;
  for (const auto & v : variables) {
    if (v.kind == kind) {
      out.insert(v.name);
    }
  }
  return out;
}

// ============================================================================
// Classification pass
// ============================================================================

namespace
{

class ClassificationPass
{
public:
  ClassificationPass(const RuntimeImports & imports, const BlockStmt & body)
  : imports_(imports), body_(body)
  {
  }

  std::vector<VariableInfo> run()
  {
    collect_declared_names();
    for (const Stmt * stmt : body_.body) {
      const auto * var = dyn_cast<VarStmt>(stmt);
      if (var == nullptr) {
        continue;
      }
      for (const VarDeclarator * decl : var->declarators) {
        if (var->var_kind == VarKind::Const) {
          declare_const(*var, *decl);
        } else {
          declare_mutable(*var, *decl);
        }
      }
    }
    return std::move(out_);
  }

private:
  void collect_declared_names()
  {
    std::vector<std::string_view> names;
    for (const Stmt * stmt : body_.body) {
      if (const auto * var = dyn_cast<VarStmt>(stmt)) {
        for (const VarDeclarator * decl : var->declarators) {
          collect_binding_names(decl->target, names);
        }
      } else if (const auto * fn = dyn_cast<FunctionDecl>(stmt)) {
        names.push_back(fn->fn.name);
      } else if (const auto * cls = dyn_cast<ClassDecl>(stmt)) {
        names.push_back(cls->name);
      }
    }
    for (std::string_view n : names) {
      declared_.emplace(n);
    }
  }

  /// `__<prefix>_<n>`, skipping names the component already declares.
  std::string allocate_synthetic(std::string_view prefix)
  {
    auto it = counters_.find(prefix);
    if (it == counters_.end()) {
      it = counters_.emplace(std::string(prefix), 0U).first;
    }
    std::string name;
    do {
      name = fmt::format("__{}_{}", prefix, it->second++);
    } while (declared_.count(name) != 0);
    declared_.insert(name);
    return name;
  }

  VariableInfo make(std::string_view name, ReactivityKind kind, SourceRange range, VarKind with)
  {
    VariableInfo info;
    info.name = std::string(name);
    info.kind = kind;
    info.range = range;
    info.declared_with = with;
    return info;
  }

  void add(VariableInfo info)
  {
    if (info.is_reactive() || info.has_api_properties() || info.is_reactive_source) {
      if (!info.is_synthetic) {
        tracked_.insert(info.name);
      }
    }
    out_.push_back(std::move(info));
  }

  void add_all_static(const VarStmt & stmt, const VarDeclarator & decl)
  {
    std::vector<std::string_view> names;
    collect_binding_names(decl.target, names);
    for (std::string_view n : names) {
      add(make(n, ReactivityKind::Static, decl.get_range(), stmt.var_kind));
    }
  }

  static void copy_api_properties(VariableInfo & info, const SignalApiConfig & api)
  {
    info.signal_properties = api.signal_properties;
    info.plain_properties = api.plain_properties;
    info.field_signal_properties = api.field_signal_properties;
  }

  // let / var. Signal-API property sets only apply to `const`: a mutable
  // destructuring copies each field into its own signal.
  void declare_mutable(const VarStmt & stmt, const VarDeclarator & decl)
  {
    if (const auto * target = dyn_cast<BindingIdent>(decl.target)) {
      add(make(target->name, ReactivityKind::Signal, decl.get_range(), stmt.var_kind));
      return;
    }
    if (!is_expandable_declaration(stmt, decl)) {
      add_all_static(stmt, decl);
      return;
    }

    VariableInfo source =
      make(allocate_synthetic("let"), ReactivityKind::Static, decl.init->get_range(), stmt.var_kind);
    source.is_synthetic = true;
    const std::string source_name = source.name;
    add(std::move(source));

    for (const auto & b : expandable_bindings(decl.target)) {
      VariableInfo info = make(b.name, ReactivityKind::Signal, b.range, stmt.var_kind);
      info.destructured_from = source_name;
      info.property_name = b.property;
      info.index_access = b.index_access;
      add(std::move(info));
    }
  }

  void declare_const(const VarStmt & stmt, const VarDeclarator & decl)
  {
    if (decl.init == nullptr) {
      add_all_static(stmt, decl);
      return;
    }

    const SignalApiConfig * api = imports_.api_for_call(decl.init);
    const bool reactive_source = imports_.is_reactive_source_call(decl.init);

    if (const auto * target = dyn_cast<BindingIdent>(decl.target)) {
      VariableInfo info =
        make(target->name, ReactivityKind::Static, decl.get_range(), stmt.var_kind);
      if (api != nullptr) {
        copy_api_properties(info, *api);
      } else if (reactive_source) {
        info.is_reactive_source = true;
      } else if (references_any(decl.init, tracked_)) {
        info.kind = ReactivityKind::Computed;
      }
      add(std::move(info));
      return;
    }

    if (!is_expandable_declaration(stmt, decl)) {
      add_all_static(stmt, decl);
      return;
    }

    const auto bindings = expandable_bindings(decl.target);
    if (api != nullptr) {
      VariableInfo source =
        make(allocate_synthetic(api->name), ReactivityKind::Static, decl.init->get_range(),
             stmt.var_kind);
      source.is_synthetic = true;
      copy_api_properties(source, *api);
      const std::string source_name = source.name;
      add(std::move(source));

      for (const auto & b : bindings) {
        const bool is_signal = !b.index_access && api->signal_properties.count(b.property) != 0;
        VariableInfo info = make(
          b.name, is_signal ? ReactivityKind::Computed : ReactivityKind::Static, b.range,
          stmt.var_kind);
        info.destructured_from = source_name;
        info.property_name = b.property;
        info.index_access = b.index_access;
        add(std::move(info));
      }
      return;
    }

    const bool reactive = reactive_source || references_any(decl.init, tracked_);
    for (const auto & b : bindings) {
      VariableInfo info = make(
        b.name, reactive ? ReactivityKind::Computed : ReactivityKind::Static, b.range,
        stmt.var_kind);
      info.property_name = b.property;
      info.index_access = b.index_access;
      add(std::move(info));
    }
  }

  const RuntimeImports & imports_;
  const BlockStmt & body_;
  std::vector<VariableInfo> out_;
  NameSet declared_;
  NameSet tracked_;  ///< Signals, computeds, signal-API and reactive-source bindings
  std::map<std::string, unsigned, std::less<>> counters_;
};

}  // namespace

std::vector<VariableInfo> VariableClassifier::classify(const ComponentInfo & component) const
{
  const BlockStmt * body = component.block_body();
  if (body == nullptr) {
    return {};
  }
  return ClassificationPass(imports_, *body).run();
}

}  // namespace reactc
