// reactc/driver/report.cpp - JSON serialization of compile results
//
#include "reactc/driver/report.hpp"

namespace reactc
{

using nlohmann::json;

void to_json(json & j, const SourceRange & range)
{
  if (!range.is_valid()) {
    j = nullptr;
    return;
  }
  j = json{{"start", range.start}, {"end", range.end}};
}

void to_json(json & j, const Diagnostic & diag)
{
  j = json{
    {"severity", std::string(to_string(diag.severity))},
    {"code", diag.code},
    {"message", diag.message},
    {"range", diag.primary_range()},
  };
  if (diag.location.is_valid()) {
    j["line"] = diag.location.line;
    j["column"] = diag.location.column;
  }
  if (diag.fix) {
    j["fix"] = *diag.fix;
  }
}

void to_json(json & j, const DiagnosticBag & diags)
{
  j = json::array();
  for (const auto & d : diags) {
    j.push_back(d);
  }
}

void to_json(json & j, const VariableInfo & variable)
{
  j = json{
    {"name", variable.name},
    {"kind", std::string(to_string(variable.kind))},
    {"declaredWith", std::string(to_string(variable.declared_with))},
    {"range", variable.range},
  };
  if (variable.destructured_from) {
    j["destructuredFrom"] = *variable.destructured_from;
  }
  if (variable.property_name) {
    j["property"] = *variable.property_name;
  }
  if (variable.has_api_properties()) {
    j["signalProperties"] = variable.signal_properties;
    j["plainProperties"] = variable.plain_properties;
    if (!variable.field_signal_properties.empty()) {
      j["fieldSignalProperties"] = variable.field_signal_properties;
    }
  }
  if (variable.is_synthetic) {
    j["synthetic"] = true;
  }
  if (variable.is_reactive_source) {
    j["reactiveSource"] = true;
  }
}

void to_json(json & j, const MutationInfo & mutation)
{
  j = json{
    {"kind", std::string(to_string(mutation.kind))},
    {"root", mutation.root},
    {"range", mutation.range},
    {"value_used", mutation.value_used},
  };
  if (!mutation.method.empty()) {
    j["method"] = mutation.method;
  }
}

void to_json(json & j, const JsxExpressionInfo & expression)
{
  j = json{
    {"range", expression.range},
    {"reactive", expression.reactive},
    {"dependencies", expression.dependencies},
  };
}

void to_json(json & j, const ComponentReport & component)
{
  j = json{
    {"name", component.name},
    {"line", component.location.line},
    {"column", component.location.column},
    {"destructuredProps", component.has_destructured_props},
    {"variables", component.variables},
    {"mutations", component.mutations},
    {"jsxExpressions", component.jsx_expressions},
  };
}

void to_json(json & j, const CompileOutput & output)
{
  j = json{
    {"success", output.success},
    {"code", output.code},
    {"diagnostics", output.diagnostics},
    {"components", output.components},
  };
}

json result_to_json(const CompileResult & result, bool include_code)
{
  json files = json::array();
  for (const auto & f : result.files) {
    json entry = f.output;
    entry["file"] = f.source.path().string();
    if (!include_code) {
      entry.erase("code");
    }
    if (!f.output_path.empty()) {
      entry["output"] = f.output_path.string();
    }
    files.push_back(std::move(entry));
  }
  return json{
    {"success", result.success},
    {"diagnostics", result.diagnostics},
    {"files", std::move(files)},
  };
}

}  // namespace reactc
