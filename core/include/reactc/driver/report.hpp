// reactc/driver/report.hpp - JSON serialization of compile results
//
// nlohmann::json ADL serializers, so `nlohmann::json j = output;` works for
// every result type. Used by `--format json` and `reactc analyze`.
//
#pragma once

#include <nlohmann/json.hpp>

#include "reactc/analysis/reactivity_types.hpp"
#include "reactc/basic/diagnostic.hpp"
#include "reactc/driver/compiler.hpp"

namespace reactc
{

void to_json(nlohmann::json & j, const SourceRange & range);
void to_json(nlohmann::json & j, const Diagnostic & diag);
void to_json(nlohmann::json & j, const DiagnosticBag & diags);
void to_json(nlohmann::json & j, const VariableInfo & variable);
void to_json(nlohmann::json & j, const MutationInfo & mutation);
void to_json(nlohmann::json & j, const JsxExpressionInfo & expression);
void to_json(nlohmann::json & j, const ComponentReport & component);

/// {"success", "code", "diagnostics", "components"}
void to_json(nlohmann::json & j, const CompileOutput & output);

/// One entry per file plus the file-independent diagnostics. The generated
/// code is included only when `include_code` is set.
[[nodiscard]] nlohmann::json result_to_json(const CompileResult & result, bool include_code);

}  // namespace reactc
