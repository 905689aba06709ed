// End-to-end tests through Compiler::compile and the file/project drivers.
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "reactc/driver/compiler.hpp"
#include "reactc/driver/report.hpp"

using namespace reactc;

namespace
{

CompileOutput compile(const std::string & src, const CompileOptions & options = CompileOptions{})
{
  return Compiler::compile(src, "App.tsx", options);
}

bool contains(const std::string & haystack, const std::string & needle)
{
  return haystack.find(needle) != std::string::npos;
}

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

void write_file(const std::filesystem::path & path, const std::string & content)
{
  std::filesystem::create_directories(path.parent_path());
  std::ofstream f(path, std::ios::binary);
  f << content;
}

std::string read_file(const std::filesystem::path & path)
{
  std::ifstream f(path, std::ios::binary);
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

}  // namespace

// ============================================================================
// Compiler::compile
// ============================================================================

TEST(IntegrationCompiler, Counter)
{
  const auto out = compile(
    "function Counter() {\n"
    "  let count = 0;\n"
    "  return <button onClick={() => count++}>{count}</button>;\n"
    "}\n");
  ASSERT_TRUE(out.success);
  EXPECT_TRUE(out.diagnostics.empty());
  EXPECT_EQ(
    out.code,
    "import { signal } from '@vertz/ui';\n"
    "import { __append, __child, __element, __on } from '@vertz/ui/internals';\n"
    "function Counter() {\n"
    "  const count = signal(0);\n"
    "  return (() => {\n"
    "  const __el0 = __element(\"button\");\n"
    "  __on(__el0, \"click\", () => count.value++);\n"
    "  __append(__el0, __child(() => count.value));\n"
    "  return __el0;\n"
    "})();\n"
    "}\n");

  ASSERT_EQ(out.components.size(), 1u);
  EXPECT_EQ(out.components[0].name, "Counter");
  EXPECT_EQ(out.components[0].location.line, 1u);
  EXPECT_EQ(out.components[0].location.column, 10u);
}

TEST(IntegrationCompiler, DerivedValuesAreComputed)
{
  const auto out = compile(
    "function Price() {\n"
    "  let quantity = 1;\n"
    "  const total = 10 * quantity;\n"
    "  return <span>{total}</span>;\n"
    "}\n");
  ASSERT_TRUE(out.success);
  EXPECT_TRUE(contains(out.code, "import { computed, signal } from '@vertz/ui';\n"));
  EXPECT_TRUE(contains(out.code, "const total = computed(() => 10 * quantity.value);"));
  EXPECT_TRUE(contains(out.code, "__child(() => total.value)"));
}

TEST(IntegrationCompiler, MutationsUsePeekAndNotify)
{
  const auto out = compile(
    "function Todos() {\n"
    "  let todos = [];\n"
    "  return <button onClick={() => todos.push(1)}>{todos.length}</button>;\n"
    "}\n");
  ASSERT_TRUE(out.success);
  EXPECT_TRUE(contains(out.code, "(todos.peek().push(1), todos.notify())"));
  EXPECT_TRUE(contains(out.code, "__child(() => todos.value.length)"));
  ASSERT_EQ(out.components[0].mutations.size(), 1u);
  EXPECT_EQ(out.components[0].mutations[0].kind, MutationKind::MethodCall);
}

TEST(IntegrationCompiler, NestedMutationKeepsItsResult)
{
  const auto out = compile(
    "function Board() {\n"
    "  let todos = [];\n"
    "  let done = [];\n"
    "  const finish = (i) => done.push(todos.splice(i, 1)[0]);\n"
    "  return <ul onClick={finish}>{todos.length}{done.length}</ul>;\n"
    "}\n");
  ASSERT_TRUE(out.success);
  EXPECT_TRUE(contains(
    out.code,
    "(i) => (done.peek().push("
    "((__v) => (todos.notify(), __v))(todos.peek().splice(i, 1))[0]), done.notify())"));
}

TEST(IntegrationCompiler, UserValuePropertyIsReadOffTheComputed)
{
  const auto out = compile(
    "function Picker() {\n"
    "  let index = 0;\n"
    "  const options = [{ value: 'a' }, { value: 'b' }];\n"
    "  const selected = options[index];\n"
    "  return <span>{selected.value}</span>;\n"
    "}\n");
  ASSERT_TRUE(out.success);
  EXPECT_TRUE(contains(out.code, "const selected = computed(() => options[index.value]);"));
  EXPECT_TRUE(contains(out.code, "__child(() => selected.value.value)"));
}

TEST(IntegrationCompiler, MarkupScopeSkipsUnrenderedSignals)
{
  CompileOptions options;
  options.mutation_scope = MutationScope::Markup;
  const auto out = compile(
    "function C() {\n"
    "  let log = [];\n"
    "  let n = 0;\n"
    "  log.push(1);\n"
    "  return <p>{n}</p>;\n"
    "}\n",
    options);
  ASSERT_TRUE(out.success);
  EXPECT_TRUE(contains(out.code, "  log.value.push(1);\n"));
  EXPECT_FALSE(contains(out.code, "log.peek()"));
}

TEST(IntegrationCompiler, ComponentPropsAreGetters)
{
  const auto out = compile(
    "function Parent() {\n"
    "  let count = 0;\n"
    "  return <Display value={count} label=\"Count\" />;\n"
    "}\n");
  ASSERT_TRUE(out.success);
  EXPECT_TRUE(contains(
    out.code, "  return Display({ get value() { return count.value; }, label: \"Count\" });\n"));
}

TEST(IntegrationCompiler, SignalApiProperties)
{
  const auto out = compile(
    "import { form } from '@vertz/ui';\n"
    "function TaskForm() {\n"
    "  const taskForm = form(schema);\n"
    "  return <button disabled={taskForm.submitting}>Save</button>;\n"
    "}\n");
  ASSERT_TRUE(out.success);
  EXPECT_TRUE(contains(out.code, "__attr(__el0, \"disabled\", () => taskForm.submitting.value)"));
  EXPECT_FALSE(contains(out.code, "from '@vertz/ui';\nimport"));
  EXPECT_TRUE(contains(out.code, "import { __append, __attr, __element, __staticText } from "));
}

TEST(IntegrationCompiler, QueryResultReadsThroughSignals)
{
  const auto out = compile(
    "import { query } from '@vertz/ui';\n"
    "function Tasks() {\n"
    "  const tasks = query(() => fetchTasks());\n"
    "  return <div>{tasks.loading ? 'Loading' : 'Done'}</div>;\n"
    "}\n");
  ASSERT_TRUE(out.success);
  EXPECT_TRUE(contains(
    out.code, "__conditional(() => tasks.loading.value, () => 'Loading', () => 'Done')"));
}

TEST(IntegrationCompiler, DestructuredQuery)
{
  const auto out = compile(
    "import { query } from '@vertz/ui';\n"
    "function Tasks() {\n"
    "  const { data: tasks, refetch } = query(() => fetchTasks());\n"
    "  return <p onClick={refetch}>{tasks}</p>;\n"
    "}\n");
  ASSERT_TRUE(out.success);
  EXPECT_TRUE(contains(out.code, "const __query_0 = query(() => fetchTasks());"));
  EXPECT_TRUE(contains(out.code, "const tasks = computed(() => __query_0.data.value);"));
  EXPECT_TRUE(contains(out.code, "const refetch = __query_0.refetch;"));
  EXPECT_TRUE(contains(out.code, "__on(__el0, \"click\", refetch)"));
  EXPECT_TRUE(contains(out.code, "__child(() => tasks.value)"));
}

TEST(IntegrationCompiler, ExistingImportsAreNotRepeated)
{
  const auto out = compile(
    "import { signal } from '@vertz/ui';\n"
    "function C() { let n = 0; return <p>{n}</p>; }\n");
  ASSERT_TRUE(out.success);
  EXPECT_EQ(
    out.code.rfind(
      "import { __append, __child, __element } from '@vertz/ui/internals';\n"
      "import { signal } from '@vertz/ui';\n",
      0),
    0u);
}

TEST(IntegrationCompiler, CustomRuntimeModules)
{
  CompileOptions options;
  options.runtime_module = "my-ui";
  options.internals_module = "my-ui/dom";
  const auto out = compile("function C() { let n = 0; return <p>{n}</p>; }\n", options);
  ASSERT_TRUE(out.success);
  EXPECT_EQ(
    out.code.rfind(
      "import { signal } from 'my-ui';\n"
      "import { __append, __child, __element } from 'my-ui/dom';\n",
      0),
    0u);
}

TEST(IntegrationCompiler, NonReactiveMutationWarns)
{
  const std::string src =
    "function List() {\n"
    "  const items = [];\n"
    "  items.push(1);\n"
    "  return <div>{items}</div>;\n"
    "}\n";
  const auto out = compile(src);
  EXPECT_TRUE(out.success);
  ASSERT_EQ(out.diagnostics.size(), 1u);
  const Diagnostic & d = out.diagnostics.all()[0];
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.code, diag_codes::k_non_reactive_mutation);
  ASSERT_TRUE(d.fix.has_value());
  EXPECT_TRUE(contains(*d.fix, "let"));
  EXPECT_EQ(d.location.line, 3u);
  EXPECT_EQ(d.location.column, 3u);
  EXPECT_TRUE(contains(out.code, "  items.push(1);\n"));

  CompileOptions strict;
  strict.warnings_as_errors = true;
  EXPECT_FALSE(compile(src, strict).success);
}

TEST(IntegrationCompiler, UnrenderedConstMutationIsQuiet)
{
  const auto out = compile(
    "function List() {\n"
    "  const items = [];\n"
    "  items.push(1);\n"
    "  return <div>empty</div>;\n"
    "}\n");
  EXPECT_TRUE(out.success);
  EXPECT_TRUE(out.diagnostics.empty());
}

TEST(IntegrationCompiler, PropsDestructuringWarnsAndKeepsParameters)
{
  const auto out = compile("function Card({ title }) { return <div>{title}</div>; }\n");
  EXPECT_TRUE(out.success);
  ASSERT_EQ(out.diagnostics.with_code(diag_codes::k_props_destructuring).size(), 1u);
  EXPECT_TRUE(contains(out.code, "function Card({ title }) {"));
}

TEST(IntegrationCompiler, ParseErrorReturnsSourceUnchanged)
{
  const std::string src = "function C() { return <div>; }\n";
  const auto out = compile(src);
  EXPECT_FALSE(out.success);
  EXPECT_TRUE(out.diagnostics.has_errors());
  EXPECT_FALSE(out.diagnostics.with_code(diag_codes::k_parse_error).empty());
  EXPECT_EQ(out.code, src);
  EXPECT_TRUE(out.components.empty());
}

TEST(IntegrationCompiler, ModulesWithoutComponentsAreUnchanged)
{
  const std::string src = "export const answer = 42;\nexport function helper() { return 1; }\n";
  const auto out = compile(src);
  EXPECT_TRUE(out.success);
  EXPECT_EQ(out.code, src);
  EXPECT_TRUE(out.components.empty());
}

TEST(IntegrationCompiler, JsonReport)
{
  const auto out = compile(
    "function Counter() {\n"
    "  let count = 0;\n"
    "  return <p>{count}</p>;\n"
    "}\n");
  const nlohmann::json j = out;
  EXPECT_EQ(j["success"], true);
  EXPECT_TRUE(j["diagnostics"].is_array());
  ASSERT_EQ(j["components"].size(), 1u);
  const auto & c = j["components"][0];
  EXPECT_EQ(c["name"], "Counter");
  EXPECT_EQ(c["destructuredProps"], false);
  ASSERT_EQ(c["variables"].size(), 1u);
  EXPECT_EQ(c["variables"][0]["name"], "count");
  EXPECT_EQ(c["variables"][0]["kind"], "signal");
  EXPECT_EQ(c["variables"][0]["declaredWith"], "let");
  ASSERT_EQ(c["jsxExpressions"].size(), 1u);
  EXPECT_EQ(c["jsxExpressions"][0]["reactive"], true);
  EXPECT_EQ(c["jsxExpressions"][0]["dependencies"], nlohmann::json::array({"count"}));
}

// ============================================================================
// File and project drivers
// ============================================================================

TEST(IntegrationCompiler, SingleFileBuildWritesOutput)
{
  const TempDir temp_dir(std::filesystem::temp_directory_path() / "reactc_single_file");
  const auto input = temp_dir.path / "Counter.tsx";
  write_file(input, "function Counter() { let n = 0; return <p>{n}</p>; }\n");

  CompileOptions options;
  options.output_dir = temp_dir.path / "out";
  const auto result = Compiler::compile_single_file(input, options);

  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.files.size(), 1u);
  ASSERT_EQ(result.generated_files.size(), 1u);
  EXPECT_EQ(result.generated_files[0], temp_dir.path / "out" / "Counter.tsx");
  EXPECT_EQ(read_file(result.generated_files[0]), result.files[0].output.code);

  const auto j = result_to_json(result, false);
  EXPECT_EQ(j["success"], true);
  ASSERT_EQ(j["files"].size(), 1u);
  EXPECT_EQ(j["files"][0]["file"], input.string());
  EXPECT_EQ(j["files"][0]["output"], result.generated_files[0].string());
  EXPECT_FALSE(j["files"][0].contains("code"));
  EXPECT_TRUE(result_to_json(result, true)["files"][0].contains("code"));
}

TEST(IntegrationCompiler, CheckModeWritesNothing)
{
  const TempDir temp_dir(std::filesystem::temp_directory_path() / "reactc_check_mode");
  const auto input = temp_dir.path / "C.tsx";
  write_file(input, "function C() { let n = 0; return <p>{n}</p>; }\n");

  CompileOptions options;
  options.mode = CompileMode::Check;
  options.output_dir = temp_dir.path / "out";
  const auto result = Compiler::compile_single_file(input, options);

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.generated_files.empty());
  EXPECT_FALSE(std::filesystem::exists(temp_dir.path / "out"));
}

TEST(IntegrationCompiler, MissingFileIsAnIoError)
{
  const auto result = Compiler::compile_single_file(
    std::filesystem::temp_directory_path() / "reactc_missing" / "Nope.tsx", CompileOptions{});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.files.empty());
  ASSERT_EQ(result.diagnostics.with_code(diag_codes::k_io_error).size(), 1u);
}

TEST(IntegrationCompiler, ProjectBuildCompilesEntryPoints)
{
  const TempDir temp_dir(std::filesystem::temp_directory_path() / "reactc_project");
  write_file(
    temp_dir.path / "reactc.yaml",
    "compiler:\n"
    "  entry_points: [src/A.tsx, src/B.tsx]\n"
    "  output_dir: build\n");
  write_file(temp_dir.path / "src" / "A.tsx", "function A() { let a = 0; return <p>{a}</p>; }\n");
  write_file(
    temp_dir.path / "src" / "B.tsx",
    "function B() { const xs = []; xs.push(1); return <p>{xs}</p>; }\n");

  const auto loaded = load_project_config(temp_dir.path / "reactc.yaml");
  ASSERT_TRUE(loaded.success) << loaded.error;
  const auto result =
    Compiler::compile_project(loaded.config, CompileOptions::from_config(loaded.config));

  EXPECT_TRUE(result.success);
  ASSERT_EQ(result.files.size(), 2u);
  EXPECT_EQ(result.generated_files.size(), 2u);
  EXPECT_TRUE(std::filesystem::exists(temp_dir.path / "build" / "A.tsx"));
  EXPECT_TRUE(std::filesystem::exists(temp_dir.path / "build" / "B.tsx"));
  EXPECT_EQ(result.files[1].output.diagnostics.size(), 1u);
}

TEST(IntegrationCompiler, ProjectWithoutEntryPointsFails)
{
  ProjectConfig config;
  config.project_root = std::filesystem::temp_directory_path();
  const auto result = Compiler::compile_project(config, CompileOptions{});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_errors());
}
