#include <gtest/gtest.h>

#include <string>

#include "reactc/transform/mutation_transformer.hpp"
#include "reactc/transform/signal_transformer.hpp"
#include "reactc/test_support/parse_helpers.hpp"

using namespace reactc;
using reactc::test_support::analyze;

namespace
{

std::string rewrite(const std::string & src)
{
  const auto mod = analyze(src);
  EXPECT_TRUE(mod.ok());
  if (!mod.ok() || mod.components.empty()) {
    return src;
  }
  const auto variables = mod.classify();
  const auto mutations = MutationDetector().detect(mod.components[0], variables);
  EditBuffer buffer(src);
  HelperUsage helpers;
  SignalTransformer().transform(buffer, mod.components[0], variables, mutations, helpers);
  MutationTransformer().transform(buffer, mutations);
  return buffer.to_string();
}

}  // namespace

TEST(TransformMutation, MethodCallBecomesPeekAndNotify)
{
  const auto out = rewrite(
    "function C() {\n"
    "  let todos = [];\n"
    "  const add = (t) => todos.push(t);\n"
    "  return <p />;\n"
    "}\n");
  EXPECT_NE(
    out.find("const add = (t) => (todos.peek().push(t), todos.notify());"), std::string::npos);
}

TEST(TransformMutation, AssignmentsAndDeletes)
{
  const auto out = rewrite(
    "function C() {\n"
    "  let state = {};\n"
    "  const f = () => {\n"
    "    state.user.name = 'x';\n"
    "    state[key] = 1;\n"
    "    delete state.old;\n"
    "    Object.assign(state, patch);\n"
    "  };\n"
    "  return <p />;\n"
    "}\n");
  EXPECT_NE(out.find("(state.peek().user.name = 'x', state.notify());"), std::string::npos);
  EXPECT_NE(out.find("(state.peek()[key] = 1, state.notify());"), std::string::npos);
  EXPECT_NE(out.find("(delete state.peek().old, state.notify());"), std::string::npos);
  EXPECT_NE(out.find("(Object.assign(state.peek(), patch), state.notify());"), std::string::npos);
}

TEST(TransformMutation, ArgumentsStillReadSignalValues)
{
  const auto out = rewrite(
    "function C() {\n"
    "  let items = [];\n"
    "  let next = 1;\n"
    "  const f = () => items.push(next);\n"
    "  return <p />;\n"
    "}\n");
  EXPECT_NE(out.find("(items.peek().push(next.value), items.notify())"), std::string::npos);
}

TEST(TransformMutation, NestedSitesCloseInOrder)
{
  const auto out = rewrite(
    "function C() {\n"
    "  let a = [];\n"
    "  let b = [];\n"
    "  const f = () => a.push(b.pop());\n"
    "  return <p />;\n"
    "}\n");
  EXPECT_NE(
    out.find("(a.peek().push(((__v) => (b.notify(), __v))(b.peek().pop())), a.notify())"),
    std::string::npos);
}

TEST(TransformMutation, ConsumedResultsAreKept)
{
  const auto out = rewrite(
    "function C() {\n"
    "  let todos = [];\n"
    "  let done = [];\n"
    "  const finish = (i) => done.push(todos.splice(i, 1)[0]);\n"
    "  const undo = () => {\n"
    "    const last = done.pop();\n"
    "    return items.length ? last : (done.pop());\n"
    "  };\n"
    "  return <p />;\n"
    "}\n");
  EXPECT_NE(
    out.find(
      "const finish = (i) => (done.peek().push("
      "((__v) => (todos.notify(), __v))(todos.peek().splice(i, 1))[0]), done.notify());"),
    std::string::npos);
  EXPECT_NE(
    out.find("const last = ((__v) => (done.notify(), __v))(done.peek().pop());"),
    std::string::npos);
  EXPECT_NE(
    out.find("last : (((__v) => (done.notify(), __v))(done.peek().pop()));"), std::string::npos);
}

TEST(TransformMutation, StatementSitesUseTheSequenceForm)
{
  const auto out = rewrite(
    "function C() {\n"
    "  let items = [];\n"
    "  const reset = () => {\n"
    "    items.pop();\n"
    "    (items.shift(), items.push(1));\n"
    "    void items.reverse();\n"
    "  };\n"
    "  return <p />;\n"
    "}\n");
  EXPECT_NE(out.find("    (items.peek().pop(), items.notify());\n"), std::string::npos);
  EXPECT_NE(
    out.find("((items.peek().shift(), items.notify()), (items.peek().push(1), items.notify()));"),
    std::string::npos);
  EXPECT_NE(out.find("void (items.peek().reverse(), items.notify());"), std::string::npos);
}

TEST(TransformMutation, SideEffectingArgumentsAppearOnce)
{
  const auto out = rewrite(
    "function C() {\n"
    "  let items = [];\n"
    "  const add = () => items.push(sideEffecting());\n"
    "  const put = (k) => { items[nextKey()] = sideEffecting(); };\n"
    "  return <p />;\n"
    "}\n");
  size_t calls = 0;
  for (size_t pos = out.find("sideEffecting()"); pos != std::string::npos;
       pos = out.find("sideEffecting()", pos + 1)) {
    ++calls;
  }
  EXPECT_EQ(calls, 2u);
  EXPECT_NE(out.find("(items.peek().push(sideEffecting()), items.notify())"), std::string::npos);
  EXPECT_NE(
    out.find("(items.peek()[nextKey()] = sideEffecting(), items.notify());"), std::string::npos);
}

TEST(TransformMutation, ConstBindingsAreNotRewritten)
{
  const auto out = rewrite(
    "function C() {\n"
    "  const list = [];\n"
    "  const f = () => list.push(1);\n"
    "  return <p />;\n"
    "}\n");
  EXPECT_NE(out.find("const f = () => list.push(1);"), std::string::npos);
}
