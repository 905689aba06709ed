#include <gtest/gtest.h>

#include "reactc/transform/edit_buffer.hpp"

using reactc::EditBuffer;

TEST(TransformEditBuffer, UnchangedBufferRoundTrips)
{
  EditBuffer buf("const x = 1;");
  EXPECT_FALSE(buf.has_changed());
  EXPECT_EQ(buf.to_string(), "const x = 1;");
  EXPECT_EQ(buf.slice(6, 7), "x");
}

TEST(TransformEditBuffer, OverwriteAndInsertionsUseOriginalOffsets)
{
  EditBuffer buf("let x = 1;");
  buf.overwrite(0, 3, "const");
  buf.append_left(8, "signal(");
  buf.append_right(9, ")");
  EXPECT_TRUE(buf.has_changed());
  EXPECT_EQ(buf.to_string(), "const x = signal(1);");
  EXPECT_EQ(buf.rejected_edits(), 0u);
}

TEST(TransformEditBuffer, AppendAndPrependOrderAtSamePoint)
{
  EditBuffer buf("ab");
  buf.append_left(1, "1");
  buf.append_left(1, "2");
  buf.prepend_left(1, "0");
  buf.append_right(1, "4");
  buf.prepend_right(1, "3");
  EXPECT_EQ(buf.to_string(), "a01234b");
}

TEST(TransformEditBuffer, InsertionsAtBufferEdges)
{
  EditBuffer buf("x");
  buf.append_left(0, "<");
  buf.append_right(1, ">");
  buf.prepend("// header\n");
  EXPECT_EQ(buf.to_string(), "// header\n<x>");
}

TEST(TransformEditBuffer, SliceIncludesInnerEditsOnly)
{
  // "count + 1"
  EditBuffer buf("count + 1");
  buf.append_left(5, ".value");
  buf.append_left(0, "L");
  buf.append_right(9, "R");

  // Left insertion at the end is part of the slice, left insertion at the
  // start and right insertion at the end are not.
  EXPECT_EQ(buf.slice(0, 5), "count.value");
  EXPECT_EQ(buf.slice(0, 9), "count.value + 1");
  EXPECT_EQ(buf.to_string(), "Lcount.value + 1R");
}

TEST(TransformEditBuffer, SliceIncludesRightInsertionAtStart)
{
  EditBuffer buf("a.push(1)");
  buf.prepend_right(0, "(");
  buf.append_left(9, ", a.notify())");
  EXPECT_EQ(buf.slice(0, 9), "(a.push(1), a.notify())");
}

TEST(TransformEditBuffer, OverwriteDropsInnerInsertions)
{
  EditBuffer buf("<div>{x}</div>");
  buf.append_left(7, ".value");
  buf.overwrite(0, 14, "el");
  EXPECT_EQ(buf.to_string(), "el");
}

TEST(TransformEditBuffer, ReplaceKeepsEdgeInsertions)
{
  EditBuffer buf("f(<a/>)");
  buf.prepend_right(2, "[");
  buf.append_left(6, "]");
  buf.replace(2, 6, "el");
  EXPECT_EQ(buf.to_string(), "f([el])");
}

TEST(TransformEditBuffer, EditsInsideOverwrittenTextAreRejected)
{
  EditBuffer buf("abcdef");
  buf.overwrite(1, 5, "X");
  buf.append_left(3, "!");
  buf.overwrite(2, 6, "Y");
  EXPECT_EQ(buf.rejected_edits(), 2u);
  EXPECT_EQ(buf.to_string(), "aXf");
}

TEST(TransformEditBuffer, OverwriteOfWholeEditedRangeIsAllowed)
{
  EditBuffer buf("abcdef");
  buf.overwrite(1, 3, "X");
  buf.overwrite(0, 6, "Z");
  EXPECT_EQ(buf.rejected_edits(), 0u);
  EXPECT_EQ(buf.to_string(), "Z");
}

TEST(TransformEditBuffer, SliceReturnsOverwrittenChunksWhole)
{
  EditBuffer buf("let a = 1;");
  buf.overwrite(0, 3, "const");
  EXPECT_EQ(buf.slice(0, 5), "const a");
}

TEST(TransformEditBuffer, InvalidRangesAreRejected)
{
  EditBuffer buf("abc");
  buf.overwrite(2, 2, "x");
  buf.overwrite(1, 10, "x");
  buf.append_left(4, "x");
  EXPECT_EQ(buf.rejected_edits(), 3u);
  EXPECT_EQ(buf.to_string(), "abc");
  EXPECT_EQ(buf.slice(2, 1), "");
}
