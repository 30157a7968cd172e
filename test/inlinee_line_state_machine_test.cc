#include "cvdebug/inlinee_line_state_machine.hpp"

#include <gtest/gtest.h>

#include <vector>

#include "utils/test_helpers.h"

using namespace cvdebug;

class InlineeLineIteratorTest : public ::testing::Test {
 protected:
  std::vector<LineInfo> Run(const std::vector<uint8_t>& annotations,
                            SectionOffset parent = SectionOffset{0x100, 1}) {
    annotations_ = annotations;
    InlineSiteSymbol site;
    site.inlinee = inlinee_line_.inlinee;
    site.annotations = BinaryAnnotations(ByteSpan(annotations_));

    std::vector<LineInfo> lines;
    InlineeLineIterator iterator(parent, site, inlinee_line_);
    while (auto line = iterator.Next()) {
      lines.push_back(*line);
    }
    EXPECT_FALSE(iterator.Next().has_value());
    return lines;
  }

  void SetUp() override {
    inlinee_line_.inlinee = IdIndex(0x1031);
    inlinee_line_.file_id = FileIndex{0x20};
    inlinee_line_.line = 10;
  }

  std::vector<uint8_t> annotations_;
  InlineeSourceLine inlinee_line_;
};

TEST_F(InlineeLineIteratorTest, CodeLengthAndOffsetPairs) {
  inlinee_line_.file_id = FileIndex{0x270};
  inlinee_line_.line = 341;

  auto lines = Run({12, 2, 63, 12, 3, 9, 0, 0}, SectionOffset{0x120, 1});
  ASSERT_EQ(lines.size(), 2u);

  LineInfo first;
  first.offset = SectionOffset{0x15f, 1};
  first.length = 2;
  first.file_index = FileIndex{0x270};
  first.line_start = 341;
  first.line_end = 342;
  first.kind = LineInfoKind::kStatement;
  EXPECT_EQ(lines[0], first);

  LineInfo second = first;
  second.offset = SectionOffset{0x168, 1};
  second.length = 3;
  EXPECT_EQ(lines[1], second);
}

TEST_F(InlineeLineIteratorTest, LengthInferredFromNextRecord) {
  // ChangeCodeOffset 0x10, then ChangeCodeOffsetAndLineOffset code +4 line +1
  auto lines = Run({BA_OP_ChangeCodeOffset, 0x10, BA_OP_ChangeCodeOffsetAndLineOffset, 0x24});
  ASSERT_EQ(lines.size(), 2u);

  EXPECT_EQ(lines[0].offset, (SectionOffset{0x110, 1}));
  EXPECT_EQ(lines[0].length, 4u);
  EXPECT_EQ(lines[0].line_start, 10u);
  EXPECT_EQ(lines[0].line_end, 11u);

  // the last record has nothing after it
  EXPECT_EQ(lines[1].offset, (SectionOffset{0x114, 1}));
  EXPECT_FALSE(lines[1].length.has_value());
  EXPECT_EQ(lines[1].line_start, 11u);
  EXPECT_EQ(lines[1].line_end, 12u);
}

TEST_F(InlineeLineIteratorTest, ChangeCodeLengthPatchesPendingRecord) {
  auto lines = Run({BA_OP_ChangeCodeOffset, 8, BA_OP_ChangeCodeLength, 6,
                    BA_OP_ChangeCodeOffset, 2});
  ASSERT_EQ(lines.size(), 2u);

  EXPECT_EQ(lines[0].offset, (SectionOffset{0x108, 1}));
  EXPECT_EQ(lines[0].length, 6u);

  // ChangeCodeLength also moves the code offset past the patched range
  EXPECT_EQ(lines[1].offset, (SectionOffset{0x110, 1}));
  EXPECT_FALSE(lines[1].length.has_value());
}

TEST_F(InlineeLineIteratorTest, LengthIgnoresCodeOffsetJumps) {
  // CodeOffset moves the offset backwards between the two records
  auto lines = Run({BA_OP_ChangeCodeOffset, 8, BA_OP_CodeOffset, 0x7f, BA_OP_ChangeCodeOffset, 4});
  ASSERT_EQ(lines.size(), 2u);

  EXPECT_EQ(lines[0].offset, (SectionOffset{0x108, 1}));
  EXPECT_EQ(lines[0].length, 4u);

  EXPECT_EQ(lines[1].offset, (SectionOffset{0x83, 1}));
  EXPECT_FALSE(lines[1].length.has_value());
}

TEST_F(InlineeLineIteratorTest, LengthIgnoresCodeOffsetBaseChange) {
  auto lines = Run({BA_OP_ChangeCodeOffset, 8, BA_OP_ChangeCodeOffsetBase, 0x40,
                    BA_OP_ChangeCodeLengthAndCodeOffset, 2, 6});
  ASSERT_EQ(lines.size(), 2u);

  EXPECT_EQ(lines[0].offset, (SectionOffset{0x108, 1}));
  EXPECT_EQ(lines[0].length, 6u);

  EXPECT_EQ(lines[1].offset, (SectionOffset{0x14e, 1}));
  EXPECT_EQ(lines[1].length, 2u);
}

TEST_F(InlineeLineIteratorTest, RangeKindChangeKeepsLengthUnset) {
  auto lines = Run({BA_OP_ChangeCodeOffset, 8, BA_OP_ChangeRangeKind, 0,
                    BA_OP_ChangeCodeOffset, 4});
  ASSERT_EQ(lines.size(), 2u);

  EXPECT_EQ(lines[0].kind, LineInfoKind::kStatement);
  EXPECT_FALSE(lines[0].length.has_value());
  EXPECT_EQ(lines[1].kind, LineInfoKind::kExpression);
  EXPECT_EQ(lines[1].offset, (SectionOffset{0x10c, 1}));
}

TEST_F(InlineeLineIteratorTest, UnknownRangeKindIsIgnored) {
  auto lines = Run({BA_OP_ChangeRangeKind, 0, BA_OP_ChangeRangeKind, 5,
                    BA_OP_ChangeCodeOffset, 0});
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].kind, LineInfoKind::kExpression);
}

TEST_F(InlineeLineIteratorTest, AppliesStateChanges) {
  auto lines = Run({
      BA_OP_ChangeColumnStart, 5,        //
      BA_OP_ChangeColumnEndDelta, 4,     // no column end yet
      BA_OP_ChangeColumnEnd, 9,          //
      BA_OP_ChangeColumnEndDelta, 4,     // +2
      BA_OP_ChangeFile, 0x38,            //
      BA_OP_ChangeLineEndDelta, 3,       //
      BA_OP_ChangeLineOffset, 7,         // -3
      BA_OP_ChangeCodeOffsetBase, 0x40,  //
      BA_OP_CodeOffset, 0x20,            //
      BA_OP_ChangeCodeOffset, 0,         //
  });
  ASSERT_EQ(lines.size(), 1u);

  EXPECT_EQ(lines[0].offset, (SectionOffset{0x60, 1}));
  EXPECT_EQ(lines[0].file_index, FileIndex{0x38});
  EXPECT_EQ(lines[0].line_start, 7u);
  EXPECT_EQ(lines[0].line_end, 10u);
  EXPECT_EQ(lines[0].column_start, 5u);
  EXPECT_EQ(lines[0].column_end, 11u);
  EXPECT_EQ(lines[0].kind, LineInfoKind::kStatement);
}

TEST_F(InlineeLineIteratorTest, LineNumbersWrapAround) {
  inlinee_line_.line = 1;
  auto lines = Run({BA_OP_ChangeLineOffset, 7, BA_OP_ChangeCodeOffset, 0});
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].line_start, 0xfffffffeu);
  EXPECT_EQ(lines[0].line_end, 0xffffffffu);
}

TEST_F(InlineeLineIteratorTest, NoEmittingAnnotationsNoRecords) {
  EXPECT_TRUE(Run({BA_OP_ChangeFile, 4, BA_OP_ChangeLineOffset, 2}).empty());
  EXPECT_TRUE(Run({}).empty());
}

TEST_F(InlineeLineIteratorTest, DefaultIteratorIsEmpty) {
  InlineeLineIterator iterator;
  EXPECT_FALSE(iterator.Next().has_value());
}

TEST_F(InlineeLineIteratorTest, DecodeErrorPropagates) {
  annotations_ = {BA_OP_ChangeCodeOffset, 2, 14};
  InlineSiteSymbol site;
  site.annotations = BinaryAnnotations(ByteSpan(annotations_));
  InlineeLineIterator iterator(SectionOffset{0, 1}, site, inlinee_line_);
  EXPECT_THROW(iterator.Next(), Error);
}

TEST_F(InlineeLineIteratorTest, RerunIsIdentical) {
  const std::vector<uint8_t> annotations = {BA_OP_ChangeCodeOffset, 0x10,
                                            BA_OP_ChangeCodeOffsetAndLineOffset, 0x24,
                                            BA_OP_ChangeCodeLengthAndCodeOffset, 2, 3};
  auto first = Run(annotations);
  auto second = Run(annotations);
  EXPECT_EQ(first, second);
  EXPECT_EQ(first.size(), 3u);
}
