#include "cvdebug/module_debug_info.hpp"

#include <gtest/gtest.h>

#include <variant>
#include <vector>

#include "utils/test_helpers.h"

using namespace cvdebug;
using namespace cvdebug::test::utils;

class ModuleDebugInfoTest : public ::testing::Test {
 protected:
  void SetUp() override { data_ = MakeSampleModule(); }

  std::vector<uint8_t> data_;
};

TEST_F(ModuleDebugInfoTest, ValidModule) {
  EXPECT_TRUE(ModuleDebugInfo::IsValid(data_.data(), static_cast<uint32_t>(data_.size())));

  ModuleDebugInfo module(data_.data(), static_cast<uint32_t>(data_.size()));
  EXPECT_TRUE(module.IsValid());
  EXPECT_EQ(module.GetData().size, data_.size());
}

TEST_F(ModuleDebugInfoTest, NullOrEmptyDataIsInvalid) {
  EXPECT_FALSE(ModuleDebugInfo::IsValid(nullptr, 16));
  EXPECT_FALSE(ModuleDebugInfo::IsValid(data_.data(), 0));

  ModuleDebugInfo module(nullptr, 0);
  EXPECT_FALSE(module.IsValid());
}

TEST_F(ModuleDebugInfoTest, TruncatedDataIsInvalid) {
  // cuts the last subsection body short
  auto size = static_cast<uint32_t>(data_.size() - 2);
  EXPECT_FALSE(ModuleDebugInfo::IsValid(data_.data(), size));
  EXPECT_THROW(ModuleDebugInfo::CheckSubsections(ByteSpan(data_.data(), size)), Error);

  ModuleDebugInfo module(data_.data(), size);
  EXPECT_FALSE(module.IsValid());
}

TEST_F(ModuleDebugInfoTest, UnknownSubsectionIsInvalid) {
  auto data = ByteWriter().Append(data_).Append(MakeSubsection(0x42, {1, 2, 3, 4})).Data();
  EXPECT_FALSE(ModuleDebugInfo::IsValid(data.data(), static_cast<uint32_t>(data.size())));
  try {
    ModuleDebugInfo::CheckSubsections(ByteSpan(data));
    FAIL() << "no error thrown";
  } catch (const Error& error) {
    EXPECT_EQ(error.kind(), ErrorKind::kUnimplementedDebugSubsection);
    EXPECT_EQ(error.value(), 0x42u);
  }
}

TEST_F(ModuleDebugInfoTest, CollectsLineInfo) {
  ModuleDebugInfo module(data_.data(), static_cast<uint32_t>(data_.size()));

  auto lines = module.GetLineInfo();
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0].offset, kSampleProc1);
  EXPECT_EQ(lines[2].offset, (SectionOffset{0x2004, 1}));

  auto proc_lines = module.GetLineInfo(kSampleProc1);
  ASSERT_EQ(proc_lines.size(), 2u);
  EXPECT_EQ(proc_lines[0], lines[0]);
  EXPECT_EQ(proc_lines[1], lines[1]);

  EXPECT_TRUE(module.GetLineInfo(SectionOffset{0x3000, 1}).empty());
}

TEST_F(ModuleDebugInfoTest, CollectsFileInfo) {
  ModuleDebugInfo module(data_.data(), static_cast<uint32_t>(data_.size()));

  auto files = module.GetFileInfo();
  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(files[0].name, StringRef{0x10});
  EXPECT_EQ(files[1].name, StringRef{0x20});

  for (const auto& line : module.GetLineInfo()) {
    auto file = module.GetLineProgram().GetFileInfo(line.file_index);
    EXPECT_TRUE(file == files[0] || file == files[1]) << line;
  }
}

TEST_F(ModuleDebugInfoTest, CollectsInlinees) {
  ModuleDebugInfo module(data_.data(), static_cast<uint32_t>(data_.size()));

  auto inlinees = module.GetInlineeList();
  ASSERT_EQ(inlinees.size(), 2u);
  EXPECT_EQ(inlinees[0].Index(), IdIndex(kSampleInlinee1));
  EXPECT_EQ(inlinees[1].Index(), IdIndex(kSampleInlinee2));
}

TEST_F(ModuleDebugInfoTest, CollectsExports) {
  ModuleDebugInfo module(data_.data(), static_cast<uint32_t>(data_.size()));

  auto exports = module.GetExportList();
  ASSERT_EQ(exports.size(), 2u);

  const auto* type_export = std::get_if<CrossModuleTypeExport>(&exports[0]);
  ASSERT_NE(type_export, nullptr);
  EXPECT_EQ(type_export->local.index, TypeIndex(0x1004));
  EXPECT_EQ(type_export->global, TypeIndex(0x2004));

  const auto* id_export = std::get_if<CrossModuleIdExport>(&exports[1]);
  ASSERT_NE(id_export, nullptr);
  EXPECT_EQ(id_export->global, IdIndex(0x80003000));
}

TEST_F(ModuleDebugInfoTest, ResolvesImports) {
  ModuleDebugInfo module(data_.data(), static_cast<uint32_t>(data_.size()));

  auto imports = module.GetImports();
  auto resolved = imports.ResolveImport(IdIndex(CV_CROSS_MODULE_FLAG | 1));
  EXPECT_EQ(resolved.module, ModuleRef{0x100});
  EXPECT_EQ(resolved.local.index, IdIndex(0x80000002));
}

TEST_F(ModuleDebugInfoTest, InlineeLineInfoOfInlineSite) {
  ModuleDebugInfo module(data_.data(), static_cast<uint32_t>(data_.size()));

  const std::vector<uint8_t> annotations = {
      BA_OP_ChangeCodeOffset, 0x10,               //
      BA_OP_ChangeCodeOffsetAndLineOffset, 0x24,  // code +4, line +1
      BA_OP_ChangeCodeLength, 2,                  //
  };
  InlineSiteSymbol site;
  site.inlinee = IdIndex(kSampleInlinee2);
  site.annotations = BinaryAnnotations(ByteSpan(annotations));

  auto lines = module.GetInlineeLineInfo(kSampleProc2, site);
  ASSERT_EQ(lines.size(), 2u);

  EXPECT_EQ(lines[0].offset, (SectionOffset{0x2010, 1}));
  EXPECT_EQ(lines[0].length, 4u);
  EXPECT_EQ(lines[0].file_index, FileIndex{kSampleFile2});
  EXPECT_EQ(lines[0].line_start, 40u);

  EXPECT_EQ(lines[1].offset, (SectionOffset{0x2014, 1}));
  EXPECT_EQ(lines[1].length, 2u);
  EXPECT_EQ(lines[1].line_start, 41u);
}

TEST_F(ModuleDebugInfoTest, InlineSiteOfUnknownInlineeHasNoLines) {
  ModuleDebugInfo module(data_.data(), static_cast<uint32_t>(data_.size()));

  const std::vector<uint8_t> annotations = {BA_OP_ChangeCodeOffset, 0x10};
  InlineSiteSymbol site;
  site.inlinee = IdIndex(0x9999);
  site.annotations = BinaryAnnotations(ByteSpan(annotations));

  EXPECT_TRUE(module.GetInlineeLineInfo(kSampleProc1, site).empty());
}

TEST(ModuleDebugInfoEmptyTest, ModuleWithOnlySymbols) {
  auto data = MakeSubsection(DEBUG_S_SYMBOLS, ByteWriter().U32(0).Data());
  ModuleDebugInfo module(data.data(), static_cast<uint32_t>(data.size()));
  ASSERT_TRUE(module.IsValid());

  EXPECT_TRUE(module.GetLineInfo().empty());
  EXPECT_TRUE(module.GetFileInfo().empty());
  EXPECT_TRUE(module.GetInlineeList().empty());
  EXPECT_TRUE(module.GetExportList().empty());
  EXPECT_TRUE(module.GetImports().GetModules().empty());
}
