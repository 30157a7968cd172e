#ifndef TEST_UTILS_TEST_HELPERS_H_
#define TEST_UTILS_TEST_HELPERS_H_

#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <vector>

#include "cvdebug/codeview_def.hpp"
#include "cvdebug/codeview_types.hpp"
#include "cvdebug/cvdebug.h"

// Needs to be in the same namespace as cvdebug_result so leave it outside.
inline std::ostream& operator<<(std::ostream& out, cvdebug_result result_val) {
  out << cvdebugResultTypeToString(result_val);
  return out;
}

namespace cvdebug {

inline std::ostream& operator<<(std::ostream& out, const SectionOffset& offset) {
  out << std::hex << offset.section << ":" << offset.offset << std::dec;
  return out;
}

inline std::ostream& operator<<(std::ostream& out, const LineInfo& line) {
  out << "{" << line.offset << " len=";
  if (line.length) {
    out << *line.length;
  } else {
    out << "none";
  }
  out << " file=0x" << std::hex << line.file_index.value << std::dec << " lines=" << line.line_start
      << "-" << line.line_end << " kind="
      << (line.kind == LineInfoKind::kStatement ? "statement" : "expression") << "}";
  return out;
}

}  // namespace cvdebug

namespace cvdebug::test::utils {

// Little-endian byte buffer builder for hand-made debug data.
class ByteWriter {
 public:
  ByteWriter& U8(uint8_t value) {
    data_.push_back(value);
    return *this;
  }

  ByteWriter& U16(uint16_t value) {
    U8(value & 0xff);
    U8(value >> 8);
    return *this;
  }

  ByteWriter& U32(uint32_t value) {
    U16(value & 0xffff);
    U16(value >> 16);
    return *this;
  }

  ByteWriter& Bytes(std::initializer_list<uint8_t> bytes) {
    data_.insert(data_.end(), bytes.begin(), bytes.end());
    return *this;
  }

  ByteWriter& Append(const std::vector<uint8_t>& bytes) {
    data_.insert(data_.end(), bytes.begin(), bytes.end());
    return *this;
  }

  ByteWriter& Align(size_t alignment) {
    while (data_.size() % alignment != 0) {
      data_.push_back(0);
    }
    return *this;
  }

  size_t Size() const { return data_.size(); }
  const std::vector<uint8_t>& Data() const { return data_; }

 private:
  std::vector<uint8_t> data_;
};

inline std::vector<uint8_t> MakeSubsection(uint32_t kind, const std::vector<uint8_t>& body) {
  return ByteWriter().U32(kind).U32(static_cast<uint32_t>(body.size())).Append(body).Data();
}

inline uint32_t MakeLineFlags(uint32_t start_line, uint32_t delta, bool is_statement) {
  return (start_line & CV_LINE_START_MASK) | ((delta & CV_LINE_DELTA_MASK) << CV_LINE_DELTA_SHIFT) |
         (is_statement ? CV_LINE_STATEMENT_FLAG : 0u);
}

struct TestLine {
  uint32_t offset;
  uint32_t flags;
};

struct TestColumn {
  uint16_t start;
  uint16_t end;
};

// One block of a lines subsection. Columns are written only if not empty.
inline std::vector<uint8_t> MakeLinesBlock(uint32_t file_index, const std::vector<TestLine>& lines,
                                           const std::vector<TestColumn>& columns = {}) {
  uint32_t block_size = kDebugLinesBlockHeaderSize +
                        static_cast<uint32_t>(lines.size()) * kLineNumberRecordSize +
                        static_cast<uint32_t>(columns.size()) * kColumnNumberRecordSize;
  ByteWriter writer;
  writer.U32(file_index).U32(static_cast<uint32_t>(lines.size())).U32(block_size);
  for (const auto& line : lines) {
    writer.U32(line.offset).U32(line.flags);
  }
  for (const auto& column : columns) {
    writer.U16(column.start).U16(column.end);
  }
  return writer.Data();
}

inline std::vector<uint8_t> MakeLinesBody(SectionOffset offset, uint16_t flags, uint32_t code_size,
                                          const std::vector<std::vector<uint8_t>>& blocks) {
  ByteWriter writer;
  writer.U32(offset.offset).U16(offset.section).U16(flags).U32(code_size);
  for (const auto& block : blocks) {
    writer.Append(block);
  }
  return writer.Data();
}

// Body of a file checksums subsection with the given entries, each padded to 4 bytes.
struct TestChecksum {
  uint32_t name_offset;
  uint8_t kind;
  std::vector<uint8_t> bytes;
};

inline std::vector<uint8_t> MakeChecksumsBody(const std::vector<TestChecksum>& entries) {
  ByteWriter writer;
  for (const auto& entry : entries) {
    writer.U32(entry.name_offset).U8(static_cast<uint8_t>(entry.bytes.size())).U8(entry.kind);
    writer.Append(entry.bytes);
    writer.Align(4);
  }
  return writer.Data();
}

// Module with two procedures, two source files, two inlinees and both cross module tables.
constexpr SectionOffset kSampleProc1{0x1000, 1};
constexpr SectionOffset kSampleProc2{0x2000, 1};
constexpr uint32_t kSampleFile1 = 0;   // MD5 entry
constexpr uint32_t kSampleFile2 = 24;  // entry without checksum
constexpr uint32_t kSampleInlinee1 = 0x1031;
constexpr uint32_t kSampleInlinee2 = 0x1032;

inline std::vector<uint8_t> MakeSampleModule() {
  auto checksums = MakeChecksumsBody({
      {0x10, 1, std::vector<uint8_t>(16, 0xaa)},
      {0x20, 0, {}},
  });

  auto proc1 = MakeLinesBody(kSampleProc1, 0, 0x20,
                             {MakeLinesBlock(kSampleFile1, {{0, MakeLineFlags(10, 11, true)},
                                                            {8, MakeLineFlags(12, 12, true)}})});
  auto proc2 = MakeLinesBody(kSampleProc2, CV_LINES_HAVE_COLUMNS, 0x10,
                             {MakeLinesBlock(kSampleFile2, {{4, MakeLineFlags(20, 21, false)}},
                                             {{3, 9}})});

  auto inlinee_lines = ByteWriter()
                           .U32(CV_INLINEE_SOURCE_LINE_SIGNATURE)
                           .U32(kSampleInlinee1).U32(kSampleFile1).U32(30)
                           .U32(kSampleInlinee2).U32(kSampleFile2).U32(40)
                           .Data();

  auto imports = ByteWriter().U32(0x100).U32(2).U32(0x1001).U32(0x80000002).Data();
  auto exports = ByteWriter().U32(0x1004).U32(0x2004).U32(0x80001000).U32(0x80003000).Data();

  return ByteWriter()
      .Append(MakeSubsection(DEBUG_S_SYMBOLS, ByteWriter().U32(0).Data()))
      .Append(MakeSubsection(DEBUG_S_FILECHKSMS, checksums))
      .Append(MakeSubsection(DEBUG_S_LINES, proc1))
      .Append(MakeSubsection(DEBUG_S_IGNORE, proc1))
      .Append(MakeSubsection(DEBUG_S_LINES, proc2))
      .Append(MakeSubsection(DEBUG_S_INLINEELINES, inlinee_lines))
      .Append(MakeSubsection(DEBUG_S_CROSSSCOPEIMPORTS, imports))
      .Append(MakeSubsection(DEBUG_S_CROSSSCOPEEXPORTS, exports))
      .Data();
}

}  // namespace cvdebug::test::utils

#endif  // TEST_UTILS_TEST_HELPERS_H_
