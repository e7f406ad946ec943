#include "pdf_writer.h"

#include "logger.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace svgpdf {

namespace {

// Appends '\n'-separated lines while tracking the byte offset at which the
// next line starts.
class PdfByteWriter {
public:
  size_t Offset() const { return bytes_.size() + (pending_ ? 1 : 0); }

  void Line(const std::string &text) {
    if (pending_)
      bytes_ += '\n';
    bytes_ += text;
    pending_ = true;
  }

  std::string Take() { return std::move(bytes_); }

private:
  std::string bytes_;
  bool pending_ = false;
};

std::string XrefEntry(size_t offset) {
  std::ostringstream ss;
  ss << std::setw(10) << std::setfill('0') << offset << " 00000 n ";
  return ss.str();
}

std::string OsCause(int err, const std::string &fallback) {
  return err != 0 ? std::strerror(err) : fallback;
}

} // namespace

SerializedPdf SerializePdf(const PdfObjectTable &table) {
  SerializedPdf result;
  PdfByteWriter out;

  out.Line("%PDF-1.4");
  out.Line("%\xE2\xE3\xCF\xD3");

  result.objectOffsets.reserve(table.Size());
  for (const auto &object : table.Objects()) {
    result.objectOffsets.push_back(out.Offset());
    out.Line(std::to_string(object.number) + " 0 obj");
    out.Line(object.body);
    out.Line("endobj");
  }

  result.xrefOffset = out.Offset();
  out.Line("xref");
  out.Line("0 " + std::to_string(table.XrefEntryCount()));
  out.Line("0000000000 65535 f ");
  for (size_t offset : result.objectOffsets)
    out.Line(XrefEntry(offset));

  out.Line("trailer");
  out.Line("<<");
  out.Line("/Size " + std::to_string(table.XrefEntryCount()));
  out.Line("/Root " + std::to_string(table.NumberOf(PdfObjectKind::Catalog)) +
           " 0 R");
  if (int info = table.NumberOf(PdfObjectKind::Info))
    out.Line("/Info " + std::to_string(info) + " 0 R");
  out.Line(">>");
  out.Line("startxref");
  out.Line(std::to_string(result.xrefOffset));
  out.Line("%%EOF");

  result.bytes = out.Take();
  return result;
}

ConversionResult SerializeDocument(const Document &document,
                                   SerializedPdf &out) {
  PdfObjectTable table;
  ConversionResult built = BuildObjectTable(document, table);
  if (!built.success)
    return built;
  out = SerializePdf(table);
  return built;
}

ConversionResult WritePdfDocument(const fs::path &outputPath,
                                  const std::string &bytes) {
  fs::path tempPath = outputPath;
  tempPath += ".tmp";

  auto fail = [&](const std::string &operation, const std::string &cause) {
    std::error_code ec;
    fs::remove(tempPath, ec);
    return ConversionResult::Fail(ConversionError::DestinationWriteError,
                                  "error writing PDF '" + outputPath.string() +
                                      "': " + operation + ": " + cause);
  };

  {
    errno = 0;
    std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
      return fail("cannot open " + tempPath.string(),
                  OsCause(errno, "unable to open file"));
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file)
      return fail("cannot write " + tempPath.string(),
                  OsCause(errno, "write failed"));
  }

  std::error_code ec;
  fs::rename(tempPath, outputPath, ec);
  if (ec)
    return fail("cannot move " + tempPath.string() + " into place",
                ec.message());

  Logger::Instance().Debug("Wrote " + std::to_string(bytes.size()) +
                           " bytes to " + outputPath.string());
  return ConversionResult::Ok();
}

} // namespace svgpdf
