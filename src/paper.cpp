#include "paper.hpp"
#include "errors.hpp"

#include <cmath>
#include <utility>
#include <boost/format.hpp>
#include <boost/algorithm/string/case_conv.hpp>

namespace fetchmap {

namespace {

struct paper_format {
  const char *name;
  // portrait width and height in mm
  unsigned int short_mm, long_mm;
};

const paper_format paper_formats_mm[] = {
  { "A0", 841, 1189 },
  { "A1", 594, 841 },
  { "A2", 420, 594 },
  { "A3", 297, 420 },
  { "A4", 210, 297 },
  { "A5", 148, 210 },
  { "A6", 105, 148 },
  { "A7", 74,  105 },
};

unsigned int mm_to_px(unsigned int mm, unsigned int margin_mm, unsigned int dpi) {
  return static_cast<unsigned int>(std::lround(double(mm - margin_mm) / 25.4 * double(dpi)));
}

} // anonymous namespace

page_size paper_size_px(const std::string &format, bool landscape,
                        unsigned int dpi, unsigned int margin_mm) {
  const std::string name = boost::algorithm::to_upper_copy(format);

  for (const paper_format &p : paper_formats_mm) {
    if (name == p.name) {
      if (dpi == 0) {
        throw invalid_request_error("Printer resolution must be greater than zero DPI.");
      }
      if (margin_mm >= p.short_mm) {
        throw invalid_request_error((boost::format("Margin of %1% mm leaves nothing of paper format %2%.")
                                     % margin_mm % p.name).str());
      }

      page_size size(mm_to_px(p.short_mm, margin_mm, dpi), mm_to_px(p.long_mm, margin_mm, dpi));
      if (landscape) {
        std::swap(size.width, size.height);
      }
      return size;
    }
  }

  throw invalid_request_error((boost::format("Unknown paper format \"%1%\".") % format).str());
}

std::vector<std::string> paper_formats() {
  std::vector<std::string> names;
  for (const paper_format &p : paper_formats_mm) {
    names.push_back(p.name);
  }
  return names;
}

} // namespace fetchmap
