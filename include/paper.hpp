#ifndef FETCHMAP_PAPER_HPP
#define FETCHMAP_PAPER_HPP

#include <string>
#include <vector>

namespace fetchmap {

// usable size of a printed page, in pixels.
struct page_size {
  page_size() : width(0), height(0) {}
  page_size(unsigned int w, unsigned int h) : width(w), height(h) {}

  unsigned int width, height;
};

/* Usable pixel size of an ISO paper format (A0 to A7, case
 * insensitive) at the given resolution, after removing the
 * margin (in mm). In portrait orientation the width is the
 * shorter side; landscape swaps them.
 *
 * Throws invalid_request_error for unknown formats, a zero DPI
 * or a margin which leaves no usable area.
 */
page_size paper_size_px(const std::string &format, bool landscape,
                        unsigned int dpi, unsigned int margin_mm);

// names of the known paper formats, sorted.
std::vector<std::string> paper_formats();

} // namespace fetchmap

#endif /* FETCHMAP_PAPER_HPP */
