// vfilter/basic/source_manager.cpp - Position rendering and line table
#include "vfilter/basic/source_manager.hpp"

#include <fmt/core.h>

#include <utility>

namespace vfilter
{

std::string Position::to_string() const { return fmt::format("{}:{}", line, column); }

SourceManager::SourceManager(std::string text, std::string name)
: text_(std::move(text)), name_(std::move(name))
{
  compute_line_offsets();
}

void SourceManager::compute_line_offsets()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_offsets_.push_back(i + 1);
    }
  }
}

std::string_view SourceManager::get_line(uint32_t line) const noexcept
{
  if (line == 0 || line > line_offsets_.size()) {
    return {};
  }

  const size_t start = line_offsets_[line - 1];
  size_t end = (line < line_offsets_.size()) ? line_offsets_[line] : text_.size();

  // Strip the line terminator (LF or CRLF)
  if (end > start && text_[end - 1] == '\n') {
    --end;
  }
  if (end > start && text_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(text_).substr(start, end - start);
}

}  // namespace vfilter
