// vfilter/basic/diagnostic.cpp
#include "vfilter/basic/diagnostic.hpp"

#include <utility>

namespace vfilter
{

std::string_view to_string(Severity s) noexcept
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "error";
}

Diagnostic & Diagnostic::with_code(std::string c)
{
  code = std::move(c);
  return *this;
}

Diagnostic & Diagnostic::with_related(SourceRange r, std::string note)
{
  related = RelatedSpan{r, std::move(note)};
  return *this;
}

Diagnostic & Diagnostic::insert_after(Position after, std::string text)
{
  insertion = Insertion{after, std::move(text)};
  return *this;
}

Diagnostic & Diagnostic::with_help(std::string text)
{
  help = std::move(text);
  return *this;
}

Diagnostic & DiagnosticBag::error(SourceRange range, std::string message, std::string caption)
{
  return push(Severity::Error, range, std::move(message), std::move(caption));
}

Diagnostic & DiagnosticBag::warning(SourceRange range, std::string message, std::string caption)
{
  return push(Severity::Warning, range, std::move(message), std::move(caption));
}

const Diagnostic * DiagnosticBag::first_error() const noexcept
{
  for (const Diagnostic & d : items_) {
    if (d.is_error()) {
      return &d;
    }
  }
  return nullptr;
}

Diagnostic & DiagnosticBag::push(
  Severity severity, SourceRange range, std::string message, std::string caption)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.range = range;
  d.caption = std::move(caption);
  if (d.is_error()) {
    ++error_count_;
  }
  items_.push_back(std::move(d));
  return items_.back();
}

}  // namespace vfilter
