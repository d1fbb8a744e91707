#include "minisql/diagnostic.h"

#include <fmt/format.h>

namespace minisql {

std::string Diagnostic::to_string() const {
    return fmt::format("[Line {}, Col {}] {} {}: {}",
                       location_.line, location_.column,
                       phase_to_string(phase_),
                       severity_ == Severity::Warning ? "Warning" : "Error",
                       message_);
}

} // namespace minisql
