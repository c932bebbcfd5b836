#include "types.hpp"

std::string_view error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None: return "ok";
    case ErrorKind::DocumentLoad: return "document load error";
    case ErrorKind::ReferenceResolution: return "reference resolution error";
    case ErrorKind::Serialization: return "serialization error";
    case ErrorKind::Highlight: return "highlight error";
    case ErrorKind::Render: return "render error";
  }
  return "error";
}
