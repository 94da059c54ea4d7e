#pragma once

#include <string>

namespace irmcp::capability {

/// Readable capability exposed through resources/list and resources/read.
/// content() may be fixed text or computed on every read; callers never cache it.
class IResource {
 public:
  virtual ~IResource() = default;

  [[nodiscard]] virtual std::string name() const = 0;
  [[nodiscard]] virtual std::string description() const = 0;
  [[nodiscard]] virtual std::string mime_type() const = 0;
  [[nodiscard]] virtual std::string content() const = 0;
};

}  // namespace irmcp::capability
