#pragma once

#include "irmcp/capability/resource.h"

#include <string>

namespace irmcp::resources {

/// Markdown API reference for controller helpers, prop types, headers and generators.
class ApiReferenceResource : public capability::IResource {
 public:
  [[nodiscard]] std::string name() const override { return "Inertia Rails API Reference"; }
  [[nodiscard]] std::string description() const override {
    return "Complete API reference for Inertia-rails methods, modules, and configuration options";
  }
  [[nodiscard]] std::string mime_type() const override { return "text/markdown"; }
  [[nodiscard]] std::string content() const override;
};

/// Markdown guide to global, controller-level and frontend configuration.
class ConfigurationReferenceResource : public capability::IResource {
 public:
  [[nodiscard]] std::string name() const override { return "Inertia Rails Configuration Guide"; }
  [[nodiscard]] std::string description() const override {
    return "Comprehensive guide to configuring Inertia-rails in your application";
  }
  [[nodiscard]] std::string mime_type() const override { return "text/markdown"; }
  [[nodiscard]] std::string content() const override;
};

}  // namespace irmcp::resources
