#pragma once

#include <memory>
#include <string>

#include "notepress/block_parser.hpp"

namespace notepress::markdown {

enum class RendererKind { kSimple = 0, kCmark };

// Turns a markdown body into an HTML fragment that can be embedded as is.
class Renderer {
 public:
  virtual ~Renderer() = default;

  virtual std::string Name() const = 0;
  virtual std::string Render(const std::string& body) const = 0;
};

// The built-in block parser.
class SimpleRenderer : public Renderer {
 public:
  explicit SimpleRenderer(BlockOptions options = {});

  std::string Name() const override;
  std::string Render(const std::string& body) const override;

 private:
  BlockOptions options_;
};

RendererKind ParseRendererKind(const std::string& value);
std::string RendererKindName(RendererKind kind);
bool IsRendererAvailable(RendererKind kind);

// Falls back to SimpleRenderer, with a warning, when |kind| was not compiled in.
std::unique_ptr<Renderer> MakeRenderer(RendererKind kind, const BlockOptions& options = {});

}  // namespace notepress::markdown
