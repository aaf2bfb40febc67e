// modgraph/sfc/raw_template_compiler.hpp - Static-markup template compiler
#pragma once

#include "modgraph/sfc/toolchain.hpp"

namespace modgraph::sfc
{

/**
 * Compiles a template block into a render module that returns the markup as
 * one static vnode created through the runtime module.
 *
 * - the scope id, when given, is added as an attribute to every element
 * - relative `src`/`href` URLs (`./x.png`) are rebased onto the asset base
 * - unbalanced elements are reported with block-relative positions
 * - templates declaring a preprocessing language are reported as unsupported
 *   and compiled as plain markup
 */
class RawTemplateCompiler : public TemplateCompiler
{
public:
  [[nodiscard]] TemplateResult compile(const TemplateRequest & request) override;
};

}  // namespace modgraph::sfc
