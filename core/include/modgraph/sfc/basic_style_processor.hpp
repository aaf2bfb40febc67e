// modgraph/sfc/basic_style_processor.hpp - Scoping / CSS-module style processor
#pragma once

#include "modgraph/sfc/toolchain.hpp"

namespace modgraph::sfc
{

/**
 * Rewrites the selectors of a plain CSS style block.
 *
 * Scoped: `[data-v-<hash>]` is attached to the last compound selector of
 * every rule (before its pseudo classes), including rules nested in
 * `@media` / `@supports`. Keyframes and font-face bodies are left untouched.
 *
 * Modules: every `.class` in a selector is renamed with the pattern from the
 * `generate_scoped_name` style option (default `[local]_[hash]`) and the
 * mapping is returned.
 *
 * Errors carry the PostCSS-style prefix `<filename>:<line>:<column>: ` with
 * lines relative to the block.
 */
class BasicStyleProcessor : public StyleProcessor
{
public:
  [[nodiscard]] StyleResult compile(const StyleRequest & request) override;
};

}  // namespace modgraph::sfc
