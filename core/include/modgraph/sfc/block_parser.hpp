// modgraph/sfc/block_parser.hpp - Top-level block splitter for composite files
#pragma once

#include <string>
#include <string_view>

#include "modgraph/sfc/toolchain.hpp"

namespace modgraph::sfc
{

/**
 * Splits a composite file into its top-level `<script>`, `<template>` and
 * `<style>` blocks.
 *
 * Recognised attributes: `lang`, `scoped`, `module` / `module="name"`.
 * Other top-level elements (custom blocks) are skipped. Script and template
 * blocks carry a line source map back into the file.
 *
 * Errors (positions relative to the file):
 * - a block without its end tag (the block is dropped)
 * - a second `<script>` or `<template>` (the first one is kept)
 * - a stray top-level end tag
 */
class BlockParser : public Parser
{
public:
  [[nodiscard]] ParseResult parse(std::string_view source, const std::string & filename) override;
};

}  // namespace modgraph::sfc
