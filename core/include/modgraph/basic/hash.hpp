// modgraph/basic/hash.hpp - Scope-id hashing
#pragma once

#include <string>
#include <string_view>

namespace modgraph
{

/**
 * Hash a string exactly like the `hash-sum` package does for string input.
 *
 * The result is the browser runtime's component id: 8 lowercase hex digits
 * (9 in the single overflow case). Input is hashed per UTF-16 code unit;
 * ASCII paths hash identically to their byte form.
 */
[[nodiscard]] std::string hash_sum(std::string_view text);

/// `data-v-<hash_sum(public_path)>`
[[nodiscard]] std::string scope_id_for(std::string_view public_path);

}  // namespace modgraph
