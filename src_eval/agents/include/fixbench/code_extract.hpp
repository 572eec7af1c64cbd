#pragma once

#include <string>
#include <string_view>

namespace fixbench::extract {

/**
 * Structural check for an extracted candidate: starts with `def `, the first line
 * contains `:`, and there is at least one body line.
 */
[[nodiscard]] bool is_valid_function(std::string_view code);

/**
 * Pull a function definition out of free-form model output (primary producer grammar).
 *
 * Strategies, first structurally valid match wins:
 *  1. fenced block starting with `def`
 *  2. unterminated fence starting with `def`, to end of text
 *  3. text starting with `def` up to a closing fence or end
 *  4. line scan from the first `def` line until the body dedents
 * Falls back to `original` when nothing qualifies.
 */
[[nodiscard]] std::string primary(std::string_view text, std::string_view original);

/**
 * Secondary producer grammar: python fence, bare fence, bare `def name(...):` block,
 * then a line scan that skips fence lines. Falls back to `original`.
 */
[[nodiscard]] std::string secondary(std::string_view text, std::string_view original);

}  // namespace fixbench::extract
