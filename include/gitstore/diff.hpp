#pragma once
#include "gitstore/consts.hpp"
#include "gitstore/object_store.hpp"
#include "gitstore/tree_diff.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gitstore::diff {

enum class EditOp : std::uint8_t { Keep, Delete, Insert };

// Split text into lines, each keeping its '\n'. A final line without one is
// kept as-is, so "a\nb" -> {"a\n", "b"} and the two texts stay distinguishable.
std::vector<std::string> split_lines(std::string_view text);

// Myers O(ND) shortest edit script turning `a` into `b` (an LCS alignment).
std::vector<EditOp> edit_script(const std::vector<std::string> &a,
                                const std::vector<std::string> &b);

struct HunkLine {
  char prefix; // ' ', '-' or '+'
  std::string text;
};

struct Hunk {
  std::size_t old_start = 0; // 1-based; line before the hunk when old_len == 0
  std::size_t old_len = 0;
  std::size_t new_start = 0;
  std::size_t new_len = 0;
  std::vector<HunkLine> lines;
};

// Group an edit script into hunks with `context` unchanged lines around changes.
std::vector<Hunk> make_hunks(const std::vector<std::string> &a, const std::vector<std::string> &b,
                             std::size_t context = consts::kDefaultContext);

// "@@ -<start>,<len> +<start>,<len> @@"
std::string hunk_header(const Hunk &h);

/**
 * Unified diff of two texts. `old_label` / `new_label` go into the ---/+++
 * lines verbatim ("a/path", "/dev/null", ...). Empty string if equal.
 */
std::string unified_diff(std::string_view old_text, std::string_view new_text,
                         std::string_view old_label, std::string_view new_label,
                         std::size_t context = consts::kDefaultContext);

struct RenderOptions {
  std::size_t context = consts::kDefaultContext;
};

// Render tree-diff records as a git-style patch, reading blob content from `store`.
std::string render_patch(const ObjectStore &store, const std::vector<ChangeRecord> &records,
                         const RenderOptions &opts = {});

} // namespace gitstore::diff
