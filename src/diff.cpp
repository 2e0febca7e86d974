#include "gitstore/diff.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <sstream>

namespace gitstore::diff {

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t nl = text.find('\n', pos);
    if (nl == std::string_view::npos) {
      out.emplace_back(text.substr(pos));
      break;
    }
    out.emplace_back(text.substr(pos, nl - pos + 1));
    pos = nl + 1;
  }
  return out;
}

// Myers O(ND) diff. `trace` keeps the V array before each D round so the
// path can be walked back from (N, M).
std::vector<EditOp> edit_script(const std::vector<std::string> &a,
                                const std::vector<std::string> &b) {
  const int N = static_cast<int>(a.size());
  const int M = static_cast<int>(b.size());
  const int MAX = N + M;
  const int OFFSET = MAX + 1;
  std::vector<int> v(static_cast<std::size_t>((2 * MAX) + 3), 0);
  std::vector<std::vector<int>> trace;

  for (int d = 0; d <= MAX; ++d) {
    trace.push_back(v); // snapshot before exploring this D layer
    for (int k = -d; k <= d; k += 2) {
      int x;
      if (k == -d || (k != d && v[OFFSET + k - 1] < v[OFFSET + k + 1])) {
        x = v[OFFSET + k + 1];     // down (insertion)
      } else {
        x = v[OFFSET + k - 1] + 1; // right (deletion)
      }
      int y = x - k;
      while (x < N && y < M && a[x] == b[y]) { ++x; ++y; }
      v[OFFSET + k] = x;
      if (x >= N && y >= M) {
        std::vector<EditOp> rev;
        int cx = N, cy = M;
        for (int dd = d; dd > 0; --dd) {
          const auto &vv = trace[dd];
          const int kk = cx - cy;
          const bool down =
              kk == -dd || (kk != dd && vv[OFFSET + kk - 1] < vv[OFFSET + kk + 1]);
          const int prev_k = down ? kk + 1 : kk - 1;
          const int px = vv[OFFSET + prev_k];
          const int py = px - prev_k;
          // the snake of this round started right after the single edit
          const int sx = down ? px : px + 1;
          while (cx > sx) { rev.push_back(EditOp::Keep); --cx; --cy; }
          rev.push_back(down ? EditOp::Insert : EditOp::Delete);
          cx = px; cy = py;
        }
        while (cx > 0 && cy > 0) { rev.push_back(EditOp::Keep); --cx; --cy; }
        return {rev.rbegin(), rev.rend()};
      }
    }
  }
  return {};
}

std::vector<Hunk> make_hunks(const std::vector<std::string> &a, const std::vector<std::string> &b,
                             std::size_t context) {
  const auto ops = edit_script(a, b);
  const std::size_t n = ops.size();

  // line positions in a and b before each op
  std::vector<std::size_t> apos(n + 1, 0);
  std::vector<std::size_t> bpos(n + 1, 0);
  std::vector<std::size_t> changes;
  for (std::size_t k = 0; k < n; ++k) {
    apos[k + 1] = apos[k] + (ops[k] != EditOp::Insert ? 1 : 0);
    bpos[k + 1] = bpos[k] + (ops[k] != EditOp::Delete ? 1 : 0);
    if (ops[k] != EditOp::Keep) {
      changes.push_back(k);
    }
  }

  std::vector<Hunk> hunks;
  std::size_t i = 0;
  while (i < changes.size()) {
    const std::size_t start = changes[i] > context ? changes[i] - context : 0;
    std::size_t last = changes[i];
    std::size_t j = i + 1;
    while (j < changes.size() && changes[j] - last - 1 <= 2 * context) {
      last = changes[j++];
    }
    const std::size_t end = std::min(n, last + context + 1);

    Hunk h;
    h.old_len = apos[end] - apos[start];
    h.new_len = bpos[end] - bpos[start];
    h.old_start = h.old_len ? apos[start] + 1 : apos[start];
    h.new_start = h.new_len ? bpos[start] + 1 : bpos[start];
    for (std::size_t k = start; k < end; ++k) {
      switch (ops[k]) {
      case EditOp::Keep:
        h.lines.push_back({' ', a[apos[k]]});
        break;
      case EditOp::Delete:
        h.lines.push_back({'-', a[apos[k]]});
        break;
      case EditOp::Insert:
        h.lines.push_back({'+', b[bpos[k]]});
        break;
      }
    }
    hunks.push_back(std::move(h));
    i = j;
  }
  return hunks;
}

std::string hunk_header(const Hunk &h) {
  std::ostringstream out;
  out << "@@ -" << h.old_start << "," << h.old_len << " +" << h.new_start << "," << h.new_len
      << " @@";
  return out.str();
}

std::string unified_diff(std::string_view old_text, std::string_view new_text,
                         std::string_view old_label, std::string_view new_label,
                         std::size_t context) {
  const auto a = split_lines(old_text);
  const auto b = split_lines(new_text);
  const auto hunks = make_hunks(a, b, context);
  if (hunks.empty()) {
    return {};
  }

  std::ostringstream out;
  out << "--- " << old_label << "\n";
  out << "+++ " << new_label << "\n";
  for (const auto &h : hunks) {
    out << hunk_header(h) << "\n";
    for (const auto &line : h.lines) {
      out << line.prefix << line.text;
      if (line.text.empty() || line.text.back() != '\n') {
        out << "\n\\ No newline at end of file\n";
      }
    }
  }
  return out.str();
}

namespace {

std::string mode_string(std::uint32_t mode) {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%06o", mode);
  return {buf.data()};
}

bool looks_binary(std::string_view text) {
  return text.substr(0, consts::kBinarySniffBytes).find('\0') != std::string_view::npos;
}

std::string side_content(const ObjectStore &store, const std::optional<std::uint32_t> &mode,
                         const std::optional<ObjectId> &id) {
  if (!id) {
    return {};
  }
  if (mode && *mode == consts::kModeGitlink) {
    return "Subproject commit " + id->hex() + "\n";
  }
  return std::string(store.read_blob(*id).text());
}

} // namespace

std::string render_patch(const ObjectStore &store, const std::vector<ChangeRecord> &records,
                         const RenderOptions &opts) {
  std::ostringstream out;
  for (const auto &rec : records) {
    const std::string a_path = "a/" + rec.path;
    const std::string b_path = "b/" + rec.path;
    out << "diff --git " << a_path << " " << b_path << "\n";

    switch (rec.kind) {
    case ChangeKind::Added:
      out << "new file mode " << mode_string(*rec.new_mode) << "\n";
      break;
    case ChangeKind::Removed:
      out << "deleted file mode " << mode_string(*rec.old_mode) << "\n";
      break;
    case ChangeKind::Modified:
      if (rec.old_mode != rec.new_mode) {
        out << "old mode " << mode_string(*rec.old_mode) << "\n";
        out << "new mode " << mode_string(*rec.new_mode) << "\n";
      }
      break;
    }
    if (rec.old_id && rec.new_id && *rec.old_id == *rec.new_id) {
      continue; // mode-only change
    }

    const std::string zero(7, '0');
    out << "index " << (rec.old_id ? rec.old_id->short_hex() : zero) << ".."
        << (rec.new_id ? rec.new_id->short_hex() : zero);
    if (rec.kind == ChangeKind::Modified && rec.old_mode == rec.new_mode) {
      out << " " << mode_string(*rec.new_mode);
    }
    out << "\n";

    const std::string old_label = rec.old_id ? a_path : "/dev/null";
    const std::string new_label = rec.new_id ? b_path : "/dev/null";
    const std::string old_text = side_content(store, rec.old_mode, rec.old_id);
    const std::string new_text = side_content(store, rec.new_mode, rec.new_id);
    if (looks_binary(old_text) || looks_binary(new_text)) {
      out << "Binary files " << old_label << " and " << new_label << " differ\n";
      continue;
    }
    out << unified_diff(old_text, new_text, old_label, new_label, opts.context);
  }
  return out.str();
}

} // namespace gitstore::diff
