#include "sidecar/changes/diff_parser.hpp"

#include "sidecar/common/fs.hpp"
#include "sidecar/common/text.hpp"

#include <sstream>

namespace sidecar::changes {

namespace {

constexpr const char *kFileHeader = "diff --git";

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    const auto end = text.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

std::string join_lines(const std::vector<std::string> &lines) {
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out.push_back('\n');
    }
    out += lines[i];
  }
  return out;
}

bool is_octal(const char ch) { return ch >= '0' && ch <= '7'; }

// Undoes git's C-style path quoting: "\303\251" octal byte escapes and the usual
// single-character escapes. Unquoted input is returned trimmed.
std::string unquote_path(const std::string &raw) {
  const std::string path = common::trim(raw);
  if (path.size() < 2 || path.front() != '"' || path.back() != '"') {
    return path;
  }
  const std::string body = path.substr(1, path.size() - 2);
  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '\\' || i + 1 >= body.size()) {
      out.push_back(body[i]);
      continue;
    }
    if (i + 3 < body.size() && is_octal(body[i + 1]) && is_octal(body[i + 2]) &&
        is_octal(body[i + 3])) {
      const int byte = (body[i + 1] - '0') * 64 + (body[i + 2] - '0') * 8 + (body[i + 3] - '0');
      out.push_back(static_cast<char>(byte));
      i += 3;
      continue;
    }
    const char esc = body[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 'a':
      out.push_back('\a');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'v':
      out.push_back('\v');
      break;
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

// Path on the b/ side of a "diff --git" header, which git quotes when it holds
// non-ASCII or special characters.
std::string header_path(const std::string &header) {
  if (!header.empty() && header.back() == '"') {
    const auto pos = header.rfind(" \"b/");
    if (pos != std::string::npos) {
      const std::string path = unquote_path(header.substr(pos + 1));
      if (path.size() > 2) {
        return path.substr(2);
      }
    }
    return "unknown";
  }
  const auto pos = header.rfind(" b/");
  if (pos == std::string::npos || pos + 3 >= header.size()) {
    return "unknown";
  }
  return header.substr(pos + 3);
}

FileChange build_file_change(const std::vector<std::string> &lines) {
  FileChange change;
  change.path = header_path(lines.front());

  bool in_hunk = false;
  for (const auto &line : lines) {
    if (!in_hunk) {
      if (common::starts_with(line, "@@")) {
        in_hunk = true;
      } else if (common::starts_with(line, "new file")) {
        change.status = FileStatus::Added;
      } else if (common::starts_with(line, "deleted file")) {
        change.status = FileStatus::Deleted;
      } else if (common::starts_with(line, "rename")) {
        change.status = FileStatus::Renamed;
      }
      continue;
    }
    if (common::starts_with(line, "+")) {
      ++change.additions;
    } else if (common::starts_with(line, "-")) {
      ++change.deletions;
    }
  }

  change.diff_text = join_lines(lines);
  return change;
}

} // namespace

ChangeSet parse_unified_diff(const std::string &diff_text, const std::size_t max_chars) {
  ChangeSet change_set;
  change_set.provenance = Provenance::VersionControl;

  std::string text = diff_text;
  if (text.size() > max_chars) {
    text = common::truncate_utf8(text, max_chars);
    change_set.truncated = true;
  }

  std::vector<std::string> current;
  for (auto &line : split_lines(text)) {
    if (common::starts_with(line, kFileHeader)) {
      if (!current.empty()) {
        change_set.files.push_back(build_file_change(current));
      }
      current.clear();
      current.push_back(std::move(line));
    } else if (!current.empty()) {
      current.push_back(std::move(line));
    }
  }
  if (!current.empty()) {
    change_set.files.push_back(build_file_change(current));
  }

  change_set.recompute_totals();
  return change_set;
}

std::vector<StatusEntry> parse_porcelain_status(const std::string &status_text) {
  std::vector<StatusEntry> entries;
  for (const auto &line : split_lines(status_text)) {
    if (line.size() < 4) {
      continue;
    }
    const std::string code = line.substr(0, 2);
    std::string path = line.substr(3);

    StatusEntry entry;
    if (code == "??" || code.find('A') != std::string::npos) {
      entry.status = FileStatus::Added;
    } else if (code.find('D') != std::string::npos) {
      entry.status = FileStatus::Deleted;
    } else if (code.find('R') != std::string::npos) {
      entry.status = FileStatus::Renamed;
      if (const auto arrow = path.find(" -> "); arrow != std::string::npos) {
        path = path.substr(arrow + 4);
      }
    } else {
      entry.status = FileStatus::Modified;
    }
    entry.path = unquote_path(path);
    if (!entry.path.empty()) {
      entries.push_back(std::move(entry));
    }
  }
  return entries;
}

ChangeSet synthesize_status_changes(const std::vector<StatusEntry> &entries,
                                    const std::filesystem::path &root,
                                    const std::size_t max_chars) {
  ChangeSet change_set;
  change_set.provenance = Provenance::VersionControl;
  std::size_t used = 0;

  for (const auto &entry : entries) {
    FileChange change{.path = entry.path, .status = entry.status};
    const bool readable_kind =
        entry.status == FileStatus::Added || entry.status == FileStatus::Modified;

    if (readable_kind && used >= max_chars) {
      change_set.truncated = true;
    } else if (readable_kind) {
      std::error_code ec;
      const auto full_path = root / entry.path;
      auto content = std::filesystem::is_regular_file(full_path, ec)
                         ? common::read_file(full_path)
                         : common::Result<std::string>::failure(common::ErrorCode::NotFound,
                                                                "not a regular file");
      if (content.ok()) {
        std::ostringstream body;
        body << "diff --git a/" << entry.path << " b/" << entry.path << "\n";
        if (entry.status == FileStatus::Added) {
          body << "new file mode 100644\n--- /dev/null\n";
        } else {
          body << "--- a/" << entry.path << "\n";
        }
        body << "+++ b/" << entry.path;
        const std::string header = body.str();

        std::string diff = header;
        std::istringstream lines(content.value());
        std::string line;
        while (std::getline(lines, line)) {
          diff += "\n+" + line;
        }

        const std::size_t remaining = max_chars - used;
        if (diff.size() > remaining) {
          diff = common::truncate_utf8(diff, remaining);
          change_set.truncated = true;
        }
        used += diff.size();

        // Count only the content lines that made it into the body.
        if (diff.size() > header.size()) {
          for (const auto &added : split_lines(diff.substr(header.size()))) {
            if (common::starts_with(added, "+")) {
              ++change.additions;
            }
          }
        }
        change.diff_text = std::move(diff);
      }
    }

    change_set.files.push_back(std::move(change));
  }

  change_set.recompute_totals();
  return change_set;
}

} // namespace sidecar::changes
