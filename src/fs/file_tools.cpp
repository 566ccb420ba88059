/*
 * File read/write/edit implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/fs/file_tools.hpp>
#include <mcp-toolbox/fs/text.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace toolbox {
namespace fs = std::filesystem;

static const int kDefaultReadLines = 2000;

std::pair<long, long> calculate_line_range(long total_lines, long offset, long limit) {
    long start = offset > 0 ? offset : 1;
    long end = total_lines;
    // Compared as a remaining count so start + limit never overflows.
    if (limit > 0 && limit <= total_lines - start) end = start + limit - 1;
    if (limit == 0 && offset == 0 && total_lines > kDefaultReadLines) end = kDefaultReadLines;
    return {start, end};
}

static bool starts_with(const std::string& s, const char* magic, size_t n) {
    return s.size() >= n && std::memcmp(s.data(), magic, n) == 0;
}

std::string detect_binary_type(const std::string& content) {
    if (starts_with(content, "\x89PNG\r\n\x1a\n", 8)) return "image/png";
    if (starts_with(content, "\xff\xd8\xff", 3)) return "image/jpeg";
    if (starts_with(content, "GIF87a", 6) || starts_with(content, "GIF89a", 6)) return "image/gif";
    if (starts_with(content, "RIFF", 4) && content.size() >= 12 && content.compare(8, 4, "WEBP") == 0) return "image/webp";
    if (starts_with(content, "RIFF", 4) && content.size() >= 12 && content.compare(8, 4, "WAVE") == 0) return "audio/wav";
    if (starts_with(content, "ID3", 3)) return "audio/mpeg";
    if (starts_with(content, "%PDF-", 5)) return "application/pdf";
    size_t scan = std::min<size_t>(content.size(), 8000);
    if (std::memchr(content.data(), '\0', scan) != nullptr) return "application/octet-stream";
    return "";
}

static bool read_whole_file(const std::string& path, std::string& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) { error = std::string("Cannot read file: ") + std::strerror(errno); return false; }
    std::ostringstream oss; oss << in.rdbuf();
    if (in.bad()) { error = "Cannot read file: I/O error"; return false; }
    out = oss.str();
    return true;
}

// Truncating write; new files get 0600.
static bool write_whole_file(const std::string& path, const std::string& content, std::string& error) {
    int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) { error = std::string("Cannot write file: ") + std::strerror(errno); return false; }
    size_t off = 0;
    while (off < content.size()) {
        ssize_t n = ::write(fd, content.data() + off, content.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = std::string("Cannot write file: ") + std::strerror(errno);
            ::close(fd);
            return false;
        }
        off += static_cast<size_t>(n);
    }
    if (::close(fd) != 0) { error = std::string("Cannot write file: ") + std::strerror(errno); return false; }
    return true;
}

ToolResult FileTools::read(const std::string& file_path, long offset, long limit) {
    std::string err;
    auto resolved = resolve_path(file_path, err);
    if (!resolved) return ToolResult::failure(ErrorKind::InvalidInput, err);
    if (offset < 0 || limit < 0) return ToolResult::failure(ErrorKind::InvalidInput, "offset and limit must not be negative");

    std::error_code ec;
    auto st = fs::status(*resolved, ec);
    if (ec || !fs::exists(st)) return ToolResult::failure(ErrorKind::NotFound, "file does not exist: " + *resolved);
    if (fs::is_directory(st)) return ToolResult::failure(ErrorKind::InvalidInput, "path is a directory, not a file: " + *resolved);
    auto size = fs::file_size(*resolved, ec);
    if (ec) return ToolResult::failure(ErrorKind::System, "Cannot stat file: " + ec.message());
    if (auto too_big = check_file_size(static_cast<size_t>(size), m_limits)) return ToolResult::failure(ErrorKind::TooLarge, *too_big);
    auto mtime = FileMutationGuard::disk_mtime(*resolved);
    if (!mtime) return ToolResult::failure(ErrorKind::System, "Cannot stat file: " + *resolved);

    std::string content;
    if (!read_whole_file(*resolved, content, err)) return ToolResult::failure(ErrorKind::System, err);
    m_guard.record_read(*resolved, *mtime);

    if (content.empty())
        return ToolResult::success("<system-reminder>Warning: the file exists but the contents are empty.</system-reminder>");

    std::string binary = detect_binary_type(content);
    if (!binary.empty())
        return ToolResult::success("[Binary file: " + *resolved + ", " + std::to_string(content.size()) + " bytes]");

    auto lines = split_lines(content);
    if (lines.size() > 1 && lines.back().empty()) lines.pop_back(); // final newline ends a line, not starts one
    long total = static_cast<long>(lines.size());
    auto [start, end] = calculate_line_range(total, offset, limit);
    if (offset > 0 && (start < 1 || start > total)) {
        return ToolResult::success("<system-reminder>Warning: the file exists but is shorter than the provided offset (" +
                                   std::to_string(start) + "). The file has " + std::to_string(total) + " lines.</system-reminder>");
    }
    std::string listing = cat_n(lines, static_cast<size_t>(start - 1), static_cast<size_t>(end), static_cast<int>(start));
    if (auto too_big = check_output_size(listing, "read", m_limits)) return ToolResult::failure(ErrorKind::TooLarge, *too_big);
    return ToolResult::success(listing);
}

ToolResult FileTools::write(const std::string& file_path, const std::string& content) {
    std::string err;
    auto resolved = resolve_path(file_path, err);
    if (!resolved) return ToolResult::failure(ErrorKind::InvalidInput, err);

    auto before = FileMutationGuard::disk_mtime(*resolved);
    switch (m_guard.check_mutation(*resolved, before)) {
        case MutationCheck::NotRead:
            return ToolResult::failure(ErrorKind::Conflict, "file exists, you must read it first before writing: " + *resolved);
        case MutationCheck::ModifiedSinceRead:
            return ToolResult::failure(ErrorKind::Conflict, "file has been modified since last read, please read again before writing: " + *resolved);
        case MutationCheck::Ok:
            break;
    }

    std::error_code ec;
    fs::create_directories(fs::path(*resolved).parent_path(), ec);
    if (!write_whole_file(*resolved, content, err)) {
        if (ec) err += " (creating parent directories: " + ec.message() + ")";
        return ToolResult::failure(ErrorKind::System, err);
    }
    if (auto after = FileMutationGuard::disk_mtime(*resolved)) m_guard.record_read(*resolved, *after);

    return ToolResult::success(before ? "File updated successfully at: " + *resolved
                                      : "File created successfully at: " + *resolved);
}

static size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return haystack.size() + 1;
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size())) ++count;
    return count;
}

static std::string replace_all_of(const std::string& s, const std::string& from, const std::string& to) {
    std::string out;
    size_t last = 0;
    for (size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, last)) {
        out.append(s, last, pos - last);
        out += to;
        last = pos + from.size();
    }
    out.append(s, last, std::string::npos);
    return out;
}

static ToolResult apply_edit(std::string& content, const EditItem& e, const std::vector<std::string>& previous_new) {
    for (auto& prev : previous_new) {
        if (prev.find(e.old_string) != std::string::npos)
            return ToolResult::failure(ErrorKind::InvalidInput, "edit conflict detected: the string to replace is part of a previous edit's replacement");
    }
    if (e.old_string.empty() && !content.empty())
        return ToolResult::failure(ErrorKind::InvalidInput, "old_string must not be empty unless the file is empty");
    size_t count = count_occurrences(content, e.old_string);
    if (count == 0)
        return ToolResult::failure(ErrorKind::InvalidInput, "String to replace not found in file.\nString: " + e.old_string);
    if (e.old_string.empty()) {
        content = e.new_string;
        return ToolResult::success("");
    }
    if (e.replace_all) {
        content = replace_all_of(content, e.old_string, e.new_string);
        return ToolResult::success("");
    }
    if (count > 1) {
        return ToolResult::failure(ErrorKind::InvalidInput,
            "Found " + std::to_string(count) + " matches of the string to replace, but replace_all is false. "
            "To replace all occurrences, set replace_all to true. To replace only one occurrence, provide more "
            "context to uniquely identify the instance.\nString: " + e.old_string);
    }
    content.replace(content.find(e.old_string), e.old_string.size(), e.new_string);
    return ToolResult::success("");
}

ToolResult FileTools::edit_many(const std::string& file_path, const std::vector<EditItem>& edits,
                                std::string* old_content, std::string* new_content) {
    if (edits.empty()) return ToolResult::failure(ErrorKind::InvalidInput, "at least one edit is required");
    for (auto& e : edits) {
        if (e.old_string == e.new_string)
            return ToolResult::failure(ErrorKind::InvalidInput, "old_string and new_string are the same - no changes to make");
    }
    std::string err;
    auto resolved = resolve_path(file_path, err);
    if (!resolved) return ToolResult::failure(ErrorKind::InvalidInput, err);

    if (!m_guard.recorded(*resolved))
        return ToolResult::failure(ErrorKind::Conflict, "file has not been read yet - please read the file before editing: " + *resolved);
    if (m_guard.check_mutation(*resolved) == MutationCheck::ModifiedSinceRead)
        return ToolResult::failure(ErrorKind::Conflict, "file has been modified since it was last read - please read the file again before editing: " + *resolved);

    std::string original;
    if (!read_whole_file(*resolved, original, err)) return ToolResult::failure(ErrorKind::System, err);
    std::string updated = original;
    std::vector<std::string> previous_new;
    for (auto& e : edits) {
        ToolResult r = apply_edit(updated, e, previous_new);
        if (!r.ok) return r;
        previous_new.push_back(e.new_string);
    }
    if (updated == original)
        return ToolResult::failure(ErrorKind::InvalidInput, "the original content matches the edited content - no changes to make");
    if (!write_whole_file(*resolved, updated, err)) return ToolResult::failure(ErrorKind::System, err);
    if (auto after = FileMutationGuard::disk_mtime(*resolved)) m_guard.record_read(*resolved, *after);

    if (old_content) *old_content = std::move(original);
    if (new_content) *new_content = std::move(updated);
    return ToolResult::success(*resolved);
}

ToolResult FileTools::edit(const std::string& file_path, const std::string& old_string,
                           const std::string& new_string, bool replace_all) {
    std::string before, after;
    ToolResult r = edit_many(file_path, {EditItem{old_string, new_string, replace_all}}, &before, &after);
    if (!r.ok) return r;
    const std::string& path = r.text;
    if (replace_all) {
        return ToolResult::success("The file " + path + " has been updated. All occurrences of '" + old_string +
                                   "' were successfully replaced with '" + new_string + "'.");
    }
    auto old_lines = split_lines(before);
    auto new_lines = split_lines(after);
    // Window over the new content: the changed region plus two lines each side.
    auto [start, end] = modified_lines(new_lines, old_lines, 2);
    if (end < start) end = std::min(start + 1, static_cast<int>(new_lines.size()));
    return ToolResult::success("The file " + path + " has been updated. Here's the result of running `cat -n` on a snippet of the edited file:\n" +
                               cat_n(new_lines, static_cast<size_t>(start - 1), static_cast<size_t>(end), start));
}

} // namespace toolbox
