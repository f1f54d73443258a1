// swlint/basic/source_manager.hpp - Source files, locations and ranges
//
// Locations are byte offsets into a registered file. Line/column and
// character-based positions are computed on demand by SourceFile.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace swlint
{

// ============================================================================
// FileId - Handle to a file in a SourceRegistry
// ============================================================================

struct FileId
{
  static constexpr uint16_t k_invalid = UINT16_MAX;

  uint16_t value = k_invalid;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value != other.value;
  }
};

// ============================================================================
// SourceLocation - Byte position inside one file
// ============================================================================

class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;

  constexpr SourceLocation(FileId file, uint32_t offset) noexcept : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_.is_valid() && offset_ != k_invalid_offset;
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return file_ == other.file_ && offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return !(*this == other);
  }
  /// Ordering is only meaningful within one file.
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }

private:
  FileId file_;
  uint32_t offset_ = k_invalid_offset;
};

// ============================================================================
// SourceRange - Half-open byte range [begin, end) inside one file
// ============================================================================

class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(FileId file, uint32_t begin, uint32_t end) noexcept
  : file_(file), begin_(begin), end_(end)
  {
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return {file_, begin_}; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return {file_, end_}; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_.is_valid() && begin_ != SourceLocation::k_invalid_offset &&
           end_ != SourceLocation::k_invalid_offset && begin_ <= end_;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() ? end_ - begin_ : 0;
  }

  [[nodiscard]] constexpr bool contains(SourceLocation loc) const noexcept
  {
    return loc.file_id() == file_ && loc.offset() >= begin_ && loc.offset() < end_;
  }

  /// True if the two ranges share at least one byte.
  [[nodiscard]] constexpr bool overlaps(SourceRange other) const noexcept
  {
    return file_ == other.file_ && begin_ < other.end_ && other.begin_ < end_;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return file_ == other.file_ && begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  FileId file_;
  uint32_t begin_ = SourceLocation::k_invalid_offset;
  uint32_t end_ = SourceLocation::k_invalid_offset;
};

// ============================================================================
// Human-readable positions
// ============================================================================

/// 1-indexed line and byte column (0 = invalid).
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/// Range with pre-computed line/column information, for printing.
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

/// A `{location, length}` range over the characters of a file's contents.
struct TextRange
{
  uint32_t location = 0;
  uint32_t length = 0;

  [[nodiscard]] constexpr uint32_t end() const noexcept { return location + length; }
};

// ============================================================================
// SourceFile - One file's path, contents and line table
// ============================================================================

class SourceFile
{
public:
  SourceFile(std::filesystem::path path, std::string content);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  void set_content(std::string new_content);

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// 1-based column of `offset` counted in UTF-8 code points.
  [[nodiscard]] uint32_t get_character_column(uint32_t offset) const noexcept;

  /// Byte offset of the first character of a 0-indexed line.
  [[nodiscard]] uint32_t get_line_offset(uint32_t line_index) const noexcept;

  /// Line text without its terminator (0-indexed).
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

  /**
   * Map a byte range onto a range of the contents.
   *
   * Returns std::nullopt when the range is invalid, extends past the end of
   * the contents, or starts/ends inside a multi-byte UTF-8 sequence.
   */
  [[nodiscard]] std::optional<TextRange> resolve_text_range(SourceRange range) const noexcept;

private:
  void build_line_table();
  [[nodiscard]] bool is_char_boundary(uint32_t offset) const noexcept;

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry - Owns every file of a lint run
// ============================================================================

class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  /// Register a file; re-registering a path returns the existing id.
  FileId register_file(std::filesystem::path path, std::string content);

  void update_content(FileId id, std::string new_content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] const std::filesystem::path & get_path(FileId id) const noexcept;
  [[nodiscard]] std::optional<FileId> find_by_path(const std::filesystem::path & path) const;
  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

private:
  [[nodiscard]] static std::string normalize_key(const std::filesystem::path & path);

  std::vector<std::unique_ptr<SourceFile>> files_;
  std::unordered_map<std::string, FileId> path_to_id_;
};

}  // namespace swlint
