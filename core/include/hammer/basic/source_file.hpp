// hammer/basic/source_file.hpp - Source files referenced by diagnostics
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hammer
{

/**
 * Content of one source file with a pre-computed line table.
 */
class SourceFile
{
public:
  SourceFile(std::filesystem::path path, std::string content);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }

  /// Number of lines (a trailing newline does not start a new line)
  [[nodiscard]] size_t line_count() const noexcept;

  /// Content of a line without its terminator (0-indexed); empty if out of range
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

/**
 * Loads each file at most once per run.
 */
class SourceCache
{
public:
  /**
   * @throws RenderError if the file cannot be read
   */
  const SourceFile & load(const std::filesystem::path & path);

private:
  std::map<std::filesystem::path, std::unique_ptr<SourceFile>> files_;
};

}  // namespace hammer
