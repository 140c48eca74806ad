// hammer/basic/source_file.cpp - SourceFile and SourceCache implementation
#include "hammer/basic/source_file.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include "hammer/basic/error.hpp"

namespace fs = std::filesystem;

namespace hammer
{

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  build_line_table();
}

size_t SourceFile::line_count() const noexcept
{
  if (!content_.empty() && content_.back() == '\n') {
    return line_offsets_.size() - 1;
  }
  return line_offsets_.size();
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_count()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(content_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && content_[end - 1] == '\n') {
      --end;
    }
  }
  if (end > start && content_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(content_).substr(start, end - start);
}

void SourceFile::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

// ============================================================================
// SourceCache
// ============================================================================

const SourceFile & SourceCache::load(const fs::path & path)
{
  if (const auto it = files_.find(path); it != files_.end()) {
    return *it->second;
  }

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw RenderError("source file not found: " + path.string());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw RenderError("cannot read source file " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  auto file = std::make_unique<SourceFile>(path, buffer.str());
  const SourceFile & ref = *file;
  files_.emplace(path, std::move(file));
  return ref;
}

}  // namespace hammer
