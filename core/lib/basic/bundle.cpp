// hammer/basic/bundle.cpp - DiagnosticBundle implementation
#include "hammer/basic/bundle.hpp"

#include <iterator>

namespace hammer
{

std::vector<Diagnostic> & DiagnosticBundle::touch(std::string_view attr)
{
  std::string key(attr);
  if (const auto it = index_.find(key); it != index_.end()) {
    return entries_[it->second].second;
  }
  index_.emplace(key, entries_.size());
  entries_.emplace_back(std::move(key), std::vector<Diagnostic>{});
  return entries_.back().second;
}

void DiagnosticBundle::add(std::string_view attr, Diagnostic diag)
{
  touch(attr).push_back(std::move(diag));
}

void DiagnosticBundle::append(std::string_view attr, std::vector<Diagnostic> diags)
{
  auto & list = touch(attr);
  list.insert(
    list.end(), std::make_move_iterator(diags.begin()), std::make_move_iterator(diags.end()));
}

bool DiagnosticBundle::contains(std::string_view attr) const
{
  return index_.find(std::string(attr)) != index_.end();
}

const std::vector<Diagnostic> * DiagnosticBundle::find(std::string_view attr) const
{
  const auto it = index_.find(std::string(attr));
  if (it == index_.end()) {
    return nullptr;
  }
  return &entries_[it->second].second;
}

std::vector<std::string> DiagnosticBundle::names() const
{
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto & entry : entries_) {
    out.push_back(entry.first);
  }
  return out;
}

size_t DiagnosticBundle::diagnostic_count() const
{
  size_t n = 0;
  for (const auto & entry : entries_) {
    n += entry.second.size();
  }
  return n;
}

}  // namespace hammer
