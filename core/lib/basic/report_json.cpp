// hammer/basic/report_json.cpp - JSON encoding implementation
//
#include "hammer/basic/report_json.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

#include "hammer/basic/error.hpp"

namespace hammer
{
namespace
{

// ============================================================================
// Helper functions
// ============================================================================

std::string child(const std::string & where, const std::string & key) { return where + "/" + key; }

std::string child(const std::string & where, size_t index)
{
  return where + "/" + std::to_string(index);
}

/// JSON-pointer escaping of object keys ("~" -> "~0", "/" -> "~1")
std::string escape_key(const std::string & key)
{
  std::string out;
  out.reserve(key.size());
  for (const char c : key) {
    if (c == '~') {
      out += "~0";
    } else if (c == '/') {
      out += "~1";
    } else {
      out += c;
    }
  }
  return out;
}

const char * type_name(const Json & j) { return j.type_name(); }

void require_object(const Json & j, const std::string & where)
{
  if (!j.is_object()) {
    throw DecodeError(where, std::string("expected an object, got ") + type_name(j));
  }
}

std::string get_string(const Json & j, const char * key, const std::string & where)
{
  const auto it = j.find(key);
  if (it == j.end()) {
    throw DecodeError(where, std::string("missing required field '") + key + "'");
  }
  if (!it->is_string()) {
    throw DecodeError(
      child(where, key), std::string("expected a string, got ") + type_name(*it));
  }
  return it->get<std::string>();
}

std::optional<std::string> get_optional_string(
  const Json & j, const char * key, const std::string & where)
{
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw DecodeError(
      child(where, key), std::string("expected a string, got ") + type_name(*it));
  }
  return it->get<std::string>();
}

std::optional<bool> get_optional_bool(const Json & j, const char * key, const std::string & where)
{
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_boolean()) {
    throw DecodeError(
      child(where, key), std::string("expected a boolean, got ") + type_name(*it));
  }
  return it->get<bool>();
}

uint32_t to_positive(const Json & value, const std::string & where)
{
  // Accept only integral numbers; 3.0 from a careless producer is still an error
  if (!value.is_number_integer()) {
    throw DecodeError(where, std::string("expected an integer, got ") + type_name(value));
  }
  const auto n = value.get<int64_t>();
  if (n < 1 || n > std::numeric_limits<uint32_t>::max()) {
    throw DecodeError(where, "expected a positive integer, got " + std::to_string(n));
  }
  return static_cast<uint32_t>(n);
}

}  // namespace

// ============================================================================
// Encoding
// ============================================================================

Json to_json(const SourceLocation & location)
{
  Json j{{"file", location.file.string()}, {"line", location.line}};
  if (location.column) {
    j["column"] = *location.column;
  }
  return j;
}

Json to_json(const Diagnostic & diag)
{
  Json locations = Json::array();
  for (const auto & loc : diag.locations) {
    locations.push_back(to_json(loc));
  }
  return Json{
    {"name", diag.name},
    {"msg", diag.message},
    {"severity", std::string(to_string(diag.severity))},
    {"locations", std::move(locations)},
    {"link", diag.has_documentation_link}};
}

Json to_json(const AttributeDescriptor & attr)
{
  Json j{{"name", attr.name}};
  if (attr.location) {
    j["location"] = to_json(*attr.location);
  }
  if (attr.build_plan_path) {
    j["drv"] = attr.build_plan_path->string();
  }
  if (attr.artifact_path) {
    j["output"] = attr.artifact_path->string();
  }
  return j;
}

Json to_json(const DiagnosticBundle & bundle)
{
  Json j = Json::object();
  for (const auto & [name, diags] : bundle) {
    Json reports = Json::array();
    for (const auto & d : diags) {
      reports.push_back(to_json(d));
    }
    j[name] = std::move(reports);
  }
  return j;
}

Json to_json(const std::vector<AttributeDescriptor> & attrs)
{
  Json j = Json::array();
  for (const auto & a : attrs) {
    j.push_back(to_json(a));
  }
  return j;
}

// ============================================================================
// Decoding
// ============================================================================

SourceLocation decode_location(const Json & j, const std::string & where)
{
  require_object(j, where);

  SourceLocation loc;
  loc.file = get_string(j, "file", where);

  const auto line = j.find("line");
  if (line == j.end()) {
    throw DecodeError(where, "missing required field 'line'");
  }
  loc.line = to_positive(*line, child(where, "line"));

  if (const auto column = j.find("column"); column != j.end() && !column->is_null()) {
    loc.column = to_positive(*column, child(where, "column"));
  }
  return loc;
}

std::optional<Diagnostic> decode_report(const Json & j, const std::string & where)
{
  require_object(j, where);

  if (const auto cond = get_optional_bool(j, "cond", where); cond && !*cond) {
    return std::nullopt;
  }

  Diagnostic diag;
  diag.name = get_string(j, "name", where);
  diag.message = get_string(j, "msg", where);

  if (const auto severity = get_optional_string(j, "severity", where)) {
    const auto parsed = parse_severity(*severity);
    if (!parsed) {
      throw DecodeError(child(where, "severity"), "unknown severity '" + *severity + "'");
    }
    diag.severity = *parsed;
  }

  if (const auto locations = j.find("locations");
      locations != j.end() && !locations->is_null()) {
    const std::string loc_where = child(where, "locations");
    if (!locations->is_array()) {
      throw DecodeError(loc_where, std::string("expected an array, got ") + type_name(*locations));
    }
    for (size_t i = 0; i < locations->size(); ++i) {
      diag.locations.push_back(decode_location((*locations)[i], child(loc_where, i)));
    }
  }

  diag.has_documentation_link = get_optional_bool(j, "link", where).value_or(true);
  return diag;
}

std::vector<Diagnostic> decode_reports(const Json & j, const std::string & where)
{
  if (!j.is_array()) {
    throw DecodeError(where, std::string("expected an array, got ") + type_name(j));
  }
  std::vector<Diagnostic> out;
  out.reserve(j.size());
  for (size_t i = 0; i < j.size(); ++i) {
    if (auto diag = decode_report(j[i], child(where, i))) {
      out.push_back(std::move(*diag));
    }
  }
  return out;
}

AttributeDescriptor decode_attribute(const Json & j, const std::string & where)
{
  require_object(j, where);

  AttributeDescriptor attr;
  attr.name = get_string(j, "name", where);
  if (const auto loc = j.find("location"); loc != j.end() && !loc->is_null()) {
    attr.location = decode_location(*loc, child(where, "location"));
  }
  if (auto drv = get_optional_string(j, "drv", where)) {
    attr.build_plan_path = std::move(*drv);
  }
  if (auto output = get_optional_string(j, "output", where)) {
    attr.artifact_path = std::move(*output);
  }
  return attr;
}

DiagnosticBundle decode_bundle(const Json & j)
{
  require_object(j, "");

  DiagnosticBundle bundle;
  for (const auto & item : j.items()) {
    bundle.append(item.key(), decode_reports(item.value(), "/" + escape_key(item.key())));
  }
  return bundle;
}

}  // namespace hammer
