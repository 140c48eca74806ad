// hammer/basic/report_json.hpp - JSON encoding of reports and attributes
//
// Schema shared by the evaluator response, the external check protocol and
// the --json output:
//
//   location   {"file": string, "line": int >= 1, "column"?: int >= 1}
//   report     {"name": string, "msg": string, "severity"?: "notice"|"warning"|"error",
//               "locations"?: [location], "link"?: bool, "cond"?: bool}
//   attribute  {"name": string, "location"?: location, "drv"?: string, "output"?: string}
//   bundle     {attr name: [report]}
//
// Absent optionals are omitted on encode. Decoders validate every field and
// throw DecodeError naming the offending path.
//
#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

#include "hammer/basic/attribute.hpp"
#include "hammer/basic/bundle.hpp"
#include "hammer/basic/report.hpp"

namespace hammer
{

/// Insertion-ordered JSON so that bundles keep their attribute order.
using Json = nlohmann::ordered_json;

// ============================================================================
// Encoding
// ============================================================================

[[nodiscard]] Json to_json(const SourceLocation & location);
[[nodiscard]] Json to_json(const Diagnostic & diag);
[[nodiscard]] Json to_json(const AttributeDescriptor & attr);
[[nodiscard]] Json to_json(const DiagnosticBundle & bundle);
[[nodiscard]] Json to_json(const std::vector<AttributeDescriptor> & attrs);

// ============================================================================
// Decoding
// ============================================================================

/**
 * Decode a location object.
 *
 * @param where Path of `j` inside the enclosing document, used in errors
 */
[[nodiscard]] SourceLocation decode_location(const Json & j, const std::string & where);

/**
 * Decode one report.
 *
 * Missing "severity" defaults to warning, missing "locations" to none and
 * missing "link" to true. A report whose "cond" is false is inactive and
 * decodes to nullopt.
 */
[[nodiscard]] std::optional<Diagnostic> decode_report(const Json & j, const std::string & where);

/// Decode an array of reports, dropping inactive ones.
[[nodiscard]] std::vector<Diagnostic> decode_reports(const Json & j, const std::string & where);

/// Decode an attribute descriptor record.
[[nodiscard]] AttributeDescriptor decode_attribute(const Json & j, const std::string & where);

/// Decode a bundle object (attribute name -> report array).
[[nodiscard]] DiagnosticBundle decode_bundle(const Json & j);

}  // namespace hammer
