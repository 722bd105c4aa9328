#pragma once

#include <gradebox/model/report.hpp>
#include <gradebox/model/test_outcome.hpp>

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace gradebox {

/// Result file document, schema version ``Report::SCHEMA_VERSION``.
///
/// Hidden tests keep their status and points but lose everything that could reveal their content:
/// name (replaced by "Hidden test N"), description, output and message.
nlohmann::json to_json_document(const Report& report);

/// ``hidden_index`` numbers hidden tests from 1 in declaration order
nlohmann::json to_json_document(const TestOutcome& outcome, int hidden_index);

/// Pretty-printed document. Invalid UTF-8 in captured output is replaced, never fatal
std::string serialize_report(const Report& report);

} // namespace gradebox
