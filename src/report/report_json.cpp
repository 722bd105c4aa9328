#include "report/report_json.hpp"

#include <gradebox/model/report.hpp>
#include <gradebox/model/test_outcome.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace gradebox {

using nlohmann::json;

json to_json_document(const TestOutcome& outcome, int hidden_index) {
    json doc = json::object();

    doc["status"] = std::string{to_wire_string(outcome.status)};
    doc["points"] = outcome.points;
    doc["max_points"] = outcome.max_points;
    doc["duration"] = std::chrono::duration<double>{outcome.duration}.count();

    if (outcome.hidden) {
        doc["name"] = hidden_test_name(hidden_index);
        doc["output"] = "";
        doc["output_truncated"] = false;
        doc["hidden"] = true;
    } else {
        doc["name"] = outcome.name;
        doc["output"] = outcome.output;
        doc["output_truncated"] = outcome.output_truncated;

        if (!outcome.message.empty()) {
            doc["message"] = outcome.message;
        }

        if (!outcome.description.empty()) {
            doc["description"] = outcome.description;
        }
    }

    if (!outcome.scored) {
        doc["scored"] = false;
    }

    return doc;
}

json to_json_document(const Report& report) {
    json tests = json::array();
    int num_hidden = 0;

    for (const TestOutcome& outcome : report.tests) {
        tests.push_back(to_json_document(outcome, outcome.hidden ? ++num_hidden : 0));
    }

    return {
        {"schema_version", Report::SCHEMA_VERSION},
        {"gradable", report.gradable},
        {"status", std::string{to_wire_string(report.status)}},
        {"points", report.points},
        {"max_points", report.max_points},
        {"score", report.score},
        {"message", report.message},
        {"output", report.output},
        {"tests", std::move(tests)},
    };
}

std::string serialize_report(const Report& report) {
    return to_json_document(report).dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

} // namespace gradebox
