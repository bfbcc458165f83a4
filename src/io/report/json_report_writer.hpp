#ifndef JSON_REPORT_WRITER_HPP
#define JSON_REPORT_WRITER_HPP

#include "report/report.hpp"
#include "nlohmann/json.hpp"

#include <ostream>
#include <string>

namespace JsonReportWriter {

nlohmann::json evidence_to_json_object(const Finding &finding);
nlohmann::json finding_to_json_object(const Finding &finding);
nlohmann::json summary_to_json_object(const Report &report);
nlohmann::json report_to_json_object(const Report &report);

// Invalid UTF-8 in log text is replaced rather than rejected.
std::string format_report_to_json(const Report &report, bool pretty);

void write_report(const Report &report, std::ostream &out, bool pretty);
// Returns false (and logs) when the file cannot be written.
bool write_report_to_file(const Report &report, const std::string &filepath,
                          bool pretty);

} // namespace JsonReportWriter

#endif // JSON_REPORT_WRITER_HPP
