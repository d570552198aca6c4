#include "line_protocol_adapter.hpp"
#include "utils/logger.hpp"
#include <cstring>

namespace tsimport {
namespace importer {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

bool starts_with(const std::string& text, const char* prefix) {
    return text.compare(0, std::strlen(prefix), prefix) == 0;
}

std::string directive_value(const std::string& line, const char* token) {
    return trim(line.substr(std::strlen(token)));
}

} // namespace

Action LineProtocolAdapter::process(const std::string& raw_line) {
    std::string line = trim(raw_line);

    if (starts_with(line, DDL_TOKEN)) {
        context_.enter_ddl();
        return Action::none();
    }
    if (starts_with(line, DML_TOKEN)) {
        context_.enter_dml();
        return Action::none();
    }
    if (starts_with(line, DATABASE_TOKEN)) {
        context_.set_database(directive_value(line, DATABASE_TOKEN));
        TSIMPORT_LOG_DEBUG("Context database set to '{}'", context_.database());
        return Action::none();
    }
    if (starts_with(line, RETENTION_POLICY_TOKEN)) {
        context_.set_retention_policy(directive_value(line, RETENTION_POLICY_TOKEN));
        TSIMPORT_LOG_DEBUG("Context retention policy set to '{}'", context_.retention_policy());
        return Action::none();
    }
    if (line.empty() || line[0] == '#') {
        return Action::none();
    }

    if (context_.phase() == ImportPhase::DDL) {
        return Action::query(line);
    }

    context_.require_database("make sure `# CONTEXT-DATABASE:` token is exist");
    return context_.enqueue_line(std::move(line));
}

} // namespace importer
} // namespace tsimport
