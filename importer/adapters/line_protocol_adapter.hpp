#pragma once

#include "import_context.hpp"
#include <string>

namespace tsimport {
namespace importer {

// Directive-aware processing of one line of protocol text:
//   # DDL / # DML                         switch phase
//   # CONTEXT-DATABASE: / -RETENTION-POLICY: set the write target
// In the DDL phase every other non-comment line is a statement; in the DML
// phase it is a data line for the buffer.
class LineProtocolAdapter {
public:
    static constexpr const char* DDL_TOKEN = "# DDL";
    static constexpr const char* DML_TOKEN = "# DML";
    static constexpr const char* DATABASE_TOKEN = "# CONTEXT-DATABASE:";
    static constexpr const char* RETENTION_POLICY_TOKEN = "# CONTEXT-RETENTION-POLICY:";

    explicit LineProtocolAdapter(ImportContext& context) : context_(context) {}

    Action process(const std::string& line);

private:
    ImportContext& context_;
};

} // namespace importer
} // namespace tsimport
