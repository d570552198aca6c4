#pragma once

#include "import_context.hpp"
#include "config/config_manager.hpp"
#include <string>
#include <vector>

namespace tsimport {
namespace importer {

// First row is the header: it resolves the tag/field/time columns and
// requests CREATE DATABASE. Every later row becomes one Point.
class CsvAdapter {
public:
    CsvAdapter(ImportContext& context, const config::ImportConfig& config);

    Action process(std::vector<std::string> row);

    static void strip_bom(std::string& cell);

private:
    Action process_header(std::vector<std::string>& header);
    Action process_row(const std::vector<std::string>& row);
    void validate_mapping() const;

    ImportContext& context_;
    const config::ImportConfig& config_;
    int max_position_ = -1;
};

} // namespace importer
} // namespace tsimport
