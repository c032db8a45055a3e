#pragma once

#include "pqm/error.hpp"

#include <string>
#include <vector>

namespace pqm {

// A named script as it lives inside an external document
struct ExtractedScript {
    std::string name;
    std::string body;
    std::string description;
};

/**
 * @brief Seam to an external document host (spreadsheet, workbook, ...)
 *
 * Implementations own the document format and any timeouts talking to the
 * host application. The Manager never retries a failed call.
 */
class DocumentAdapter {
public:
    virtual ~DocumentAdapter() = default;

    /// All scripts currently defined in `document`
    virtual Result<std::vector<ExtractedScript>> read_scripts(const std::string& document) = 0;

    /// Add or replace one script in `document`. Called in insertion order.
    virtual Result<void> write_script(const std::string& document,
                                      const std::string& name,
                                      const std::string& body,
                                      const std::string& description) = 0;
};

} // namespace pqm
