#pragma once

#include <optional>
#include <string>
#include <vector>
#include "records.pb.h"

namespace homestead {

/// Text renderer for receipts.
class ReceiptRenderer {
public:
    ReceiptRenderer() = default;

    /// Render a finished sale. Cells past the header count print on their own line.
    std::string render(const std::vector<std::string>& headers,
                       const std::vector<std::vector<std::string>>& rows,
                       const std::string& total,
                       const std::string& customer_name,
                       const std::optional<std::string>& savings = std::nullopt) const;

    /// Render a sale that has not been checked out.
    std::string render_pending() const;

    /// Dispatch on receipt.pending().
    std::string render(const records::Receipt& receipt) const;
};

}  // namespace homestead
