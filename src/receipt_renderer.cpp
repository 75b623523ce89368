#include "homestead/receipt_renderer.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace homestead {

namespace {

constexpr const char* kBanner = "========================================";

std::string pad(const std::string& text, std::size_t width) {
    std::ostringstream out;
    out << std::left << std::setw(static_cast<int>(width)) << text;
    return out.str();
}

}  // namespace

std::string ReceiptRenderer::render(const std::vector<std::string>& headers,
                                    const std::vector<std::vector<std::string>>& rows,
                                    const std::string& total,
                                    const std::string& customer_name,
                                    const std::optional<std::string>& savings) const {
    std::vector<std::size_t> widths;
    for (const auto& header : headers) {
        widths.push_back(header.size());
    }
    for (const auto& row : rows) {
        for (std::size_t i = 0; i < row.size() && i < widths.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto print_cells = [&widths](std::ostringstream& out, const std::vector<std::string>& cells) {
        for (std::size_t i = 0; i < cells.size() && i < widths.size(); ++i) {
            if (i > 0) out << "  ";
            if (i + 1 == widths.size() || i + 1 == cells.size()) {
                out << cells[i];
            } else {
                out << pad(cells[i], widths[i]);
            }
        }
        out << "\n";
    };

    std::ostringstream receipt;
    receipt << kBanner << "\n";
    receipt << "               RECEIPT\n";
    receipt << kBanner << "\n";
    print_cells(receipt, headers);
    receipt << "----------------------------------------\n";
    for (const auto& row : rows) {
        print_cells(receipt, row);
        for (std::size_t i = widths.size(); i < row.size(); ++i) {
            receipt << "    " << row[i] << "\n";
        }
    }
    receipt << "----------------------------------------\n";
    receipt << "Total: " << total << "\n";
    if (savings) {
        receipt << "Savings: " << *savings << "\n";
    }
    receipt << "Customer: " << customer_name << "\n";
    receipt << kBanner << "\n";
    receipt << "     Thank you for shopping with us!\n";
    receipt << kBanner << "\n";
    return receipt.str();
}

std::string ReceiptRenderer::render_pending() const {
    std::ostringstream receipt;
    receipt << kBanner << "\n";
    receipt << "        TRANSACTION IN PROGRESS\n";
    receipt << kBanner << "\n";
    return receipt.str();
}

std::string ReceiptRenderer::render(const records::Receipt& receipt) const {
    if (receipt.pending()) {
        return render_pending();
    }

    std::vector<std::string> headers(receipt.headers().begin(), receipt.headers().end());
    std::vector<std::vector<std::string>> rows;
    for (const auto& row : receipt.rows()) {
        rows.emplace_back(row.cells().begin(), row.cells().end());
    }
    std::optional<std::string> savings;
    if (receipt.has_savings()) {
        savings = receipt.savings();
    }
    return render(headers, rows, receipt.total(), receipt.customer_name(), savings);
}

}  // namespace homestead
