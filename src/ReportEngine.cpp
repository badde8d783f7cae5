#include "ReportEngine.h"
#include "LottoLensExceptions.h"

#include <fstream>

namespace {
std::string escapeMarkdownTableCell(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 8);
    for (char ch : value) {
        if (ch == '|') {
            escaped += "\\|";
        } else if (ch == '\n') {
            escaped += "<br>";
        } else if (ch != '\r') {
            escaped.push_back(ch);
        }
    }
    return escaped;
}

constexpr size_t kTallTableRowCap = 60;

void appendMarkdownTable(std::string& body,
                         const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows) {
    body += "|";
    for (const auto& h : headers) {
        body += " " + escapeMarkdownTableCell(h) + " |";
    }
    body += "\n|";
    for (size_t i = 0; i < headers.size(); ++i) {
        body += " --- |";
    }
    body += "\n";

    for (const auto& row : rows) {
        body += "|";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += " " + escapeMarkdownTableCell(i < row.size() ? row[i] : "") + " |";
        }
        body += "\n";
    }
    body += "\n";
}

} // namespace

void ReportEngine::addTitle(const std::string& title) {
    body_ += "# " + title + "\n\n";
}

void ReportEngine::addHeading(const std::string& heading) {
    body_ += "## " + heading + "\n\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    body_ += text + "\n\n";
}

void ReportEngine::addBulletList(const std::vector<std::string>& items) {
    if (items.empty()) {
        body_ += "_(none)_\n\n";
        return;
    }
    for (const auto& item : items) body_ += "- " + item + "\n";
    body_ += "\n";
}

void ReportEngine::addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    body_ += "## " + title + "\n";
    if (headers.empty()) {
        body_ += "(no columns)\n\n";
        return;
    }
    if (rows.empty()) {
        body_ += "_(no rows)_\n\n";
        return;
    }

    // Per-number tables for large ranges (Lotomania) fold behind a preview.
    if (rows.size() <= kTallTableRowCap) {
        appendMarkdownTable(body_, headers, rows);
        return;
    }

    const std::vector<std::vector<std::string>> previewRows(rows.begin(), rows.begin() + static_cast<long>(kTallTableRowCap));
    body_ += "_First " + std::to_string(kTallTableRowCap) + " of " + std::to_string(rows.size()) + " rows._\n\n";
    appendMarkdownTable(body_, headers, previewRows);
    body_ += "<details>\n<summary>All " + std::to_string(rows.size()) + " rows</summary>\n\n";
    appendMarkdownTable(body_, headers, rows);
    body_ += "</details>\n\n";
}

void ReportEngine::save(const std::string& filePath) const {
    std::ofstream out(filePath);
    if (!out) throw LottoLens::IOException("Could not open report file for writing: " + filePath);
    out << body_;
    if (!out) throw LottoLens::IOException("Failed writing report file: " + filePath);
}
