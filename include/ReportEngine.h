#pragma once
#include <string>
#include <vector>

class ReportEngine {
public:
    void addTitle(const std::string& title);
    void addHeading(const std::string& heading);
    void addParagraph(const std::string& text);
    void addBulletList(const std::vector<std::string>& items);
    void addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows);
    const std::string& markdown() const { return body_; }

    /**
     * @throws LottoLens::IOException when the file cannot be written.
     */
    void save(const std::string& filePath) const;

private:
    std::string body_;
};
