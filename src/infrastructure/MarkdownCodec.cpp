/**
 * @file MarkdownCodec.cpp
 * @brief Implementation of MarkdownCodec.
 */
#include "infrastructure/MarkdownCodec.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>
#include "domain/ScratchpadError.hpp"

namespace scratchpad::infrastructure {

using domain::ErrorKind;
using domain::ScratchpadDocument;
using domain::ScratchpadError;
using domain::ScratchpadItem;
using domain::Timestamp;

namespace {

const char* kTitle = "# 📋 AI Scratchpad";
const char* kFormatMarker = "<!-- scratchpad-format: ";
const char* kNoActiveTask = "_No active task_";
const char* kNoTimestamp = "`--:--`";

const char* kFocusHeader = "## 🎯 Current Focus";
const char* kInterruptionsHeader = "## 💡 Interruptions / Ideas";
const char* kReviewHeader = "## 🔄 To Review Later";
const char* kCompletedHeader = "## ✅ Completed Today";
const char* kArchivedHeader = "## 🗑️ Archived / Dismissed";
const char* kStatisticsHeader = "## 📊 Usage Statistics";

const char* kStartedPrefix = "**Started:**";
const char* kTaskPrefix = "**Task:** ";
const char* kLastUpdatedPrefix = "- **Last Updated:**";

enum class Section {
    Preamble,
    Focus,
    Interruptions,
    ReviewLater,
    Completed,
    Archived,
    Statistics,
    Unknown
};

bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::string Trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

Section ClassifyHeader(const std::string& line) {
    if (line.find("Current Focus") != std::string::npos) return Section::Focus;
    if (line.find("Interruptions") != std::string::npos) return Section::Interruptions;
    if (line.find("To Review Later") != std::string::npos) return Section::ReviewLater;
    if (line.find("Completed Today") != std::string::npos) return Section::Completed;
    if (line.find("Archived") != std::string::npos) return Section::Archived;
    if (line.find("Statistics") != std::string::npos) return Section::Statistics;
    return Section::Unknown;
}

std::string Stamp(const std::optional<Timestamp>& ts) {
    return ts ? "`" + domain::FormatTimestamp(*ts) + "`" : std::string(kNoTimestamp);
}

std::string TypeCell(const ScratchpadItem& item) {
    return domain::ItemTypeEmoji(item.type) + " " + domain::Capitalize(domain::ItemTypeToString(item.type));
}

std::string PriorityCell(const ScratchpadItem& item) {
    return domain::PriorityEmoji(item.priority) + " " + domain::Capitalize(domain::PriorityToString(item.priority));
}

void WriteOpenItems(std::ostringstream& out, const std::vector<ScratchpadItem>& items, const char* placeholder) {
    if (items.empty()) {
        out << placeholder << "\n";
        return;
    }
    out << "| Time | Type | Note | Priority |\n";
    out << "|------|------|------|----------|\n";
    for (const auto& item : items) {
        out << "| " << Stamp(item.createdAt) << " | " << TypeCell(item) << " | "
            << MarkdownCodec::EscapeText(item.text) << " | " << PriorityCell(item) << " |\n";
    }
}

void WriteClosedItems(std::ostringstream& out, const std::vector<ScratchpadItem>& items,
                      const char* stampColumn, bool archived, const char* placeholder) {
    if (items.empty()) {
        out << placeholder << "\n";
        return;
    }
    out << "| " << stampColumn << " | Logged | Type | Note | Priority |\n";
    out << "|" << std::string(std::string(stampColumn).size() + 2, '-') << "|--------|------|------|----------|\n";
    for (const auto& item : items) {
        const auto& closedAt = archived ? item.archivedAt : item.completedAt;
        out << "| " << Stamp(closedAt) << " | " << Stamp(item.createdAt) << " | " << TypeCell(item) << " | "
            << MarkdownCodec::EscapeText(item.text) << " | " << PriorityCell(item) << " |\n";
    }
}

[[noreturn]] void Malformed(size_t lineNo, const std::string& what) {
    throw ScratchpadError(ErrorKind::InvalidFormat, "line " + std::to_string(lineNo) + ": " + what);
}

// Splits "| a | b\| c |" on unescaped pipes, dropping the single pad space around each cell.
std::vector<std::string> SplitRow(const std::string& line, size_t lineNo) {
    std::vector<std::string> cells;
    std::string current;
    for (size_t i = 1; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\' && i + 1 < line.size()) {
            current += c;
            current += line[++i];
        } else if (c == '|') {
            if (!current.empty() && current.front() == ' ') current.erase(0, 1);
            if (!current.empty() && current.back() == ' ') current.pop_back();
            cells.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!Trim(current).empty()) {
        Malformed(lineNo, "table row is not terminated by '|'");
    }
    return cells;
}

std::optional<Timestamp> ParseStampCell(const std::string& cell, size_t lineNo, bool optional) {
    std::string value = Trim(cell);
    if (value == kNoTimestamp && optional) {
        return std::nullopt;
    }
    if (value.size() < 2 || value.front() != '`' || value.back() != '`') {
        Malformed(lineNo, "timestamp must be wrapped in backticks");
    }
    auto ts = domain::ParseTimestamp(value.substr(1, value.size() - 2));
    if (!ts) {
        Malformed(lineNo, "unparseable timestamp");
    }
    return ts;
}

std::string LastWordLower(const std::string& cell) {
    std::string value = Trim(cell);
    size_t space = value.find_last_of(' ');
    std::string word = (space == std::string::npos) ? value : value.substr(space + 1);
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return word;
}

ScratchpadItem ParseItemCells(const std::string& typeCell, const std::string& noteCell,
                              const std::string& priorityCell, size_t lineNo) {
    ScratchpadItem item;
    auto type = domain::ItemTypeFromString(LastWordLower(typeCell));
    if (!type) Malformed(lineNo, "unknown item type");
    auto priority = domain::PriorityFromString(LastWordLower(priorityCell));
    if (!priority) Malformed(lineNo, "unknown priority");
    item.type = *type;
    item.priority = *priority;
    item.text = MarkdownCodec::UnescapeText(noteCell);
    return item;
}

bool IsHeaderOrSeparator(const std::vector<std::string>& cells, const std::string& line) {
    if (StartsWith(line, "|-") || StartsWith(line, "| -")) return true;
    if (cells.empty()) return false;
    const std::string first = Trim(cells.front());
    return first == "Time" || first == "Completed" || first == "Archived";
}

} // namespace

std::string MarkdownCodec::EscapeText(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '|': out += "\\|"; break;
            case '_': out += "\\_"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string MarkdownCodec::UnescapeText(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            char next = text[++i];
            if (next == 'n') out += '\n';
            else if (next == 'r') out += '\r';
            else out += next;
        } else {
            out += text[i];
        }
    }
    return out;
}

std::string MarkdownCodec::Serialize(const ScratchpadDocument& doc) {
    std::ostringstream out;
    const auto stats = doc.statistics();

    out << kTitle << "\n\n";
    out << kFormatMarker << doc.getFormatVersion() << " -->\n\n";
    out << "A dynamic workspace for tracking tasks, ideas, and interruptions during development sessions.\n\n";
    out << "---\n\n";

    out << kFocusHeader << "\n\n";
    out << kStartedPrefix << " " << Stamp(doc.getFocus().startedAt) << "  \n";
    out << kTaskPrefix << (doc.getFocus().task.empty() ? std::string(kNoActiveTask) : EscapeText(doc.getFocus().task)) << "\n\n";
    out << "---\n\n";

    out << kInterruptionsHeader << "\n\n";
    out << "Quick-capture zone for thoughts that pop up during focused work.\n\n";
    WriteOpenItems(out, doc.getInterruptions(), "_No entries yet_");
    out << "\n**Legend:**\n";
    out << "- **Types:** 💡 Idea | 🐛 Bug | ✨ Feature | ❓ Question | 📞 Contact | 🔧 Refactor | 📝 Task | 📌 Note\n";
    out << "- **Priority:** 🔴 High | 🟡 Medium | 🟢 Low\n\n";
    out << "---\n\n";

    out << kReviewHeader << "\n\n";
    out << "Items logged during work sessions that need follow-up or consideration.\n\n";
    WriteOpenItems(out, doc.getReviewLater(), "_Empty - all caught up!_");
    out << "\n---\n\n";

    out << kCompletedHeader << "\n\n";
    WriteClosedItems(out, doc.getCompleted(), "Completed", false, "_No completions yet_");
    out << "\n---\n\n";

    out << kArchivedHeader << "\n\n";
    out << "<details>\n<summary>Click to expand archived items</summary>\n\n";
    WriteClosedItems(out, doc.getArchived(), "Archived", true, "_Nothing archived yet_");
    out << "\n</details>\n\n";
    out << "---\n\n";

    out << kStatisticsHeader << "\n\n";
    out << "- **Total Ideas Logged:** " << stats.totalLogged << "\n";
    out << "- **Items Completed:** " << stats.totalCompleted << "\n";
    out << "- **Items Archived:** " << stats.totalArchived << "\n";
    out << kLastUpdatedPrefix << " " << Stamp(doc.getLastUpdated()) << "\n";
    return out.str();
}

ScratchpadDocument MarkdownCodec::Parse(const std::string& markdown) {
    ScratchpadDocument doc;
    domain::CurrentFocus focus;
    bool seen[static_cast<int>(Section::Unknown) + 1] = {};
    Section section = Section::Preamble;

    std::istringstream in(markdown);
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (StartsWith(line, "## ")) {
            section = ClassifyHeader(line);
            seen[static_cast<int>(section)] = true;
            continue;
        }

        switch (section) {
            case Section::Preamble:
                if (StartsWith(line, kFormatMarker)) {
                    try {
                        doc.setFormatVersion(std::stoi(line.substr(std::string(kFormatMarker).size())));
                    } catch (const std::exception&) {
                        Malformed(lineNo, "unreadable format version");
                    }
                    if (doc.getFormatVersion() > ScratchpadDocument::kFormatVersion) {
                        Malformed(lineNo, "unsupported format version " + std::to_string(doc.getFormatVersion()));
                    }
                }
                break;

            case Section::Focus:
                if (StartsWith(line, kStartedPrefix)) {
                    focus.startedAt = ParseStampCell(line.substr(std::string(kStartedPrefix).size()), lineNo, true);
                } else if (StartsWith(line, kTaskPrefix)) {
                    std::string task = line.substr(std::string(kTaskPrefix).size());
                    focus.task = (task == kNoActiveTask) ? std::string() : UnescapeText(task);
                }
                break;

            case Section::Interruptions:
            case Section::ReviewLater:
            case Section::Completed:
            case Section::Archived: {
                if (!StartsWith(line, "|")) break;
                auto cells = SplitRow(line, lineNo);
                if (IsHeaderOrSeparator(cells, line)) break;

                if (section == Section::Interruptions || section == Section::ReviewLater) {
                    if (cells.size() != 4) Malformed(lineNo, "expected 4 cells");
                    ScratchpadItem item = ParseItemCells(cells[1], cells[2], cells[3], lineNo);
                    item.createdAt = *ParseStampCell(cells[0], lineNo, false);
                    if (section == Section::Interruptions) doc.restoreInterruption(std::move(item));
                    else doc.restoreReviewLater(std::move(item));
                } else {
                    if (cells.size() != 5) Malformed(lineNo, "expected 5 cells");
                    ScratchpadItem item = ParseItemCells(cells[2], cells[3], cells[4], lineNo);
                    item.createdAt = *ParseStampCell(cells[1], lineNo, false);
                    auto closedAt = ParseStampCell(cells[0], lineNo, false);
                    if (section == Section::Completed) {
                        item.completedAt = closedAt;
                        doc.restoreCompleted(std::move(item));
                    } else {
                        item.archivedAt = closedAt;
                        doc.restoreArchived(std::move(item));
                    }
                }
                break;
            }

            case Section::Statistics:
                if (StartsWith(line, kLastUpdatedPrefix)) {
                    doc.setLastUpdated(ParseStampCell(line.substr(std::string(kLastUpdatedPrefix).size()), lineNo, true));
                }
                break;

            default:
                break;
        }
    }

    for (Section required : {Section::Focus, Section::Interruptions, Section::ReviewLater,
                             Section::Completed, Section::Archived}) {
        if (!seen[static_cast<int>(required)]) {
            throw ScratchpadError(ErrorKind::InvalidFormat, "missing required section");
        }
    }

    doc.setFocus(std::move(focus));
    return doc;
}

} // namespace scratchpad::infrastructure
