#include <cassert>
#include <iostream>
#include <string>

#include "domain/ScratchpadDocument.hpp"
#include "domain/ScratchpadError.hpp"
#include "infrastructure/MarkdownCodec.hpp"

using namespace scratchpad::domain;
using scratchpad::infrastructure::MarkdownCodec;

static Timestamp At(long long seconds) {
    return Timestamp(std::chrono::seconds(1790000000 + seconds));
}

static ScratchpadItem MakeItem(const std::string& text, ItemType type, Priority priority, Timestamp createdAt) {
    ScratchpadItem item;
    item.text = text;
    item.type = type;
    item.priority = priority;
    item.createdAt = createdAt;
    return item;
}

static bool ParseFails(const std::string& markdown) {
    try {
        MarkdownCodec::Parse(markdown);
    } catch (const ScratchpadError& e) {
        assert(e.kind() == ErrorKind::InvalidFormat);
        return true;
    }
    return false;
}

static void ReplaceFirst(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = text.find(from);
    assert(pos != std::string::npos);
    text.replace(pos, from.size(), to);
}

static void TestTransfers() {
    std::cout << "[Test] Item transfers..." << std::endl;
    ScratchpadDocument doc = ScratchpadDocument::CreateEmpty(At(0));
    assert(doc.statistics().totalLogged == 0);
    assert(doc.getFocus().task.empty());

    doc.logInterruption(MakeItem("Check cache eviction", ItemType::Idea, Priority::High, At(1)));
    doc.logInterruption(MakeItem("shared text", ItemType::Bug, Priority::Low, At(2)));
    doc.addToReviewLater(MakeItem("shared text", ItemType::Note, Priority::Medium, At(3)));
    doc.addToReviewLater(MakeItem("Read RFC 9110", ItemType::Task, Priority::Medium, At(4)));
    assert(doc.statistics().totalLogged == 4);

    // Interruptions are searched before To Review Later.
    assert(doc.markCompleted("shared text", At(10)) == ItemOrigin::Interruptions);
    assert(doc.getInterruptions().size() == 1);
    assert(doc.getReviewLater().size() == 2);
    const ScratchpadItem& done = doc.getCompleted().back();
    assert(done.type == ItemType::Bug);
    assert(done.createdAt == At(2));
    assert(done.completedAt == At(10));
    assert(!done.archivedAt);

    assert(doc.archiveItem("Read RFC 9110", At(11)) == ItemOrigin::ReviewLater);
    assert(doc.getReviewLater().size() == 1);
    assert(doc.getArchived().back().archivedAt == At(11));
    assert(!doc.getArchived().back().completedAt);

    // Unknown text is recorded directly in the destination.
    assert(doc.markCompleted("never logged", At(12)) == ItemOrigin::Direct);
    assert(doc.getCompleted().back().createdAt == At(12));
    assert(doc.getCompleted().back().type == ItemType::Note);

    // Only exact matches move; no item is ever in two sections.
    assert(doc.archiveItem("check cache eviction", At(13)) == ItemOrigin::Direct);
    assert(doc.getInterruptions().size() == 1);

    Statistics stats = doc.statistics();
    assert(stats.totalCompleted == 2);
    assert(stats.totalArchived == 2);
    assert(stats.totalLogged == doc.getInterruptions().size() + doc.getReviewLater().size() + 4);

    doc.updateFocus("write parser", At(20));
    doc.updateFocus("write tests", At(21));
    assert(doc.getFocus().task == "write tests");
    assert(doc.getFocus().startedAt == At(21));
    std::cout << "[PASS] Item transfers." << std::endl;
}

static void TestRoundTrip() {
    std::cout << "[Test] Markdown round trip..." << std::endl;
    ScratchpadDocument empty = ScratchpadDocument::CreateEmpty(At(0));
    std::string emptyText = MarkdownCodec::Serialize(empty);
    assert(emptyText.find("_No entries yet_") != std::string::npos);
    assert(emptyText.find("_No active task_") != std::string::npos);
    assert(MarkdownCodec::Parse(emptyText) == empty);

    ScratchpadDocument doc = ScratchpadDocument::CreateEmpty(At(0));
    doc.updateFocus("_No active task_", At(1));
    doc.logInterruption(MakeItem("pipes | and \\ backslash", ItemType::Question, Priority::High, At(2)));
    doc.logInterruption(MakeItem("snake_case_name", ItemType::Refactor, Priority::Low, At(3)));
    doc.logInterruption(MakeItem("line one\nline two\r\n", ItemType::Contact, Priority::Medium, At(4)));
    doc.addToReviewLater(MakeItem("  padded  ", ItemType::Feature, Priority::Medium, At(5)));
    doc.addToReviewLater(MakeItem("emoji 💡 and ünïcode", ItemType::Note, Priority::Low, At(6)));
    doc.addToReviewLater(MakeItem("trailing backslash \\", ItemType::Task, Priority::High, At(7)));
    doc.markCompleted("snake_case_name", At(8));
    doc.archiveItem("emoji 💡 and ünïcode", At(9));
    doc.archiveItem("| starts with a pipe", At(10));
    doc.touch(At(11));

    const std::string text = MarkdownCodec::Serialize(doc);
    ScratchpadDocument parsed = MarkdownCodec::Parse(text);
    assert(parsed == doc);
    assert(MarkdownCodec::Serialize(parsed) == text);
    assert(parsed.getFocus().task == "_No active task_");

    assert(text.find("- **Total Ideas Logged:** 7") != std::string::npos);
    assert(text.find("- **Items Completed:** 1") != std::string::npos);
    assert(text.find("- **Items Archived:** 2") != std::string::npos);
    std::cout << "[PASS] Markdown round trip." << std::endl;
}

static void TestStatisticsAreDerived() {
    std::cout << "[Test] Statistics ignored on parse..." << std::endl;
    ScratchpadDocument doc = ScratchpadDocument::CreateEmpty(At(0));
    doc.markCompleted("done", At(1));
    std::string text = MarkdownCodec::Serialize(doc);
    ReplaceFirst(text, "- **Items Completed:** 1", "- **Items Completed:** 42");
    ScratchpadDocument parsed = MarkdownCodec::Parse(text);
    assert(parsed.statistics().totalCompleted == 1);
    assert(parsed == doc);
    std::cout << "[PASS] Statistics ignored on parse." << std::endl;
}

static void TestMalformed() {
    std::cout << "[Test] Malformed documents..." << std::endl;
    ScratchpadDocument doc = ScratchpadDocument::CreateEmpty(At(0));
    doc.logInterruption(MakeItem("an idea", ItemType::Idea, Priority::High, At(1)));
    const std::string valid = MarkdownCodec::Serialize(doc);

    assert(ParseFails(""));
    assert(ParseFails("just some notes\n"));

    std::string noArchive = valid;
    ReplaceFirst(noArchive, "Archived / Dismissed", "Other Stuff");
    assert(ParseFails(noArchive));

    std::string newer = valid;
    ReplaceFirst(newer, "<!-- scratchpad-format: 1 -->", "<!-- scratchpad-format: 99 -->");
    assert(ParseFails(newer));

    std::string badType = valid;
    ReplaceFirst(badType, "💡 Idea |", "💡 Gadget |");
    assert(ParseFails(badType));

    std::string badStamp = valid;
    ReplaceFirst(badStamp, "| `" + FormatTimestamp(At(1)) + "`", "| yesterday");
    assert(ParseFails(badStamp));

    std::string missingCell = valid;
    ReplaceFirst(missingCell, " | 🔴 High |", " |");
    assert(ParseFails(missingCell));
    std::cout << "[PASS] Malformed documents." << std::endl;
}

static void TestTimestamps() {
    std::cout << "[Test] Timestamp format..." << std::endl;
    Timestamp ts(std::chrono::seconds(0));
    assert(FormatTimestamp(ts) == "1970-01-01T00:00:00Z");
    assert(ParseTimestamp("1970-01-01T00:00:00Z") == ts);
    assert(ParseTimestamp(FormatTimestamp(At(12345))) == At(12345));
    assert(!ParseTimestamp("1970-01-01 00:00:00"));
    assert(!ParseTimestamp("not a timestamp"));
    std::cout << "[PASS] Timestamp format." << std::endl;
}

int main() {
    TestTransfers();
    TestRoundTrip();
    TestStatisticsAreDerived();
    TestMalformed();
    TestTimestamps();
    std::cout << "[PASS] All ScratchpadDocument tests." << std::endl;
    return 0;
}
