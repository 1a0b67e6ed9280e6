#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/InputSanitizer.hpp"
#include "domain/ScratchpadError.hpp"

using namespace scratchpad::application;
using namespace scratchpad::domain;

template <typename Fn>
static ScratchpadError Capture(Fn&& fn) {
    try {
        fn();
    } catch (const ScratchpadError& e) {
        return e;
    }
    assert(false && "expected ScratchpadError");
    return ScratchpadError(ErrorKind::None, "");
}

int main() {
    std::cout << "[Test] Starting InputSanitizer Test..." << std::endl;
    InputSanitizer sanitizer;

    // Values pass through unchanged.
    assert(sanitizer.validate("note", "Fix the login bug", FieldKind::Note, 500) == "Fix the login bug");
    assert(sanitizer.validate("note", "  padded | pipe_x  ", FieldKind::Note, 500) == "  padded | pipe_x  ");
    assert(sanitizer.validate("note", "line one\nline two\ttab", FieldKind::Note, 500) == "line one\nline two\ttab");
    assert(sanitizer.validate("note", "home is ~ here", FieldKind::Note, 500) == "home is ~ here");

    // Length is counted in characters, not bytes.
    assert(sanitizer.validate("note", std::string(500, 'a'), FieldKind::Note, 500).size() == 500);
    std::string accented;
    for (int i = 0; i < 500; ++i) accented += "é";
    assert(sanitizer.validate("note", accented, FieldKind::Note, 500) == accented);
    assert(InputSanitizer::Utf8Length(accented) == std::size_t(500));

    auto tooLong = Capture([&] { sanitizer.validate("note", std::string(501, 'a'), FieldKind::Note, 500); });
    assert(tooLong.kind() == ErrorKind::ValidationError);
    assert(tooLong.field() == "note");
    assert(tooLong.reason() == "exceeds maximum length of 500 characters");

    auto longTask = Capture([&] { sanitizer.validate("task", std::string(201, 'a'), FieldKind::Task, 200); });
    assert(longTask.field() == "task");

    // Required
    assert(Capture([&] { sanitizer.validate("note", "", FieldKind::Note, 500); }).reason() == "is required");
    assert(Capture([&] { sanitizer.validate("task", "   \t", FieldKind::Task, 200); }).reason() == "is required");

    // Blocked patterns, case-insensitive
    const std::vector<std::string> blocked{"wait...", "run `rm -rf`", "costs $5", "<SCRIPT>alert(1)</script>",
                                  "JavaScript:void(0)", "see FILE:///etc/passwd", std::string("a\0b", 3)};
    for (const auto& bad : blocked) {
        auto e = Capture([&] { sanitizer.validate("note", bad, FieldKind::Note, 500); });
        assert(e.kind() == ErrorKind::ValidationError);
        assert(e.publicMessage().find(bad) == std::string::npos);
    }

    // Control characters and invalid UTF-8
    assert(Capture([&] { sanitizer.validate("note", "bell\x07", FieldKind::Note, 500); }).kind() == ErrorKind::ValidationError);
    assert(Capture([&] { sanitizer.validate("note", "bad \xff byte", FieldKind::Note, 500); }).kind() == ErrorKind::ValidationError);
    assert(!InputSanitizer::Utf8Length("\xc3"));
    assert(!InputSanitizer::Utf8Length("\xed\xa0\x80"));     // surrogate half
    assert(!InputSanitizer::Utf8Length("\xe0\x80\xaf"));     // overlong '/'
    assert(!InputSanitizer::Utf8Length("\xf0\x80\x80\xaf")); // overlong '/'
    assert(!InputSanitizer::Utf8Length("\xf4\x90\x80\x80")); // above U+10FFFF
    assert(!InputSanitizer::Utf8Length("\xc0\xaf"));
    assert(InputSanitizer::Utf8Length("\xed\x9f\xbf") == std::size_t(1));
    assert(InputSanitizer::Utf8Length("\xf4\x8f\xbf\xbf") == std::size_t(1));
    assert(InputSanitizer::Utf8Length("\xe0\xa0\x80") == std::size_t(1));
    assert(Capture([&] { sanitizer.validate("note", "ok \xed\xa0\x80", FieldKind::Note, 500); }).kind() == ErrorKind::ValidationError);

    // Path fields report blocked patterns as path violations and also reject '~'.
    assert(Capture([&] { sanitizer.validate("location", "../../etc/passwd.md", FieldKind::Path, 256); }).kind() == ErrorKind::PathViolation);
    assert(Capture([&] { sanitizer.validate("location", "~/scratchpad.md", FieldKind::Path, 256); }).kind() == ErrorKind::PathViolation);
    assert(sanitizer.validate("location", ".idea/scratchpad.md", FieldKind::Path, 256) == ".idea/scratchpad.md");
    auto longPath = Capture([&] { sanitizer.validate("location", ".idea/" + std::string(260, 'a') + ".md", FieldKind::Path, 256); });
    assert(longPath.kind() == ErrorKind::PathTooLong);
    assert(longPath.publicMessage() == "Path exceeds maximum length");

    // Enumerations
    assert(sanitizer.validateType(std::nullopt) == ItemType::Note);
    assert(sanitizer.validateType(std::string("IDEA")) == ItemType::Idea);
    assert(sanitizer.validateType(std::string(" Bug ")) == ItemType::Bug);
    assert(sanitizer.validateType(std::string("refactor")) == ItemType::Refactor);
    assert(sanitizer.validatePriority(std::nullopt) == Priority::Medium);
    assert(sanitizer.validatePriority(std::string("High")) == Priority::High);

    auto badType = Capture([&] { sanitizer.validateType(std::string("malicious")); });
    assert(badType.kind() == ErrorKind::InvalidEnumValue);
    assert(badType.field() == "type");
    assert(badType.publicMessage().find("malicious") == std::string::npos);
    assert(std::string(badType.what()).find("malicious") == std::string::npos);

    auto badPriority = Capture([&] { sanitizer.validatePriority(std::string("urgent")); });
    assert(badPriority.kind() == ErrorKind::InvalidEnumValue);
    assert(badPriority.field() == "priority");

    std::cout << "[PASS] InputSanitizer Test." << std::endl;
    return 0;
}
