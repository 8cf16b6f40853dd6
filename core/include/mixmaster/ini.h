#pragma once

#include <string>
#include <utility>
#include <vector>

namespace mixmaster {

struct IniSection {
    std::string name;
    std::vector<std::pair<std::string, std::string>> entries;

    // Replaces the value of an existing key, otherwise appends.
    void set(const std::string& key, const std::string& value);
    const std::string* find(const std::string& key) const;
};

// Sectioned key/value document. Sections keep insertion order; a section
// name that appears twice in the input is merged into the first one.
struct IniDocument {
    std::vector<IniSection> sections;

    IniSection& section(const std::string& name); // find or append
    const IniSection* find(const std::string& name) const;
};

// Parses INI text. Keys and values are stored raw (trimmed, not
// unescaped); callers that wrote escaped values apply ini_unescape.
// Returns false and sets *err ("line N: ...") on the first bad line.
bool ini_parse(const std::string& text, IniDocument* out, std::string* err);

std::string ini_write(const IniDocument& doc);

// Backslash-escapes everything that could end a value early or start a
// new key or section: backslash, CR, LF, TAB, '=', ';', '#', '[', ']', and
// leading/trailing spaces (which the parser would otherwise trim).
std::string ini_escape(const std::string& s);

// Inverse of ini_escape. Unknown sequences are kept as-is.
std::string ini_unescape(const std::string& s);

} // namespace mixmaster
