#include "mixmaster/ini.h"

#include <sstream>

namespace mixmaster {

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) b++;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) e--;
    return s.substr(b, e - b);
}

// Position of the first '=' not preceded by an escaping backslash.
static size_t find_separator(const std::string& line) {
    for (size_t i = 0; i < line.size(); i++) {
        if (line[i] == '\\') { i++; continue; }
        if (line[i] == '=') return i;
    }
    return std::string::npos;
}

void IniSection::set(const std::string& key, const std::string& value) {
    for (auto& kv : entries) {
        if (kv.first == key) { kv.second = value; return; }
    }
    entries.emplace_back(key, value);
}

const std::string* IniSection::find(const std::string& key) const {
    for (const auto& kv : entries) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

IniSection& IniDocument::section(const std::string& name) {
    for (auto& s : sections) {
        if (s.name == name) return s;
    }
    sections.push_back(IniSection{name, {}});
    return sections.back();
}

const IniSection* IniDocument::find(const std::string& name) const {
    for (const auto& s : sections) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

bool ini_parse(const std::string& text, IniDocument* out, std::string* err) {
    IniDocument doc;
    IniSection* current = nullptr;
    std::istringstream iss(text);
    std::string raw;
    int lineno = 0;

    while (std::getline(iss, raw)) {
        lineno++;
        if (!raw.empty() && raw.back() == '\r') raw.pop_back();
        std::string line = trim(raw);
        if (line.empty() || line[0] == ';' || line[0] == '#') continue;

        if (line[0] == '[') {
            if (line.back() != ']' || line.size() < 3) {
                if (err) *err = "line " + std::to_string(lineno) + ": bad section header";
                return false;
            }
            current = &doc.section(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        size_t eq = find_separator(line);
        if (eq == std::string::npos) {
            if (err) *err = "line " + std::to_string(lineno) + ": expected key = value";
            return false;
        }
        if (!current) {
            if (err) *err = "line " + std::to_string(lineno) + ": key outside of any section";
            return false;
        }
        std::string key = trim(line.substr(0, eq));
        if (key.empty()) {
            if (err) *err = "line " + std::to_string(lineno) + ": empty key";
            return false;
        }
        current->set(key, trim(line.substr(eq + 1)));
    }

    if (out) *out = std::move(doc);
    return true;
}

std::string ini_write(const IniDocument& doc) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& s : doc.sections) {
        if (!first) oss << "\n";
        first = false;
        oss << "[" << s.name << "]\n";
        for (const auto& kv : s.entries) {
            oss << kv.first << " = " << kv.second << "\n";
        }
    }
    return oss.str();
}

std::string ini_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '=': case ';': case '#': case '[': case ']':
                out += '\\';
                out += c;
                break;
            case ' ':
                if (i == 0 || i + 1 == s.size()) out += "\\s";
                else out += c;
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

std::string ini_unescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (c != '\\' || i + 1 == s.size()) {
            out += c;
            continue;
        }
        char n = s[++i];
        switch (n) {
            case '\\': out += '\\'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 's':  out += ' '; break;
            case '=': case ';': case '#': case '[': case ']':
                out += n;
                break;
            default:
                out += '\\';
                out += n;
                break;
        }
    }
    return out;
}

} // namespace mixmaster
