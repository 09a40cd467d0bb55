#include <tessera/glob.hpp>
#include <utility>

namespace tessera {

// ---- Helpers ----

static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    if (s.empty()) return segs;
    size_t begin = 0;
    while (true) {
        size_t slash = s.find('/', begin);
        if (slash == std::string::npos) {
            segs.push_back(s.substr(begin));
            return segs;
        }
        segs.push_back(s.substr(begin, slash - begin));
        begin = slash + 1;
    }
}

namespace {

// Decode UTF-8 into code points. A byte that does not start a well-formed
// sequence becomes U+DC00 + byte, which no valid sequence decodes to, so
// invalid names still match themselves byte for byte.
std::u32string decode_utf8(const std::string& s) {
    std::u32string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        auto b = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        char32_t cp = 0;
        char32_t min = 0;
        if (b < 0x80)                { len = 1; cp = b; }
        else if ((b & 0xE0) == 0xC0) { len = 2; cp = b & 0x1F; min = 0x80; }
        else if ((b & 0xF0) == 0xE0) { len = 3; cp = b & 0x0F; min = 0x800; }
        else if ((b & 0xF8) == 0xF0) { len = 4; cp = b & 0x07; min = 0x10000; }

        bool valid = len > 0 && i + len <= s.size();
        for (size_t k = 1; valid && k < len; ++k) {
            auto cb = static_cast<unsigned char>(s[i + k]);
            if ((cb & 0xC0) != 0x80) valid = false;
            cp = (cp << 6) | (cb & 0x3F);
        }
        if (valid && len > 1) {
            valid = cp >= min && cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
        }

        if (valid) {
            out.push_back(cp);
            i += len;
        } else {
            out.push_back(0xDC00 + b);
            ++i;
        }
    }
    return out;
}

// One unit of a segment pattern.
struct Token {
    enum Kind { Literal, AnyChar, Star, Class } kind = Literal;
    char32_t ch = 0;
    bool negate = false;
    std::vector<std::pair<char32_t, char32_t>> ranges;  // inclusive

    bool accepts(char32_t c) const {
        switch (kind) {
            case Literal: return c == ch;
            case AnyChar: return true;
            case Star:    return true;
            case Class: {
                bool hit = false;
                for (const auto& [lo, hi] : ranges) {
                    if (c >= lo && c <= hi) { hit = true; break; }
                }
                return hit != negate;
            }
        }
        return false;
    }
};

// An unterminated '[' is taken literally; glob_validate rejects it earlier.
std::vector<Token> tokenize(const std::u32string& pat) {
    std::vector<Token> tokens;
    for (size_t i = 0; i < pat.size(); ++i) {
        Token t;
        char32_t c = pat[i];
        if (c == U'*') {
            if (!tokens.empty() && tokens.back().kind == Token::Star) continue;
            t.kind = Token::Star;
        } else if (c == U'?') {
            t.kind = Token::AnyChar;
        } else if (c == U'[' && pat.find(U']', i + 1) != std::u32string::npos) {
            size_t j = i + 1;
            t.kind = Token::Class;
            if (pat[j] == U'!') { t.negate = true; ++j; }
            while (pat[j] != U']') {
                if (j + 2 < pat.size() && pat[j + 1] == U'-' && pat[j + 2] != U']') {
                    t.ranges.emplace_back(pat[j], pat[j + 2]);
                    j += 3;
                } else {
                    t.ranges.emplace_back(pat[j], pat[j]);
                    ++j;
                }
            }
            i = j;
        } else {
            t.ch = c;
        }
        tokens.push_back(std::move(t));
    }
    return tokens;
}

// Wildcard matching with single-point backtracking: `is_star(p)` units
// absorb any run of items, the rest must accept exactly one item.
template<typename IsStar, typename Accepts>
bool wildcard_match(size_t pat_len, size_t item_len, IsStar is_star, Accepts accepts) {
    size_t p = 0;
    size_t s = 0;
    size_t star = std::string::npos;
    size_t resume = 0;
    while (s < item_len) {
        if (p < pat_len && is_star(p)) {
            star = p++;
            resume = s;
        } else if (p < pat_len && accepts(p, s)) {
            ++p;
            ++s;
        } else if (star != std::string::npos) {
            p = star + 1;
            s = ++resume;
        } else {
            return false;
        }
    }
    while (p < pat_len && is_star(p)) ++p;
    return p == pat_len;
}

bool match_segment(const std::string& pat, const std::string& name) {
    auto tokens = tokenize(decode_utf8(pat));
    auto chars = decode_utf8(name);
    return wildcard_match(tokens.size(), chars.size(),
        [&](size_t p) { return tokens[p].kind == Token::Star; },
        [&](size_t p, size_t s) { return tokens[p].accepts(chars[s]); });
}

// '**' spans zero or more whole segments, so a trailing '**' also matches
// the directory that holds it.
bool match_segments(const std::vector<std::string>& pat, const std::vector<std::string>& path) {
    return wildcard_match(pat.size(), path.size(),
        [&](size_t p) { return pat[p] == "**"; },
        [&](size_t p, size_t s) { return match_segment(pat[p], path[s]); });
}

} // namespace

// ---- Public API ----

std::string glob_normalize(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '\\') c = '/';
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    while (out.size() >= 2 && out[0] == '.' && out[1] == '/') {
        out.erase(0, 2);
    }
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

bool glob_match(const std::string& pattern, const std::string& path) {
    auto pat_segs = split_segments(glob_normalize(pattern));
    auto path_segs = split_segments(glob_normalize(path));
    if (pat_segs.empty()) return path_segs.empty();
    return match_segments(pat_segs, path_segs);
}

bool glob_could_match_below(const std::string& pattern, const std::string& dir) {
    auto pat_segs = split_segments(glob_normalize(pattern));
    auto dir_segs = split_segments(glob_normalize(dir));

    size_t pi = 0;
    size_t si = 0;
    while (pi < pat_segs.size() && si < dir_segs.size()) {
        if (pat_segs[pi] == "**") return true;
        if (!match_segment(pat_segs[pi], dir_segs[si])) return false;
        pi++;
        si++;
    }
    // The directory is consumed; a descendant needs pattern left over.
    return si == dir_segs.size() && pi < pat_segs.size();
}

Status glob_validate(const std::string& pattern) {
    auto norm = glob_normalize(pattern);
    if (norm.empty()) {
        return TesseraError(TesseraError::InvalidArg,
            "empty filespec", "use \"**\" to match everything under the root");
    }
    if (norm[0] == '/') {
        return TesseraError(TesseraError::InvalidArg,
            "absolute filespec not allowed: " + pattern,
            "filespecs are relative to the snapshot root");
    }
    for (const auto& seg : split_segments(norm)) {
        if (seg == "." || seg == "..") {
            return TesseraError(TesseraError::InvalidArg,
                "filespec may not contain '" + seg + "' segments: " + pattern,
                "filespecs cannot reach outside the snapshot root");
        }
        bool in_class = false;
        for (char c : seg) {
            if (c == '[') in_class = true;
            else if (c == ']') in_class = false;
        }
        if (in_class) {
            return TesseraError(TesseraError::InvalidArg,
                "unterminated character class in filespec: " + pattern);
        }
    }
    return ok_status();
}

} // namespace tessera
