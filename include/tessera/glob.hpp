#pragma once

#include <tessera/result.hpp>
#include <string>
#include <vector>

namespace tessera {

// Normalize a filespec or relative path: backslashes become '/', repeated
// slashes collapse, a leading "./" and a trailing '/' are dropped.
std::string glob_normalize(const std::string& path);

// Match a glob pattern against a relative path (both normalized).
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9]
// Pattern and path are read as UTF-8, so `?` and classes match whole code
// points. Bytes that are not valid UTF-8 each count as one character.
bool glob_match(const std::string& pattern, const std::string& path);

// True when some path strictly below `dir` could match `pattern`.
// `dir` is relative to the root; "" is the root itself. Used by the
// walker to skip subtrees no filespec can reach.
bool glob_could_match_below(const std::string& pattern, const std::string& dir);

// Reject filespecs that can never be resolved under a root: empty,
// absolute, containing "." or ".." segments, or with an unterminated
// character class.
Status glob_validate(const std::string& pattern);

} // namespace tessera
