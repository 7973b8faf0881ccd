#pragma once

namespace serve::url {

// Decodes percent-encoded sequences of [first, last) in place and returns the new logical end.
// '+' is kept as is (path semantics, not form encoding).
// Returns nullptr if an escape sequence is truncated or contains non hexadecimal digits.
char* DecodeInPlace(char* first, const char* last);

}  // namespace serve::url
