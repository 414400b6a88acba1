#pragma once
#include <string>

// Canonical form of an entity's source: comments dropped, whitespace runs
// collapsed, quoting unified, line endings and indentation width erased.
// Total over any input; malformed text is normalized as opaque characters.
std::string normalize_source(const std::string& raw, const std::string& language = "");

std::string sha256_hex(const std::string& bytes);

// "sha256:<64 hex>" over normalize_source(raw, language).
std::string normalize_and_fingerprint(const std::string& raw, const std::string& language = "");

bool is_fingerprint(const std::string& s);
