#pragma once

#include <string>

// Picks the headword a phrase is stored under.
//
// The phrase is lowercased, bracketed annotations ("(away)", "{f}",
// "[coll.]") are removed in a single pass, ". , < >" become spaces and the
// longest remaining token wins, the first one on ties. Length is counted in
// code points. Returns an empty string when nothing is left, such phrases are
// not indexed.
//
// A bracket span never contains another opening bracket of its own kind, so
// for nested brackets only the innermost span is removed.
std::string extract_key(const std::string& phrase);
