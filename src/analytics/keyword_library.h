#pragma once

/// @file keyword_library.h
/// @brief Maps well-known Robot Framework keywords to their library

#include <string>
#include <string_view>

#include "model/types.h"

namespace runlens::analytics {

/// Returned when a keyword cannot be attributed to any library
inline constexpr std::string_view kUnknownLibrary = "Unknown";

/// @brief Library owning a keyword name (case-insensitive exact match)
///
/// The table covers BuiltIn, Collections, String, OperatingSystem, DateTime,
/// Process, XML, SeleniumLibrary, Browser, RequestsLibrary, DatabaseLibrary
/// and SSHLibrary. When several libraries define the same name the first in
/// that order wins.
/// @return Library name, or kUnknownLibrary
std::string ResolveLibrary(std::string_view keyword_name);

/// @brief Library of a recorded call
///
/// Recorded library first, then the static table, then BuiltIn for setup
/// and teardown calls.
std::string ResolveCallLibrary(const KeywordCall& call);

/// @brief Number of distinct keyword names in the table
size_t KnownKeywordCount();

}  // namespace runlens::analytics
