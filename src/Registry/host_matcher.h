#pragma once

#include <string>
#include <string_view>

namespace registry {

/**
 * Ratcliff/Obershelp similarity in [0, 1]: 2*M / (|a| + |b|), where M is the
 * number of characters in the longest common block plus, recursively, the
 * matches on both sides of it. Two empty strings score 1.
 * Comparison is byte-wise; callers lowercase first for case-insensitive scores.
 */
double similarityRatio(std::string_view a, std::string_view b);

struct SanitizedHostname
{
    std::string hostname;
    bool modified = false;
};

/**
 * Strip artifacts from a hostname extracted from free text:
 * markup tags, anything after '/', a ":port" suffix, characters outside
 * [A-Za-z0-9.-], and leading/trailing dots and hyphens.
 * Literal IPv4/IPv6 addresses are returned untouched.
 */
SanitizedHostname sanitizeHostname(std::string_view raw);

} // namespace registry
