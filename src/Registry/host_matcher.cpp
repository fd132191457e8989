#include "host_matcher.h"

#include <arpa/inet.h>

#include <cctype>
#include <vector>

namespace registry {

namespace {

struct Block
{
    size_t a;
    size_t b;
    size_t size;
};

// Longest common block of a[alo, ahi) and b[blo, bhi); earliest in a, then in b, wins ties
Block longestMatch(std::string_view a, size_t alo, size_t ahi,
                   std::string_view b, size_t blo, size_t bhi)
{
    Block best{alo, blo, 0};
    std::vector<size_t> prev(bhi - blo + 1, 0);
    std::vector<size_t> cur(bhi - blo + 1, 0);

    for (size_t i = alo; i < ahi; ++i)
    {
        for (size_t j = blo; j < bhi; ++j)
        {
            size_t col = j - blo + 1;
            if (a[i] == b[j])
            {
                cur[col] = prev[col - 1] + 1;
                if (cur[col] > best.size)
                {
                    best.size = cur[col];
                    best.a = i + 1 - best.size;
                    best.b = j + 1 - best.size;
                }
            }
            else
            {
                cur[col] = 0;
            }
        }
        std::swap(prev, cur);
    }
    return best;
}

size_t matchingCharacters(std::string_view a, size_t alo, size_t ahi,
                          std::string_view b, size_t blo, size_t bhi)
{
    if (alo >= ahi || blo >= bhi)
        return 0;

    Block m = longestMatch(a, alo, ahi, b, blo, bhi);
    if (m.size == 0)
        return 0;

    return m.size
         + matchingCharacters(a, alo, m.a, b, blo, m.b)
         + matchingCharacters(a, m.a + m.size, ahi, b, m.b + m.size, bhi);
}

bool isIpLiteral(const std::string& s)
{
    unsigned char buf[16];
    return inet_pton(AF_INET, s.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, s.c_str(), buf) == 1;
}

std::string stripTags(std::string_view in)
{
    std::string out;
    out.reserve(in.size());

    size_t i = 0;
    while (i < in.size())
    {
        if (in[i] == '<')
        {
            size_t name = i + 1;
            if (name < in.size() && in[name] == '/')
                ++name;
            size_t close = in.find('>', i);
            if (name < in.size() && std::isalpha(static_cast<unsigned char>(in[name])) &&
                close != std::string_view::npos)
            {
                i = close + 1;
                continue;
            }
        }
        out.push_back(in[i]);
        ++i;
    }
    return out;
}

} // namespace

double similarityRatio(std::string_view a, std::string_view b)
{
    size_t total = a.size() + b.size();
    if (total == 0)
        return 1.0;

    size_t matches = matchingCharacters(a, 0, a.size(), b, 0, b.size());
    return 2.0 * static_cast<double>(matches) / static_cast<double>(total);
}

SanitizedHostname sanitizeHostname(std::string_view raw)
{
    SanitizedHostname result;
    result.hostname = std::string(raw);
    if (raw.empty() || isIpLiteral(result.hostname))
        return result;

    std::string s = stripTags(raw);

    size_t slash = s.find('/');
    if (slash != std::string::npos)
        s.erase(slash);

    // host:22 -> host; bracketed IPv6 is left alone
    size_t colon = s.find(':');
    if (colon != std::string::npos && s.front() != '[')
        s.erase(colon);

    std::string clean;
    clean.reserve(s.size());
    for (char c : s)
    {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x80 && (std::isalnum(u) || c == '-' || c == '.'))
            clean.push_back(c);
    }

    size_t first = clean.find_first_not_of(".-");
    if (first == std::string::npos)
    {
        clean.clear();
    }
    else
    {
        size_t last = clean.find_last_not_of(".-");
        clean = clean.substr(first, last - first + 1);
    }

    result.modified = clean != raw;
    result.hostname = std::move(clean);
    return result;
}

} // namespace registry
