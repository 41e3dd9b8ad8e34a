#include "HttpTransport.hpp"

#include <algorithm>
#include <cctype>

bool CaseInsensitiveLess::operator()(const std::string& lhs, const std::string& rhs) const noexcept
{
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](unsigned char a, unsigned char b) { return std::tolower(a) < std::tolower(b); });
}

std::string HttpResponse::Header(const std::string& name) const
{
    const auto it = headers.find(name);
    if (it == headers.end())
        return "";

    return it->second;
}
