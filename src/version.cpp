#include "backport/version.hpp"
#include "backport/errors.hpp"

#include <algorithm>

namespace backport {

Version Version::parse(std::string_view text)
{
    if (text.empty())
        throw configuration_error("empty version string");
    std::vector<uint32_t> parts;
    uint64_t cur = 0;
    bool have_digit = false;
    for (char c : text)
    {
        if (c >= '0' && c <= '9')
        {
            cur = cur * 10 + static_cast<uint64_t>(c - '0');
            if (cur > 0xFFFFFFFFull)
                throw configuration_error("version component out of range: '" + std::string(text) + "'");
            have_digit = true;
        }
        else if (c == '.')
        {
            if (!have_digit)
                throw configuration_error("invalid version string: '" + std::string(text) + "'");
            parts.push_back(static_cast<uint32_t>(cur));
            cur = 0;
            have_digit = false;
        }
        else
        {
            throw configuration_error("invalid version string: '" + std::string(text) + "'");
        }
    }
    if (!have_digit)
        throw configuration_error("invalid version string: '" + std::string(text) + "'");
    parts.push_back(static_cast<uint32_t>(cur));
    return Version(std::move(parts));
}

std::string Version::to_string() const
{
    std::string out;
    for (size_t i = 0; i < components_.size(); ++i)
    {
        if (i)
            out += '.';
        out += std::to_string(components_[i]);
    }
    return out;
}

int compare(const Version &a, const Version &b)
{
    const size_t n = std::max(a.components_.size(), b.components_.size());
    for (size_t i = 0; i < n; ++i)
    {
        uint32_t x = i < a.components_.size() ? a.components_[i] : 0;
        uint32_t y = i < b.components_.size() ? b.components_[i] : 0;
        if (x != y)
            return x < y ? -1 : 1;
    }
    return 0;
}

int compare_prefix(const Version &a, const Version &bound)
{
    std::vector<uint32_t> head(a.components_.begin(),
                               a.components_.begin() + std::min(a.components_.size(), bound.components_.size()));
    return compare(Version(std::move(head)), bound);
}

VersionInfo::VersionInfo(std::string_view since, std::string_view until,
                         std::optional<std::string_view> w_since,
                         std::optional<std::string_view> w_until)
    : apply_since(Version::parse(since)),
      apply_until(Version::parse(until)),
      works_since(w_since ? Version::parse(*w_since) : apply_since)
{
    if (w_until)
        works_until = Version::parse(*w_until);
    if (apply_until < apply_since)
        throw configuration_error("apply window is empty: " + apply_since.to_string() + ".." + apply_until.to_string());
    if (works_until && *works_until < works_since)
        throw configuration_error("works window is empty: " + works_since.to_string() + ".." + works_until->to_string());
}

std::string VersionInfo::to_string() const
{
    std::string out = "apply " + apply_since.to_string() + ".." + apply_until.to_string();
    out += ", works " + works_since.to_string() + "..";
    out += works_until ? works_until->to_string() : std::string("*");
    return out;
}

} // namespace backport
