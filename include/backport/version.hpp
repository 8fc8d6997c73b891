// Target versions and fixer applicability windows.
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace backport {

// Dotted numeric version ("2.7", "3.10", "3.4.1"). Missing trailing
// components compare as zero, so 3.7 == 3.7.0.
class Version {
public:
    Version() = default;
    explicit Version(std::vector<uint32_t> components) : components_(std::move(components)) {}

    // Throws configuration_error on anything but digits separated by single dots.
    static Version parse(std::string_view text);

    const std::vector<uint32_t> &components() const { return components_; }
    std::string to_string() const;

    friend int compare(const Version &a, const Version &b);
    // Compares a against bound using only the components bound names, so
    // 2.7.18 equals 2.7 here while compare() orders it after.
    friend int compare_prefix(const Version &a, const Version &bound);
    friend bool operator==(const Version &a, const Version &b) { return compare(a, b) == 0; }
    friend bool operator!=(const Version &a, const Version &b) { return compare(a, b) != 0; }
    friend bool operator<(const Version &a, const Version &b) { return compare(a, b) < 0; }
    friend bool operator<=(const Version &a, const Version &b) { return compare(a, b) <= 0; }
    friend bool operator>(const Version &a, const Version &b) { return compare(a, b) > 0; }
    friend bool operator>=(const Version &a, const Version &b) { return compare(a, b) >= 0; }

private:
    std::vector<uint32_t> components_;
};

// Applicability window of a fixer or checker.
//   apply_since..apply_until  versions for which running it is mandatory
//   works_since..works_until  versions for which running it is harmless
// works_since defaults to apply_since; an absent works_until is open-ended.
// An upper bound covers every release below it: "2.7" holds 2.7.18.
struct VersionInfo {
    Version apply_since;
    Version apply_until;
    Version works_since;
    std::optional<Version> works_until;

    VersionInfo(std::string_view apply_since, std::string_view apply_until,
                std::optional<std::string_view> works_since = std::nullopt,
                std::optional<std::string_view> works_until = std::nullopt);

    bool is_required_for(const Version &v) const
    {
        return apply_since <= v && compare_prefix(v, apply_until) <= 0;
    }
    bool is_compatible_with(const Version &v) const
    {
        return works_since <= v && (!works_until || compare_prefix(v, *works_until) <= 0);
    }
    // True when the apply windows share at least one version.
    bool overlaps(const VersionInfo &other) const
    {
        return compare_prefix(apply_since, other.apply_until) <= 0 &&
               compare_prefix(other.apply_since, apply_until) <= 0;
    }
    std::string to_string() const;
};

} // namespace backport
