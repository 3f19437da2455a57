#pragma once

#include <exegrader/language/language_profile.hpp>

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace exegrader {

/// An immutable table of language profiles.
///
/// Constructed once at startup and handed by reference to the ExecutionBackend; there is no
/// runtime registration. Extending the supported languages means adding a profile here.
class LanguageRegistry
{
public:
    /// Validates every profile; throws std::invalid_argument if a profile has an empty id or
    /// run command, a non-positive timeout, or an id already taken (compared case-insensitively)
    explicit LanguageRegistry(std::vector<LanguageProfile> profiles);

    /// Registry holding `default_profiles()`
    static LanguageRegistry with_defaults();

    /// python (interpreted), c and cpp (compile-then-run)
    static std::vector<LanguageProfile> default_profiles();

    /// Case-insensitive lookup of a profile by id
    std::optional<std::reference_wrapper<const LanguageProfile>> resolve(std::string_view language_id) const;

    /// Like `resolve`, but throws UnsupportedLanguageError on a miss
    const LanguageProfile& get(std::string_view language_id) const;

    /// Finds the profile generating files with the given extension (e.g., ".c")
    std::optional<std::reference_wrapper<const LanguageProfile>> find_by_extension(std::string_view extension) const;

    std::vector<std::string_view> ids() const;

    const std::vector<LanguageProfile>& get_profiles() const noexcept { return profiles_; }

private:
    std::vector<LanguageProfile> profiles_;
};

} // namespace exegrader
