#include <exegrader/language/language_registry.hpp>

#include "common/strings.hpp"

#include <exegrader/exceptions.hpp>
#include <exegrader/language/language_profile.hpp>
#include <exegrader/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace exegrader {

LanguageRegistry::LanguageRegistry(std::vector<LanguageProfile> profiles)
    : profiles_{std::move(profiles)} {
    for (auto iter = profiles_.begin(); iter != profiles_.end(); ++iter) {
        const LanguageProfile& profile = *iter;

        if (profile.id.empty()) {
            throw std::invalid_argument("Language profile with an empty id");
        }

        if (profile.run_command.empty()) {
            throw std::invalid_argument(fmt::format("Language profile {:?} has an empty run command", profile.id));
        }

        if (profile.compile_command && profile.compile_command->empty()) {
            throw std::invalid_argument(fmt::format("Language profile {:?} has an empty compile command", profile.id));
        }

        if (profile.timeout <= std::chrono::seconds::zero()) {
            throw std::invalid_argument(fmt::format("Language profile {:?} has a non-positive timeout", profile.id));
        }

        auto same_id = [&profile](const LanguageProfile& other) { return iequals(other.id, profile.id); };
        if (ranges::find_if(profiles_.begin(), iter, same_id) != iter) {
            throw std::invalid_argument(fmt::format("Duplicate language profile {:?}", profile.id));
        }
    }

    LOG_DEBUG("Language registry initialized with {}", ids());
}

LanguageRegistry LanguageRegistry::with_defaults() {
    return LanguageRegistry{default_profiles()};
}

std::vector<LanguageProfile> LanguageRegistry::default_profiles() {
    using namespace std::chrono_literals;

    return {
        LanguageProfile{
            .id = "python",
            .source_extension = ".py",
            .compile_command = std::nullopt,
            .run_command = {"python3", "{source}"},
            .timeout = 8s,
        },
        LanguageProfile{
            .id = "c",
            .source_extension = ".c",
            .compile_command = std::vector<std::string>{"gcc", "{source}", "-o", "{binary}"},
            .run_command = {"{binary}"},
            .timeout = 10s,
        },
        LanguageProfile{
            .id = "cpp",
            .source_extension = ".cpp",
            .compile_command = std::vector<std::string>{"g++", "{source}", "-o", "{binary}"},
            .run_command = {"{binary}"},
            .timeout = 10s,
        },
    };
}

std::optional<std::reference_wrapper<const LanguageProfile>>
LanguageRegistry::resolve(std::string_view language_id) const {
    auto iter =
        ranges::find_if(profiles_, [language_id](const LanguageProfile& prof) { return iequals(prof.id, language_id); });

    if (iter == profiles_.end()) {
        return std::nullopt;
    }

    return *iter;
}

const LanguageProfile& LanguageRegistry::get(std::string_view language_id) const {
    auto profile = resolve(language_id);

    if (!profile) {
        LOG_DEBUG("No profile registered for language {:?}", language_id);
        throw UnsupportedLanguageError{language_id};
    }

    return profile->get();
}

std::optional<std::reference_wrapper<const LanguageProfile>>
LanguageRegistry::find_by_extension(std::string_view extension) const {
    auto iter = ranges::find_if(
        profiles_, [extension](const LanguageProfile& prof) { return iequals(prof.source_extension, extension); });

    if (iter == profiles_.end()) {
        return std::nullopt;
    }

    return *iter;
}

std::vector<std::string_view> LanguageRegistry::ids() const {
    return profiles_ | ranges::views::transform([](const LanguageProfile& prof) -> std::string_view { return prof.id; }) |
           ranges::to<std::vector>();
}

} // namespace exegrader
