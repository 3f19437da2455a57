#include <exegrader/grading/exercise_store.hpp>

#include "common/files.hpp"
#include "common/strings.hpp"

#include <exegrader/common/error_types.hpp>
#include <exegrader/grading/test_case.hpp>
#include <exegrader/logging.hpp>

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/sort.hpp>

#include <cctype>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace exegrader {

void InMemoryExerciseStore::add(std::string exercise_id, std::vector<TestCase> test_cases) {
    ranges::sort(test_cases, {}, &TestCase::id);
    exercises_.insert_or_assign(std::move(exercise_id), std::move(test_cases));
}

Result<std::vector<TestCase>> InMemoryExerciseStore::load(std::string_view exercise_id) const {
    auto iter = exercises_.find(exercise_id);

    if (iter == exercises_.end()) {
        return ErrorKind::ExerciseNotFound;
    }

    return iter->second;
}

namespace {

/// Parses a whole string as a non-negative decimal integer
std::optional<int> parse_int(std::string_view str) {
    if (str.empty() || !ranges::all_of(str, [](char chr) { return std::isdigit(static_cast<unsigned char>(chr)); })) {
        return std::nullopt;
    }

    int value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);

    if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
    }

    return value;
}

/// Files found for one test id
struct TestFiles
{
    std::optional<std::filesystem::path> out;
    std::optional<std::filesystem::path> in;
    std::optional<std::filesystem::path> timeout;
    bool hidden = false;
};

} // namespace

DirectoryExerciseStore::DirectoryExerciseStore(std::filesystem::path root)
    : root_{std::move(root)} {}

bool DirectoryExerciseStore::is_valid_exercise_id(std::string_view exercise_id) {
    return !exercise_id.empty() && exercise_id != "." && exercise_id != ".." &&
           exercise_id.find('/') == std::string_view::npos && exercise_id.find('\0') == std::string_view::npos;
}

Result<std::vector<TestCase>> DirectoryExerciseStore::load(std::string_view exercise_id) const {
    if (!is_valid_exercise_id(exercise_id)) {
        LOG_DEBUG("Rejecting exercise id {:?}", exercise_id);
        return ErrorKind::ExerciseNotFound;
    }

    const std::filesystem::path exercise_dir = root_ / exercise_id;

    std::error_code err;
    if (!std::filesystem::is_directory(exercise_dir, err)) {
        LOG_DEBUG("No exercise directory {}", exercise_dir);
        return ErrorKind::ExerciseNotFound;
    }

    // Ordered by test id
    std::map<int, TestFiles> found;

    std::filesystem::directory_iterator dir_iter{exercise_dir, err};
    if (err) {
        LOG_WARN("Could not list {}: {}", exercise_dir, err.message());
        return ErrorKind::IoFailure;
    }

    for (const auto& entry : dir_iter) {
        if (!entry.is_regular_file(err)) {
            continue;
        }

        const std::filesystem::path& path = entry.path();
        const std::string ext = path.extension().string();
        const std::optional<int> test_id = parse_int(path.stem().string());

        if (!test_id) {
            LOG_TRACE("Ignoring {}", path);
            continue;
        }

        if (ext == ".out") {
            found[*test_id].out = path;
        } else if (ext == ".in") {
            found[*test_id].in = path;
        } else if (ext == ".timeout") {
            found[*test_id].timeout = path;
        } else if (ext == ".hidden") {
            found[*test_id].hidden = true;
        } else {
            LOG_TRACE("Ignoring {}", path);
        }
    }

    std::vector<TestCase> result;

    for (const auto& [test_id, files] : found) {
        if (!files.out) {
            LOG_DEBUG("Test {} of exercise {:?} has no expected output; skipping it", test_id, exercise_id);
            continue;
        }

        std::string expected_output = TRY(read_file(*files.out));

        TestCase test{.id = test_id,
                      .input_data = std::nullopt,
                      .expected_output = std::move(expected_output),
                      .timeout = std::nullopt,
                      .is_hidden = files.hidden};

        if (files.in) {
            test.input_data = TRY(read_file(*files.in));
        }

        if (files.timeout) {
            const std::string contents = TRY(read_file(*files.timeout));
            const std::optional<int> seconds = parse_int(trim(contents));

            if (!seconds || *seconds == 0) {
                LOG_WARN("Malformed timeout in {}: {:?}", *files.timeout, contents);
                return ErrorKind::IoFailure;
            }

            test.timeout = std::chrono::seconds{*seconds};
        }

        result.push_back(std::move(test));
    }

    LOG_DEBUG("Loaded {} test(s) for exercise {:?} from {}", result.size(), exercise_id, exercise_dir);

    return result;
}

} // namespace exegrader
