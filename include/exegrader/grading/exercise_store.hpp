#pragma once

#include <exegrader/common/error_types.hpp>
#include <exegrader/grading/test_case.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace exegrader {

/// Source of the ordered test cases of an exercise
class ExerciseStore
{
public:
    virtual ~ExerciseStore() = default;

    /// Test cases of `exercise_id`, ordered by test id.
    /// Returns ExerciseNotFound if the exercise is unknown; an empty vector if it has no tests.
    virtual Result<std::vector<TestCase>> load(std::string_view exercise_id) const = 0;
};

/// Exercises kept in memory, keyed by id
class InMemoryExerciseStore : public ExerciseStore
{
public:
    InMemoryExerciseStore() = default;

    /// Replaces any test cases previously added for `exercise_id`
    void add(std::string exercise_id, std::vector<TestCase> test_cases);

    Result<std::vector<TestCase>> load(std::string_view exercise_id) const override;

private:
    std::map<std::string, std::vector<TestCase>, std::less<>> exercises_;
};

/// Exercises laid out on disk.
///
/// Exercise `<id>` is the directory `<root>/<id>/`. Within it, test `n` (a non-negative integer) consists of:
///   `<n>.out`     expected output (required)
///   `<n>.in`      input (optional; absent means no input)
///   `<n>.hidden`  marks the test as hidden (contents ignored)
///   `<n>.timeout` timeout in whole seconds (optional)
/// Every other file is ignored, as are `.in` / `.hidden` / `.timeout` files without a matching `.out`.
class DirectoryExerciseStore : public ExerciseStore
{
public:
    explicit DirectoryExerciseStore(std::filesystem::path root);

    /// Returns IoFailure if a test file exists but cannot be read, or a timeout file is malformed
    Result<std::vector<TestCase>> load(std::string_view exercise_id) const override;

    const std::filesystem::path& get_root() const { return root_; }

    /// Whether `exercise_id` names a single directory entry (no separators, not "." or "..")
    static bool is_valid_exercise_id(std::string_view exercise_id);

private:
    std::filesystem::path root_;
};

} // namespace exegrader
