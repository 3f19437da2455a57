#pragma once

#include <exegrader/common/error_types.hpp>                // IWYU pragma: export
#include <exegrader/common/expected.hpp>                   // IWYU pragma: export
#include <exegrader/exceptions.hpp>                        // IWYU pragma: export
#include <exegrader/execution/execution_backend.hpp>       // IWYU pragma: export
#include <exegrader/execution/execution_result.hpp>        // IWYU pragma: export
#include <exegrader/grading/exercise_store.hpp>            // IWYU pragma: export
#include <exegrader/grading/progress.hpp>                  // IWYU pragma: export
#include <exegrader/grading/test_case.hpp>                 // IWYU pragma: export
#include <exegrader/grading/test_harness.hpp>              // IWYU pragma: export
#include <exegrader/language/language_profile.hpp>         // IWYU pragma: export
#include <exegrader/language/language_registry.hpp>        // IWYU pragma: export
#include <exegrader/logging.hpp>                           // IWYU pragma: export
