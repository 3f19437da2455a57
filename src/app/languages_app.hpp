#pragma once

#include "app/app.hpp" // IWYU pragma: export

namespace exegrader {

/// `exegrader languages`: lists the supported languages
class LanguagesApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;
};

} // namespace exegrader
