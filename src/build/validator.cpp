#include "build/validator.hpp"

namespace stylebook::build {

auto validate(const BuildConfig& config) -> ErrorList {
    ErrorList errors;

    if (config.source.empty()) {
        errors.emplace_back("No source directory specified in the config file");
    }
    for (const auto& dir : config.source) {
        if (!config.resolve(dir)) {
            errors.push_back("Can not read source directory (" + dir + "), does it exist?");
        }
    }

    if (!config.destination) {
        errors.emplace_back("No destination directory specified in the config");
    }

    if (!config.documentation_assets) {
        errors.emplace_back("No documentation assets directory specified");
    }

    return errors;
}

} // namespace stylebook::build
