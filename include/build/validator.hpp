//! # Configuration Validation
//!
//! Checks that a resolved configuration names everything a build needs.
//! All checks always run; the result lists every problem in check order.

#ifndef STYLEBOOK_BUILD_VALIDATOR_HPP
#define STYLEBOOK_BUILD_VALIDATOR_HPP

#include "build/config.hpp"
#include "build/errors.hpp"

namespace stylebook::build {

/// Returns the validation errors of `config`; empty means valid.
///
/// - no source, or one error per source directory that does not exist
/// - no destination (existence is not checked, it is created later)
/// - no documentation assets directory (existence is only a warning later)
[[nodiscard]] auto validate(const BuildConfig& config) -> ErrorList;

} // namespace stylebook::build

#endif // STYLEBOOK_BUILD_VALIDATOR_HPP
