#ifndef TOOLGUARD_HPP
#define TOOLGUARD_HPP

// Main header that includes everything

#include <toolguard/command_validator.hpp>
#include <toolguard/config.hpp>
#include <toolguard/errors.hpp>
#include <toolguard/path_sanitizer.hpp>
#include <toolguard/path_validator.hpp>
#include <toolguard/security_validator.hpp>
#include <toolguard/types.hpp>
#include <toolguard/version.hpp>

// Optional: gated tool dispatcher built on SecurityValidator
#include <toolguard/ext/gated_dispatcher.hpp>

#endif // TOOLGUARD_HPP
