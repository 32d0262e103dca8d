#ifndef BUILD_CARGO_HPP
#define BUILD_CARGO_HPP

#include<iostream>
#include<string>

namespace Build { namespace Cargo {

/** Build::Cargo::crate_name
 *
 * @brief reads a `Cargo.toml` and returns the name
 * of the library artifact: the `[lib]` name if
 * given, else the `[package]` name, with `-` mapped
 * to `_`.
 *
 * @return the empty string if neither is present.
 * Throws `Build::ConfigError` if the manifest is
 * not valid TOML.
 */
std::string crate_name(std::istream& cargo_toml);

/** Build::Cargo::solana_version
 *
 * @brief reads a `Cargo.lock` and returns the
 * locked version of `solana-program`, falling back
 * to `solana-sdk`.
 *
 * @return the empty string if neither is locked.
 * Throws `Build::ConfigError` if the lock file is
 * not valid TOML.
 */
std::string solana_version(std::istream& cargo_lock);

}}

#endif /* !defined(BUILD_CARGO_HPP) */
