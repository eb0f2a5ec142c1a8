#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <core/types.hpp>
#include <platform/process.hpp>

// The operation runs its built-in implementation.
struct BuiltIn {};

// The operation is delegated to <hooks_dir>/<op>/hook.sh.
struct ExternalHook {
    std::filesystem::path path;
};

using OperationStrategy = std::variant<BuiltIn, ExternalHook>;

// Decided once per invocation: an executable hook wins over the built-in.
OperationStrategy resolve_strategy(const GlobalSettings& settings, const std::string& operation);

// FLEETSH_HOST, FLEETSH_PORT, FLEETSH_USER, FLEETSH_PASSWORD,
// FLEETSH_KEYFILE and FLEETSH_ALIAS for a hook.
platform::EnvMap hook_environment(const HostProfile& profile, int port, const std::string& alias,
                                  const std::optional<std::filesystem::path>& key_path);

// Run the hook with the operation's remaining arguments; its exit status
// is the operation's result.
Result<int> run_hook(const ExternalHook& hook, const std::vector<std::string>& args,
                     const platform::EnvMap& env);
