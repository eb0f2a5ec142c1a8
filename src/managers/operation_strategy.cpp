#include "operation_strategy.hpp"
#include <platform/platform.hpp>

namespace fs = std::filesystem;

OperationStrategy resolve_strategy(const GlobalSettings& settings, const std::string& operation) {
    if (settings.hooks_dir.empty()) return BuiltIn{};
    fs::path hook = fs::path(settings.hooks_dir) / operation / "hook.sh";
    if (platform::is_executable(hook)) {
        return ExternalHook{hook};
    }
    return BuiltIn{};
}

platform::EnvMap hook_environment(const HostProfile& profile, int port, const std::string& alias,
                                  const std::optional<fs::path>& key_path) {
    return {
        {"FLEETSH_HOST", profile.host},
        {"FLEETSH_PORT", std::to_string(port)},
        {"FLEETSH_USER", profile.user},
        {"FLEETSH_PASSWORD", profile.password.value_or("")},
        {"FLEETSH_KEYFILE", key_path ? key_path->string() : ""},
        {"FLEETSH_ALIAS", alias},
    };
}

Result<int> run_hook(const ExternalHook& hook, const std::vector<std::string>& args,
                     const platform::EnvMap& env) {
    auto proc = platform::spawn(hook.path.string(), args, env);
    if (!proc.valid()) {
        return Result<int>::Err("Failed to start hook " + hook.path.string(), ErrorKind::Io);
    }
    int code = proc.wait();
    if (code < 0) {
        return Result<int>::Err("Hook " + hook.path.string() + " did not exit normally", ErrorKind::Io);
    }
    return Result<int>::Ok(code);
}
