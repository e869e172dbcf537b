#pragma once

// Per-task sandbox: a private directory under a shared ephemeral root plus
// an environment overlay that points the child's home, cache, config, data
// and temp locations into it.

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace agentd {

using EnvOverlay = std::vector<std::pair<std::string, std::string>>;

struct Sandbox {
    std::string correlation_id;
    std::filesystem::path root;
    EnvOverlay env;
};

enum class ProvisionError {
    NONE,
    UNSAFE_IDENTIFIER, // identifier rejected before touching the filesystem
    CREATE_FAILED,     // filesystem error, or a non-directory in the way
};

const char* provision_error_to_str(ProvisionError e);

class SandboxProvisioner {
public:
    explicit SandboxProvisioner(std::filesystem::path base_root);

    // Validates `correlation_id` and creates <base_root>/<correlation_id>.
    // A directory left over from an earlier delivery is reused.
    ProvisionError acquire(const std::string& correlation_id, Sandbox* out, std::string* err) const;

    // Recursively removes the sandbox directory. Advisory: returns false and
    // fills `err` on failure, never throws.
    bool release(const Sandbox& sb, std::string* err) const;

private:
    std::filesystem::path base_root_;
};

// Releases an acquired sandbox when it goes out of scope.
class SandboxLease {
public:
    SandboxLease(const SandboxProvisioner& prov, Sandbox sb, bool keep = false)
        : prov_(&prov), sb_(std::move(sb)), keep_(keep) {}
    ~SandboxLease();

    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;

    const Sandbox& get() const { return sb_; }

    // Release now; returns the release result. Later calls are no-ops.
    bool release(std::string* err);

private:
    const SandboxProvisioner* prov_;
    Sandbox sb_;
    bool keep_{false};
    bool released_{false};
};

} // namespace agentd
