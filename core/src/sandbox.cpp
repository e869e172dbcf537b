#include "agentd/sandbox.h"
#include "agentd/ids.h"

#include <initializer_list>
#include <system_error>

namespace agentd {

const char* provision_error_to_str(ProvisionError e) {
    switch (e) {
        case ProvisionError::NONE: return "NONE";
        case ProvisionError::UNSAFE_IDENTIFIER: return "UNSAFE_IDENTIFIER";
        case ProvisionError::CREATE_FAILED: return "CREATE_FAILED";
    }
    return "CREATE_FAILED";
}

SandboxProvisioner::SandboxProvisioner(std::filesystem::path base_root)
    : base_root_(std::move(base_root)) {}

ProvisionError SandboxProvisioner::acquire(const std::string& correlation_id,
                                           Sandbox* out,
                                           std::string* err) const {
    if (!is_safe_path_segment(correlation_id)) {
        if (err) *err = "unsafe correlation id for a path segment";
        return ProvisionError::UNSAFE_IDENTIFIER;
    }
    if (base_root_.empty()) {
        if (err) *err = "sandbox root not configured";
        return ProvisionError::CREATE_FAILED;
    }

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(base_root_, ec);
    if (ec) {
        if (err) *err = "create " + base_root_.string() + ": " + ec.message();
        return ProvisionError::CREATE_FAILED;
    }

    const fs::path dir = base_root_ / correlation_id;

    // refuse to follow anything that is not a plain directory
    auto st = fs::symlink_status(dir, ec);
    if (!ec && fs::exists(st) && !fs::is_directory(st)) {
        if (err) *err = dir.string() + " exists and is not a directory";
        return ProvisionError::CREATE_FAILED;
    }
    ec.clear();

    const fs::path cache = dir / ".cache";
    const fs::path config = dir / ".config";
    const fs::path data = dir / ".local" / "share";
    const fs::path tmp = dir / "tmp";
    for (const auto& p : {cache, config, data, tmp}) {
        fs::create_directories(p, ec);
        if (ec) {
            std::string msg = "create " + p.string() + ": " + ec.message();
            // do not leave a half-built sandbox behind
            std::error_code rm;
            fs::remove_all(dir, rm);
            if (rm) msg += "; cleanup failed: " + rm.message();
            if (err) *err = msg;
            return ProvisionError::CREATE_FAILED;
        }
    }
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    ec.clear();

    Sandbox sb;
    sb.correlation_id = correlation_id;
    sb.root = dir;
    sb.env = {
        {"HOME", dir.string()},
        {"XDG_CACHE_HOME", cache.string()},
        {"XDG_CONFIG_HOME", config.string()},
        {"XDG_DATA_HOME", data.string()},
        {"TMPDIR", tmp.string()},
    };
    if (out) *out = std::move(sb);
    return ProvisionError::NONE;
}

bool SandboxProvisioner::release(const Sandbox& sb, std::string* err) const {
    if (sb.root.empty()) return true;
    std::error_code ec;
    std::filesystem::remove_all(sb.root, ec);
    if (ec) {
        if (err) *err = "remove " + sb.root.string() + ": " + ec.message();
        return false;
    }
    return true;
}

SandboxLease::~SandboxLease() {
    std::string ignored;
    (void)release(&ignored);
}

bool SandboxLease::release(std::string* err) {
    if (released_) return true;
    released_ = true;
    if (keep_) return true;
    return prov_->release(sb_, err);
}

} // namespace agentd
