#include "warden/security/boundary.hpp"

#include <filesystem>

#include "warden/core/logger.hpp"
#include "warden/core/utils.hpp"

namespace warden::security {

namespace fs = std::filesystem;

namespace {

auto canonical_dir(const std::string& dir, const fs::path& cwd) -> Result<std::string> {
    fs::path p(resolve_env_refs(dir));
    if (p.is_relative()) p = cwd / p;

    std::error_code ec;
    auto canonical = fs::weakly_canonical(p, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Cannot canonicalize directory", dir + ": " + ec.message()));
    }
    return normalize_lexical(canonical.string());
}

} // anonymous namespace

auto SecurityBoundary::contains(std::string_view absolute_path) const -> bool {
    if (is_path_within(absolute_path, base_dir, case_insensitive)) {
        return true;
    }
    for (const auto& dir : allowed_dirs) {
        if (is_path_within(absolute_path, dir, case_insensitive)) {
            return true;
        }
    }
    return false;
}

auto make_boundary(const BoundaryConfig& config) -> Result<SecurityBoundary> {
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Cannot determine current directory", ec.message()));
    }

    SecurityBoundary boundary;
    boundary.case_insensitive = config.case_insensitive.value_or(default_case_insensitive());
    boundary.max_path_length = config.max_path_length;

    auto base = canonical_dir(config.base_dir.empty() ? cwd.string() : config.base_dir, cwd);
    if (!base) return std::unexpected(base.error());
    boundary.base_dir = std::move(*base);

    for (const auto& dir : config.allowed_dirs) {
        if (utils::trim(dir).empty()) continue;
        auto allowed = canonical_dir(dir, cwd);
        if (!allowed) return std::unexpected(allowed.error());
        boundary.allowed_dirs.push_back(std::move(*allowed));
    }

    LOG_DEBUG("Security boundary: base={} allowed={} case_insensitive={}",
              boundary.base_dir, boundary.allowed_dirs.size(), boundary.case_insensitive);
    return boundary;
}

auto normalize_lexical(std::string_view path) -> std::string {
    if (path.empty()) return ".";

    auto normal = fs::path(path).lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    if (normal.empty()) return ".";
    return normal;
}

auto resolve_lexical(std::string_view base, std::string_view path) -> std::string {
    fs::path p(path);
    if (p.is_absolute()) return normalize_lexical(path);
    return normalize_lexical((fs::path(base) / p).string());
}

auto is_path_within(std::string_view target, std::string_view base, bool case_insensitive) -> bool {
    auto t = normalize_lexical(target);
    auto b = normalize_lexical(base);
    if (case_insensitive) {
        t = utils::to_lower(t);
        b = utils::to_lower(b);
    }

    auto relative = fs::path(t).lexically_relative(b);
    if (relative.empty()) return false;          // different roots
    if (relative.is_absolute()) return false;

    auto first = *relative.begin();
    return first != "..";
}

} // namespace warden::security
