#include <pinch/specifier.hpp>
#include <pinch/log.hpp>

namespace pinch {

static void replace_all(std::string& s, const std::string& from,
                        const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string translate_python_ops(const std::string& constraint) {
    std::string out = constraint;
    // Order matters: each pass sees the output of the previous one
    replace_all(out, "==", "=");
    replace_all(out, "~=", "~");
    replace_all(out, "!=", "!");
    return out;
}

// Remainder after the name, in Python or Cargo syntax. Errors are reported
// against the text as the user wrote it.
static Result<VersionReq> parse_requirement(const std::string& raw,
                                            const std::string& version_str) {
    if (version_str.empty()) {
        log::debug("'%s': no constraint, matches any version", raw.c_str());
        return Result<VersionReq>::ok(VersionReq::any());
    }

    std::string translated = translate_python_ops(version_str);
    log::trace("'%s': constraint '%s' translated to '%s'",
               raw.c_str(), version_str.c_str(), translated.c_str());

    return VersionReq::parse(translated).or_else(
        [&](PinchError& e) -> Result<VersionReq> {
            return PinchError{PinchError::InvalidRequirement,
                "invalid version requirement: '" + version_str + "'",
                e.message};
        });
}

Result<PackageSpecifier> PackageSpecifier::parse(const std::string& raw) {
    size_t name_len = PkgName::scan(raw);
    if (name_len == 0) {
        return PinchError{PinchError::InvalidFormat,
            "invalid package format: '" + raw + "'",
            "expected a package name ([a-zA-Z0-9_-]+) followed by an "
            "optional version constraint"};
    }

    return PkgName::parse(raw.substr(0, name_len)).and_then(
        [&](PkgName& name) {
            return parse_requirement(raw, raw.substr(name_len)).map(
                [&](VersionReq& req) {
                    PackageSpecifier spec;
                    spec.name = std::move(name);
                    spec.requirement = std::move(req);
                    log::debug("'%s': parsed as %s", raw.c_str(),
                               spec.to_string().c_str());
                    return spec;
                });
        });
}

std::string PackageSpecifier::to_string() const {
    return name.str() + " " + requirement.to_string();
}

} // namespace pinch
