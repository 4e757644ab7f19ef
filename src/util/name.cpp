#include <pinch/name.hpp>
#include <cctype>

namespace pinch {

bool PkgName::is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

size_t PkgName::scan(const std::string& s) {
    size_t n = 0;
    while (n < s.size() && is_name_char(s[n])) ++n;
    return n;
}

Result<PkgName> PkgName::parse(const std::string& raw) {
    if (raw.empty()) {
        return PinchError{PinchError::InvalidFormat, "empty package name"};
    }

    size_t n = scan(raw);
    if (n != raw.size()) {
        return PinchError{PinchError::InvalidFormat,
            "invalid character '" + std::string(1, raw[n]) +
            "' in package name '" + raw + "'",
            "allowed: [a-zA-Z0-9_-]"};
    }

    PkgName name;
    name.raw_ = raw;
    return Result<PkgName>::ok(std::move(name));
}

const std::string& PkgName::str() const { return raw_; }

bool PkgName::operator==(const PkgName& o) const {
    return raw_ == o.raw_;
}

bool PkgName::operator!=(const PkgName& o) const {
    return !(*this == o);
}

} // namespace pinch
