#pragma once

#include <pinch/result.hpp>
#include <string>

namespace pinch {

// Package name: [a-zA-Z0-9_-]+, compared byte for byte
struct PkgName {
    static Result<PkgName> parse(const std::string& raw);

    // Length of the longest prefix of s made of name characters
    static size_t scan(const std::string& s);
    static bool is_name_char(char c);

    const std::string& str() const;

    bool operator==(const PkgName& o) const;
    bool operator!=(const PkgName& o) const;

private:
    std::string raw_;
};

} // namespace pinch
