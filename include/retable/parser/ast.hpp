#pragma once

#include <string>
#include <vector>

namespace retable::parser {

struct Identifier final {
    std::string value{};
    bool quoted = false;
};

struct QualifiedName final {
    std::vector<Identifier> parts{};

    [[nodiscard]] bool empty() const noexcept { return parts.empty(); }
};

}  // namespace retable::parser
