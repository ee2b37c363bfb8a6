#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "lumen/core/Expected.hpp"
#include "lumen/structure/FixtureNode.hpp"

namespace lumen::structure {

/**
 * @brief Maps persisted type keys to fixture constructors.
 *
 * builtin() knows point, strip, arc, grid and group. Applications with their
 * own fixture classes build a factory from it and register more types.
 */
class FixtureFactory {
public:
    using Constructor = std::function<std::unique_ptr<FixtureNode>()>;

    FixtureFactory() = default;

    static const FixtureFactory& builtin();

    void registerType(std::string key, Constructor constructor);
    bool hasType(std::string_view key) const;
    std::vector<std::string> typeKeys() const;

    expected<std::unique_ptr<FixtureNode>> create(std::string_view key) const;

private:
    std::map<std::string, Constructor, std::less<>> constructors;
};

} // namespace lumen::structure
