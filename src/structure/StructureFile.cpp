// JSON persistence of the fixture tree.
//
//   { "version": 1,
//     "fixtures": [ { "type": "strip", "label": "...",
//                     "parameters": { "numPoints": 30, "protocol": "kinet", ... },
//                     "children": [ ... ] } ] }

#include "lumen/structure/Structure.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <type_traits>
#include <utility>
#include <variant>

#include "lumen/log/Log.hpp"

namespace lumen::structure {

using nlohmann::json;

namespace {

json valueToJson(const Parameter::Value& value) {
    return std::visit([](const auto& v) { return json(v); }, value);
}

expected<Parameter::Value> valueFromJson(const json& value) {
    if (value.is_boolean()) {
        return Parameter::Value(value.get<bool>());
    }
    if (value.is_number_integer()) {
        const auto wide = value.get<std::int64_t>();
        if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
            return unexpected(errc::invalid_parameter);
        }
        return Parameter::Value(static_cast<int>(wide));
    }
    if (value.is_number_float()) {
        return Parameter::Value(value.get<double>());
    }
    if (value.is_string()) {
        return Parameter::Value(value.get<std::string>());
    }
    return unexpected(errc::invalid_parameter);
}

} // namespace

json fixtureToJson(const FixtureNode& fixture) {
    json parameters = json::object();
    for (const Parameter* p : fixture.parameters()) {
        parameters[p->key()] = valueToJson(p->value());
    }

    json children = json::array();
    for (const auto& child : fixture.children()) {
        children.push_back(fixtureToJson(*child));
    }

    json object = json::object();
    object["type"] = fixture.typeKey();
    object["label"] = fixture.label();
    object["parameters"] = std::move(parameters);
    object["children"] = std::move(children);
    return object;
}

json Structure::save() const {
    json fixtures = json::array();
    for (const auto& fixture : fixtures_) {
        fixtures.push_back(fixtureToJson(*fixture));
    }
    json document = json::object();
    document["version"] = FILE_VERSION;
    document["fixtures"] = std::move(fixtures);
    return document;
}

expected<std::unique_ptr<FixtureNode>> Structure::fixtureFromJson(const json& object) const {
    if (!object.is_object()) {
        return unexpected(errc::malformed_config);
    }
    auto type = object.find("type");
    if (type == object.end() || !type->is_string()) {
        return unexpected(errc::malformed_config);
    }

    auto created = factory_->create(type->get<std::string>());
    if (!created) {
        logError("[Structure] unknown fixture type '", type->get<std::string>(), "'\n");
        return unexpected(created.error());
    }
    std::unique_ptr<FixtureNode> fixture = std::move(*created);

    if (auto label = object.find("label"); label != object.end()) {
        if (!label->is_string()) {
            return unexpected(errc::malformed_config);
        }
        fixture->setLabel(label->get<std::string>());
    }

    // The fixture is still detached, so values are stored without propagation
    // and applied by the single regenerate that attaching performs.
    if (auto parameters = object.find("parameters"); parameters != object.end()) {
        if (!parameters->is_object()) {
            return unexpected(errc::malformed_config);
        }
        for (auto it = parameters->begin(); it != parameters->end(); ++it) {
            auto value = valueFromJson(it.value());
            if (!value) {
                logError("[Structure] '", fixture->label(), "': bad value for '", it.key(), "'\n");
                return unexpected(value.error());
            }
            if (auto ok = fixture->setParameter(it.key(), std::move(*value)); !ok) {
                logError("[Structure] '", fixture->label(), "': cannot set '", it.key(), "': ",
                         ok.error().message(), "\n");
                return unexpected(ok.error());
            }
        }
    }

    if (auto children = object.find("children"); children != object.end()) {
        if (!children->is_array()) {
            return unexpected(errc::malformed_config);
        }
        for (const auto& childObject : *children) {
            auto child = fixtureFromJson(childObject);
            if (!child) {
                return unexpected(child.error());
            }
            if (auto ok = fixture->addChild(std::move(*child)); !ok) {
                return unexpected(ok.error());
            }
        }
    }

    return fixture;
}

expected<void> Structure::load(const json& document) {
    if (auto ok = checkMutable(); !ok) return ok;

    if (!document.is_object()) {
        return unexpected(errc::malformed_config);
    }
    auto version = document.find("version");
    if (version == document.end() || !version->is_number_integer() ||
        version->get<int>() != FILE_VERSION) {
        logError("[Structure] unsupported structure file version\n");
        return unexpected(errc::malformed_config);
    }
    auto list = document.find("fixtures");
    if (list == document.end() || !list->is_array()) {
        return unexpected(errc::malformed_config);
    }

    // Build the whole tree first so a bad file leaves the current one untouched.
    std::vector<std::unique_ptr<FixtureNode>> loaded;
    loaded.reserve(list->size());
    for (const auto& object : *list) {
        auto fixture = fixtureFromJson(object);
        if (!fixture) {
            return unexpected(fixture.error());
        }
        loaded.push_back(std::move(*fixture));
    }

    loading_ = true;
    expected<void> result = removeAllFixtures();
    for (auto& fixture : loaded) {
        if (!result) break;
        result = addFixture(std::move(fixture));
    }
    loading_ = false;

    rebuild();
    if (result) {
        logInfo("[Structure] loaded ", fixtures_.size(), " fixture(s), ", totalSize(), " point(s)\n");
    }
    return result;
}

expected<void> Structure::saveFile(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        logError("[Structure] cannot write '", path, "'\n");
        return unexpected(std::make_error_code(std::errc::io_error));
    }
    out << save().dump(2) << '\n';
    if (!out) {
        return unexpected(std::make_error_code(std::errc::io_error));
    }
    return {};
}

expected<void> Structure::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        logError("[Structure] cannot open '", path, "'\n");
        return unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }
    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        logError("[Structure] '", path, "' is not valid JSON\n");
        return unexpected(errc::malformed_config);
    }
    return load(document);
}

} // namespace lumen::structure
