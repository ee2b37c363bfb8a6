#include "lumen/structure/Structure.hpp"

#include <algorithm>
#include <utility>

#include "lumen/log/Log.hpp"

namespace lumen::structure {

namespace {

const std::vector<std::string> ROOT_MODEL_KEYS = {"structure"};

template<typename Fn>
void forEachFixture(const std::vector<std::unique_ptr<FixtureNode>>& fixtures, Fn&& fn) {
    for (const auto& fixture : fixtures) {
        fn(*fixture);
        forEachFixture(fixture->children(), fn);
    }
}

void collectEntries(const std::vector<std::unique_ptr<FixtureNode>>& fixtures,
                    float parentBrightness,
                    bool parentEnabled,
                    bool parentSoloed,
                    bool anySolo,
                    std::vector<output::OutputEntry>& entries) {
    for (const auto& fixture : fixtures) {
        const float brightness = parentBrightness * fixture->brightnessLevel();
        const bool enabled = parentEnabled && fixture->isEnabled() && !fixture->isMuted();
        const bool soloed = parentSoloed || fixture->isSoloed();
        const bool audible = enabled && (!anySolo || soloed);

        for (const auto& spec : fixture->packetSpecs()) {
            entries.push_back({spec, brightness, audible});
        }
        collectEntries(fixture->children(), brightness, enabled, soloed, anySolo, entries);
    }
}

} // namespace

Structure::Structure(const FixtureFactory& factory)
: factory_(&factory)
, model_(model::Model::fromPoints({}, ROOT_MODEL_KEYS))
, outputFrame_(std::make_shared<const output::OutputFrame>()) {}

Structure::~Structure() {
    fixtures_.clear();
}

expected<void> Structure::checkMutable() const {
    if (isIterating()) {
        return unexpected(errc::reentrant_mutation);
    }
    return {};
}

void Structure::renumberFixtures() {
    for (std::size_t i = 0; i < fixtures_.size(); ++i) {
        fixtures_[i]->index_ = i;
    }
}

std::size_t Structure::totalSize() const {
    std::size_t total = 0;
    for (const auto& fixture : fixtures_) {
        total += fixture->totalSize();
    }
    return total;
}

// ---------------------------------------------------------------------------
// Fixture list
// ---------------------------------------------------------------------------

expected<void> Structure::addFixture(std::unique_ptr<FixtureNode> fixture,
                                     std::optional<std::size_t> position) {
    if (!fixture || fixture->isDisposed()) {
        return unexpected(errc::invalid_argument);
    }
    if (auto ok = checkMutable(); !ok) return ok;
    if (fixture->container_ == this) {
        return unexpected(errc::duplicate_child);
    }
    if (fixture->container_) {
        return unexpected(errc::already_attached);
    }

    const std::size_t at = position.value_or(fixtures_.size());
    if (at > fixtures_.size()) {
        return unexpected(errc::invalid_argument);
    }

    FixtureNode& added = *fixture;
    fixtures_.insert(fixtures_.begin() + static_cast<std::ptrdiff_t>(at), std::move(fixture));
    renumberFixtures();
    added.attach(*this, nullptr, at, model::identityMatrix());
    return added.regenerate();
}

expected<std::unique_ptr<FixtureNode>> Structure::removeFixture(FixtureNode& fixture) {
    if (auto ok = checkMutable(); !ok) return unexpected(ok.error());

    auto it = std::find_if(fixtures_.begin(), fixtures_.end(),
                           [&](const std::unique_ptr<FixtureNode>& f) { return f.get() == &fixture; });
    if (it == fixtures_.end()) {
        return unexpected(errc::unknown_child);
    }

    std::unique_ptr<FixtureNode> removed = std::move(*it);
    fixtures_.erase(it);
    renumberFixtures();
    removed->detach();

    if (!loading_) rebuild();
    return removed;
}

expected<void> Structure::moveFixture(FixtureNode& fixture, std::size_t position) {
    if (auto ok = checkMutable(); !ok) return ok;

    auto it = std::find_if(fixtures_.begin(), fixtures_.end(),
                           [&](const std::unique_ptr<FixtureNode>& f) { return f.get() == &fixture; });
    if (it == fixtures_.end()) {
        return unexpected(errc::unknown_child);
    }
    if (position >= fixtures_.size()) {
        return unexpected(errc::invalid_argument);
    }

    const auto from = static_cast<std::size_t>(it - fixtures_.begin());
    if (from == position) {
        return {};
    }
    auto moved = std::move(*it);
    fixtures_.erase(it);
    fixtures_.insert(fixtures_.begin() + static_cast<std::ptrdiff_t>(position), std::move(moved));
    renumberFixtures();

    if (!loading_) rebuild();
    return {};
}

expected<void> Structure::removeAllFixtures() {
    if (auto ok = checkMutable(); !ok) return ok;

    for (auto& fixture : fixtures_) {
        if (auto ok = fixture->dispose(); !ok) return ok;
    }
    fixtures_.clear();

    if (!loading_) rebuild();
    return {};
}

expected<void> Structure::soloFixture(FixtureNode* fixture) {
    if (!fixture) {
        std::vector<FixtureNode*> soloed;
        forEachFixture(fixtures_, [&](FixtureNode& f) {
            if (f.isSoloed()) soloed.push_back(&f);
        });
        for (FixtureNode* f : soloed) {
            if (auto ok = f->setParameter("solo", false); !ok) return ok;
        }
        return {};
    }

    const FixtureNode* root = fixture;
    while (root->parent()) {
        root = root->parent();
    }
    if (root->container() != this) {
        return unexpected(errc::unknown_child);
    }
    return fixture->setParameter("solo", true);
}

// ---------------------------------------------------------------------------
// Snapshots
// ---------------------------------------------------------------------------

model::Model::Ptr Structure::model() const {
    return std::atomic_load(&model_);
}

std::shared_ptr<const output::OutputFrame> Structure::outputFrame() const {
    return std::atomic_load(&outputFrame_);
}

void Structure::setModelChangedCallback(ModelChangedCallback callback) {
    modelChangedCallback_ = std::move(callback);
}

void Structure::rebuild() {
    reindex();
    rebuildModel(false);
    publishOutput();
}

void Structure::reindex() {
    std::uint32_t next = 0;
    for (auto& fixture : fixtures_) {
        fixture->reindex(next);
        next += static_cast<std::uint32_t>(fixture->totalSize());
    }
}

void Structure::rebuildModel(bool geometryOnly) {
    auto storage = std::make_shared<model::Model::Storage>();
    storage->points.reserve(totalSize());

    std::vector<model::Model::Ptr> children;
    children.reserve(fixtures_.size());
    for (auto& fixture : fixtures_) {
        children.push_back(fixture->buildModel(storage));
    }

    const std::size_t count = storage->points.size();
    model::Model::Ptr root = std::make_shared<model::Model>(
        std::move(storage), 0, count, 1, ROOT_MODEL_KEYS, std::move(children), model::identityMatrix());
    std::atomic_store(&model_, root);

    if (!geometryOnly) {
        logInfo("[Structure] model rebuilt: ", fixtures_.size(), " fixture(s), ", count, " point(s)\n");
    }
    notifyModelChanged(geometryOnly);
}

void Structure::publishOutput() {
    bool anySolo = false;
    forEachFixture(fixtures_, [&](FixtureNode& f) {
        if (f.isSoloed()) anySolo = true;
    });

    auto frame = std::make_shared<output::OutputFrame>();
    frame->generation = ++outputGeneration_;
    frame->pointCount = totalSize();
    collectEntries(fixtures_, 1.0f, true, false, anySolo, frame->entries);

    std::atomic_store(&outputFrame_, std::shared_ptr<const output::OutputFrame>(std::move(frame)));
}

void Structure::notifyModelChanged(bool geometryOnly) {
    if (modelChangedCallback_) {
        modelChangedCallback_(model(), geometryOnly);
    }
}

// ---------------------------------------------------------------------------
// FixtureContainer
// ---------------------------------------------------------------------------

void Structure::fixtureGenerationChanged(FixtureNode&) {
    if (loading_) return;
    rebuild();
}

void Structure::fixtureGeometryChanged(FixtureNode&) {
    if (loading_) return;
    // Indices are unchanged; only positions and transforms need a new snapshot.
    rebuildModel(true);
}

void Structure::fixturePacketsChanged(FixtureNode&) {
    if (loading_) return;
    publishOutput();
}

void Structure::fixtureOutputChanged(FixtureNode& fixture) {
    if (loading_) return;
    if (fixture.isSoloed()) {
        forEachFixture(fixtures_, [&](FixtureNode& other) {
            if (&other == &fixture || !other.isSoloed()) return;
            if (auto changed = other.solo.assign(false); !changed) {
                logError("[Structure] could not clear solo on '", other.label(), "': ",
                         changed.error().message(), "\n");
            }
        });
    }
    publishOutput();
}

} // namespace lumen::structure
