#pragma once

namespace lumen::structure {

class FixtureNode;

/**
 * @brief Receives change notifications from the fixtures it holds.
 *
 * Implemented by FixtureNode (for its children) and by Structure (for the
 * top-level fixtures). Each callback receives the fixture where the change
 * originated; nested containers forward it unchanged up the chain.
 */
class FixtureContainer {
public:
    virtual ~FixtureContainer() = default;

    /// Point count or tree shape changed: indices must be reassigned.
    virtual void fixtureGenerationChanged(FixtureNode& fixture) = 0;

    /// Positions changed; indices are unchanged.
    virtual void fixtureGeometryChanged(FixtureNode& fixture) = 0;

    /// Packet specs were rebuilt.
    virtual void fixturePacketsChanged(FixtureNode& fixture) = 0;

    /// Output state (enabled, brightness, mute, solo, ...) changed.
    virtual void fixtureOutputChanged(FixtureNode& fixture) = 0;

    virtual bool isIterating() const = 0;
    virtual bool isLoading() const = 0;
};

} // namespace lumen::structure
