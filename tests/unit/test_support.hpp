#pragma once

#include <set>

#include <entt/entt.hpp>

#include "gunpong/components/match.hpp"
#include "gunpong/core/entity_store.hpp"
#include "gunpong/core/game_config.hpp"
#include "gunpong/core/input.hpp"
#include "gunpong/core/random.hpp"
#include "gunpong/particles/particle_system.hpp"
#include "gunpong/systems/frame_context.hpp"

// Scripted input: keys stay held until released, actions fire when listed
class FakeInput : public IInputSource {
public:
    void press(Key key) { held.insert(key); }
    void release(Key key) { held.erase(key); }
    void trigger(Action action) { actions.insert(action); }
    void clearActions() { actions.clear(); }

    bool isKeyDown(Key key) const override { return held.count(key) > 0; }
    bool wasActionPressed(Action action) const override { return actions.count(action) > 0; }

private:
    std::set<Key> held;
    std::set<Action> actions;
};

// Owns everything a system needs so a single system can be run in isolation
struct SystemFixture {
    GameConfig config;
    EntityStore store;
    Components::MatchState match;
    Particles::ParticleSystem particles{20000, 7};
    entt::dispatcher events;
    FakeInput input;
    Random random{42};

    SystemFixture() {
        config.randomSeed = 42;
        config.strictEntityChecks = true;
    }

    Systems::FrameContext context(double now = 1.0) {
        return Systems::FrameContext{store, match, particles, events, input, random, config, now};
    }
};
