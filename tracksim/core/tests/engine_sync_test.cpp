#include <tracksim/core/engine.hpp>
#include <tracksim/core/error.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tracksim::core;

namespace {

struct RuleFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace

class SyncEngineTest : public ::testing::Test {
protected:
    TimePoint time(double seconds) {
        return time_from_seconds(seconds);
    }

    // "walker" moves one site along its "direction" state (default +1);
    // "sitter" explicitly stays.
    static RuleSet walker_rules() {
        RuleSet rules;
        rules.declare_trait("walker");
        rules.declare_trait("sitter");
        rules.bind_stepping("walker", [](Particle& self, const RuleContext&) {
            return StepAction::move_to(self.position() + self.get_or<int64_t>("direction", 1));
        });
        rules.bind_stepping("sitter", [](Particle&, const RuleContext&) {
            return StepAction::stay();
        });
        return rules;
    }

    static RuleSet walker_rules_with_collision(CollisionOutcome outcome) {
        RuleSet rules = walker_rules();
        rules.set_fallback_collision([outcome](Particle&, const Particle&, const RuleContext&) {
            return outcome;
        });
        return rules;
    }

    static ParticleSpec walker(Site site, int64_t direction = 1) {
        return ParticleSpec{site, {"walker"}, {{"direction", direction}}};
    }

    static ParticleSpec sitter(Site site) {
        return ParticleSpec{site, {"sitter"}, {}};
    }
};

// ============================================================================
// Basic stepping
// ============================================================================

TEST_F(SyncEngineTest, WalkerStopsAtClosedEnd) {
    Engine engine(Track(5, BoundaryMode::Closed), walker_rules());
    ParticleId id = engine.add_particle(walker(2));

    engine.step_once();
    engine.step_once();
    EXPECT_EQ(engine.particle(id).position(), 4);

    engine.step_once();
    EXPECT_EQ(engine.particle(id).position(), 4);
    EXPECT_EQ(engine.step_index(), 3U);
    EXPECT_EQ(engine.time(), time(3.0));
}

TEST_F(SyncEngineTest, TrajectoryRecordsEveryCommittedChange) {
    Engine engine(Track(5, BoundaryMode::Closed), walker_rules());
    ParticleId id = engine.add_particle(walker(2));

    auto result = engine.run(3);

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.steps, 3U);
    EXPECT_EQ(result.reason, StopReason::RequestedSteps);
    ASSERT_EQ(result.entries.size(), 2U);
    EXPECT_EQ(result.entries[0], (TrajectoryEntry{1, time(1.0), id, 2, 3, EventKind::Move}));
    EXPECT_EQ(result.entries[1], (TrajectoryEntry{2, time(2.0), id, 3, 4, EventKind::Move}));

    const auto& log = engine.trajectory();
    ASSERT_EQ(log.size(), 3U);
    EXPECT_EQ(log[0], (TrajectoryEntry{0, time(0.0), id, std::nullopt, 2, EventKind::Place}));
}

TEST_F(SyncEngineTest, LowerIdWinsSameTargetContest) {
    Engine engine(Track(5, BoundaryMode::Closed), walker_rules());
    ParticleId low = engine.add_particle(walker(1, +1));
    ParticleId high = engine.add_particle(walker(3, -1));

    auto committed = engine.step_once();

    EXPECT_EQ(engine.particle(low).position(), 2);
    EXPECT_EQ(engine.particle(high).position(), 3);
    ASSERT_EQ(committed.size(), 1U);
    EXPECT_EQ(committed[0].particle, low);
}

TEST_F(SyncEngineTest, OccupancyIsJudgedAgainstPreTickTrack) {
    Engine engine(Track(6, BoundaryMode::Closed), walker_rules());
    ParticleId back = engine.add_particle(walker(1));
    ParticleId front = engine.add_particle(walker(2));

    engine.step_once();

    // The front walker leaves site 2 during the tick, but the back walker
    // saw it occupied and was blocked.
    EXPECT_EQ(engine.particle(front).position(), 3);
    EXPECT_EQ(engine.particle(back).position(), 1);

    engine.step_once();
    EXPECT_EQ(engine.particle(front).position(), 4);
    EXPECT_EQ(engine.particle(back).position(), 2);
}

TEST_F(SyncEngineTest, RulesSeeTickStartTimeAndStep) {
    RuleSet rules;
    rules.declare_trait("clock");
    std::vector<std::pair<uint64_t, TimePoint>> seen;
    rules.bind_stepping("clock", [&seen](Particle&, const RuleContext& ctx) {
        seen.emplace_back(ctx.step(), ctx.now());
        return StepAction::stay();
    });
    EngineConfig config;
    config.tick_length = duration_from_seconds(0.5);
    Engine engine(Track(3, BoundaryMode::Closed), std::move(rules), config);
    engine.add_particle({0, {"clock"}, {}});

    (void)engine.run(2);

    ASSERT_EQ(seen.size(), 2U);
    EXPECT_EQ(seen[0].first, 1U);
    EXPECT_EQ(seen[0].second, time(0.0));
    EXPECT_EQ(seen[1].first, 2U);
    EXPECT_EQ(seen[1].second, time(0.5));
    EXPECT_EQ(engine.time(), time(1.0));
}

TEST_F(SyncEngineTest, ExplicitRemoval) {
    RuleSet rules;
    rules.declare_trait("quitter");
    rules.bind_stepping("quitter", [](Particle&, const RuleContext&) { return StepAction::remove(); });
    Engine engine(Track(3, BoundaryMode::Closed), std::move(rules));
    ParticleId id = engine.add_particle({1, {"quitter"}, {}});

    auto committed = engine.step_once();

    ASSERT_EQ(committed.size(), 1U);
    EXPECT_EQ(committed[0], (TrajectoryEntry{1, time(1.0), id, 1, std::nullopt, EventKind::Remove}));
    EXPECT_FALSE(engine.contains(id));
    EXPECT_FALSE(engine.track().is_occupied(1));
}

// ============================================================================
// Boundaries
// ============================================================================

TEST_F(SyncEngineTest, OpenBoundaryLetsParticlesExit) {
    Engine engine(Track(5, BoundaryMode::Open), walker_rules());
    ParticleId id = engine.add_particle(walker(4));

    auto result = engine.run(5);

    EXPECT_EQ(result.steps, 1U);
    EXPECT_EQ(result.reason, StopReason::NoLiveParticles);
    ASSERT_EQ(result.entries.size(), 1U);
    EXPECT_EQ(result.entries[0].kind, EventKind::Exit);
    EXPECT_EQ(result.entries[0].from, 4);
    EXPECT_FALSE(result.entries[0].to.has_value());
    EXPECT_FALSE(engine.contains(id));
    EXPECT_TRUE(engine.finished());
}

TEST_F(SyncEngineTest, MarkedTrackPlacesEndMarkers) {
    Engine engine(Track(6, BoundaryMode::Marked), walker_rules());

    EXPECT_EQ(engine.track().occupant_at(0), ParticleId{0});
    EXPECT_EQ(engine.track().occupant_at(5), ParticleId{1});
    EXPECT_TRUE(engine.rules().has_trait(engine.particle(ParticleId{0}), "track_end"));
    EXPECT_EQ(engine.live_particle_count(), 0U);

    ParticleId id = engine.add_particle(walker(2, -1));
    EXPECT_EQ(id, ParticleId{2});
    EXPECT_EQ(engine.live_particle_count(), 1U);
}

TEST_F(SyncEngineTest, EndMarkersBlockWalkers) {
    Engine engine(Track(6, BoundaryMode::Marked), walker_rules());
    ParticleId id = engine.add_particle(walker(2, -1));

    (void)engine.run(4);

    EXPECT_EQ(engine.particle(id).position(), 1);
    EXPECT_EQ(engine.particle(ParticleId{0}).position(), 0);
    EXPECT_EQ(engine.particle(ParticleId{1}).position(), 5);
}

TEST_F(SyncEngineTest, LeavingMarkedTrackIsBoundaryError) {
    Engine engine(Track(6, BoundaryMode::Marked),
                  walker_rules_with_collision(CollisionOutcome::swap()));
    ParticleId id = engine.add_particle(walker(1, -1));

    auto result = engine.run(5);

    // Tick 1 swaps the walker with the marker, tick 2 walks off the edge.
    EXPECT_EQ(result.steps, 1U);
    EXPECT_EQ(result.reason, StopReason::Failed);
    EXPECT_FALSE(result.ok());
    EXPECT_THROW(result.rethrow_if_failed(), BoundaryError);
    ASSERT_EQ(result.entries.size(), 2U);
    EXPECT_EQ(result.entries[0].kind, EventKind::Swap);
    EXPECT_EQ(engine.particle(id).position(), 0);
    EXPECT_TRUE(engine.finished());
    EXPECT_EQ(engine.finish_reason(), StopReason::Failed);
    EXPECT_THROW(engine.step_once(), InvalidStateError);
}

// ============================================================================
// Collision outcomes
// ============================================================================

TEST_F(SyncEngineTest, SwapExchangesSites) {
    Engine engine(Track(5, BoundaryMode::Closed),
                  walker_rules_with_collision(CollisionOutcome::swap()));
    ParticleId mover = engine.add_particle(walker(1));
    ParticleId occupant = engine.add_particle(sitter(2));

    auto committed = engine.step_once();

    EXPECT_EQ(engine.particle(mover).position(), 2);
    EXPECT_EQ(engine.particle(occupant).position(), 1);
    ASSERT_EQ(committed.size(), 2U);
    EXPECT_EQ(committed[0], (TrajectoryEntry{1, time(1.0), mover, 1, 2, EventKind::Swap}));
    EXPECT_EQ(committed[1], (TrajectoryEntry{1, time(1.0), occupant, 2, 1, EventKind::Swap}));
}

TEST_F(SyncEngineTest, MergeKeepsMover) {
    Engine engine(Track(5, BoundaryMode::Closed),
                  walker_rules_with_collision(CollisionOutcome::merge(Survivor::Mover)));
    ParticleId mover = engine.add_particle(walker(1));
    ParticleId occupant = engine.add_particle(sitter(2));

    auto committed = engine.step_once();

    EXPECT_FALSE(engine.contains(occupant));
    EXPECT_EQ(engine.particle(mover).position(), 2);
    ASSERT_EQ(committed.size(), 2U);
    EXPECT_EQ(committed[0], (TrajectoryEntry{1, time(1.0), occupant, 2, std::nullopt, EventKind::Merge}));
    EXPECT_EQ(committed[1], (TrajectoryEntry{1, time(1.0), mover, 1, 2, EventKind::Merge}));
}

TEST_F(SyncEngineTest, MergeKeepsOccupant) {
    Engine engine(Track(5, BoundaryMode::Closed),
                  walker_rules_with_collision(CollisionOutcome::merge(Survivor::Occupant)));
    ParticleId mover = engine.add_particle(walker(1));
    ParticleId occupant = engine.add_particle(sitter(2));

    engine.step_once();

    EXPECT_FALSE(engine.contains(mover));
    EXPECT_EQ(engine.particle(occupant).position(), 2);
    EXPECT_EQ(engine.track().occupied_count(), 1U);
}

TEST_F(SyncEngineTest, PushDisplacesTrain) {
    Engine engine(Track(5, BoundaryMode::Closed),
                  walker_rules_with_collision(CollisionOutcome::push()));
    ParticleId a = engine.add_particle(walker(1));
    ParticleId b = engine.add_particle(sitter(2));
    ParticleId c = engine.add_particle(sitter(3));

    auto committed = engine.step_once();

    EXPECT_EQ(engine.particle(a).position(), 2);
    EXPECT_EQ(engine.particle(b).position(), 3);
    EXPECT_EQ(engine.particle(c).position(), 4);
    ASSERT_EQ(committed.size(), 3U);
    EXPECT_EQ(committed[0].kind, EventKind::Push);
    EXPECT_EQ(committed[1].kind, EventKind::Push);
    EXPECT_EQ(committed[2], (TrajectoryEntry{1, time(1.0), a, 1, 2, EventKind::Move}));

    // The train now touches the closed end and cannot be pushed further.
    auto blocked = engine.step_once();
    EXPECT_TRUE(blocked.empty());
    EXPECT_EQ(engine.particle(a).position(), 2);
}

TEST_F(SyncEngineTest, BounceRedirectsMover) {
    RuleSet rules = walker_rules();
    rules.set_fallback_collision([](Particle& mover, const Particle&, const RuleContext&) {
        return CollisionOutcome::bounce(mover.position() - 1);
    });
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules));
    ParticleId mover = engine.add_particle(walker(2));
    engine.add_particle(sitter(3));

    auto committed = engine.step_once();

    ASSERT_EQ(committed.size(), 1U);
    EXPECT_EQ(committed[0], (TrajectoryEntry{1, time(1.0), mover, 2, 1, EventKind::Bounce}));
}

TEST_F(SyncEngineTest, BounceOntoOwnTargetIsRuleError) {
    RuleSet rules = walker_rules();
    rules.set_fallback_collision([](Particle& mover, const Particle&, const RuleContext&) {
        return CollisionOutcome::bounce(mover.position() + 1);
    });
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules));
    engine.add_particle(walker(2));
    engine.add_particle(sitter(3));

    EXPECT_THROW(engine.step_once(), RuleError);
    EXPECT_TRUE(engine.finished());
}

TEST_F(SyncEngineTest, OutcomeTouchingClaimedParticleIsRejected) {
    Engine engine(Track(6, BoundaryMode::Closed),
                  walker_rules_with_collision(CollisionOutcome::swap()));
    ParticleId back = engine.add_particle(walker(1));
    ParticleId front = engine.add_particle(walker(2));

    engine.step_once();

    // The front walker's plain move claims it first; the swap is dropped.
    EXPECT_EQ(engine.particle(front).position(), 3);
    EXPECT_EQ(engine.particle(back).position(), 1);
}

// ============================================================================
// Lifetime, removal and spawning
// ============================================================================

TEST_F(SyncEngineTest, ExpiryNeverHappensEarly) {
    RuleSet rules = walker_rules();
    rules.declare_trait("mortal");
    rules.bind_lifetime("mortal", [](const Particle& self, const RuleContext&) -> std::optional<TimePoint> {
        return self.created_at() + duration_from_seconds(self.get<double>("lifetime"));
    });
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules));
    ParticleId early = engine.add_particle({0, {"sitter", "mortal"}, {{"lifetime", 2.0}}});
    ParticleId late = engine.add_particle({4, {"sitter", "mortal"}, {{"lifetime", 2.5}}});

    (void)engine.run(2);
    EXPECT_FALSE(engine.contains(early));
    EXPECT_TRUE(engine.contains(late));

    auto committed = engine.step_once();
    EXPECT_FALSE(engine.contains(late));
    ASSERT_EQ(committed.size(), 1U);
    EXPECT_EQ(committed[0], (TrajectoryEntry{3, time(3.0), late, 4, std::nullopt, EventKind::Expire}));
}

TEST_F(SyncEngineTest, RemovalRuleReloadsReplacement) {
    RuleSet rules = walker_rules();
    rules.declare_trait("reloading");
    rules.bind_removal("reloading", [](const Particle&, const RuleContext&)
                                        -> std::optional<std::vector<ParticleSpec>> {
        return std::vector<ParticleSpec>{ParticleSpec{0, {"walker"}, {}}};
    });
    Engine engine(Track(5, BoundaryMode::Open), std::move(rules));
    engine.add_particle({4, {"walker", "reloading"}, {}});

    auto committed = engine.step_once();

    ASSERT_EQ(committed.size(), 2U);
    EXPECT_EQ(committed[0].kind, EventKind::Exit);
    EXPECT_EQ(committed[1], (TrajectoryEntry{1, time(1.0), ParticleId{1}, std::nullopt, 0, EventKind::Spawn}));
    EXPECT_EQ(engine.particle(ParticleId{1}).created_at(), time(1.0));

    engine.step_once();
    EXPECT_EQ(engine.particle(ParticleId{1}).position(), 1);
}

TEST_F(SyncEngineTest, SpawnOnOccupiedSiteIsDropped) {
    RuleSet rules = walker_rules();
    rules.declare_trait("spawner");
    rules.bind_stepping("spawner", [](Particle& self, const RuleContext&) {
        return StepAction::stay().with_spawn(ParticleSpec{self.position() + 1, {"sitter"}, {}});
    });
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules));
    engine.add_particle({0, {"spawner"}, {}});
    engine.add_particle(sitter(1));

    auto committed = engine.step_once();

    EXPECT_TRUE(committed.empty());
    EXPECT_EQ(engine.particles().size(), 2U);
}

TEST_F(SyncEngineTest, SpawnLandsAfterCommit) {
    RuleSet rules = walker_rules();
    rules.declare_trait("layer");
    rules.bind_stepping("layer", [](Particle& self, const RuleContext&) {
        return StepAction::move_to(self.position() + 1).with_spawn(ParticleSpec{self.position(), {"sitter"}, {}});
    });
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules));
    ParticleId layer = engine.add_particle({0, {"layer"}, {}});

    auto committed = engine.step_once();

    ASSERT_EQ(committed.size(), 2U);
    EXPECT_EQ(committed[0].kind, EventKind::Move);
    EXPECT_EQ(committed[1].kind, EventKind::Spawn);
    EXPECT_EQ(engine.particle(layer).position(), 1);
    EXPECT_EQ(engine.track().occupant_at(0), ParticleId{1});
}

// ============================================================================
// Particles that cannot act
// ============================================================================

TEST_F(SyncEngineTest, TraitWithoutRuleCannotMoveIsConfigurationError) {
    RuleSet rules = walker_rules();
    rules.declare_trait("stray");
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules));

    EXPECT_THROW(engine.add_particle({1, {"stray"}, {}}), ConfigurationError);
    EXPECT_TRUE(engine.particles().empty());
    EXPECT_FALSE(engine.track().is_occupied(1));
    EXPECT_EQ(engine.step_index(), 0U);

    // The engine stays usable for valid particles.
    ParticleId id = engine.add_particle(walker(1));
    engine.step_once();
    EXPECT_EQ(engine.particle(id).position(), 2);
}

TEST_F(SyncEngineTest, LifetimeOnlyParticleIsConfigurationError) {
    RuleSet rules = walker_rules();
    rules.declare_trait("mortal");
    rules.bind_lifetime("mortal", [](const Particle& self, const RuleContext&) -> std::optional<TimePoint> {
        return self.created_at() + duration_from_seconds(1.0);
    });
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules));

    EXPECT_THROW(engine.add_particle({0, {"mortal"}, {}}), ConfigurationError);
    EXPECT_NO_THROW(engine.add_particle({0, {"sitter", "mortal"}, {}}));
}

TEST_F(SyncEngineTest, TaggedParticleIsInertMarker) {
    RuleSet rules = walker_rules();
    rules.declare_tag("post");
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules));
    ParticleId id = engine.add_particle(walker(0));
    ParticleId post = engine.add_particle({2, {"post"}, {}});

    EXPECT_EQ(engine.live_particle_count(), 1U);
    auto result = engine.run(3);

    EXPECT_EQ(result.reason, StopReason::RequestedSteps);
    EXPECT_EQ(engine.particle(id).position(), 1);
    EXPECT_EQ(engine.particle(post).position(), 2);
    ASSERT_EQ(result.entries.size(), 1U);
}

TEST_F(SyncEngineTest, FallbackSteppingMovesUnboundTrait) {
    RuleSet rules;
    rules.declare_trait("stray");
    rules.set_fallback_stepping([](Particle& self, const RuleContext&) {
        return StepAction::move_to(self.position() + 1);
    });
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules));
    ParticleId id = engine.add_particle({0, {"stray"}, {}});

    engine.step_once();

    EXPECT_EQ(engine.particle(id).position(), 1);
}

TEST_F(SyncEngineTest, SpawnThatCannotActIsRuleError) {
    RuleSet rules = walker_rules();
    rules.declare_trait("stray");
    rules.declare_trait("spawner");
    rules.bind_stepping("spawner", [](Particle& self, const RuleContext&) {
        return StepAction::stay().with_spawn(ParticleSpec{self.position() + 1, {"stray"}, {}});
    });
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules));
    engine.add_particle({0, {"spawner"}, {}});

    auto result = engine.run(2);

    EXPECT_EQ(result.reason, StopReason::Failed);
    EXPECT_THROW(result.rethrow_if_failed(), RuleError);
    EXPECT_EQ(engine.particles().size(), 1U);
}

// ============================================================================
// Rule contract failures
// ============================================================================

TEST_F(SyncEngineTest, NonAdjacentMoveIsRuleError) {
    RuleSet rules;
    rules.declare_trait("jumper");
    rules.bind_stepping("jumper", [](Particle& self, const RuleContext&) {
        return StepAction::move_to(self.position() + 2);
    });
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules));
    engine.add_particle({0, {"jumper"}, {}});

    auto result = engine.run(3);

    EXPECT_EQ(result.reason, StopReason::Failed);
    EXPECT_EQ(result.steps, 0U);
    EXPECT_THROW(result.rethrow_if_failed(), RuleError);
}

TEST_F(SyncEngineTest, RuleExceptionPropagatesWithPartialTrajectory) {
    RuleSet rules;
    rules.declare_trait("fragile");
    rules.bind_stepping("fragile", [](Particle& self, const RuleContext& ctx) {
        if (ctx.step() == 3) {
            throw RuleFailure("fragile rule gave up");
        }
        return StepAction::move_to(self.position() + 1);
    });
    Engine engine(Track(10, BoundaryMode::Closed), std::move(rules));
    engine.add_particle({0, {"fragile"}, {}});

    auto result = engine.run(10);

    EXPECT_EQ(result.steps, 2U);
    EXPECT_EQ(result.reason, StopReason::Failed);
    EXPECT_EQ(result.entries.size(), 2U);
    EXPECT_THROW(result.rethrow_if_failed(), RuleFailure);
    EXPECT_TRUE(engine.finished());
    EXPECT_THROW((void)engine.run(1), InvalidStateError);
}

TEST_F(SyncEngineTest, StepOnceRethrowsRuleExceptionUnchanged) {
    RuleSet rules;
    rules.declare_trait("fragile");
    rules.bind_stepping("fragile", [](Particle&, const RuleContext&) -> StepAction {
        throw RuleFailure("boom");
    });
    Engine engine(Track(3, BoundaryMode::Closed), std::move(rules));
    engine.add_particle({0, {"fragile"}, {}});

    EXPECT_THROW(engine.step_once(), RuleFailure);
    EXPECT_EQ(engine.finish_reason(), StopReason::Failed);
    EXPECT_NE(engine.failure(), nullptr);
}

// ============================================================================
// Observation and invariants
// ============================================================================

TEST_F(SyncEngineTest, ObserverSeesEachCommittedStep) {
    Engine engine(Track(5, BoundaryMode::Closed), walker_rules());
    ParticleId id = engine.add_particle(walker(0));

    std::vector<uint64_t> steps;
    std::vector<std::size_t> committed;
    engine.set_observer([&](const Snapshot& snapshot) {
        steps.push_back(snapshot.step);
        committed.push_back(snapshot.committed.size());
        EXPECT_EQ(snapshot.track.occupant_at(snapshot.particles.at(id).position()), id);
        EXPECT_EQ(snapshot.time, time_from_seconds(static_cast<double>(snapshot.step)));
    });

    (void)engine.run(5);

    EXPECT_EQ(steps, (std::vector<uint64_t>{1, 2, 3, 4, 5}));
    EXPECT_EQ(committed, (std::vector<std::size_t>{1, 1, 1, 1, 0}));
}

TEST_F(SyncEngineTest, OccupancyStaysConsistentUnderCrowding) {
    RuleSet rules;
    rules.declare_trait("jitter");
    rules.bind_stepping("jitter", [](Particle& self, const RuleContext& ctx) {
        return StepAction::move_to(self.position() + (ctx.uniform() < 0.5 ? -1 : 1));
    });
    rules.set_fallback_collision([](Particle&, const Particle&, const RuleContext& ctx) {
        double u = ctx.uniform();
        if (u < 0.25) {
            return CollisionOutcome::swap();
        }
        if (u < 0.5) {
            return CollisionOutcome::push();
        }
        return CollisionOutcome::blocked();
    });
    EngineConfig config;
    config.seed = 7;
    Engine engine(Track(12, BoundaryMode::Marked), std::move(rules), config);
    for (Site site = 2; site < 10; ++site) {
        engine.add_particle({site, {"jitter"}, {}});
    }

    engine.set_observer([](const Snapshot& snapshot) {
        EXPECT_EQ(snapshot.track.occupied_count(), snapshot.particles.size());
        for (const auto& [id, particle] : snapshot.particles) {
            EXPECT_EQ(snapshot.track.occupant_at(particle.position()), id);
        }
    });

    // Swaps and pushes can still shove a marker; stop as soon as that happens.
    auto result = engine.run(100);
    if (!result.ok()) {
        EXPECT_THROW(result.rethrow_if_failed(), BoundaryError);
    }
}
