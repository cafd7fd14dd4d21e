#include <tracksim/core/engine.hpp>
#include <tracksim/core/error.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <utility>
#include <vector>

using namespace tracksim::core;

class AsyncEngineTest : public ::testing::Test {
protected:
    TimePoint time(double seconds) {
        return time_from_seconds(seconds);
    }

    static EngineConfig async_config() {
        EngineConfig config;
        config.policy = SchedulingPolicy::Asynchronous;
        return config;
    }

    // "runner" moves forward and acts again after 1/speed seconds.
    static RuleSet runner_rules() {
        RuleSet rules;
        rules.declare_trait("runner");
        rules.bind_stepping("runner", [](Particle& self, const RuleContext&) {
            double speed = self.get_or<double>("speed", 1.0);
            return StepAction::move_to(self.position() + 1).with_wait(duration_from_seconds(1.0 / speed));
        });
        return rules;
    }

    static ParticleSpec runner(Site site, double speed) {
        return ParticleSpec{site, {"runner"}, {{"speed", speed}}};
    }

    // Runners plus a "rock" that stays put for five seconds at a time.
    // Every collision is settled by @p collide.
    static RuleSet rock_rules(CollisionRule collide) {
        RuleSet rules = runner_rules();
        rules.declare_trait("rock");
        rules.bind_stepping("rock", [](Particle&, const RuleContext&) {
            return StepAction::stay().with_wait(duration_from_seconds(5.0));
        });
        rules.set_fallback_collision(std::move(collide));
        return rules;
    }

    static CollisionRule always(CollisionOutcome outcome) {
        return [outcome](Particle&, const Particle&, const RuleContext&) { return outcome; };
    }

    static ParticleSpec rock(Site site) {
        return ParticleSpec{site, {"rock"}, {}};
    }
};

TEST_F(AsyncEngineTest, FinalizeQueuesFirstOpportunities) {
    Engine engine(Track(10, BoundaryMode::Closed), runner_rules(), async_config());
    engine.add_particle(runner(0, 1.0));
    engine.add_particle(runner(5, 2.0));

    EXPECT_EQ(engine.pending_event_count(), 0U);
    engine.finalize();
    EXPECT_TRUE(engine.is_finalized());
    EXPECT_EQ(engine.pending_event_count(), 2U);
    EXPECT_THROW(engine.add_particle(runner(8, 1.0)), InvalidStateError);
}

TEST_F(AsyncEngineTest, WaitingTimesOrderEvents) {
    Engine engine(Track(10, BoundaryMode::Closed), runner_rules(), async_config());
    ParticleId slow = engine.add_particle(runner(0, 1.0));
    ParticleId fast = engine.add_particle(runner(5, 2.0));

    auto result = engine.run_until(time(1.0));

    // t=0: slow, fast; t=0.5: fast; t=1.0: slow (queued first), fast.
    EXPECT_EQ(result.reason, StopReason::Deadline);
    EXPECT_EQ(result.steps, 5U);
    EXPECT_EQ(engine.particle(slow).position(), 2);
    EXPECT_EQ(engine.particle(fast).position(), 8);
    EXPECT_EQ(engine.time(), time(1.0));

    ASSERT_EQ(result.entries.size(), 5U);
    EXPECT_EQ(result.entries[0], (TrajectoryEntry{1, time(0.0), slow, 0, 1, EventKind::Move}));
    EXPECT_EQ(result.entries[1], (TrajectoryEntry{2, time(0.0), fast, 5, 6, EventKind::Move}));
    EXPECT_EQ(result.entries[2], (TrajectoryEntry{3, time(0.5), fast, 6, 7, EventKind::Move}));
    EXPECT_EQ(result.entries[3], (TrajectoryEntry{4, time(1.0), slow, 1, 2, EventKind::Move}));
    EXPECT_EQ(result.entries[4], (TrajectoryEntry{5, time(1.0), fast, 7, 8, EventKind::Move}));
}

TEST_F(AsyncEngineTest, RunUntilAdvancesTimeBetweenEvents) {
    Engine engine(Track(10, BoundaryMode::Closed), runner_rules(), async_config());
    ParticleId id = engine.add_particle(runner(0, 0.5));

    auto result = engine.run_until(time(1.5));

    EXPECT_EQ(result.steps, 1U);
    EXPECT_EQ(engine.time(), time(1.5));
    EXPECT_EQ(engine.particle(id).position(), 1);

    (void)engine.run_until(time(2.0));
    EXPECT_EQ(engine.particle(id).position(), 2);
}

TEST_F(AsyncEngineTest, BlockedMoverStillReschedules) {
    RuleSet rules = runner_rules();
    rules.declare_trait("rock");
    rules.bind_stepping("rock", [](Particle&, const RuleContext&) {
        return StepAction::stay().with_wait(duration_from_seconds(100.0));
    });
    Engine engine(Track(10, BoundaryMode::Closed), std::move(rules), async_config());
    ParticleId id = engine.add_particle(runner(0, 1.0));
    engine.add_particle({1, {"rock"}, {}});

    auto result = engine.run_until(time(3.0));

    EXPECT_TRUE(result.entries.empty());
    EXPECT_EQ(engine.particle(id).position(), 0);
    // Runner at t = 0, 1, 2, 3 plus the rock at t = 0.
    EXPECT_EQ(result.steps, 5U);
}

TEST_F(AsyncEngineTest, MissingWaitIsRuleError) {
    RuleSet rules;
    rules.declare_trait("hasty");
    rules.bind_stepping("hasty", [](Particle& self, const RuleContext&) {
        return StepAction::move_to(self.position() + 1);
    });
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules), async_config());
    engine.add_particle({0, {"hasty"}, {}});

    auto result = engine.run(3);

    EXPECT_EQ(result.reason, StopReason::Failed);
    EXPECT_THROW(result.rethrow_if_failed(), RuleError);
}

TEST_F(AsyncEngineTest, NegativeWaitIsRuleError) {
    RuleSet rules;
    rules.declare_trait("eager");
    rules.bind_stepping("eager", [](Particle&, const RuleContext&) {
        return StepAction::stay().with_wait(duration_from_seconds(-1.0));
    });
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules), async_config());
    engine.add_particle({0, {"eager"}, {}});

    EXPECT_THROW(engine.step_once(), RuleError);
}

TEST_F(AsyncEngineTest, ParticleWhoseRulePassesGoesDormant) {
    RuleSet rules;
    rules.declare_trait("pass");
    rules.bind_stepping("pass", [](Particle&, const RuleContext&) { return StepAction::pass(); });
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules), async_config());
    engine.add_particle({0, {"pass"}, {}});

    auto result = engine.run(10);

    EXPECT_EQ(result.steps, 1U);
    EXPECT_EQ(result.reason, StopReason::QueueEmpty);
    EXPECT_TRUE(engine.finished());
}

TEST_F(AsyncEngineTest, ExpiryFiresBeforeStepAtSameTime) {
    RuleSet rules;
    rules.declare_trait("mortal");
    int steps_taken = 0;
    rules.bind_stepping("mortal", [&steps_taken](Particle&, const RuleContext&) {
        ++steps_taken;
        return StepAction::stay().with_wait(duration_from_seconds(1.0));
    });
    rules.bind_lifetime("mortal", [](const Particle& self, const RuleContext&) -> std::optional<TimePoint> {
        return self.created_at() + duration_from_seconds(2.0);
    });
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules), async_config());
    ParticleId id = engine.add_particle({2, {"mortal"}, {}});

    auto result = engine.run(10);

    EXPECT_EQ(steps_taken, 2);
    EXPECT_FALSE(engine.contains(id));
    EXPECT_EQ(result.reason, StopReason::NoLiveParticles);
    ASSERT_EQ(result.entries.size(), 1U);
    EXPECT_EQ(result.entries[0], (TrajectoryEntry{3, time(2.0), id, 2, std::nullopt, EventKind::Expire}));
    EXPECT_EQ(engine.pending_event_count(), 0U);
}

TEST_F(AsyncEngineTest, LifetimeIsRequeriedAfterStateChange) {
    RuleSet rules;
    rules.declare_trait("renewing");
    rules.bind_stepping("renewing", [](Particle& self, const RuleContext& ctx) {
        self.set("deadline", time_to_seconds(ctx.now()) + 1.5);
        return StepAction::stay().with_wait(duration_from_seconds(1.0));
    });
    rules.bind_lifetime("renewing", [](const Particle& self, const RuleContext&) -> std::optional<TimePoint> {
        return time_from_seconds(self.get_or<double>("deadline", 1.5));
    });
    Engine engine(Track(5, BoundaryMode::Closed), std::move(rules), async_config());
    ParticleId id = engine.add_particle({2, {"renewing"}, {}});

    (void)engine.run_until(time(10.0));

    // Every step pushes the deadline half a second past the next step.
    EXPECT_TRUE(engine.contains(id));
}

TEST_F(AsyncEngineTest, SpawnedParticleActsAtCreationTime) {
    RuleSet rules = runner_rules();
    rules.declare_trait("source");
    rules.bind_stepping("source", [](Particle& self, const RuleContext& ctx) {
        StepAction action = StepAction::stay().with_wait(duration_from_seconds(10.0));
        if (ctx.step() == 1) {
            action.with_spawn(ParticleSpec{self.position() + 1, {"runner"}, {}});
        }
        return action;
    });
    Engine engine(Track(10, BoundaryMode::Closed), std::move(rules), async_config());
    engine.add_particle({0, {"source"}, {}});

    auto result = engine.run(2);

    ASSERT_EQ(result.entries.size(), 2U);
    EXPECT_EQ(result.entries[0], (TrajectoryEntry{1, time(0.0), ParticleId{1}, std::nullopt, 1, EventKind::Spawn}));
    EXPECT_EQ(result.entries[1], (TrajectoryEntry{2, time(0.0), ParticleId{1}, 1, 2, EventKind::Move}));
}

TEST_F(AsyncEngineTest, RemovedParticleLeavesNoEvents) {
    RuleSet rules = runner_rules();
    rules.set_fallback_collision([](Particle&, const Particle&, const RuleContext&) {
        return CollisionOutcome::merge(Survivor::Mover);
    });
    rules.declare_trait("rock");
    rules.bind_stepping("rock", [](Particle&, const RuleContext&) {
        return StepAction::stay().with_wait(duration_from_seconds(5.0));
    });
    Engine engine(Track(10, BoundaryMode::Closed), std::move(rules), async_config());
    ParticleId runner_id = engine.add_particle(runner(0, 1.0));
    ParticleId rock = engine.add_particle({1, {"rock"}, {}});

    engine.step_once();

    EXPECT_FALSE(engine.contains(rock));
    EXPECT_EQ(engine.particle(runner_id).position(), 1);
    // Only the runner's next step is left.
    EXPECT_EQ(engine.pending_event_count(), 1U);
}

TEST_F(AsyncEngineTest, TimeLimitFinishesAtLimit) {
    EngineConfig config = async_config();
    config.time_limit = time(2.5);
    Engine engine(Track(10, BoundaryMode::Closed), runner_rules(), config);
    ParticleId id = engine.add_particle(runner(0, 1.0));

    auto result = engine.run(100);

    EXPECT_EQ(result.reason, StopReason::TimeLimit);
    EXPECT_EQ(result.steps, 3U);
    EXPECT_EQ(engine.particle(id).position(), 3);
    EXPECT_EQ(engine.time(), time(2.5));
    EXPECT_TRUE(engine.finished());
}

// ============================================================================
// Collisions
// ============================================================================

TEST_F(AsyncEngineTest, SwapExchangesSitesAndKeepsBothScheduled) {
    Engine engine(Track(10, BoundaryMode::Closed), rock_rules(always(CollisionOutcome::swap())),
                  async_config());
    ParticleId mover = engine.add_particle(runner(1, 1.0));
    ParticleId occupant = engine.add_particle(rock(2));

    auto committed = engine.step_once();

    EXPECT_EQ(engine.particle(mover).position(), 2);
    EXPECT_EQ(engine.particle(occupant).position(), 1);
    ASSERT_EQ(committed.size(), 2U);
    EXPECT_EQ(committed[0], (TrajectoryEntry{1, time(0.0), mover, 1, 2, EventKind::Swap}));
    EXPECT_EQ(committed[1], (TrajectoryEntry{1, time(0.0), occupant, 2, 1, EventKind::Swap}));
    // The runner's next step and the rock's first one.
    EXPECT_EQ(engine.pending_event_count(), 2U);
}

TEST_F(AsyncEngineTest, PushDisplacesOccupant) {
    Engine engine(Track(10, BoundaryMode::Closed), rock_rules(always(CollisionOutcome::push())),
                  async_config());
    ParticleId mover = engine.add_particle(runner(1, 1.0));
    ParticleId occupant = engine.add_particle(rock(2));

    auto committed = engine.step_once();

    EXPECT_EQ(engine.particle(mover).position(), 2);
    EXPECT_EQ(engine.particle(occupant).position(), 3);
    ASSERT_EQ(committed.size(), 2U);
    EXPECT_EQ(committed[0], (TrajectoryEntry{1, time(0.0), occupant, 2, 3, EventKind::Push}));
    EXPECT_EQ(committed[1], (TrajectoryEntry{1, time(0.0), mover, 1, 2, EventKind::Move}));
    EXPECT_EQ(engine.pending_event_count(), 2U);
}

TEST_F(AsyncEngineTest, PushOffOpenEndRemovesOccupantAndItsEvents) {
    Engine engine(Track(4, BoundaryMode::Open), rock_rules(always(CollisionOutcome::push())),
                  async_config());
    ParticleId mover = engine.add_particle(runner(2, 1.0));
    ParticleId occupant = engine.add_particle(rock(3));

    auto committed = engine.step_once();

    EXPECT_FALSE(engine.contains(occupant));
    EXPECT_EQ(engine.particle(mover).position(), 3);
    ASSERT_EQ(committed.size(), 2U);
    EXPECT_EQ(committed[0], (TrajectoryEntry{1, time(0.0), occupant, 3, std::nullopt, EventKind::Exit}));
    EXPECT_EQ(committed[1], (TrajectoryEntry{1, time(0.0), mover, 2, 3, EventKind::Move}));
    // The rock's first step was cancelled along with it.
    EXPECT_EQ(engine.pending_event_count(), 1U);
}

TEST_F(AsyncEngineTest, BounceRedirectsMover) {
    auto bounce_back = [](Particle& mover, const Particle&, const RuleContext&) {
        return CollisionOutcome::bounce(mover.position() - 1);
    };
    Engine engine(Track(10, BoundaryMode::Closed), rock_rules(bounce_back), async_config());
    ParticleId mover = engine.add_particle(runner(2, 1.0));
    ParticleId occupant = engine.add_particle(rock(3));

    auto committed = engine.step_once();

    EXPECT_EQ(engine.particle(mover).position(), 1);
    EXPECT_EQ(engine.particle(occupant).position(), 3);
    ASSERT_EQ(committed.size(), 1U);
    EXPECT_EQ(committed[0], (TrajectoryEntry{1, time(0.0), mover, 2, 1, EventKind::Bounce}));
    EXPECT_EQ(engine.pending_event_count(), 2U);
}

TEST_F(AsyncEngineTest, MergeKeepingOccupantDropsMover) {
    Engine engine(Track(10, BoundaryMode::Closed),
                  rock_rules(always(CollisionOutcome::merge(Survivor::Occupant))), async_config());
    ParticleId mover = engine.add_particle(runner(1, 1.0));
    ParticleId occupant = engine.add_particle(rock(2));

    auto committed = engine.step_once();

    EXPECT_FALSE(engine.contains(mover));
    EXPECT_EQ(engine.particle(occupant).position(), 2);
    ASSERT_EQ(committed.size(), 1U);
    EXPECT_EQ(committed[0], (TrajectoryEntry{1, time(0.0), mover, 1, std::nullopt, EventKind::Merge}));
    // The mover is not rescheduled; only the rock's first step is left.
    EXPECT_EQ(engine.pending_event_count(), 1U);
    EXPECT_EQ(engine.live_particle_count(), 1U);
}

TEST_F(AsyncEngineTest, DisplacedOccupantExpiryFollowsItsNewSite) {
    RuleSet rules = runner_rules();
    rules.set_fallback_collision(always(CollisionOutcome::push()));
    // A crate lasts until the time, in seconds, given by its site.
    rules.declare_trait("crate");
    rules.bind_stepping("crate", [](Particle&, const RuleContext&) {
        return StepAction::stay().with_wait(duration_from_seconds(100.0));
    });
    rules.bind_lifetime("crate", [](const Particle& self, const RuleContext&) -> std::optional<TimePoint> {
        return time_from_seconds(static_cast<double>(self.position()));
    });
    Engine engine(Track(10, BoundaryMode::Closed), std::move(rules), async_config());
    ParticleId mover = engine.add_particle(runner(1, 0.2));
    ParticleId crate = engine.add_particle({2, {"crate"}, {}});

    engine.finalize();
    EXPECT_EQ(engine.pending_event_count(), 3U);

    auto pushed = engine.step_once();
    ASSERT_EQ(pushed.size(), 2U);
    EXPECT_EQ(pushed[0], (TrajectoryEntry{1, time(0.0), crate, 2, 3, EventKind::Push}));
    // Crate step, runner step at t=5 and the crate's expiry moved to t=3.
    EXPECT_EQ(engine.pending_event_count(), 3U);

    auto result = engine.run_until(time(4.0));

    // The crate's own step, then its expiry; nothing fires at t=2.
    EXPECT_EQ(result.steps, 2U);
    ASSERT_EQ(result.entries.size(), 1U);
    EXPECT_EQ(result.entries[0], (TrajectoryEntry{3, time(3.0), crate, 3, std::nullopt, EventKind::Expire}));
    EXPECT_FALSE(engine.contains(crate));
    EXPECT_EQ(engine.particle(mover).position(), 2);
    EXPECT_EQ(engine.pending_event_count(), 1U);
}

// ============================================================================
// Particles that cannot act
// ============================================================================

TEST_F(AsyncEngineTest, TraitWithoutRuleCannotMoveIsConfigurationError) {
    RuleSet rules = runner_rules();
    rules.declare_trait("stray");
    Engine engine(Track(10, BoundaryMode::Closed), std::move(rules), async_config());

    EXPECT_THROW(engine.add_particle({4, {"stray"}, {}}), ConfigurationError);
    EXPECT_TRUE(engine.particles().empty());
    engine.finalize();
    EXPECT_EQ(engine.pending_event_count(), 0U);
}

TEST_F(AsyncEngineTest, LifetimeOrRemovalOnlyParticleIsConfigurationError) {
    RuleSet rules = runner_rules();
    rules.declare_trait("mortal");
    rules.bind_lifetime("mortal", [](const Particle& self, const RuleContext&) -> std::optional<TimePoint> {
        return self.created_at() + duration_from_seconds(3.0);
    });
    rules.declare_trait("reloading");
    rules.bind_removal("reloading", [](const Particle&, const RuleContext&)
                                        -> std::optional<std::vector<ParticleSpec>> {
        return std::vector<ParticleSpec>{};
    });
    Engine engine(Track(10, BoundaryMode::Closed), std::move(rules), async_config());

    EXPECT_THROW(engine.add_particle({4, {"mortal"}, {}}), ConfigurationError);
    EXPECT_THROW(engine.add_particle({4, {"reloading"}, {}}), ConfigurationError);
    EXPECT_THROW(engine.add_particle({4, {"mortal", "reloading"}, {}}), ConfigurationError);

    ParticleId id = engine.add_particle({4, {"mortal", "runner"}, {}});
    auto result = engine.run_until(time(10.0));
    EXPECT_FALSE(engine.contains(id));
    EXPECT_EQ(result.reason, StopReason::NoLiveParticles);
}

TEST_F(AsyncEngineTest, TaggedParticleIsNeverScheduled) {
    RuleSet rules = runner_rules();
    rules.declare_tag("post");
    Engine engine(Track(10, BoundaryMode::Closed), std::move(rules), async_config());
    ParticleId id = engine.add_particle(runner(0, 1.0));
    ParticleId post = engine.add_particle({2, {"post"}, {}});

    engine.finalize();
    EXPECT_EQ(engine.pending_event_count(), 1U);

    (void)engine.run_until(time(3.0));
    EXPECT_EQ(engine.particle(id).position(), 1);
    EXPECT_EQ(engine.particle(post).position(), 2);
}
