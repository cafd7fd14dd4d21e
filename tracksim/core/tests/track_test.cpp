#include <tracksim/core/error.hpp>
#include <tracksim/core/track.hpp>

#include <gtest/gtest.h>

using namespace tracksim::core;

class TrackTest : public ::testing::Test {
protected:
    Track track_{5, BoundaryMode::Closed};
};

TEST_F(TrackTest, StartsEmpty) {
    EXPECT_EQ(track_.length(), 5U);
    EXPECT_EQ(track_.boundary(), BoundaryMode::Closed);
    EXPECT_EQ(track_.occupied_count(), 0U);
    for (Site site = 0; site < 5; ++site) {
        EXPECT_FALSE(track_.occupant_at(site).has_value());
    }
}

TEST_F(TrackTest, PlaceAndVacate) {
    track_.place(ParticleId{7}, 2);

    EXPECT_TRUE(track_.is_occupied(2));
    EXPECT_EQ(track_.occupant_at(2), ParticleId{7});
    EXPECT_EQ(track_.occupied_count(), 1U);

    auto removed = track_.vacate(2);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, ParticleId{7});
    EXPECT_FALSE(track_.is_occupied(2));
    EXPECT_EQ(track_.occupied_count(), 0U);
}

TEST_F(TrackTest, VacateEmptySiteReturnsNothing) {
    EXPECT_FALSE(track_.vacate(3).has_value());
    EXPECT_EQ(track_.occupied_count(), 0U);
}

TEST_F(TrackTest, PlaceOnOccupiedSiteThrows) {
    track_.place(ParticleId{0}, 1);
    EXPECT_THROW(track_.place(ParticleId{1}, 1), OccupiedError);
    EXPECT_EQ(track_.occupant_at(1), ParticleId{0});
}

TEST_F(TrackTest, MutatorsRejectOffTrackSites) {
    EXPECT_THROW(track_.place(ParticleId{0}, -1), OutOfRangeError);
    EXPECT_THROW(track_.place(ParticleId{0}, 5), OutOfRangeError);
    EXPECT_THROW(track_.vacate(5), OutOfRangeError);
}

TEST_F(TrackTest, QueriesTreatOffTrackSitesAsEmpty) {
    EXPECT_FALSE(track_.is_in_bounds(-1));
    EXPECT_FALSE(track_.is_in_bounds(5));
    EXPECT_FALSE(track_.occupant_at(-1).has_value());
    EXPECT_FALSE(track_.is_occupied(99));
}

TEST_F(TrackTest, NeighborsStayInBounds) {
    EXPECT_EQ(track_.neighbors(0), (std::vector<Site>{1}));
    EXPECT_EQ(track_.neighbors(2), (std::vector<Site>{1, 3}));
    EXPECT_EQ(track_.neighbors(4), (std::vector<Site>{3}));
}

TEST_F(TrackTest, NextEmptyFindsEndOfTrain) {
    track_.place(ParticleId{0}, 1);
    track_.place(ParticleId{1}, 2);
    track_.place(ParticleId{2}, 3);

    EXPECT_EQ(track_.next_empty(1, +1), 4);
    EXPECT_EQ(track_.next_empty(3, -1), 0);
    EXPECT_EQ(track_.next_empty(4, +1), 4);
}

TEST_F(TrackTest, NextEmptyMayLeaveTheTrack) {
    track_.place(ParticleId{0}, 3);
    track_.place(ParticleId{1}, 4);

    EXPECT_EQ(track_.next_empty(3, +1), 5);
}

TEST_F(TrackTest, NextEmptyRejectsDirectionOtherThanUnit) {
    track_.place(ParticleId{0}, 2);

    EXPECT_THROW((void)track_.next_empty(2, 0), OutOfRangeError);
    EXPECT_THROW((void)track_.next_empty(2, 2), OutOfRangeError);
    // Rejected even when the start site is free.
    EXPECT_THROW((void)track_.next_empty(3, 0), OutOfRangeError);
}

TEST_F(TrackTest, OccupantsInHalfOpenRange) {
    track_.place(ParticleId{4}, 0);
    track_.place(ParticleId{2}, 2);
    track_.place(ParticleId{9}, 4);

    EXPECT_EQ(track_.occupants_in(0, 4), (std::vector<ParticleId>{ParticleId{4}, ParticleId{2}}));
    EXPECT_EQ(track_.occupants_in(-3, 10).size(), 3U);
    EXPECT_TRUE(track_.occupants_in(3, 3).empty());
}

TEST(BoundaryModeTest, NamesRoundTrip) {
    for (auto mode : {BoundaryMode::Closed, BoundaryMode::Open, BoundaryMode::Marked}) {
        EXPECT_EQ(boundary_mode_from_string(to_string(mode)), mode);
    }
    EXPECT_FALSE(boundary_mode_from_string("periodic").has_value());
}
