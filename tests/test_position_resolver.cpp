#include <gtest/gtest.h>

#include "FakeDecoder.hpp"
#include "PositionResolver.hpp"

namespace {

struct ResolverFixture {
    FakeDecoder decoder;
    PositionResolver resolver{decoder, 10.0};
    CprState state;
};

}  // namespace

TEST(PositionResolver, ResolvesFreshPair) {
    ResolverFixture f;
    EXPECT_FALSE(f.resolver.update(f.state, "ABC123", "EVEN", false, 100.0));
    auto position = f.resolver.update(f.state, "ABC123", "ODD", true, 104.0);

    ASSERT_TRUE(position.has_value());
    EXPECT_DOUBLE_EQ(position->lat, 52.0);
    EXPECT_DOUBLE_EQ(position->lon, 5.0);
    EXPECT_EQ(f.state.stale_pairs, 0);
    EXPECT_EQ(f.decoder.resolve_calls, 1);
}

TEST(PositionResolver, RejectsStalePairAndKeepsNewestFrame) {
    ResolverFixture f;
    f.resolver.update(f.state, "ABC123", "EVEN", false, 100.0);
    auto position = f.resolver.update(f.state, "ABC123", "ODD", true, 115.0);

    EXPECT_FALSE(position.has_value());
    EXPECT_EQ(f.state.stale_pairs, 1);
    EXPECT_EQ(f.decoder.resolve_calls, 0);
    EXPECT_FALSE(f.state.even.has_value());
    ASSERT_TRUE(f.state.odd.has_value());
    EXPECT_EQ(f.state.odd->frame, "ODD");
    EXPECT_DOUBLE_EQ(f.state.odd->timestamp, 115.0);
}

TEST(PositionResolver, PairAtThresholdIsNotStale) {
    ResolverFixture f;
    f.resolver.update(f.state, "ABC123", "EVEN", false, 100.0);
    EXPECT_TRUE(f.resolver.update(f.state, "ABC123", "ODD", true, 110.0));
    EXPECT_EQ(f.state.stale_pairs, 0);
}

TEST(PositionResolver, RepeatedFrameGivesSameResult) {
    ResolverFixture f;
    f.resolver.update(f.state, "ABC123", "EVEN", false, 100.0);
    auto first = f.resolver.update(f.state, "ABC123", "ODD", true, 104.0);
    auto second = f.resolver.update(f.state, "ABC123", "ODD", true, 104.0);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_DOUBLE_EQ(first->lat, second->lat);
    EXPECT_DOUBLE_EQ(first->lon, second->lon);
    EXPECT_EQ(f.state.stale_pairs, 0);
}

TEST(PositionResolver, FailedDecodeKeepsBothSlots) {
    ResolverFixture f;
    f.decoder.next_position.reset();
    f.resolver.update(f.state, "ABC123", "EVEN", false, 100.0);
    EXPECT_FALSE(f.resolver.update(f.state, "ABC123", "ODD", true, 101.0));
    EXPECT_TRUE(f.state.even.has_value());
    EXPECT_TRUE(f.state.odd.has_value());

    f.decoder.next_position = GeoPosition{51.0, 4.0};
    auto position = f.resolver.update(f.state, "ABC123", "EVEN2", false, 102.0);
    ASSERT_TRUE(position.has_value());
    EXPECT_DOUBLE_EQ(position->lat, 51.0);
}

TEST(PositionResolver, DecoderExceptionIsContained) {
    ResolverFixture f;
    f.decoder.throw_on_resolve = true;
    f.resolver.update(f.state, "ABC123", "EVEN", false, 100.0);
    EXPECT_NO_THROW({
        EXPECT_FALSE(f.resolver.update(f.state, "ABC123", "ODD", true, 101.0));
    });
    EXPECT_TRUE(f.state.even.has_value());
    EXPECT_TRUE(f.state.odd.has_value());
}

TEST(PositionResolver, FailureLogIsRateLimited) {
    ResolverFixture f;
    f.decoder.next_position.reset();
    f.resolver.update(f.state, "ABC123", "EVEN", false, 100.0);
    f.resolver.update(f.state, "ABC123", "ODD", true, 101.0);
    EXPECT_DOUBLE_EQ(f.state.last_failure_log, 101.0);

    f.resolver.update(f.state, "ABC123", "ODD", true, 105.0);
    EXPECT_DOUBLE_EQ(f.state.last_failure_log, 101.0);

    f.resolver.update(f.state, "ABC123", "EVEN", false, 140.0);
    EXPECT_DOUBLE_EQ(f.state.last_failure_log, 140.0);
}

TEST(Haversine, KnownDistances) {
    EXPECT_NEAR(haversine_nm(52.0, 4.0, 52.0, 5.0), 36.964, 0.01);
    EXPECT_NEAR(haversine_nm(51.4775, -0.4614, 40.6413, -73.7781), 2990.98,
                0.5);
    EXPECT_DOUBLE_EQ(haversine_nm(10.0, 20.0, 10.0, 20.0), 0.0);
}

TEST(Haversine, AnnotatesBothUnits) {
    AircraftRecord record;
    record.position = GeoPosition{52.0, 5.0};
    annotate_distance(record, GeoPosition{52.0, 4.0});

    ASSERT_TRUE(record.distance_nm.has_value());
    ASSERT_TRUE(record.distance_km.has_value());
    EXPECT_NEAR(*record.distance_km, *record.distance_nm * 1.852, 1e-9);

    annotate_distance(record, std::nullopt);
    EXPECT_FALSE(record.distance_nm.has_value());
    EXPECT_FALSE(record.distance_km.has_value());
}
