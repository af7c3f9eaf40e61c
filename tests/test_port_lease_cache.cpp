// =============================================================================
// Unit tests for PortLeaseCache (src/port_lease_cache.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "port_lease_cache.hpp"
#include "test_fakes.hpp"

using namespace autolink;
using autolink::testing::FakePortProber;

// ---------------------------------------------------------------------------
// First free candidate wins
// ---------------------------------------------------------------------------
TEST(PortLeaseCacheTest, LeasesFirstCandidate) {
    auto prober = std::make_shared<FakePortProber>();
    PortLeaseCache cache(prober);

    auto r = cache.lease({7000, 7001});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), 7000);
    EXPECT_TRUE(cache.isLeased(7000));
    EXPECT_FALSE(cache.isLeased(7001));
}

// ---------------------------------------------------------------------------
// Explicit port leased twice in one window -> PortLocked
// ---------------------------------------------------------------------------
TEST(PortLeaseCacheTest, SecondExplicitLeaseIsLocked) {
    auto prober = std::make_shared<FakePortProber>();
    PortLeaseCache cache(prober);

    ASSERT_TRUE(cache.tryLease(7000).is_ok());
    auto again = cache.tryLease(7000);
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.error().code, ErrorCode::PortLocked);
    EXPECT_EQ(again.error().message, "7000 is locked");
}

// ---------------------------------------------------------------------------
// Cached candidate is skipped in favour of the next one
// ---------------------------------------------------------------------------
TEST(PortLeaseCacheTest, LockedCandidateFallsThrough) {
    auto prober = std::make_shared<FakePortProber>();
    PortLeaseCache cache(prober);

    ASSERT_TRUE(cache.lease({7000}).is_ok());
    auto r = cache.lease({7000, 7001});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), 7001);
}

// ---------------------------------------------------------------------------
// EADDRINUSE on a candidate moves on, wildcard comes last
// ---------------------------------------------------------------------------
TEST(PortLeaseCacheTest, InUseCandidateFallsBackToWildcard) {
    auto prober = std::make_shared<FakePortProber>();
    prober->status[7000] = ProbeStatus::InUse;
    prober->wildcard_ports = {45123};
    PortLeaseCache cache(prober);

    auto r = cache.lease({7000});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), 45123);
    ASSERT_EQ(prober->probed.size(), 2u);
    EXPECT_EQ(prober->probed[0], 7000);
    EXPECT_EQ(prober->probed[1], 0);
}

// ---------------------------------------------------------------------------
// Unexpected probe failure is not swallowed
// ---------------------------------------------------------------------------
TEST(PortLeaseCacheTest, ProbeFailureIsIoError) {
    auto prober = std::make_shared<FakePortProber>();
    prober->status[7000] = ProbeStatus::Failed;
    PortLeaseCache cache(prober);

    auto r = cache.lease({7000, 7001});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::Io);
    EXPECT_EQ(prober->probed.size(), 1u);
}

// ---------------------------------------------------------------------------
// Wildcard keeps returning leased ports -> NoAvailablePorts
// ---------------------------------------------------------------------------
TEST(PortLeaseCacheTest, ExhaustedWildcardReportsNoAvailablePorts) {
    auto prober = std::make_shared<FakePortProber>();
    prober->wildcard_ports = {45000};
    PortLeaseCache cache(prober);

    ASSERT_TRUE(cache.lease().is_ok());
    auto r = cache.lease();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::NoAvailablePorts);
    EXPECT_EQ(r.error().message, "No available ports found");
    EXPECT_EQ(prober->probed.size(), 1u + PortLeaseCache::MAX_WILDCARD_ATTEMPTS);
}

// ---------------------------------------------------------------------------
// Leased explicit candidate goes through the wildcard, not PortLocked
// ---------------------------------------------------------------------------
TEST(PortLeaseCacheTest, LeasedCandidateWithExhaustedWildcard) {
    auto prober = std::make_shared<FakePortProber>();
    prober->wildcard_ports = {7000};
    PortLeaseCache cache(prober);

    ASSERT_TRUE(cache.lease({7000}).is_ok());
    auto r = cache.lease({7000});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::NoAvailablePorts);
    EXPECT_EQ(prober->probed.size(), 2u + PortLeaseCache::MAX_WILDCARD_ATTEMPTS);
    EXPECT_EQ(prober->probed[1], 7000);
    EXPECT_EQ(prober->probed[2], 0);
}

// ---------------------------------------------------------------------------
// Wildcard re-probes past a leased port
// ---------------------------------------------------------------------------
TEST(PortLeaseCacheTest, WildcardSkipsLeasedPort) {
    auto prober = std::make_shared<FakePortProber>();
    prober->wildcard_ports = {45000, 45000, 45001};
    PortLeaseCache cache(prober);

    auto a = cache.lease();
    auto b = cache.lease();
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(a.value(), 45000);
    EXPECT_EQ(b.value(), 45001);
}

// ---------------------------------------------------------------------------
// A lease survives one rotation and expires on the second
// ---------------------------------------------------------------------------
TEST(PortLeaseCacheTest, LeaseExpiresAfterTwoRotations) {
    auto prober = std::make_shared<FakePortProber>();
    PortLeaseCache cache(prober);

    ASSERT_TRUE(cache.tryLease(7000).is_ok());

    cache.rotate();
    EXPECT_TRUE(cache.isLeased(7000));
    EXPECT_EQ(cache.tryLease(7000).error().code, ErrorCode::PortLocked);

    cache.rotate();
    EXPECT_FALSE(cache.isLeased(7000));
    EXPECT_TRUE(cache.tryLease(7000).is_ok());
}

TEST(PortLeaseCacheTest, ClearDropsEverything) {
    auto prober = std::make_shared<FakePortProber>();
    PortLeaseCache cache(prober);

    ASSERT_TRUE(cache.tryLease(7000).is_ok());
    cache.rotate();
    ASSERT_TRUE(cache.tryLease(7001).is_ok());
    EXPECT_EQ(cache.leasedCount(), 2u);

    cache.clear();
    EXPECT_EQ(cache.leasedCount(), 0u);
}

// ---------------------------------------------------------------------------
// Two sequential leases never collide (adb needs two forwards)
// ---------------------------------------------------------------------------
TEST(PortLeaseCacheTest, SequentialLeasesAreDistinct) {
    PortLeaseCache cache;  // real sockets
    auto a = cache.lease();
    auto b = cache.lease();
    ASSERT_TRUE(a.is_ok()) << a.error().message;
    ASSERT_TRUE(b.is_ok()) << b.error().message;
    EXPECT_GT(a.value(), 0);
    EXPECT_GT(b.value(), 0);
    EXPECT_NE(a.value(), b.value());
}

TEST(SocketPortProberTest, WildcardReturnsBoundPort) {
    SocketPortProber prober;
    ProbeResult r = prober.probe(0);
    EXPECT_EQ(r.status, ProbeStatus::Free);
    EXPECT_GT(r.port, 0);
}
