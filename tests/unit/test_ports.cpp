#include <gtest/gtest.h>
#include "ports.h"
#include <thread>
#include <vector>
#include <atomic>

namespace benefice {
namespace {

// ============================================================================
// Enarx.toml listen ports
// ============================================================================

TEST(ParseListenPortsTest, CollectsListenEntries) {
    std::string config =
        "# Standard streams\n"
        "[[files]]\n"
        "kind = \"stdin\"\n"
        "\n"
        "[[files]]\n"
        "kind = \"stdout\"\n"
        "\n"
        "[[files]]\n"
        "name = \"LISTEN\"\n"
        "kind = \"listen\"\n"
        "prot = \"tls\"\n"
        "port = 8443\n"
        "\n"
        "[[files]]\n"
        "kind = \"listen\"\n"
        "prot = \"tcp\"\n"
        "port = 12345   # trailing comment\n";

    PortSet ports = parse_listen_ports(config);
    EXPECT_EQ(ports, (PortSet{8443, 12345}));
}

TEST(ParseListenPortsTest, NoFilesMeansNoPorts) {
    EXPECT_TRUE(parse_listen_ports("").empty());
    EXPECT_TRUE(parse_listen_ports("env = { RUST_LOG = \"info\" }\nargs = [\"--flag\", \"x\"]\n").empty());
}

TEST(ParseListenPortsTest, AcceptsInlineTablesAndOtherSections) {
    std::string config =
        "args = [\n"
        "  \"serve\",\n"
        "  \"--verbose\",\n"
        "]\n"
        "\n"
        "[env]\n"
        "MODE = 'release'\n"
        "\n"
        "[[files]]\n"
        "kind = \"listen\"\n"
        "port = 3000\n"
        "extra = { tls = true, certs = [1, 2] }\n";

    EXPECT_EQ(parse_listen_ports(config), (PortSet{3000}));
}

TEST(ParseListenPortsTest, DuplicatePortsCollapse) {
    std::string config =
        "[[files]]\nkind = \"listen\"\nport = 4000\n"
        "[[files]]\nkind = \"listen\"\nport = 4000\n";

    EXPECT_EQ(parse_listen_ports(config), (PortSet{4000}));
}

TEST(ParseListenPortsTest, ListenWithoutPortIsMalformed) {
    EXPECT_THROW(parse_listen_ports("[[files]]\nkind = \"listen\"\n"), ConfigParseError);
}

TEST(ParseListenPortsTest, PortMustBeInRangeInteger) {
    EXPECT_THROW(parse_listen_ports("[[files]]\nkind = \"listen\"\nport = \"80\"\n"), ConfigParseError);
    EXPECT_THROW(parse_listen_ports("[[files]]\nkind = \"listen\"\nport = 70000\n"), ConfigParseError);
    EXPECT_THROW(parse_listen_ports("[[files]]\nkind = \"listen\"\nport = -1\n"), ConfigParseError);
}

TEST(ParseListenPortsTest, SyntaxErrorsReportLine) {
    try {
        parse_listen_ports("[[files]]\nkind = \"listen\"\nport = \n");
        FAIL() << "Expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.line(), 3u);
    }

    EXPECT_THROW(parse_listen_ports("[[files]\nkind = \"listen\"\n"), ConfigParseError);
    EXPECT_THROW(parse_listen_ports("kind = \"unterminated\n"), ConfigParseError);
    EXPECT_THROW(parse_listen_ports("a = 1\na = 2\n"), ConfigParseError);
}

TEST(ParseListenPortsTest, DeepNestingIsMalformed) {
    // Well under the size ceiling, but far deeper than any real config
    EXPECT_THROW(parse_listen_ports("x = " + std::string(200000, '[')), ConfigParseError);

    std::string tables = "x = ";
    for (int i = 0; i < 50000; ++i) tables += "{a = ";
    EXPECT_THROW(parse_listen_ports(tables), ConfigParseError);

    std::string dotted = "a";
    for (int i = 0; i < 50000; ++i) dotted += ".a";
    EXPECT_THROW(parse_listen_ports(dotted + " = 1\n"), ConfigParseError);
    EXPECT_THROW(parse_listen_ports("[" + dotted + "]\n"), ConfigParseError);
}

TEST(ParseListenPortsTest, ModerateNestingIsAccepted) {
    PortSet ports = parse_listen_ports(
        "matrix = [[[[[[[[1, 2]]]]]]]]\n"
        "meta = { a = { b = { c = [ { d = 1 } ] } } }\n"
        "x.y.z.w = true\n"
        "\n"
        "[[files]]\n"
        "kind = \"listen\"\n"
        "port = 5000\n");
    EXPECT_EQ(ports, (PortSet{5000}));
}

TEST(ParseListenPortsTest, FilesMustBeArrayOfTables) {
    EXPECT_THROW(parse_listen_ports("files = 3\n"), ConfigParseError);
    EXPECT_THROW(parse_listen_ports("[[files]]\nname = \"no kind\"\n"), ConfigParseError);
}

// ============================================================================
// Port range validation
// ============================================================================

TEST(FindIllegalPortsTest, FlagsEveryPortOutsideRange) {
    PortRange range;  // 2000-30000
    PortSet illegal = find_illegal_ports({80, 443, 2000, 5000, 30000, 30001}, range);
    EXPECT_EQ(illegal, (PortSet{80, 443, 30001}));
}

TEST(FindIllegalPortsTest, RangeIsInclusive) {
    PortRange range{2000, 2000};
    EXPECT_TRUE(find_illegal_ports({2000}, range).empty());
    EXPECT_EQ(find_illegal_ports({1999, 2001}, range), (PortSet{1999, 2001}));
}

TEST(FindIllegalPortsTest, Port80IllegalUnderDefaults) {
    EXPECT_EQ(find_illegal_ports({80}, PortRange{}), (PortSet{80}));
}

TEST(FormatPortsTest, CommaSeparated) {
    EXPECT_EQ(format_ports({}), "");
    EXPECT_EQ(format_ports({5000}), "5000");
    EXPECT_EQ(format_ports({80, 443}), "80, 443");
}

// ============================================================================
// Registry
// ============================================================================

TEST(PortRegistryTest, ReserveAndRelease) {
    PortRegistry registry;

    EXPECT_TRUE(registry.try_reserve({5000, 5001}, "job-a").empty());
    EXPECT_TRUE(registry.is_held(5000));
    EXPECT_EQ(registry.owner_of(5001), "job-a");
    EXPECT_EQ(registry.size(), 2u);

    registry.release({5000, 5001});
    EXPECT_FALSE(registry.is_held(5000));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(PortRegistryTest, ConflictNamesEveryHeldPortAndReservesNothing) {
    PortRegistry registry;
    ASSERT_TRUE(registry.try_reserve({5000, 6000}, "job-a").empty());

    PortSet conflicts = registry.try_reserve({4000, 5000, 6000, 7000}, "job-b");
    EXPECT_EQ(conflicts, (PortSet{5000, 6000}));

    // All or nothing: the free ports were not taken either
    EXPECT_FALSE(registry.is_held(4000));
    EXPECT_FALSE(registry.is_held(7000));
    EXPECT_EQ(registry.owner_of(5000), "job-a");
    EXPECT_EQ(registry.size(), 2u);
}

TEST(PortRegistryTest, ReleaseIsIdempotent) {
    PortRegistry registry;
    ASSERT_TRUE(registry.try_reserve({5000}, "job-a").empty());

    registry.release({5000});
    registry.release({5000});
    registry.release({9999});
    EXPECT_EQ(registry.size(), 0u);

    // Released port can be claimed again
    EXPECT_TRUE(registry.try_reserve({5000}, "job-b").empty());
    EXPECT_EQ(registry.owner_of(5000), "job-b");
}

TEST(PortRegistryTest, EmptyReservationAlwaysSucceeds) {
    PortRegistry registry;
    EXPECT_TRUE(registry.try_reserve({}, "job-a").empty());
    EXPECT_EQ(registry.size(), 0u);
}

TEST(PortRegistryTest, ConcurrentReservationsStayDisjoint) {
    // Given: many threads racing for overlapping port sets
    PortRegistry registry;
    const int threads = 16;
    std::atomic<int> winners{0};
    std::vector<std::thread> workers;

    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&registry, &winners, t]() {
            PortSet wanted = {5000, static_cast<uint16_t>(6000 + t)};
            if (registry.try_reserve(wanted, "job-" + std::to_string(t)).empty()) {
                ++winners;
            }
        });
    }
    for (auto& w : workers) w.join();

    // Then: exactly one thread holds the shared port, and only its own
    // private port came with it
    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(registry.size(), 2u);
    std::string owner = registry.owner_of(5000);
    int winner = std::stoi(owner.substr(4));
    EXPECT_EQ(registry.owner_of(static_cast<uint16_t>(6000 + winner)), owner);
}

} // namespace
} // namespace benefice
