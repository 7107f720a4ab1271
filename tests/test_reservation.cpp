#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <core/reservation.hpp>

static ReservationDefaults test_defaults() {
    return {"rennes", "g5kctl job", "1:00:00"};
}

static ReservationRequest parse_ok(const std::string& yaml) {
    auto r = parse_reservation_yaml(yaml, test_defaults());
    EXPECT_TRUE(r.is_ok()) << r.error;
    return r.value;
}

TEST(Reservation, EmptyDocumentTakesDefaults) {
    auto req = parse_ok("");
    EXPECT_EQ(req.site, "rennes");
    EXPECT_EQ(req.walltime.count(), 3600);
    EXPECT_EQ(req.name, "g5kctl job");
    EXPECT_EQ(req.mode, AllocationMode::Normal);
    EXPECT_EQ(req.vlan, VlanMode::None);
    EXPECT_FALSE(req.nodes.has_value());
}

TEST(Reservation, FullRequest) {
    auto req = parse_ok(R"(
site: nancy
cluster: grisou
nodes: 4
walltime: "2:30:00"
type: deploy
switches: 1
name: bench
env: debian11-min
keys: ~/.ssh/id_rsa
)");
    EXPECT_EQ(req.site, "nancy");
    EXPECT_EQ(req.cluster.value(), "grisou");
    EXPECT_EQ(req.nodes.value(), 4);
    EXPECT_EQ(req.walltime.count(), 9000);
    EXPECT_EQ(req.mode, AllocationMode::Deploy);
    EXPECT_EQ(req.switches.value(), 1);
    EXPECT_EQ(req.name, "bench");
    EXPECT_EQ(req.environment.value(), "debian11-min");
    EXPECT_EQ(req.ssh_key.value(), "~/.ssh/id_rsa");
}

TEST(Reservation, NodesListMeansHosts) {
    auto req = parse_ok("nodes: [paravance-1, paravance-2]\nignore_dead: true\n");
    EXPECT_FALSE(req.nodes.has_value());
    ASSERT_EQ(req.hosts.size(), 2u);
    EXPECT_EQ(req.hosts[1], "paravance-2");
    EXPECT_TRUE(req.ignore_dead);
}

TEST(Reservation, HostListGivenTwice) {
    auto r = parse_reservation_yaml("nodes: [a]\nhosts: [b]\n", test_defaults());
    EXPECT_TRUE(r.is_err());
}

TEST(Reservation, TimeAliasAndUnits) {
    EXPECT_EQ(parse_ok("time: 30m\n").walltime.count(), 1800);
}

TEST(Reservation, InvalidWalltime) {
    auto r = parse_reservation_yaml("walltime: forever\n", test_defaults());
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("forever"), std::string::npos);
}

TEST(Reservation, UnknownKey) {
    auto r = parse_reservation_yaml("nodez: 2\n", test_defaults());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Unknown reservation option 'nodez'");
}

TEST(Reservation, VlanValues) {
    EXPECT_EQ(parse_ok("vlan: routed\n").vlan, VlanMode::Routed);
    EXPECT_EQ(parse_ok("vlan: isolated\n").vlan, VlanMode::Isolated);
    EXPECT_EQ(parse_ok("vlan: true\n").vlan, VlanMode::Isolated);
    EXPECT_EQ(parse_ok("vlan: false\n").vlan, VlanMode::None);
}

TEST(Reservation, UnknownVlan) {
    auto r = parse_reservation_yaml("vlan: stretched\n", test_defaults());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Option for vlan not recognized: stretched");
}

TEST(Reservation, ParseModes) {
    EXPECT_EQ(parse_allocation_mode("Deploy"), AllocationMode::Deploy);
    EXPECT_EQ(parse_allocation_mode("normal"), AllocationMode::Normal);
    EXPECT_THROW(parse_allocation_mode("besteffort"), ConfigurationError);
    EXPECT_THROW(parse_vlan_mode("maybe"), ConfigurationError);
}

TEST(Reservation, ModeNames) {
    EXPECT_STREQ(to_string(AllocationMode::Deploy), "deploy");
    EXPECT_STREQ(to_string(VlanMode::Routed), "routed");
}

TEST(Reservation, SlashOptions) {
    auto req = parse_ok("slash: 20\nslash_22: 2\nslash_18: 1\n");
    EXPECT_EQ(req.subnet.slash_bits.value(), 20);
    EXPECT_EQ(req.subnet.slash_22.value(), 2);
    EXPECT_EQ(req.subnet.slash_18.value(), 1);
}

TEST(Reservation, NonIntegerCount) {
    auto r = parse_reservation_yaml("switches: many\n", test_defaults());
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("switches"), std::string::npos);
}

TEST(Reservation, StartTime) {
    auto req = parse_ok("at: 1700003600\n");
    EXPECT_EQ(req.start_at.value(), 1700003600);
    EXPECT_TRUE(parse_reservation_yaml("at: someday\n", test_defaults()).is_err());
}

TEST(Reservation, CommandAliasesAndRaw) {
    auto req = parse_ok("cmd: hostname\nresources: \"/nodes=2\"\nasync: true\n");
    EXPECT_EQ(req.command.value(), "hostname");
    EXPECT_EQ(req.raw_resources.value(), "/nodes=2");
    EXPECT_TRUE(req.async);
}

TEST(Reservation, NotAMapping) {
    EXPECT_TRUE(parse_reservation_yaml("- a\n- b\n", test_defaults()).is_err());
}

TEST(Reservation, MalformedYaml) {
    auto r = parse_reservation_yaml("site: [unclosed\n", test_defaults());
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Failed to parse reservation"), std::string::npos);
}

TEST(Reservation, MissingFile) {
    auto r = load_reservation("/nonexistent/request.yaml", test_defaults());
    EXPECT_TRUE(r.is_err());
}
