#include <gtest/gtest.h>
#include <managers/site_catalog.hpp>
#include "fakes.hpp"

using nlohmann::json;

class SiteCatalogTest : public ::testing::Test {
protected:
    FakeApi api;
    SiteCatalog catalog{*api.client};

    FakeTransport& t() { return *api.transport; }
};

TEST_F(SiteCatalogTest, Sites) {
    t().on("GET", "sid/sites", {FakeReply::json({{"items", json::array({
        json{{"uid", "nancy"}, {"name", "Nancy"}},
        json{{"uid", "rennes"}, {"name", "Rennes"}},
    })}})});
    auto sites = catalog.sites();
    ASSERT_EQ(sites.size(), 2u);
    EXPECT_EQ(sites[1].uid, "rennes");
}

TEST_F(SiteCatalogTest, DeadHostsMatchBothNames) {
    t().on("GET", "sid/sites/rennes/status", {FakeReply::json({{"nodes", {
        {"paravance-1.rennes.grid5000.fr", {{"soft", "free"}, {"hard", "alive"}}},
        {"paravance-2.rennes.grid5000.fr", {{"soft", "unknown"}, {"hard", "dead"}}},
        {"paravance-3.rennes.grid5000.fr", {{"soft", "unknown"}, {"hard", "absent"}}},
    }}})});
    auto dead = catalog.dead_hosts("rennes");
    EXPECT_EQ(dead.size(), 4u);
    EXPECT_TRUE(dead.count("paravance-2"));
    EXPECT_TRUE(dead.count("paravance-3.rennes.grid5000.fr"));
    EXPECT_FALSE(dead.count("paravance-1"));
}

TEST_F(SiteCatalogTest, SwitchLookup) {
    json sw = {
        {"uid", "gw-1"},
        {"kind", "switch"},
        {"linecards", json::array({
            json{{"kind", "node"}, {"ports", json::array({json{{"uid", "paravance-1"}}})}},
        })},
    };
    json router = {{"uid", "r1"}, {"kind", "router"}};
    t().on("GET", "sid/sites/rennes/network_equipments",
           {FakeReply::json({{"items", json::array({sw, router})}})});

    EXPECT_EQ(catalog.switches("rennes").size(), 1u);
    auto info = catalog.switch_info("rennes", "gw-1");
    ASSERT_EQ(info.nodes.size(), 1u);
    EXPECT_EQ(info.nodes[0], "paravance-1.rennes.grid5000.fr");
    EXPECT_THROW(catalog.switch_info("rennes", "gw-9"), NotFoundError);
}

TEST_F(SiteCatalogTest, ClustersAndEnvironments) {
    t().on("GET", "sid/sites/rennes/clusters", {FakeReply::json({{"items", json::array({
        json{{"uid", "paravance"}, {"model", "Dell PowerEdge C6220 II"}},
    })}})});
    t().on("GET", "sid/sites/rennes/environments", {FakeReply::json({{"items", json::array({
        json{{"uid", "debian11-min"}, {"description", "Debian 11 minimal"}},
    })}})});
    EXPECT_EQ(catalog.clusters("rennes")[0].uid, "paravance");
    EXPECT_EQ(catalog.environments("rennes")[0].description, "Debian 11 minimal");
}

TEST_F(SiteCatalogTest, UnknownSite) {
    EXPECT_THROW(catalog.clusters("atlantis"), NotFoundError);
}
