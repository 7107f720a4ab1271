#include <gtest/gtest.h>
#include <api/records.hpp>
#include <core/errors.hpp>
#include "fakes.hpp"

using nlohmann::json;

TEST(Records, JobStates) {
    EXPECT_EQ(parse_job_state("running"), JobState::Running);
    EXPECT_EQ(parse_job_state("toLaunch"), JobState::Unknown);
    EXPECT_TRUE(is_terminal(JobState::Error));
    EXPECT_TRUE(is_terminal(JobState::Finishing));
    EXPECT_TRUE(is_terminal(JobState::Terminated));
    EXPECT_FALSE(is_terminal(JobState::Waiting));
    EXPECT_FALSE(is_terminal(JobState::Hold));
    EXPECT_FALSE(is_terminal(JobState::Unknown));
}

TEST(Records, ParseJob) {
    json j = job_json(42, "waiting", "nancy");
    j["scheduled_at"] = 1700000120;
    j["assigned_nodes"] = {"grisou-1.nancy.grid5000.fr"};

    Job job = parse_job(j);
    EXPECT_EQ(job.uid, 42);
    EXPECT_EQ(job.site, "nancy");
    EXPECT_EQ(job.state, "waiting");
    EXPECT_EQ(job.user, "alice");
    EXPECT_EQ(job.scheduled_at.value(), 1700000120);
    ASSERT_EQ(job.assigned_nodes.size(), 1u);
    EXPECT_EQ(job.rel_self(), "/sid/sites/nancy/jobs/42");
}

TEST(Records, ParseJobStringUid) {
    json j = {{"uid", "1234"}, {"state", "running"}};
    Job job = parse_job(j, "lyon");
    EXPECT_EQ(job.uid, 1234);
    EXPECT_EQ(job.site, "lyon");
    EXPECT_EQ(job.job_state(), JobState::Running);
}

TEST(Records, ParseJobRejectsGarbage) {
    EXPECT_THROW(parse_job(json::array()), G5kError);
    EXPECT_THROW(parse_job(json{{"state", "running"}}), G5kError);
}

TEST(Records, OversizedUidRejected) {
    EXPECT_THROW(parse_job(json{{"uid", 4294967338LL}, {"state", "running"}}), G5kError);
    EXPECT_THROW(parse_job(json{{"uid", "4294967338"}, {"state", "running"}}), G5kError);
}

TEST(Records, MissingRelThrows) {
    Job job = parse_job(json{{"uid", 1}}, "rennes");
    EXPECT_THROW(job.rel_self(), G5kError);
}

TEST(Records, JobCarriesDeployments) {
    json j = job_json(5, "running");
    j["deploy"] = json::array({deployment_json("D1", "terminated", {"a"}, {{"a", "OK"}})});
    Job job = parse_job(j);
    ASSERT_EQ(job.deploy.size(), 1u);
    EXPECT_EQ(job.deploy[0].uid, "D1");
    EXPECT_EQ(job.deploy[0].site, "rennes");
    EXPECT_EQ(job.deploy[0].result.at("a"), "OK");
}

TEST(Records, DeploymentResultForms) {
    json nested = deployment_json("D2", "processing", {"a", "b"}, {{"a", "OK"}, {"b", "KO"}});
    Deployment d = parse_deployment(nested);
    EXPECT_TRUE(d.processing());
    EXPECT_EQ(d.site, "rennes");
    EXPECT_EQ(d.result.at("b"), "KO");

    json flat = {{"uid", "D3"}, {"status", "terminated"}, {"result", {{"a", "OK"}}}};
    Deployment f = parse_deployment(flat, "lille");
    EXPECT_FALSE(f.processing());
    EXPECT_EQ(f.result.at("a"), "OK");
}

TEST(Records, SiteFromHref) {
    EXPECT_EQ(site_from_href("/sid/sites/nancy/jobs/1"), "nancy");
    EXPECT_EQ(site_from_href("/sid/sites/lyon"), "lyon");
    EXPECT_EQ(site_from_href("/sid/users"), "");
}

TEST(Records, NodeStatuses) {
    json status = {{"nodes", {
        {"paravance-1.rennes.grid5000.fr", {{"soft", "free"}, {"hard", "alive"}}},
        {"paravance-2.rennes.grid5000.fr", {{"soft", "unknown"}, {"hard", "dead"}}},
        {"paravance-3.rennes.grid5000.fr", {{"soft", "unknown"}, {"hard", "absent"}}},
    }}};
    auto nodes = parse_node_statuses(status);
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_FALSE(nodes["paravance-1.rennes.grid5000.fr"].dead());
    EXPECT_TRUE(nodes["paravance-2.rennes.grid5000.fr"].dead());
    EXPECT_TRUE(nodes["paravance-3.rennes.grid5000.fr"].dead());
}

TEST(Records, SwitchWithNodeLinecard) {
    json j = {
        {"uid", "gw-1"},
        {"kind", "switch"},
        {"linecards", {
            {{"kind", "other"}},
            {{"kind", "node"}, {"ports", {
                {{"uid", "paravance-1"}},
                json::object(),
                {{"uid", "paravance-2"}},
            }}},
        }},
    };
    auto sw = parse_switch(j, "rennes");
    ASSERT_TRUE(sw.has_value());
    EXPECT_EQ(sw->uid, "gw-1");
    ASSERT_EQ(sw->nodes.size(), 2u);
    EXPECT_EQ(sw->nodes[0], "paravance-1.rennes.grid5000.fr");
}

TEST(Records, NonSwitchEquipmentSkipped) {
    EXPECT_FALSE(parse_switch(json{{"uid", "r1"}, {"kind", "router"}}, "rennes").has_value());
    json ib = {{"uid", "ib"}, {"kind", "switch"}, {"linecards", {{{"kind", "other"}}}}};
    EXPECT_FALSE(parse_switch(ib, "rennes").has_value());
}

TEST(Records, CollectionItems) {
    EXPECT_EQ(collection_items(json{{"items", {1, 2}}}).size(), 2u);
    EXPECT_TRUE(collection_items(json::object()).empty());
}

TEST(Records, CollectionItemsOutliveTemporaryDocument) {
    std::vector<int> uids;
    for (const auto& item : collection_items(json{{"items", {job_json(1, "running"), job_json(2, "waiting")}}})) {
        uids.push_back(parse_job(item).uid);
    }
    EXPECT_EQ(uids, (std::vector<int>{1, 2}));
}

TEST(Records, CatalogRecords) {
    Cluster c = parse_cluster(json{{"uid", "paravance"}, {"model", "Dell"}, {"queues", {"default", "admin"}}});
    EXPECT_EQ(c.queue, "default");
    Site s = parse_site(json{{"uid", "rennes"}, {"name", "Rennes"}});
    EXPECT_EQ(s.name, "Rennes");
    Environment e = parse_environment(json{{"uid", "debian11-min"}, {"version", 2023}});
    EXPECT_EQ(e.version, "2023");
}
