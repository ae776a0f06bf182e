//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_router.cpp
// Purpose: Capability namespace, prefix collisions and routing failures
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mcphost/ToolRouter.h"
#include "mcphost/errors/Errors.h"

using namespace mcphost;

namespace {

class RecordingDispatcher : public IInstanceDispatcher {
public:
    struct CallRecord {
        std::string instanceId;
        std::string localName;
    };

    JSONValue Dispatch(const std::string& instanceId, const std::string& localName, const JSONValue&,
                       std::chrono::milliseconds) override {
        calls.push_back(CallRecord{instanceId, localName});
        return JSONValue(instanceId + ":" + localName);
    }

    std::vector<CallRecord> calls;
};

InstanceView view(const std::string& id, const std::string& name, std::vector<std::string> tools,
                  bool running = true) {
    InstanceView v;
    v.id = id;
    v.displayName = name;
    v.running = running;
    for (auto& t : tools) v.tools.emplace_back(t, "does " + t);
    return v;
}

void expectRoutingError(const ToolRouter& router, const std::string& name) {
    try {
        router.Call(name, JSONValue(JSONValue::Object{}), std::chrono::seconds(1));
        FAIL() << "expected RoutingError for " << name;
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::RoutingError);
    }
}

} // namespace

TEST(ToolRouterTest, SanitizePrefix) {
    EXPECT_EQ(ToolRouter::SanitizePrefix("GitHub"), "github");
    EXPECT_EQ(ToolRouter::SanitizePrefix("AWS  Docs (beta)"), "aws_docs_beta");
    EXPECT_EQ(ToolRouter::SanitizePrefix("my-server_2"), "my-server_2");
    EXPECT_EQ(ToolRouter::SanitizePrefix("  !!  "), "server");
    EXPECT_EQ(ToolRouter::SanitizePrefix(""), "server");
}

TEST(ToolRouterTest, RoutesByPrefixToOwningInstance) {
    ToolRouter router;
    RecordingDispatcher dispatcher;
    router.SetDispatcher(&dispatcher);
    router.Publish({view("id-github", "GitHub", {"create_issue", "search"}), view("id-slack", "Slack", {"post"})});

    auto caps = router.List();
    ASSERT_EQ(caps.size(), 3u);
    EXPECT_EQ(caps[0].prefixedName, "github.create_issue");
    EXPECT_EQ(caps[2].prefixedName, "slack.post");

    JSONValue r = router.Call("slack.post", JSONValue(JSONValue::Object{}), std::chrono::seconds(1));
    EXPECT_EQ(std::get<std::string>(r.value), "id-slack:post");
    ASSERT_EQ(dispatcher.calls.size(), 1u);
    EXPECT_EQ(dispatcher.calls[0].localName, "post");
}

TEST(ToolRouterTest, CollidingNamesGetIdSuffix) {
    ToolRouter router;
    router.Publish({view("aaaaaaaa-1111", "Files", {"read"}), view("bbbbbbbb-2222", "files", {"read"})});
    EXPECT_EQ(router.PrefixFor("aaaaaaaa-1111").value_or(""), "files");
    EXPECT_EQ(router.PrefixFor("bbbbbbbb-2222").value_or(""), "files_bbbbbbbb");
    EXPECT_EQ(router.ResolvePrefix("files_bbbbbbbb").value_or(""), "bbbbbbbb-2222");
    auto caps = router.List();
    ASSERT_EQ(caps.size(), 2u);
    EXPECT_NE(caps[0].prefixedName, caps[1].prefixedName);
}

TEST(ToolRouterTest, UnknownNamesFailWithoutDispatch) {
    ToolRouter router;
    RecordingDispatcher dispatcher;
    router.SetDispatcher(&dispatcher);
    router.Publish({view("id-github", "GitHub", {"search"})});

    expectRoutingError(router, "nosuffix");
    expectRoutingError(router, ".search");
    expectRoutingError(router, "jira.search");
    expectRoutingError(router, "github.delete_repo");
    EXPECT_TRUE(dispatcher.calls.empty());
}

TEST(ToolRouterTest, LocalNameMayContainSeparator) {
    ToolRouter router;
    RecordingDispatcher dispatcher;
    router.SetDispatcher(&dispatcher);
    router.Publish({view("id-fs", "FS", {"dir.list"})});
    router.Call("fs.dir.list", JSONValue(JSONValue::Object{}), std::chrono::seconds(1));
    ASSERT_EQ(dispatcher.calls.size(), 1u);
    EXPECT_EQ(dispatcher.calls[0].localName, "dir.list");
}

TEST(ToolRouterTest, DormantInstancesAreCallableButNotListed) {
    ToolRouter router;
    RecordingDispatcher dispatcher;
    router.SetDispatcher(&dispatcher);
    router.Publish({view("id-a", "Alpha", {"one"}), view("id-b", "Beta", {"two"}, false)});

    auto caps = router.List();
    ASSERT_EQ(caps.size(), 1u);
    EXPECT_EQ(caps[0].prefixedName, "alpha.one");
    EXPECT_EQ(router.DescribeForPrompt(), "- alpha.one: does one\n");

    router.Call("beta.two", JSONValue(JSONValue::Object{}), std::chrono::seconds(1));
    ASSERT_EQ(dispatcher.calls.size(), 1u);
    EXPECT_EQ(dispatcher.calls[0].instanceId, "id-b");
}

TEST(ToolRouterTest, RepublishReplacesSnapshot) {
    ToolRouter router;
    router.Publish({view("id-a", "Alpha", {"one"})});
    router.Publish({});
    EXPECT_TRUE(router.List().empty());
    EXPECT_TRUE(router.DescribeForPrompt().empty());
    EXPECT_FALSE(router.ResolvePrefix("alpha").has_value());
    expectRoutingError(router, "alpha.one");
}

TEST(ToolRouterTest, CustomSeparator) {
    ToolRouter router("__");
    router.Publish({view("id-a", "Alpha", {"one"})});
    ASSERT_EQ(router.List().size(), 1u);
    EXPECT_EQ(router.List()[0].prefixedName, "alpha__one");
    EXPECT_THROW(ToolRouter(""), std::invalid_argument);
}

TEST(ToolRouterTest, ReservedPrefixesWinRegardlessOfOrder) {
    ToolRouter router;
    RecordingDispatcher dispatcher;
    router.SetDispatcher(&dispatcher);
    InstanceView second = view("bbbbbbbb-2222", "Files", {"read"});
    second.prefix = "files_bbbbbbbb";
    InstanceView first = view("aaaaaaaa-1111", "Files", {"read"});
    first.prefix = "files";
    router.Publish({second, first});

    EXPECT_EQ(router.PrefixFor("bbbbbbbb-2222").value_or(""), "files_bbbbbbbb");
    router.Call("files.read", JSONValue(JSONValue::Object{}), std::chrono::seconds(1));
    ASSERT_EQ(dispatcher.calls.size(), 1u);
    EXPECT_EQ(dispatcher.calls[0].instanceId, "aaaaaaaa-1111");
}

TEST(ToolRouterTest, ReservePrefixSkipsTakenNames) {
    EXPECT_EQ(ToolRouter::ReservePrefix("Git Hub", "1234567890", {}), "git_hub");
    EXPECT_EQ(ToolRouter::ReservePrefix("Git Hub", "1234567890", {"git_hub"}), "git_hub_12345678");
    EXPECT_EQ(ToolRouter::ReservePrefix("Git Hub", "1234567890", {"git_hub", "git_hub_12345678"}),
              "git_hub_12345678_2");
}
