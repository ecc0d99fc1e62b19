#include <gtest/gtest.h>
#include "mcpgate/registry.hpp"
#include "mcpgate/shared_mutex.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace mcpgate;

namespace {

ToolEntry make_tool(const std::string& name, const std::string& reply = "ok") {
    ToolDefinition def;
    def.name = name;
    def.description = "tool " + name;
    return ToolEntry{def, make_tool_handler([reply](const RequestContext&, const nlohmann::json&) {
        CallToolResult r;
        r.content.push_back(TextContent{reply});
        return r;
    })};
}

ResourceTemplateEntry make_template(const std::string& pattern, const std::string& tag) {
    ResourceTemplate def;
    def.uri_template = pattern;
    def.name = tag;
    return ResourceTemplateEntry{def, UriTemplate::compile(pattern),
        make_resource_template_handler([](const RequestContext&, const std::string& uri, const UriParams&) {
            return std::vector<ResourceContent>{{uri, std::nullopt, std::string("x"), std::nullopt}};
        })};
}

} // namespace

TEST(Registry, ListsInRegistrationOrder) {
    ToolRegistry reg;
    EXPECT_TRUE(reg.empty());
    EXPECT_FALSE(reg.add(make_tool("b")));
    EXPECT_FALSE(reg.add(make_tool("a")));
    EXPECT_FALSE(reg.add(make_tool("c")));

    auto defs = reg.definitions();
    ASSERT_EQ(defs.size(), 3u);
    EXPECT_EQ(defs[0].name, "b");
    EXPECT_EQ(defs[1].name, "a");
    EXPECT_EQ(defs[2].name, "c");
}

TEST(Registry, ReplaceKeepsPosition) {
    ToolRegistry reg;
    reg.add(make_tool("a", "first"));
    reg.add(make_tool("b"));
    EXPECT_TRUE(reg.add(make_tool("a", "second")));

    EXPECT_EQ(reg.size(), 2u);
    EXPECT_EQ(reg.definitions()[0].name, "a");

    auto entry = reg.find("a");
    ASSERT_TRUE(entry.has_value());
    auto result = entry->handler->call(RequestContext{}, nlohmann::json::object());
    EXPECT_EQ(std::get<TextContent>(result.content[0]).text, "second");
}

TEST(Registry, RemoveReindexes) {
    ToolRegistry reg;
    reg.add(make_tool("a"));
    reg.add(make_tool("b"));
    reg.add(make_tool("c"));

    EXPECT_TRUE(reg.remove("a"));
    EXPECT_FALSE(reg.remove("a"));
    EXPECT_FALSE(reg.find("a").has_value());
    ASSERT_TRUE(reg.find("c").has_value());
    EXPECT_EQ(reg.find("c")->definition.name, "c");

    // Replacing after a removal must hit the right slot
    EXPECT_TRUE(reg.add(make_tool("c", "new")));
    auto defs = reg.definitions();
    ASSERT_EQ(defs.size(), 2u);
    EXPECT_EQ(defs[0].name, "b");
    EXPECT_EQ(defs[1].name, "c");
}

TEST(Registry, HandlerOutlivesReplacement) {
    ToolRegistry reg;
    reg.add(make_tool("a", "old"));
    auto held = reg.find("a");
    reg.add(make_tool("a", "new"));
    reg.remove("a");

    auto result = held->handler->call(RequestContext{}, nlohmann::json::object());
    EXPECT_EQ(std::get<TextContent>(result.content[0]).text, "old");
}

TEST(ResourceTemplateRegistry, FirstRegisteredMatchWins) {
    ResourceTemplateRegistry reg;
    reg.add(make_template("item://{id}", "generic"));
    reg.add(make_template("item://{slug}", "shadowed"));

    auto m = reg.match("item://7");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->entry.definition.name, "generic");
    EXPECT_EQ(m->params.at("id"), "7");

    EXPECT_FALSE(reg.match("item://7/x").has_value());
    EXPECT_FALSE(reg.match("other://7").has_value());
}

TEST(Registry, ConcurrentListNeverSeesPartialEntries) {
    ToolRegistry reg;
    constexpr int kWrites = 500;
    std::atomic<bool> done{false};
    std::atomic<int> bad{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            size_t last = 0;
            while (!done.load()) {
                auto defs = reg.definitions();
                // Appends only: the snapshot never shrinks and every entry is whole
                if (defs.size() < last) ++bad;
                last = defs.size();
                for (size_t i = 0; i < defs.size(); ++i) {
                    if (defs[i].name != "t" + std::to_string(i) ||
                        defs[i].description != "tool " + defs[i].name) {
                        ++bad;
                    }
                }
            }
        });
    }

    for (int i = 0; i < kWrites; ++i) {
        reg.add(make_tool("t" + std::to_string(i)));
    }
    done = true;
    for (auto& t : readers) t.join();

    EXPECT_EQ(bad.load(), 0);
    EXPECT_EQ(reg.size(), static_cast<size_t>(kWrites));
}

TEST(SharedMutex, ReadersShareWritersExclude) {
    SharedMutex m;
    m.lock_shared();
    EXPECT_TRUE(m.try_lock_shared());
    EXPECT_FALSE(m.try_lock());
    m.unlock_shared();
    m.unlock_shared();

    EXPECT_TRUE(m.try_lock());
    EXPECT_FALSE(m.try_lock_shared());
    m.unlock();
}

TEST(SharedMutex, WaitingWriterBlocksNewReaders) {
    SharedMutex m;
    m.lock_shared();

    std::atomic<bool> writer_done{false};
    std::thread writer([&] {
        m.lock();
        writer_done = true;
        m.unlock();
    });

    // Give the writer time to queue up behind the reader
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(m.try_lock_shared());
    EXPECT_FALSE(writer_done.load());

    m.unlock_shared();
    writer.join();
    EXPECT_TRUE(writer_done.load());
    EXPECT_TRUE(m.try_lock_shared());
    m.unlock_shared();
}
