// tests/test_world_pool.cpp
#include <catch2/catch_test_macros.hpp>
#include "papermake/render/world_pool.h"

using namespace papermake;

namespace {

Template make_template(const std::string& id, const std::string& content) {
    return Template(TemplateId{id}, id, content, Schema{});
}

void return_world(WorldPool& pool, const Template& tpl) {
    WorldLease lease = pool.acquire(tpl);
    if (!lease) lease.adopt(std::make_unique<World>(tpl, nlohmann::json::object()));
}

} // namespace

TEST_CASE("Empty pool hands out empty leases", "[pool]") {
    WorldPool pool;
    WorldLease lease = pool.acquire(make_template("a", "x"));
    REQUIRE_FALSE(lease);
    REQUIRE(lease.get() == nullptr);
}

TEST_CASE("Released worlds are reused per template", "[pool]") {
    WorldPool pool;
    Template a = make_template("a", "x");
    Template b = make_template("b", "y");

    return_world(pool, a);
    REQUIRE(pool.idle_count(a.id()) == 1);
    REQUIRE(pool.idle_count(b.id()) == 0);

    WorldLease lease = pool.acquire(b);
    REQUIRE_FALSE(lease);
    WorldLease reused = pool.acquire(a);
    REQUIRE(reused);
    REQUIRE(reused.get()->template_id() == a.id());
}

TEST_CASE("Idle worlds are capped per template", "[pool]") {
    WorldPool pool(1);
    Template tpl = make_template("a", "x");
    {
        WorldLease first = pool.acquire(tpl);
        first.adopt(std::make_unique<World>(tpl, nlohmann::json::object()));
        WorldLease second = pool.acquire(tpl);
        second.adopt(std::make_unique<World>(tpl, nlohmann::json::object()));
    }
    REQUIRE(pool.idle_count(tpl.id()) == 1);
}

TEST_CASE("Stale worlds are dropped on acquire", "[pool]") {
    WorldPool pool;
    Template tpl = make_template("a", "old");
    return_world(pool, tpl);

    TemplateUpdate changes;
    changes.content = "new";
    tpl.update(changes);
    WorldLease lease = pool.acquire(tpl);
    REQUIRE_FALSE(lease);
    REQUIRE(pool.idle_count(tpl.id()) == 0);
}

TEST_CASE("Discarded, invalidated and cleared worlds leave the pool", "[pool]") {
    WorldPool pool;
    Template a = make_template("a", "x");
    Template b = make_template("b", "y");

    {
        WorldLease lease = pool.acquire(a);
        lease.adopt(std::make_unique<World>(a, nlohmann::json::object()));
        lease.discard();
    }
    REQUIRE(pool.idle_count(a.id()) == 0);

    return_world(pool, a);
    return_world(pool, b);
    pool.invalidate(a.id());
    REQUIRE(pool.idle_count(a.id()) == 0);
    REQUIRE(pool.idle_count(b.id()) == 1);

    pool.clear();
    REQUIRE(pool.idle_count(b.id()) == 0);
}

TEST_CASE("Moved leases return their world once", "[pool]") {
    WorldPool pool;
    Template tpl = make_template("a", "x");
    {
        WorldLease lease = pool.acquire(tpl);
        lease.adopt(std::make_unique<World>(tpl, nlohmann::json::object()));
        WorldLease moved = std::move(lease);
        REQUIRE(moved);
    }
    REQUIRE(pool.idle_count(tpl.id()) == 1);
}

TEST_CASE("Worlds leased before an invalidate are not pooled", "[pool]") {
    WorldPool pool;
    Template tpl = make_template("a", "x");
    {
        WorldLease lease = pool.acquire(tpl);
        lease.adopt(std::make_unique<World>(tpl, nlohmann::json::object()));
        pool.invalidate(tpl.id());
    }
    REQUIRE(pool.idle_count(tpl.id()) == 0);
    REQUIRE(pool.total_idle() == 0);

    // Leases taken after the invalidate are pooled as usual
    return_world(pool, tpl);
    REQUIRE(pool.idle_count(tpl.id()) == 1);
}

TEST_CASE("Worlds leased before a clear are not pooled", "[pool]") {
    WorldPool pool;
    Template tpl = make_template("a", "x");
    {
        WorldLease lease = pool.acquire(tpl);
        lease.adopt(std::make_unique<World>(tpl, nlohmann::json::object()));
        pool.clear();
    }
    REQUIRE(pool.idle_count(tpl.id()) == 0);
}

TEST_CASE("Idle worlds are capped across templates", "[pool]") {
    WorldPool pool(4, 2);
    for (const char* id : {"a", "b", "c"}) {
        return_world(pool, make_template(id, "x"));
    }
    REQUIRE(pool.total_idle() == 2);
    REQUIRE(pool.idle_count(TemplateId{"c"}) == 0);

    WorldLease lease = pool.acquire(make_template("a", "x"));
    REQUIRE(lease);
    REQUIRE(pool.total_idle() == 1);
}

TEST_CASE("Pooled worlds hold no input data", "[pool]") {
    WorldPool pool;
    Template tpl = make_template("a", "{{ name }}");
    {
        WorldLease lease = pool.acquire(tpl);
        lease.adopt(std::make_unique<World>(tpl, nlohmann::json{{"name", "Ada"}}));
    }
    WorldLease lease = pool.acquire(tpl);
    REQUIRE(lease);
    REQUIRE_FALSE(lease.get()->context().contains("name"));
    REQUIRE(lease.get()->serialized_data() == "null");
}
