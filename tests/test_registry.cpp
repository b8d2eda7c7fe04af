#include <catch2/catch_test_macros.hpp>

#include "idreg/identity_registry.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <format>
#include <latch>
#include <mutex>
#include <set>
#include <thread>
#include <type_traits>
#include <vector>

using namespace idreg;
namespace fs = std::filesystem;

namespace {

Config::DatabaseCfg memory_db()
{
    Config::DatabaseCfg cfg;
    cfg.path = ":memory:";
    return cfg;
}

std::unique_ptr<IdentityRegistry> make_registry(ThreadPool& writer, const Config::DatabaseCfg& cfg = memory_db())
{
    auto reg = IdentityRegistry::create(cfg, writer);
    REQUIRE(reg.has_value());
    return std::move(*reg);
}

} // namespace

TEST_CASE("a registry can only be built through create")
{
    STATIC_REQUIRE(!std::is_constructible_v<IdentityRegistry, UserDB, ThreadPool&>);
    STATIC_REQUIRE(!std::is_copy_constructible_v<IdentityRegistry>);

    ThreadPool writer(1);
    auto reg = IdentityRegistry::create(memory_db(), writer);

    REQUIRE(reg.has_value());
    REQUIRE(*reg != nullptr);
    CHECK((*reg)->count() == 0);
}

TEST_CASE("register_user returns a fully populated record")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    auto before = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    auto rec = reg->register_user("U-alice", "Alice");
    auto after = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());

    REQUIRE(rec.has_value());
    CHECK(rec->id > 0);
    CHECK(rec->external_id == "U-alice");
    CHECK(rec->display_name == "Alice");
    CHECK(rec->created_at >= before - std::chrono::seconds(1));
    CHECK(rec->created_at <= after + std::chrono::seconds(1));
}

TEST_CASE("ids are distinct and strictly increasing under serialized registration")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    int64_t last = 0;
    for (int i = 0; i < 20; ++i)
    {
        auto rec = reg->register_user(std::format("ext-{}", i), std::format("User {}", i));
        REQUIRE(rec.has_value());
        CHECK(rec->id > last);
        last = rec->id;
    }
}

TEST_CASE("same external id with a different name is rejected")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    REQUIRE(reg->register_user("r1", "Alice").has_value());
    auto second = reg->register_user("r1", "Bob");

    REQUIRE(!second.has_value());
    CHECK(second.error() == Errc::DuplicateExternalId);
    CHECK(reg->count() == 1);
}

TEST_CASE("absent external ids never collide")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    auto first = reg->register_user(std::nullopt, "Alice");
    auto second = reg->register_user(std::nullopt, "Alice");

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->id != second->id);
    CHECK(!first->external_id.has_value());
    CHECK(!second->external_id.has_value());
}

TEST_CASE("same name with different external ids is allowed")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    CHECK(reg->register_user("r2", "Carol").has_value());
    CHECK(reg->register_user("r3", "Carol").has_value());
    CHECK(reg->count() == 2);
}

TEST_CASE("exact duplicate pair reports the external id conflict")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    REQUIRE(reg->register_user("r4", "Dave").has_value());
    auto second = reg->register_user("r4", "Dave");

    REQUIRE(!second.has_value());
    CHECK(second.error() == Errc::DuplicateExternalId);
}

TEST_CASE("empty external id is a present value")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    REQUIRE(reg->register_user("", "Erin").has_value());
    auto second = reg->register_user("", "Frank");

    REQUIRE(!second.has_value());
    CHECK(second.error() == Errc::DuplicateExternalId);
    CHECK(reg->find_by_external_id("").has_value());
}

TEST_CASE("empty display name is rejected before any write")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    auto res = reg->register_user("r5", "");

    REQUIRE(!res.has_value());
    CHECK(res.error() == Errc::InvalidInput);
    CHECK(reg->count() == 0);
    CHECK(reg->find_by_external_id("r5").error() == Errc::NotFound);
}

TEST_CASE("find_by_external_id is an exact match")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    REQUIRE(reg->register_user("abc", "Grace").has_value());

    CHECK(reg->find_by_external_id("abc")->display_name == "Grace");
    CHECK(reg->find_by_external_id("ab").error() == Errc::NotFound);
    CHECK(reg->find_by_external_id("ABC").error() == Errc::NotFound);
    CHECK(reg->find_by_external_id("nonexistent").error() == Errc::NotFound);
}

TEST_CASE("records without an external id are not found by external id")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    REQUIRE(reg->register_user(std::nullopt, "Heidi").has_value());

    CHECK(reg->find_by_external_id("").error() == Errc::NotFound);
}

TEST_CASE("find_by_id returns the stored record")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    auto rec = reg->register_user("r6", "Ivan");
    REQUIRE(rec.has_value());

    auto found = reg->find_by_id(rec->id);
    REQUIRE(found.has_value());
    CHECK(found->external_id == "r6");
    CHECK(found->display_name == "Ivan");
    CHECK(found->created_at == rec->created_at);

    CHECK(reg->find_by_id(rec->id + 1).error() == Errc::NotFound);
    CHECK(reg->find_by_id(-1).error() == Errc::NotFound);
}

TEST_CASE("find_by_display_name returns the earliest match")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    auto first = reg->register_user("j1", "Judy");
    REQUIRE(first.has_value());
    REQUIRE(reg->register_user("j2", "Judy").has_value());

    auto found = reg->find_by_display_name("Judy");
    REQUIRE(found.has_value());
    CHECK(found->id == first->id);
    CHECK(reg->find_by_display_name("judy").error() == Errc::NotFound);
}

TEST_CASE("find_by_identity prefers the external id and falls back to the name")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    auto legacy = reg->register_user(std::nullopt, "Mallory");
    auto linked = reg->register_user("m1", "Mallory Two");
    REQUIRE(legacy.has_value());
    REQUIRE(linked.has_value());

    CHECK(reg->find_by_identity("m1", "Mallory")->id == linked->id);
    CHECK(reg->find_by_identity("unknown", "Mallory")->id == legacy->id);
    CHECK(reg->find_by_identity("unknown", "Nobody").error() == Errc::NotFound);
}

TEST_CASE("count and display_names follow registration order")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    CHECK(reg->count() == 0);
    CHECK(reg->display_names()->empty());

    REQUIRE(reg->register_user(std::nullopt, "Oscar").has_value());
    REQUIRE(reg->register_user("p1", "Peggy").has_value());
    REQUIRE(reg->register_user("r1", "Oscar").has_value());

    const std::vector<std::string> expected_names{"Oscar", "Peggy", "Oscar"};
    CHECK(reg->count() == 3);
    CHECK(*reg->display_names() == expected_names);
}

TEST_CASE("concurrent registrations of one external id yield a single record")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    constexpr int n_threads = 16;
    std::latch start(n_threads);
    std::atomic<int> ok{0};
    std::atomic<int> dup{0};
    std::atomic<int> other{0};

    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < n_threads; ++i)
        {
            threads.emplace_back([&, i] {
                start.arrive_and_wait();
                auto res = reg->register_user("contested", std::format("Racer {}", i));
                if (res)
                {
                    ++ok;
                }
                else if (res.error() == Errc::DuplicateExternalId)
                {
                    ++dup;
                }
                else
                {
                    ++other;
                }
            });
        }
    }

    CHECK(ok == 1);
    CHECK(dup == n_threads - 1);
    CHECK(other == 0);
    CHECK(reg->count() == 1);
}

TEST_CASE("concurrent distinct registrations all succeed with unique ids")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    constexpr int n_threads = 8;
    constexpr int per_thread = 10;
    std::mutex ids_mtx;
    std::set<int64_t> ids;

    {
        std::vector<std::jthread> threads;
        for (int t = 0; t < n_threads; ++t)
        {
            threads.emplace_back([&, t] {
                for (int i = 0; i < per_thread; ++i)
                {
                    auto res = reg->register_user(std::format("t{}-{}", t, i), "Worker");
                    if (res)
                    {
                        std::lock_guard lock(ids_mtx);
                        ids.insert(res->id);
                    }
                    // Readers run alongside the writer.
                    (void)reg->count();
                }
            });
        }
    }

    CHECK(ids.size() == n_threads * per_thread);
    CHECK(reg->count() == n_threads * per_thread);
}

TEST_CASE("records survive reopening a file database")
{
    const fs::path path = fs::temp_directory_path() / "idreg_test_reopen.db";
    fs::remove(path);
    fs::remove(path.string() + "-wal");
    fs::remove(path.string() + "-shm");

    Config::DatabaseCfg cfg;
    cfg.path = path.string();

    int64_t id = 0;
    {
        ThreadPool writer(1);
        auto reg = make_registry(writer, cfg);
        auto rec = reg->register_user("persist", "Trent");
        REQUIRE(rec.has_value());
        id = rec->id;
    }
    {
        ThreadPool writer(1);
        auto reg = make_registry(writer, cfg);
        auto found = reg->find_by_external_id("persist");
        REQUIRE(found.has_value());
        CHECK(found->id == id);

        auto dup = reg->register_user("persist", "Trent");
        REQUIRE(!dup.has_value());
        CHECK(dup.error() == Errc::DuplicateExternalId);
    }

    fs::remove(path);
    fs::remove(path.string() + "-wal");
    fs::remove(path.string() + "-shm");
}

TEST_CASE("registration fails cleanly once the writer is stopped")
{
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    writer.stop();
    auto res = reg->register_user("late", "Victor");

    REQUIRE(!res.has_value());
    CHECK(res.error() == Errc::StorageUnavailable);
    CHECK(is_retryable(res.error()));
}

TEST_CASE("registration queued behind a busy writer fails when the writer stops")
{
    using namespace std::chrono_literals;
    ThreadPool writer(1);
    auto reg = make_registry(writer);

    auto busy = std::async(std::launch::async, [&] {
        return writer.submit([] { std::this_thread::sleep_for(300ms); return true; });
    });
    std::this_thread::sleep_for(50ms);
    auto queued = std::async(std::launch::async, [&] {
        return reg->register_user("queued", "Wendy");
    });
    std::this_thread::sleep_for(50ms);

    writer.stop();

    REQUIRE(queued.wait_for(2s) == std::future_status::ready);
    auto res = queued.get();
    REQUIRE(!res.has_value());
    CHECK(res.error() == Errc::StorageUnavailable);
    CHECK(busy.get().value_or(false));
    CHECK(reg->find_by_external_id("queued").error() == Errc::NotFound);
}
