#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "recload/monitor.h"
#include "recload/worker_pool.h"
#include "test_support.h"

using namespace recload;
using namespace test_support;

// Every record ends up committed or skipped exactly once, across concurrent loaders.
static void test_counts_across_loaders() {
    constexpr int kLoaders = 8;
    constexpr int kRecords = 25;

    auto cfg = field_id_config();
    cfg->set("skip_existing", "true");

    JobMonitor mon(4);
    auto store = std::make_shared<MemoryStore>();

    uint64_t expected_bytes = 0;
    std::vector<std::unique_ptr<Loader>> loaders;
    for (int i = 0; i < kLoaders; ++i) {
        store->put("u" + std::to_string(i) + "-0", "old");

        std::vector<Record> recs;
        for (int k = 0; k < kRecords; ++k) {
            Record r = make_record("u" + std::to_string(i) + "-" + std::to_string(k),
                                   "<r n='" + std::to_string(k) + "'/>");
            expected_bytes += r.payload.size();
            recs.push_back(r);
        }
        loaders.push_back(make_loader(cfg, &mon, store, recs));
    }

    std::vector<LoadResult> results(kLoaders);
    std::vector<std::thread> ths;
    for (int i = 0; i < kLoaders; ++i) {
        ths.emplace_back([&, i] { results[(size_t)i] = loaders[(size_t)i]->execute(); });
    }
    for (auto& t : ths) t.join();

    for (const auto& r : results) {
        assert(r.outcome == Outcome::Success);
        assert(r.committed == kRecords - 1);
        assert(r.skipped == 1);
    }

    MonitorStats s = mon.snapshot();
    assert(s.records == (uint64_t)(kLoaders * kRecords));
    assert(s.skipped == (uint64_t)kLoaders);
    assert(s.committed == (uint64_t)(kLoaders * (kRecords - 1)));
    assert(s.bytes == expected_bytes);
    assert(s.failed == 0);
    assert(!s.halted);
    assert(s.elapsed_ms >= 0.0);

    assert(store->inserts == kLoaders * (kRecords - 1));
    assert(store->factory_closes == kLoaders);
}

static void test_halt_is_one_shot() {
    JobMonitor mon(1);
    mon.halt(std::make_exception_ptr(FatalError("first")));
    mon.halt(std::make_exception_ptr(FatalError("second")));
    assert(mon.halted());

    MonitorStats s = mon.snapshot();
    assert(s.halted);
    assert(s.halt_reason == "first");
}

static void test_one_concurrent_halt_wins() {
    JobMonitor mon(1);
    std::atomic<int> winners{0};
    std::vector<std::thread> ths;
    for (int i = 0; i < 16; ++i) {
        ths.emplace_back([&, i] {
            if (mon.try_halt(std::make_exception_ptr(FatalError("halt " + std::to_string(i))))) winners.fetch_add(1);
        });
    }
    for (auto& t : ths) t.join();
    assert(winners.load() == 1);
    assert(mon.halted());
    assert(!mon.try_halt(nullptr));
}

static void test_failures_are_counted() {
    JobMonitor mon(1);
    mon.record_failure("a.xml", Error{ErrorCode::IoError, "cannot open a.xml"});
    mon.record_failure("b", Error{ErrorCode::StoreError, "rejected"});

    auto f = mon.failures();
    assert(f.size() == 2);
    assert(f[0].context == "a.xml");
    assert(f[1].error.code == ErrorCode::StoreError);
    assert(mon.snapshot().failed == 2);
}

static void test_plain_file_cleanup_is_ignored() {
    JobMonitor mon(1);
    mon.cleanup("plain.xml", "plain.xml");
    assert(mon.open_archives() == 0);
}

// The start id may turn up after discovery has queued the last unit and closed the pool.
static void test_reset_widens_a_closed_pool() {
    JobMonitor mon(4);
    WorkerPool pool(1, 16);
    mon.attach_pool(&pool);

    std::atomic<bool> release{false};
    for (int i = 0; i < 5; ++i) {
        assert(pool.submit([&] {
            while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }));
    }
    pool.close();

    mon.reset_worker_pool();
    assert(mon.pool_was_reset());
    assert(pool.size() == 4);
    mon.reset_worker_pool();
    assert(pool.size() == 4);

    release.store(true);
    pool.join();
    mon.attach_pool(nullptr);
}

int main() {
    test_counts_across_loaders();
    test_halt_is_one_shot();
    test_one_concurrent_halt_wins();
    test_failures_are_counted();
    test_plain_file_cleanup_is_ignored();
    test_reset_widens_a_closed_pool();

    std::cout << "OK\n";
    return 0;
}
