#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "recload/config.h"
#include "recload/log.h"
#include "recload/monitor.h"
#include "recload/worker_pool.h"
#include "test_support.h"

using namespace recload;
using namespace test_support;

static void test_resume_point_basics() {
    ResumePoint rp;
    assert(!rp.active());
    assert(rp.evaluate("x") == ResumePoint::Decision::Inactive);

    rp.set(std::string("P"));
    assert(rp.active());
    std::string expected;
    assert(rp.evaluate("a", &expected) == ResumePoint::Decision::Mismatch);
    assert(expected == "P");
    assert(rp.evaluate("P") == ResumePoint::Decision::Matched);
    assert(!rp.active());
    assert(!rp.get().has_value());
    assert(rp.evaluate("P") == ResumePoint::Decision::Inactive);

    // empty means "no start id"
    rp.set(std::string(""));
    assert(!rp.active());
}

static void test_sequence_skips_until_match() {
    auto cfg = field_id_config();
    cfg->set("start_id", "P");

    std::ostringstream log_lines;
    set_log_stream(&log_lines);

    RecordingMonitor mon;
    auto store = std::make_shared<MemoryStore>();
    auto loader = make_loader(cfg, &mon, store,
                              {make_record(std::string("a")), make_record(std::string("P")),
                               make_record(std::string("b")), make_record(std::string("P"))});
    LoadResult r = loader->execute();
    set_log_stream(nullptr);

    assert(r.outcome == Outcome::Success);
    assert(r.committed == 3);
    assert(r.skipped == 1);

    assert(mon.skip_reasons.size() == 1);
    assert(mon.skip_reasons[0] == "id a != P");
    assert(mon.resets.load() == 1);
    assert(mon.halts == 0);

    // skipped records are reported too, once each
    assert(mon.added_uris.size() == 4);
    assert(mon.added_uris[0] == "a");
    assert(mon.added_uris[1] == "P");

    // the skipped record never opened a content handle
    assert(store->contents_opened == 3);
    assert(store->contents_closed == 3);
    assert(!store->has("a"));
    assert(store->has("P"));
    assert(store->has("b"));
    assert(store->inserts == 3);

    assert(!cfg->start_id().has_value());
    assert(log_lines.str().find("found START_ID P") != std::string::npos);
}

static void test_start_id_never_found() {
    auto cfg = field_id_config();
    cfg->set("start_id", "missing");

    RecordingMonitor mon;
    auto store = std::make_shared<MemoryStore>();
    auto loader = make_loader(cfg, &mon, store, {make_record(std::string("a")), make_record(std::string("b"))});
    LoadResult r = loader->execute();

    assert(r.outcome == Outcome::Skip);
    assert(r.skipped == 2);
    assert(r.committed == 0);
    assert(mon.resets.load() == 0);
    assert(store->contents_opened == 0);
    assert(cfg->start_id() == std::string("missing"));
}

static void test_exactly_one_match_across_threads() {
    ResumePoint rp(std::string("P"));
    std::atomic<int> matched{0};
    std::atomic<int> mismatched{0};

    std::vector<std::thread> ths;
    for (int i = 0; i < 16; ++i) {
        ths.emplace_back([&, i] {
            for (int k = 0; k < 200; ++k) {
                const std::string id = (k == 100) ? "P" : "t" + std::to_string(i) + "-" + std::to_string(k);
                switch (rp.evaluate(id)) {
                    case ResumePoint::Decision::Matched: matched.fetch_add(1); break;
                    case ResumePoint::Decision::Mismatch: mismatched.fetch_add(1); break;
                    case ResumePoint::Decision::Inactive: break;
                }
            }
        });
    }
    for (auto& t : ths) t.join();

    assert(matched.load() == 1);
    assert(mismatched.load() > 0);
    assert(!rp.active());
}

static void test_concurrent_pool_reset() {
    JobMonitor mon(8);
    WorkerPool pool(1, 16);
    mon.attach_pool(&pool);
    assert(pool.size() == 1);

    std::vector<std::thread> ths;
    for (int i = 0; i < 16; ++i) ths.emplace_back([&] { mon.reset_worker_pool(); });
    for (auto& t : ths) t.join();

    assert(mon.pool_was_reset());
    assert(pool.size() == 8);

    // later resets are no-ops
    mon.reset_worker_pool();
    assert(pool.size() == 8);

    mon.attach_pool(nullptr);
    pool.close();
    pool.join();
}

static void test_configuration_copies_share_resume_point() {
    Configuration a;
    a.set("start_id", "P");
    Configuration b = a;

    assert(&a.resume_point() == &b.resume_point());
    assert(b.resume_point().evaluate("P") == ResumePoint::Decision::Matched);
    assert(!a.start_id().has_value());

    a.set_start_id(std::string("Q"));
    assert(b.start_id() == std::string("Q"));
}

static void test_loaders_share_one_scan() {
    auto cfg = field_id_config();
    cfg->set("start_id", "L2-5");

    JobMonitor mon(4);
    auto store = std::make_shared<MemoryStore>();

    std::vector<std::unique_ptr<Loader>> loaders;
    for (int i = 0; i < 4; ++i) {
        std::vector<Record> recs;
        for (int k = 0; k < 10; ++k) {
            recs.push_back(make_record("L" + std::to_string(i) + "-" + std::to_string(k)));
        }
        loaders.push_back(make_loader(cfg, &mon, store, recs));
    }

    std::vector<LoadResult> results(4);
    std::vector<std::thread> ths;
    for (int i = 0; i < 4; ++i) {
        ths.emplace_back([&, i] { results[(size_t)i] = loaders[(size_t)i]->execute(); });
    }
    for (auto& t : ths) t.join();

    uint64_t committed = 0, skipped = 0;
    for (const auto& r : results) {
        assert(r.outcome == Outcome::Success || r.outcome == Outcome::Skip);
        committed += r.committed;
        skipped += r.skipped;
    }
    assert(committed + skipped == 40);
    // everything before the start id in its own unit was skipped
    assert(results[2].skipped >= 5);
    assert(store->has("L2-5"));
    assert(!store->has("L2-0"));
    assert(mon.pool_was_reset());

    MonitorStats s = mon.snapshot();
    assert(s.records == 40);
    assert(s.skipped == skipped);
    assert(s.committed == committed);
    assert(!cfg->resume_point().active());
}

int main() {
    test_resume_point_basics();
    test_sequence_skips_until_match();
    test_start_id_never_found();
    test_exactly_one_match_across_threads();
    test_concurrent_pool_reset();
    test_configuration_copies_share_resume_point();
    test_loaders_share_one_scan();

    std::cout << "OK\n";
    return 0;
}
