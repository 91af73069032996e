#include "kernel/batch_runner.hpp"
#include "data_structures/channel.hpp"
#include "view/reporter.hpp"
#include "config.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;

static fs::path scratch_dir() {
    fs::path dir = fs::temp_directory_path() / "pagesim_batch_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static std::string write_trace(const fs::path& dir, const std::string& name, const std::string& body) {
    fs::path path = dir / name;
    std::ofstream out(path);
    out << body;
    return path.string();
}

void test_channel_close() {
    std::cout << "Running test_channel_close..." << std::endl;
    Channel<int> ch;
    assert(ch.send(1));
    assert(ch.send(2));
    ch.close();
    assert(!ch.send(3));
    assert(ch.isClosed());

    assert(ch.receive().value() == 1);
    assert(ch.receive().value() == 2);
    assert(!ch.receive().has_value());

    // A blocked receiver is released by close
    Channel<int> idle;
    std::thread waiter([&] { assert(!idle.receive().has_value()); });
    idle.close();
    waiter.join();
    std::cout << "test_channel_close PASSED" << std::endl;
}

void test_data_mode_isolates_bad_trace() {
    std::cout << "Running test_data_mode_isolates_bad_trace..." << std::endl;
    fs::path dir = scratch_dir();

    Config cfg;
    cfg.frames = 2;
    cfg.workers = 3;
    cfg.traces = {
        write_trace(dir, "alpha.trace", "1000 R\n2000 W\n1000 R\n3000 R\n2000 R\n"),
        (dir / "missing.trace").string(),
        write_trace(dir, "beta.trace", "1000 R\n2000 R\n3000 R\n4000 R\n1000 W\n"),
        write_trace(dir, "broken.trace", "1000 R\nnonsense here\n"),
    };

    auto traces = load_traces(cfg.traces, cfg.page_shift);
    assert(traces.size() == 4);
    assert(traces[0].trace && traces[2].trace);
    assert(!traces[1].trace && !traces[1].error.empty());
    assert(!traces[3].trace && !traces[3].error.empty());

    BatchRunner runner(cfg, traces);
    auto outcomes = runner.run_data(all_policies());
    assert(outcomes.size() == 12);

    for (size_t i = 0; i < outcomes.size(); i++) {
        const auto& o = outcomes[i];
        assert(o.trace_index == i / 3);
        assert(o.policy == all_policies()[i % 3]);

        if (o.trace_index == 1 || o.trace_index == 3) {
            assert(!o.ok());
            assert(!o.result.has_value());
        } else {
            assert(o.ok());
            auto expected = simulate(*traces[o.trace_index].trace, o.policy, cfg.frames, cfg.seed);
            assert(*o.result == expected);
            assert(o.sweep.empty());
        }
    }
    assert(outcomes[0].trace_id == "alpha");
    assert(outcomes[3].trace_id == "missing");
    fs::remove_all(dir);
    std::cout << "test_data_mode_isolates_bad_trace PASSED" << std::endl;
}

void test_memory_mode() {
    std::cout << "Running test_memory_mode..." << std::endl;
    fs::path dir = scratch_dir();

    Config cfg;
    cfg.workers = 2;
    cfg.traces = {
        write_trace(dir, "alt.trace", "1000 R\n2000 R\n1000 R\n2000 R\n1000 R\n2000 R\n"),
        write_trace(dir, "empty.trace", "# no references\n"),
    };
    BatchRunner runner(cfg, load_traces(cfg.traces, cfg.page_shift));
    auto outcomes = runner.run_memory(all_policies(), MemoryCriterion::NO_CAPACITY_FAULTS);
    assert(outcomes.size() == 6);
    for (size_t i = 0; i < 3; i++) {
        assert(outcomes[i].ok());
        assert(outcomes[i].result->frames == 2);
    }
    for (size_t i = 3; i < 6; i++)
        assert(!outcomes[i].ok());

    Reporter reporter(cfg);
    std::string report = reporter.build_memory_report(outcomes);
    assert(report.find("alt") != std::string::npos);
    assert(report.find("ERROR") != std::string::npos);
    fs::remove_all(dir);
    std::cout << "test_memory_mode PASSED" << std::endl;
}

void test_sweep_and_csv() {
    std::cout << "Running test_sweep_and_csv..." << std::endl;
    fs::path dir = scratch_dir();

    Config cfg;
    cfg.frames = 1;
    cfg.workers = 1;
    cfg.sweep_step = 1;
    cfg.out_dir = (dir / "out").string();
    cfg.traces = {
        write_trace(dir, "rw.trace", "1000 W\n2000 W\n3000 W\n1000 R\n2000 R\n3000 R\n"),
    };
    auto traces = load_traces(cfg.traces, cfg.page_shift);

    auto series = sweep_frames(*traces[0].trace, PolicyKind::LRU, 1, cfg.seed);
    assert(series.size() == 3);
    assert(series[0].frames == 1 && series[0].write_backs > 0);
    assert(series.back().frames == 3 && series.back().write_backs == 0);

    BatchRunner runner(cfg, traces);
    auto outcomes = runner.run_data({PolicyKind::FIFO});
    assert(outcomes.size() == 1);
    assert(outcomes[0].sweep.size() == 3);

    Reporter reporter(cfg);
    auto written = reporter.write_sweep_csvs(outcomes);
    assert(written.size() == 1);
    assert(fs::path(written[0]).filename().string() == "rw-fifo.csv");

    std::ifstream csv(written[0]);
    std::string header;
    std::getline(csv, header);
    assert(header.find("\"frames\"") == 0);
    size_t rows = 0;
    std::string line;
    while (std::getline(csv, line)) rows++;
    assert(rows == 3);
    fs::remove_all(dir);
    std::cout << "test_sweep_and_csv PASSED" << std::endl;
}

int main() {
    try {
        test_channel_close();
        test_data_mode_isolates_bad_trace();
        test_memory_mode();
        test_sweep_and_csv();

        std::cout << "\n========================================" << std::endl;
        std::cout << "All BatchRunner tests PASSED!" << std::endl;
        std::cout << "========================================\n" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
