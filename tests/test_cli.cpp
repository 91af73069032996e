#include "view/cli.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

struct Fixture {
    fs::path dir;
    std::string trace;
    std::string config;

    Fixture() {
        dir = fs::temp_directory_path() / "pagesim_cli_test";
        fs::remove_all(dir);
        fs::create_directories(dir);

        trace = (dir / "tiny.trace").string();
        std::ofstream t(trace);
        t << "00001000 R\n00002000 W\n00001000 R\n00003000 R\n";

        config = (dir / "config.txt").string();
        std::ofstream c(config);
        c << "workers 2\n"
          << "log-file " << (dir / "log.txt").string() << "\n"
          << "trace " << trace << "\n";
    }
    ~Fixture() { fs::remove_all(dir); }

    int run(std::vector<std::string> args, std::string& out, std::string& err) {
        args.insert(args.begin(), {"--config", config});
        std::ostringstream o, e;
        CLI cli(args, o, e);
        int code = cli.run();
        out = o.str();
        err = e.str();
        return code;
    }
};

void test_single_run() {
    std::cout << "Running test_single_run..." << std::endl;
    Fixture fx;
    std::string out, err;

    // pages 1, 2(W), 1, 3 with two LRU frames: 3 faults, 1 hit, page 2 written back
    assert(fx.run({"2", "lru", "quiet", fx.trace}, out, err) == 0);
    assert(out.find("total memory frames: 2") != std::string::npos);
    assert(out.find("events in trace:     4") != std::string::npos);
    assert(out.find("total disk reads:    3") != std::string::npos);
    assert(out.find("total disk writes:   1") != std::string::npos);
    assert(out.find("FAULT") == std::string::npos);

    assert(fx.run({"2", "fifo", "debug", fx.trace}, out, err) == 0);
    assert(out.find("FAULT") != std::string::npos);
    std::cout << "test_single_run PASSED" << std::endl;
}

void test_bad_arguments() {
    std::cout << "Running test_bad_arguments..." << std::endl;
    Fixture fx;
    std::string out, err;

    assert(fx.run({"0", "lru", "quiet", fx.trace}, out, err) == 2);
    assert(err.find("Configuration error") != std::string::npos);
    assert(fx.run({"4", "optimal", "quiet", fx.trace}, out, err) == 2);
    assert(fx.run({"4", "lru", "loud", fx.trace}, out, err) == 2);
    assert(fx.run({"4", "lru"}, out, err) == 2);
    assert(fx.run({"4", "lru", "quiet", (fx.dir / "nope.trace").string()}, out, err) == 1);
    assert(err.find("Trace error") != std::string::npos);

    std::ostringstream o, e;
    assert(CLI({}, o, e).run() == 2);
    assert(e.str().find("sweep-step") != std::string::npos);
    std::cout << "test_bad_arguments PASSED" << std::endl;
}

void test_batch_modes() {
    std::cout << "Running test_batch_modes..." << std::endl;
    Fixture fx;
    std::string out, err;

    assert(fx.run({"memory"}, out, err) == 0);
    assert(out.find("tiny") != std::string::npos);
    assert(fx.run({"memory", "writes"}, out, err) == 0);
    assert(fx.run({"memory", "bogus"}, out, err) == 2);

    assert(fx.run({"data", "random"}, out, err) == 0);
    assert(out.find("random") != std::string::npos);
    assert(fx.run({"data"}, out, err) == 0);

    assert(fs::exists(fx.dir / "log.txt"));
    std::cout << "test_batch_modes PASSED" << std::endl;
}

int main() {
    try {
        test_single_run();
        test_bad_arguments();
        test_batch_modes();

        std::cout << "\n========================================" << std::endl;
        std::cout << "All CLI tests PASSED!" << std::endl;
        std::cout << "========================================\n" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
