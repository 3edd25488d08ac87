// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

#include "utilities/worker_pack.h"

TEST_CASE("worker pack: every task runs exactly once", "[worker_pack]") {
    for (int workers : {1, 3, 8}) {
        std::vector<std::atomic<int>> runs(37);
        run_workers(workers, 37, [&](int, int task) { runs[task]++; });
        for (const auto& r : runs) {
            REQUIRE(r.load() == 1);
        }
    }
}

TEST_CASE("worker pack: rethrows the exception of the lowest failing task", "[worker_pack]") {
    for (int workers : {1, 4}) {
        try {
            run_workers(workers, 16, [](int, int task) {
                if (task == 5 || task == 9) {
                    throw std::runtime_error("task " + std::to_string(task));
                }
            });
            FAIL("expected an exception");
        } catch (const std::runtime_error& e) {
            REQUIRE(std::string(e.what()) == "task 5");
        }
    }
}

TEST_CASE("worker pack: resolve_worker_count clamps to the task count", "[worker_pack]") {
    REQUIRE(resolve_worker_count(4, 2) == 2);
    REQUIRE(resolve_worker_count(1, 10) == 1);
    REQUIRE(resolve_worker_count(-3, 1) == 1);
    REQUIRE(resolve_worker_count(0, 0) == 1);
    REQUIRE(resolve_worker_count(0, 1000) >= 1);
}
