// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdio>
#include <cstdlib>

namespace testing_config {

//! Dimensions of the synthetic checkpoints built by the tests.
struct TestSizeConfig {
    int Layers = 2;
    int Hidden = 16;
    int Heads = 2;
    int Vocab = 32;
    int Experts = 4;
    int Routed = 8;
    int Shared = 12;
};

inline TestSizeConfig& mutable_cfg() {
    static TestSizeConfig cfg{};
    return cfg;
}

inline void set_test_config(const TestSizeConfig& cfg) {
    if(cfg.Routed > cfg.Shared) {
        fprintf(stderr, "ERROR: routed intermediate size must not exceed the shared one\n");
        exit(EXIT_FAILURE);
    }
    if(cfg.Experts < 2) {
        fprintf(stderr, "ERROR: at least two routed experts are needed\n");
        exit(EXIT_FAILURE);
    }
    mutable_cfg() = cfg;
}

inline const TestSizeConfig& get_test_config() {
    return mutable_cfg();
}

} // namespace testing_config
