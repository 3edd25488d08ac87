// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "conversion/runner.h"

int main(int argc, const char** argv) {
    return remora::run_converter(argc, argv);
}
