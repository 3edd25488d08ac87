// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "modules/weights/weight_fusion.h"
#include "utilities/errors.h"
#include "test_utils.h"

using namespace remora;
using namespace testing_utils;

namespace {

ExpertWeights make_expert(long intermediate, long hidden, int output_axis, uint64_t seed,
                          ETensorDType dtype = ETensorDType::FP32) {
    auto shape = [&](long out, long in) {
        return output_axis == 0 ? std::vector<long>{out, in} : std::vector<long>{in, out};
    };
    ExpertWeights w;
    w.Gate = random_tensor(dtype, shape(intermediate, hidden), seed);
    w.Up = random_tensor(dtype, shape(intermediate, hidden), seed + 1);
    w.Down = random_tensor(dtype, shape(hidden, intermediate), seed + 2);
    w.GateName = "gate";
    w.UpName = "up";
    w.DownName = "down";
    return w;
}

} // namespace

TEST_CASE("weight fusion: latent KV merge concatenates along the output axis", "[weights][fusion]") {
    SECTION("in_out layout (hidden, 256) + (hidden, 64)") {
        const long hidden = 8;
        const Tensor kv = random_tensor(ETensorDType::BF16, {hidden, 256}, 1);
        const Tensor rope = random_tensor(ETensorDType::BF16, {hidden, 64}, 2);
        const Tensor merged = merge_projections(kv, "kv", rope, "rope", 1);
        REQUIRE(merged.shape() == std::vector<long>{hidden, 320});
        for (long r = 0; r < hidden; ++r) {
            for (long c = 0; c < 256; ++c) {
                REQUIRE(merged.float_at(r * 320 + c) == kv.float_at(r * 256 + c));
            }
            for (long c = 0; c < 64; ++c) {
                REQUIRE(merged.float_at(r * 320 + 256 + c) == rope.float_at(r * 64 + c));
            }
        }
    }

    SECTION("out_in layout stacks rows") {
        const Tensor kv = iota_tensor({6, 4});
        const Tensor rope = iota_tensor({2, 4}, 100.0f);
        const Tensor merged = merge_projections(kv, "kv", rope, "rope", 0);
        REQUIRE(merged.shape() == std::vector<long>{8, 4});
        REQUIRE(equal_bytes(slice(merged, 0, 0, 6), kv));
        REQUIRE(equal_bytes(slice(merged, 0, 6, 8), rope));
    }
}

TEST_CASE("weight fusion: latent KV merge rejects a hidden-axis mismatch", "[weights][fusion][errors]") {
    const Tensor kv = iota_tensor({6, 4});
    const Tensor rope = iota_tensor({2, 5});
    try {
        (void)merge_projections(kv, "h.0.attn.kv_proj.weight", rope, "h.0.attn.k_rope_proj.weight", 0);
        FAIL("expected ShapeMismatch");
    } catch (const ShapeMismatch& e) {
        const std::string what = e.what();
        REQUIRE(e.tensor() == "h.0.attn.kv_proj.weight");
        REQUIRE(what.find("h.0.attn.k_rope_proj.weight") != std::string::npos);
        REQUIRE(what.find("(6, 4)") != std::string::npos);
        REQUIRE(what.find("(2, 5)") != std::string::npos);
    }

    REQUIRE_THROWS_AS(merge_projections(iota_tensor({6, 4}), "kv", random_tensor(ETensorDType::BF16, {2, 4}, 1),
                                        "rope", 0),
                      ShapeMismatch);
}

TEST_CASE("weight fusion: head interleave orders key then value rows per head", "[weights][fusion]") {
    // 2 heads, 3 key rows (2 kept), 2 value rows, input width 1
    const Tensor k = iota_tensor({6, 1});
    const Tensor v = iota_tensor({4, 1}, 100.0f);
    const Tensor out = interleave_heads(k, "k", v, "v", 2, 3, 2, 2, 0);
    REQUIRE(out.shape() == std::vector<long>{8, 1});
    REQUIRE(to_float_vector(out) == std::vector<float>{0, 1, 100, 101, 3, 4, 102, 103});

    const Tensor k_t = iota_tensor({1, 6});
    const Tensor v_t = iota_tensor({1, 4}, 100.0f);
    const Tensor out_t = interleave_heads(k_t, "k", v_t, "v", 2, 3, 2, 2, 1);
    REQUIRE(out_t.shape() == std::vector<long>{1, 8});
    REQUIRE(to_float_vector(out_t) == to_float_vector(out));

    REQUIRE_THROWS_AS(interleave_heads(k, "k", v, "v", 3, 3, 2, 2, 0), ShapeMismatch);
    REQUIRE_THROWS_AS(interleave_heads(k, "k", v, "v", 2, 3, 4, 2, 0), ShapeMismatch);
}

TEST_CASE("weight fusion: expert padding 512 -> 768 preserves values and zero-fills", "[weights][fusion][padding]") {
    for (int axis : {0, 1}) {
        const long hidden = 4;
        const ExpertWeights expert = make_expert(512, hidden, axis, 7);
        const ExpertWeights padded = pad_expert(expert, 768, axis);

        const auto gate_shape = axis == 0 ? std::vector<long>{768, hidden} : std::vector<long>{hidden, 768};
        const auto down_shape = axis == 0 ? std::vector<long>{hidden, 768} : std::vector<long>{768, hidden};
        REQUIRE(padded.Gate.shape() == gate_shape);
        REQUIRE(padded.Up.shape() == gate_shape);
        REQUIRE(padded.Down.shape() == down_shape);

        // gate/up: intermediate on the output axis; down: on the input axis
        auto check = [](const Tensor& src, const Tensor& dst, int pad_axis) {
            const long rows = dst.Sizes[0];
            const long cols = dst.Sizes[1];
            for (long r = 0; r < rows; ++r) {
                for (long c = 0; c < cols; ++c) {
                    const long idx = pad_axis == 0 ? r : c;
                    const float value = dst.float_at(r * cols + c);
                    if (idx < 512) {
                        REQUIRE(value == src.float_at(r * src.Sizes[1] + c));
                    } else {
                        REQUIRE(value == 0.0f);
                    }
                }
            }
        };
        check(expert.Gate, padded.Gate, axis);
        check(expert.Up, padded.Up, axis);
        check(expert.Down, padded.Down, 1 - axis);
    }
}

TEST_CASE("weight fusion: expert already at the unified size is unchanged", "[weights][fusion][padding]") {
    const ExpertWeights expert = make_expert(12, 4, 0, 3, ETensorDType::BF16);
    const ExpertWeights padded = pad_expert(expert, 12, 0);
    REQUIRE(equal_bytes(padded.Gate, expert.Gate));
    REQUIRE(equal_bytes(padded.Up, expert.Up));
    REQUIRE(equal_bytes(padded.Down, expert.Down));
}

TEST_CASE("weight fusion: padding never truncates", "[weights][fusion][padding][errors]") {
    const ExpertWeights expert = make_expert(16, 4, 0, 3);
    REQUIRE_THROWS_AS(pad_expert(expert, 12, 0), ConfigMismatch);
}

TEST_CASE("weight fusion: inconsistent expert projections are a shape mismatch", "[weights][fusion][errors]") {
    ExpertWeights expert = make_expert(8, 4, 0, 3);
    expert.Down = iota_tensor({4, 6});
    try {
        (void)pad_expert(expert, 12, 0);
        FAIL("expected ShapeMismatch");
    } catch (const ShapeMismatch& e) {
        REQUIRE(e.tensor() == "down");
    }
}

TEST_CASE("weight fusion: stacking 8 experts keeps each slice bit-identical", "[weights][fusion][stacking]") {
    const long hidden = 4;
    std::vector<Tensor> parts;
    std::vector<std::string> names;
    for (int e = 0; e < 8; ++e) {
        parts.push_back(random_tensor(ETensorDType::BF16, {768, hidden}, 40 + e));
        names.push_back("expert." + std::to_string(e));
    }
    const Tensor stacked = stack_tensors(parts, names, "switch_mlp.gate_proj.weight");
    REQUIRE(stacked.shape() == std::vector<long>{8, 768, hidden});
    for (int e = 0; e < 8; ++e) {
        Tensor part = slice(stacked, 0, e, e + 1);
        part.Rank = 2;
        part.Sizes = {768, hidden};
        REQUIRE(equal_bytes(part, parts[e]));
    }
}

TEST_CASE("weight fusion: stacking rejects divergent shapes", "[weights][fusion][stacking][errors]") {
    std::vector<Tensor> parts{iota_tensor({4, 2}), iota_tensor({4, 2}), iota_tensor({3, 2})};
    std::vector<std::string> names{"e0", "e1", "e2"};
    try {
        (void)stack_tensors(parts, names, "stacked");
        FAIL("expected ShapeMismatch");
    } catch (const ShapeMismatch& e) {
        REQUIRE(e.tensor() == "e2");
    }
    REQUIRE_THROWS_AS(stack_tensors({}, {}, "stacked"), ShapeMismatch);
}

TEST_CASE("weight fusion: transpose and constant helpers", "[weights][fusion]") {
    const Tensor m = iota_tensor({2, 3});
    const Tensor t = transpose_matrix(m);
    REQUIRE(t.shape() == std::vector<long>{3, 2});
    REQUIRE(to_float_vector(t) == std::vector<float>{0, 3, 1, 4, 2, 5});
    REQUIRE_THROWS_AS(transpose_matrix(iota_tensor({4})), std::logic_error);

    const Tensor ones = constant_tensor(ETensorDType::BF16, {5}, 1.0f);
    REQUIRE(to_float_vector(ones) == std::vector<float>(5, 1.0f));
}
