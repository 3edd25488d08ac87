// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/weights/weight_mapping.h"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <string_view>

#include <fmt/core.h>

#include "utilities/errors.h"

namespace remora {

namespace {

constexpr std::string_view kLayerPlaceholder = "{layer}";
constexpr std::string_view kExpertPlaceholder = "{expert}";

int count_occurrences(const std::string& haystack, std::string_view needle) {
    int count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

void replace_placeholder(std::string& result, std::string_view placeholder, int value) {
    const auto pos = result.find(placeholder);
    if (pos != std::string::npos) {
        result.replace(pos, placeholder.size(), std::to_string(value));
    }
}

/// Index captured from a tensor name; values that do not fit an int name the tensor.
int parse_index(const std::string& tensor_name, const std::string& digits, std::string_view what) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        throw ConfigMismatch("convert", tensor_name, fmt::format("{} index {} is out of range", what, digits));
    }
    return value;
}

} // namespace

std::string WeightPattern::expand_name(int layer_idx, int expert_idx) const {
    std::string result = NameTemplate;
    replace_placeholder(result, kLayerPlaceholder, layer_idx);
    replace_placeholder(result, kExpertPlaceholder, expert_idx);
    return result;
}

const WeightPattern* BaseWeightMapping::find_pattern(const TensorKey& key) const {
    const TensorKey schema = key.schema_key();
    for (const auto& pattern : mPatterns) {
        if (pattern.Key == schema) return &pattern;
    }
    return nullptr;
}

bool BaseWeightMapping::declares(const TensorKey& key) const {
    return find_pattern(key) != nullptr;
}

std::optional<std::string> BaseWeightMapping::name_for(const TensorKey& key) const {
    if (const auto* pattern = find_pattern(key)) {
        return pattern->expand_name(key.Layer, key.Expert);
    }
    return std::nullopt;
}

std::string BaseWeightMapping::require_name(const TensorKey& key) const {
    if (auto name = name_for(key)) {
        return *name;
    }
    throw ConfigMismatch("schema", key.to_string(),
                         fmt::format("the {} schema has no entry for `{}`", schema_name(), key.schema_id()));
}

std::optional<TensorKey> BaseWeightMapping::match(const std::string& tensor_name) const {
    for (std::size_t i = 0; i < mPatterns.size(); ++i) {
        std::smatch m;
        if (!std::regex_match(tensor_name, m, mCompiledPatterns[i])) continue;

        const auto& pattern = mPatterns[i];
        int layer = -1;
        int expert = -1;
        if (pattern.LayerGroup > 0) layer = parse_index(tensor_name, m[pattern.LayerGroup].str(), "layer");
        if (pattern.ExpertGroup > 0) expert = parse_index(tensor_name, m[pattern.ExpertGroup].str(), "expert");
        return pattern.Key.instantiate(layer, expert);
    }
    return std::nullopt;
}

void BaseWeightMapping::add_pattern(const std::string& name, TensorKey key, bool optional) {
    set_pattern(name, key, optional);
}

void BaseWeightMapping::add_layer_pattern(const std::string& name_template, TensorKey key, bool optional) {
    set_pattern(name_template, key, optional);
}

void BaseWeightMapping::add_expert_pattern(const std::string& name_template, TensorKey key, bool optional) {
    set_pattern(name_template, key, optional);
}

/**
 * @brief Insert or replace the pattern for @p key after checking its placeholders.
 *
 * Global keys take no placeholder, per-layer keys exactly one `{layer}`, per-expert keys
 * one `{layer}` and one `{expert}`. A template already used by a different key is rejected,
 * since parsing names back into keys would become ambiguous.
 */
void BaseWeightMapping::set_pattern(const std::string& name_template, const TensorKey& key, bool optional) {
    const TensorKey schema = key.schema_key();
    const int want_layer = is_per_layer(schema.Block) ? 1 : 0;
    const int want_expert = is_per_expert(schema.Block) ? 1 : 0;
    const int have_layer = count_occurrences(name_template, kLayerPlaceholder);
    const int have_expert = count_occurrences(name_template, kExpertPlaceholder);
    if (have_layer != want_layer || have_expert != want_expert) {
        throw ConfigMismatch("schema", schema.schema_id(),
                             fmt::format("template \"{}\" must contain {} {{layer}} and {} {{expert}} placeholder(s)",
                                         name_template, want_layer, want_expert));
    }
    if (name_template.empty()) {
        throw ConfigMismatch("schema", schema.schema_id(), "empty name template");
    }

    for (const auto& other : mPatterns) {
        if (other.Key != schema && other.NameTemplate == name_template) {
            throw ConfigMismatch("schema", schema.schema_id(),
                                 fmt::format("template \"{}\" is already used by `{}` in the {} schema",
                                             name_template, other.Key.schema_id(), schema_name()));
        }
    }

    WeightPattern p;
    p.Key = schema;
    p.NameTemplate = name_template;
    p.Regex = escape_and_replace(name_template, p.LayerGroup, p.ExpertGroup);
    p.Optional = optional;

    auto existing = std::find_if(mPatterns.begin(), mPatterns.end(),
                                 [&](const WeightPattern& w) { return w.Key == schema; });
    if (existing != mPatterns.end()) {
        *existing = std::move(p);
    } else {
        mPatterns.push_back(std::move(p));
    }
    compile();
}

void BaseWeightMapping::compile() {
    mCompiledPatterns.clear();
    mCompiledPatterns.reserve(mPatterns.size());
    for (const auto& p : mPatterns) {
        mCompiledPatterns.emplace_back(p.Regex);
    }
}

void BaseWeightMapping::apply_overrides(const nlohmann::json& overrides) {
    if (!overrides.is_object()) {
        throw ConfigMismatch("schema", std::string(schema_name()), "override section must be a JSON object");
    }
    for (const auto& [id, value] : overrides.items()) {
        auto key = parse_schema_id(id);
        if (!key) {
            throw ConfigMismatch("schema", id, "not a valid schema id (expected <block>.<projection>.<weight|bias>)");
        }
        if (value.is_null()) {
            std::erase_if(mPatterns, [&](const WeightPattern& w) { return w.Key == *key; });
            compile();
            continue;
        }
        if (!value.is_string()) {
            throw ConfigMismatch("schema", id, "template must be a string or null");
        }
        const auto* current = find_pattern(*key);
        // a new bias entry in a source schema is optional by default
        const bool optional = current ? current->Optional : key->Role == TensorRole::Bias;
        set_pattern(value.get<std::string>(), *key, optional);
    }
}

/**
 * @brief Turn a name template into a regex: metacharacters are escaped, placeholders become `(\d+)`.
 *
 * @param input Name template.
 * @param layer_group Receives the capture group index of `{layer}` (or -1).
 * @param expert_group Receives the capture group index of `{expert}` (or -1).
 */
std::string BaseWeightMapping::escape_and_replace(const std::string& input, int& layer_group, int& expert_group) {
    static constexpr std::string_view kMeta = R"(\^$.|?*+()[]{})";
    std::string result;
    int group = 0;
    layer_group = -1;
    expert_group = -1;
    size_t i = 0;
    while (i < input.size()) {
        if (input.compare(i, kLayerPlaceholder.size(), kLayerPlaceholder) == 0) {
            result += R"((\d+))";
            layer_group = ++group;
            i += kLayerPlaceholder.size();
        } else if (input.compare(i, kExpertPlaceholder.size(), kExpertPlaceholder) == 0) {
            result += R"((\d+))";
            expert_group = ++group;
            i += kExpertPlaceholder.size();
        } else {
            if (kMeta.find(input[i]) != std::string_view::npos) {
                result += '\\';
            }
            result += input[i];
            ++i;
        }
    }
    return result;
}

void apply_schema_file(const std::string& file_name, BaseWeightMapping& source, BaseWeightMapping& target) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw IOError("schema", file_name, "could not open schema file");
    }

    nlohmann::json schema;
    try {
        schema = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigMismatch("schema", file_name, fmt::format("malformed JSON: {}", e.what()));
    }
    if (!schema.is_object()) {
        throw ConfigMismatch("schema", file_name, "schema file must contain a JSON object");
    }
    for (const auto& [section, value] : schema.items()) {
        if (section == "source") {
            source.apply_overrides(value);
        } else if (section == "target") {
            target.apply_overrides(value);
        } else {
            throw ConfigMismatch("schema", file_name, fmt::format("unknown section \"{}\"", section));
        }
    }
}

} // namespace remora
