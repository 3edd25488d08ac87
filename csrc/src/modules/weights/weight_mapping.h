// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Weight Mapping Base Infrastructure
//
// A weight mapping is a naming schema: it maps structured TensorKeys to concrete
// checkpoint tensor names and back. Model-specific mappings (one for the source
// convention, one for the target runtime) are defined in their model directory
// (models/deepseek_moe/weight_mapping.h). Every entry can be replaced or added
// at run time from a JSON schema file, so no naming convention is hardcoded in
// the conversion stages themselves.

#ifndef REMORA_SRC_MODULES_WEIGHTS_WEIGHT_MAPPING_H
#define REMORA_SRC_MODULES_WEIGHTS_WEIGHT_MAPPING_H

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "modules/weights/tensor_key.h"

namespace remora {

// ============================================================================
// Weight Pattern Types
// ============================================================================

/**
 * @brief One schema entry: a key template and the concrete name template it maps to.
 *
 * Name templates use `{layer}` and `{expert}` as placeholders for the key's indices.
 */
struct WeightPattern {
    TensorKey Key;                  ///< Schema key (Layer and Expert are -1)
    std::string NameTemplate;       ///< Concrete name with placeholders
    std::string Regex;              ///< Regex derived from NameTemplate
    bool Optional = false;          ///< Whether a checkpoint may omit this tensor
    int LayerGroup = -1;            ///< Capture group holding the layer index
    int ExpertGroup = -1;           ///< Capture group holding the expert index

    [[nodiscard]] std::string expand_name(int layer_idx, int expert_idx = -1) const;
};

// ============================================================================
// Base Weight Mapping
// ============================================================================

/**
 * @brief Base class for naming schemas.
 *
 * Derived classes register the patterns of one naming convention in register_patterns().
 */
class BaseWeightMapping {
public:
    virtual ~BaseWeightMapping() = default;

    /**
     * @brief Register all patterns of this naming convention.
     */
    virtual void register_patterns() = 0;

    //! Short name used in messages ("source", "target").
    [[nodiscard]] virtual std::string_view schema_name() const = 0;

    /**
     * @brief Concrete name for @p key, or std::nullopt if the schema does not declare it.
     */
    [[nodiscard]] std::optional<std::string> name_for(const TensorKey& key) const;

    /**
     * @brief Concrete name for @p key.
     *
     * @throws remora::ConfigMismatch if the schema does not declare the key.
     */
    [[nodiscard]] std::string require_name(const TensorKey& key) const;

    [[nodiscard]] bool declares(const TensorKey& key) const;

    /**
     * @brief Parse a concrete tensor name back into its key.
     *
     * @return The concrete key (indices filled in), or std::nullopt if no pattern matches.
     */
    [[nodiscard]] std::optional<TensorKey> match(const std::string& tensor_name) const;

    [[nodiscard]] const WeightPattern* find_pattern(const TensorKey& key) const;

    /**
     * @brief Get all registered patterns (in registration order).
     */
    [[nodiscard]] const std::vector<WeightPattern>& patterns() const { return mPatterns; }

    /**
     * @brief Replace, add or (with a null value) remove entries.
     *
     * @param overrides JSON object mapping schema ids (`attention.kv_proj.weight`) to name
     *        templates, or to `null` to drop the entry.
     *
     * @throws remora::ConfigMismatch on unknown ids, templates with the wrong placeholders,
     *         or templates that collide with another entry.
     */
    void apply_overrides(const nlohmann::json& overrides);

protected:
    /**
     * @brief Register a pattern for a global tensor (exact name).
     */
    void add_pattern(const std::string& name, TensorKey key, bool optional = false);

    /**
     * @brief Register a pattern for per-layer tensors. Use {layer} as placeholder for the layer index.
     */
    void add_layer_pattern(const std::string& name_template, TensorKey key, bool optional = false);

    /**
     * @brief Register a pattern for per-expert tensors. Use {layer} and {expert} as placeholders.
     */
    void add_expert_pattern(const std::string& name_template, TensorKey key, bool optional = false);

private:
    void set_pattern(const std::string& name_template, const TensorKey& key, bool optional);
    void compile();

    static std::string escape_and_replace(const std::string& input, int& layer_group, int& expert_group);

    std::vector<WeightPattern> mPatterns;
    std::vector<std::regex> mCompiledPatterns;
};

/**
 * @brief Apply a schema override file to a pair of mappings.
 *
 * The file holds `{"source": {...}, "target": {...}}`, each an object accepted by
 * BaseWeightMapping::apply_overrides(). Either section may be absent.
 *
 * @throws remora::IOError if the file cannot be opened.
 * @throws remora::ConfigMismatch on malformed content.
 */
void apply_schema_file(const std::string& file_name, BaseWeightMapping& source, BaseWeightMapping& target);

} // namespace remora

#endif // REMORA_SRC_MODULES_WEIGHTS_WEIGHT_MAPPING_H
