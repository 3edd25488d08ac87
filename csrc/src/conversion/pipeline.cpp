// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "conversion/pipeline.h"

#include <atomic>
#include <filesystem>
#include <set>

#include <fmt/core.h>

#include "config/architecture_config.h"
#include "conversion/logging.h"
#include "models/deepseek_moe/weight_mapping.h"
#include "modules/weights/weight_mapping.h"
#include "modules/weights/weight_schema.h"
#include "utilities/errors.h"
#include "utilities/worker_pack.h"

namespace remora {

ConversionResult convert_checkpoint(const ConversionContext& ctx, const CheckpointMapping& source) {
    const ArchitectureConfig& cfg = ctx.Config;
    cfg.validate();

    ConversionResult result;
    if (uses_target_names(source, ctx.Target)) {
        for (const auto& [name, tensor] : source.tensors()) {
            result.Tensors.insert(name, tensor);
        }
        result.Passthrough = true;
        result.Report.add_info("convert", "", "source already uses target tensor names, passed through unchanged");
    } else {
        LayerOutput globals = convert_globals(ctx, source);

        const int n_layers = cfg.NumLayers;
        const int n_workers = resolve_worker_count(ctx.Threads, n_layers);
        if (ctx.Logger) {
            ctx.Logger->log_verbose(fmt::format("converting {} layers with {} worker(s)", n_layers, n_workers));
        }

        std::vector<LayerOutput> layers(n_layers);
        std::atomic<int> done{0};
        run_workers(n_workers, n_layers, [&](int /*worker*/, int layer) {
            layers[layer] = convert_layer(ctx, source, layer);
            if (ctx.Logger) ctx.Logger->log_progress(++done, n_layers);
        });

        std::set<std::string> consumed = std::move(globals.Consumed);
        result.Tensors.merge(std::move(globals.Tensors));
        result.Report.append(globals.Report);
        for (auto& layer : layers) {
            consumed.insert(layer.Consumed.begin(), layer.Consumed.end());
            result.Tensors.merge(std::move(layer.Tensors));
            result.Report.append(layer.Report);
            layer = LayerOutput{};
        }

        check_unconsumed(ctx, source, consumed, result.Report);
    }

    const ValidationResult validation = check_against_schema(result.Tensors.tensors(), describe_target_schema(cfg, ctx.Target));
    if (!validation.success && ctx.Logger) {
        for (const auto& error : validation.errors) {
            ctx.Logger->log_error("validate", error.tensor, fmt::format("`{}`: {}", error.tensor, error.message));
        }
    }
    throw_on_violation(validation);
    return result;
}

nlohmann::json mapping_info_json(const ConversionContext& ctx, const std::string& source_path,
                                 const ConversionResult& result) {
    const ArchitectureConfig& cfg = ctx.Config;
    return nlohmann::json{
        {"source_file", source_path},
        {"num_layers", cfg.NumLayers},
        {"num_experts", cfg.NumRoutedExperts},
        {"n_shared_experts", cfg.NumSharedExperts},
        {"routed_intermediate_size", cfg.RoutedIntermediateSize},
        {"shared_intermediate_size", cfg.SharedIntermediateSize},
        {"unified_intermediate_size", cfg.unified_intermediate_size()},
        {"total_weights", result.Tensors.size()},
        {"padding_applied", !result.Passthrough && cfg.needs_expert_padding()},
        {"passthrough", result.Passthrough},
        {"weight_layout", std::string(weight_layout_name(cfg.Layout))},
        {"precision_warnings", result.Report.warning_count()},
    };
}

PipelineResult run_pipeline(const PipelineOptions& options, ConversionLogger& logger) {
    for (const auto& file : options.CopyFiles) {
        if (!std::filesystem::is_regular_file(file)) {
            throw IOError("copy", file, "file to copy does not exist");
        }
    }

    ArchitectureConfig config;
    {
        auto section = logger.log_section_start("Loading architecture config");
        config = load_architecture_config(options.ConfigPath);
    }
    logger.log_config(config);

    auto source_mapping = create_source_mapping();
    auto target_mapping = create_target_mapping();
    if (!options.SchemaPath.empty()) {
        apply_schema_file(options.SchemaPath, *source_mapping, *target_mapping);
        logger.log_message(fmt::format("Applied naming schema overrides from {}", options.SchemaPath));
    }
    const ConversionContext ctx{config, *source_mapping, *target_mapping, &logger, options.Threads, options.Strict};

    CheckpointMapping source;
    {
        auto section = logger.log_section_start(fmt::format("Reading {}", options.SourcePath));
        source = read_checkpoint(options.SourcePath);
    }
    logger.log_verbose(fmt::format("{} source tensors", source.size()));

    ConversionResult converted;
    {
        auto section = logger.log_section_start("Converting weights");
        converted = convert_checkpoint(ctx, source);
    }
    if (converted.Passthrough) {
        logger.log_message("Source already uses the target naming schema, tensors are passed through unchanged");
    }

    PipelineResult result;
    result.Output = resolve_output_paths(options.TargetPath);
    result.TensorCount = converted.Tensors.size();
    result.Passthrough = converted.Passthrough;
    {
        auto section = logger.log_section_start(fmt::format("Writing {}", result.Output.WeightsFile));
        write_checkpoint(converted.Tensors, result.Output.WeightsFile);
        write_json_atomic(result.Output.ConfigFile, runtime_config_json(config, converted.Tensors.dominant_dtype()));
        write_json_atomic(result.Output.MappingInfoFile, mapping_info_json(ctx, options.SourcePath, converted));
        for (const auto& file : options.CopyFiles) {
            copy_file_atomic(file, result.Output.Directory);
        }
        if (!options.EmitHashesPath.empty()) {
            write_json_atomic(options.EmitHashesPath, compute_tensor_hashes(converted.Tensors));
        }
    }
    logger.log_message(fmt::format("Wrote {} tensors", result.TensorCount));

    result.Report = std::move(converted.Report);
    converted.Tensors = CheckpointMapping{};
    logger.log_report(result.Report);
    if (!options.ReportPath.empty()) {
        result.Report.save(options.ReportPath);
    }

    if (options.Verify) {
        auto section = logger.log_section_start("Verifying output");
        result.Verification = verify_checkpoint(result.Output.WeightsFile, ctx, source, result.Passthrough,
                                                options.Verification);
        for (const auto& failure : result.Verification->Failures) {
            logger.log_error("verify", "", failure);
        }
    }
    return result;
}

} // namespace remora
