#pragma once

#include "sidecar/common/result.hpp"
#include "sidecar/pipeline/pipeline.hpp"
#include "sidecar/runtime/app.hpp"

#include <functional>

namespace sidecar::cli {

void print_help();
int run_cli(int argc, char **argv);

/// Detached `analyze --background` run. Failures are logged, never returned: the
/// result is always 0, and a session lock taken for a named non-snapshot run is
/// released on every exit path, exceptions included.
int run_background_analysis(const runtime::RuntimeContext &runtime,
                            const std::function<common::Result<pipeline::Pipeline>()> &make_pipeline,
                            const pipeline::PipelineOptions &options, bool notify);

} // namespace sidecar::cli
