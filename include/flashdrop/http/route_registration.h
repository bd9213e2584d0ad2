#pragma once

#include <memory>

#include "flashdrop/core/config.h"
#include "flashdrop/http/router.h"

namespace flashdrop::upload {
class Assembler;
class ChunkSessionTracker;
}

namespace flashdrop::http {

/// Registers the upload, health and metrics routes into the provided router.
/// GET /files/{file} is served by HttpServer directly because it streams file bodies.
void RegisterDefaultRoutes(Router& router, std::shared_ptr<upload::ChunkSessionTracker> tracker,
                           std::shared_ptr<upload::Assembler> assembler,
                           const core::Config& config);

}  // namespace flashdrop::http
