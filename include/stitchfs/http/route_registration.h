#pragma once

#include <memory>

#include "stitchfs/core/error.h"
#include "stitchfs/http/router.h"

namespace stitchfs::upload {
class Assembler;
class ChunkReceiver;
}

namespace stitchfs::http {

/// Maps an error code onto the response status of its category.
boost::beast::http::status StatusForError(core::ErrorCode code);

/// Registers the server's HTTP routes into the provided router.
void RegisterDefaultRoutes(Router& router, std::shared_ptr<upload::ChunkReceiver> receiver,
                           std::shared_ptr<upload::Assembler> assembler);

}  // namespace stitchfs::http
