#include "chunkfs/core/ids.h"

#include <Poco/UUIDGenerator.h>

namespace chunkfs::core {

namespace {
Poco::UUIDGenerator& Generator() { return Poco::UUIDGenerator::defaultGenerator(); }
}  // namespace

std::string GenerateRequestId() { return Generator().createOne().toString(); }

// Version 4 (random) UUID.
std::string GenerateSessionId() { return Generator().createRandom().toString(); }

}  // namespace chunkfs::core
