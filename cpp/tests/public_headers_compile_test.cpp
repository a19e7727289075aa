#include <gtest/gtest.h>

// This test ensures that every public header compiles cleanly when included
// together (common for downstream users).

#include "sloup/cli/commands.hpp"
#include "sloup/cli/config.hpp"
#include "sloup/cli/options.hpp"
#include "sloup/core/errors.hpp"
#include "sloup/core/models.hpp"
#include "sloup/core/types.hpp"
#include "sloup/db/journal.hpp"
#include "sloup/fs/local_fs.hpp"
#include "sloup/storage/backend.hpp"
#include "sloup/storage/buffer.hpp"
#include "sloup/storage/hashing.hpp"
#include "sloup/storage/manifest_json.hpp"
#include "sloup/storage/swift_client.hpp"
#include "sloup/upload/channel.hpp"
#include "sloup/upload/coordinator.hpp"
#include "sloup/upload/disk_budget.hpp"
#include "sloup/upload/manifest.hpp"
#include "sloup/upload/planner.hpp"
#include "sloup/upload/segment_worker.hpp"
#include "sloup/upload/uploader.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
