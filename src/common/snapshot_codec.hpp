// SPDX-License-Identifier: Apache-2.0
// snapshot_codec.hpp - Kernel snapshot <-> protobuf StateSnapshot. Values are copied unrounded.
#pragma once

#include "common/pong_sim.hpp"
#include "pong.pb.h"

#include <cstdint>
#include <string>

namespace pong::codec {

void to_proto(const pong::sim::Snapshot &snap, const std::string &match_id, uint64_t tick, pong::StateSnapshot &out);
pong::sim::Snapshot from_proto(const pong::StateSnapshot &msg);

} // namespace pong::codec
