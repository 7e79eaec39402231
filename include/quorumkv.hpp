#pragma once

// Main header that includes everything
#include "quorumkv/raft/node.hpp"
#include "quorumkv/raft/types.hpp"
#include "quorumkv/storage/exceptions.hpp"
#include "quorumkv/kv/store.hpp"
#include "quorumkv/kv/command.hpp"
#include "quorumkv/kv/service.hpp"
#include "quorumkv/config/options.hpp"
