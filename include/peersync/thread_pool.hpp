/// @file thread_pool.hpp
/// @brief The worker pool that runs chunk transfers.

#pragma once

#include <BS_thread_pool.hpp>

namespace peersync {

/// Shared pool type. One pool may serve several transfer engines.
using thread_pool = BS::thread_pool;

}  // namespace peersync
