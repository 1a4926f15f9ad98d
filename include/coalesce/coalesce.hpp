// ============================================================================
// coalesce/coalesce.hpp - Main Include Header
// ============================================================================
//
// This convenience header includes the complete coalesce library.
// For smaller builds, include individual headers as needed.
//
// USAGE:
// ------
//   #include <coalesce/coalesce.hpp>
//   using namespace coalesce;
//
// ============================================================================

#pragma once

// Core primitives
#include "coalesce/core/check.hpp"
#include "coalesce/core/delegate.hpp"
#include "coalesce/core/error.hpp"
#include "coalesce/core/logging.hpp"
#include "coalesce/core/result.hpp"

// Executors
#include "coalesce/io/executor.hpp"
#include "coalesce/io/thread_pool_executor.hpp"

// Transfers
#include "coalesce/transfer/coalesced_transfer.hpp"
#include "coalesce/transfer/downloader.hpp"
#include "coalesce/transfer/network_job.hpp"
#include "coalesce/transfer/transfer_registry.hpp"
