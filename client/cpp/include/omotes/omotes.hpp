#pragma once

/**
 * OMOTES C++ SDK
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "errors.hpp"

// Logging and configuration
#include "logging.hpp"
#include "config.hpp"

// Helper utilities
#include "helpers.hpp"

// Workflow parameters and workflow registry
#include "workflow_parameter.hpp"
#include "workflow_type.hpp"

// Job handles and queue topology
#include "job.hpp"
#include "queue_names.hpp"

// Transport
#include "message_bus.hpp"
#include "in_memory_message_bus.hpp"

// Client, orchestrator and worker sessions
#include "omotes_interface.hpp"
#include "orchestrator_interface.hpp"
#include "task_runner.hpp"
#include "worker.hpp"
