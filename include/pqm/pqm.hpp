#pragma once

/**
 * @file pqm.hpp
 * @brief Umbrella header for the pqm library
 */

#include "pqm/config.hpp"
#include "pqm/dependency_resolver.hpp"
#include "pqm/digest.hpp"
#include "pqm/document_adapter.hpp"
#include "pqm/error.hpp"
#include "pqm/index_store.hpp"
#include "pqm/log.hpp"
#include "pqm/manager.hpp"
#include "pqm/metadata.hpp"
#include "pqm/platform.hpp"
#include "pqm/repository.hpp"
#include "pqm/script_record.hpp"
#include "pqm/storage_manager.hpp"
#include "pqm/types.hpp"

#define PQM_VERSION_MAJOR 0
#define PQM_VERSION_MINOR 1
#define PQM_VERSION_PATCH 0
