// This is the single entry point for the siweauth library.
// Include this file to get access to the core public API.

#pragma once

// Orchestrator and its JSON front
#include "siweauth/core/authenticator.hpp"
#include "siweauth/core/auth_api.hpp"
#include "siweauth/core/auth_flow.hpp"
#include "siweauth/core/config.hpp"

// Core data types
#include "siweauth/core/types.hpp"
#include "siweauth/core/siwe/siwe_message.hpp"

// Public interfaces for extension
#include "siweauth/core/interfaces/inonce_store.hpp"
#include "siweauth/core/interfaces/isession_store.hpp"
#include "siweauth/core/interfaces/iwallet_repository.hpp"
#include "siweauth/core/interfaces/igroup_repository.hpp"
#include "siweauth/core/interfaces/ichain_provider.hpp"
#include "siweauth/core/interfaces/iens_resolver.hpp"

// Group strategies
#include "siweauth/core/groups/group_manager.hpp"
#include "siweauth/core/groups/group_registry.hpp"

// Reference implementations
#include "siweauth/core/store/memory_stores.hpp"
#include "siweauth/core/chain/json_rpc_provider.hpp"
#include "siweauth/core/chain/ens_resolver.hpp"

// Utilities
#include "siweauth/core/util/error_types.hpp"
#include "siweauth/core/util/logger.hpp"
