#pragma once

/// @file quarry.hpp
/// @brief Convenience header that pulls in the whole public API.

#include "quarry/version.hpp"

#include "quarry/core/result.hpp"

#include "quarry/foundation/config_manager.hpp"
#include "quarry/foundation/error_code.hpp"
#include "quarry/foundation/orm_error.hpp"
#include "quarry/foundation/orm_logger.hpp"
#include "quarry/foundation/orm_result.hpp"

#include "quarry/database/adapter_factory.hpp"
#include "quarry/database/database_adapter.hpp"
#include "quarry/database/database_config.hpp"
#include "quarry/database/query_types.hpp"
#include "quarry/database/schema_types.hpp"
#include "quarry/database/value.hpp"

#include "quarry/query/extensions.hpp"
#include "quarry/query/macro_registry.hpp"
#include "quarry/query/query_builder.hpp"

#include "quarry/orm/attribute_cast.hpp"
#include "quarry/orm/database.hpp"
#include "quarry/orm/factory.hpp"
#include "quarry/orm/model.hpp"
#include "quarry/orm/model_base.hpp"
#include "quarry/orm/relations/relation_registry.hpp"

#include "quarry/schema/blueprint.hpp"
#include "quarry/schema/migration.hpp"
#include "quarry/schema/migration_runner.hpp"
#include "quarry/schema/schema.hpp"
#include "quarry/schema/seeder.hpp"

#include "quarry/validation/presence_verifier.hpp"
