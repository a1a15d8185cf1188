#pragma once

/// Convenience umbrella header for the parcel library.

#include <parcel/columnar/materializer.hpp>
#include <parcel/core/diagnostics.hpp>
#include <parcel/core/entity.hpp>
#include <parcel/core/error.hpp>
#include <parcel/core/type_registry.hpp>
#include <parcel/core/value.hpp>
#include <parcel/engine/cluster.hpp>
#include <parcel/engine/exporter.hpp>
#include <parcel/io/parquet_writer.hpp>
#include <parcel/schema/schema_builder.hpp>
#include <parcel/schema/type_mapping.hpp>
#include <parcel/store/entity_store.hpp>
#include <parcel/store/world.hpp>
