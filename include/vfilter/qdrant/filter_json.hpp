// vfilter/qdrant/filter_json.hpp - Qdrant REST JSON for backend filters
#pragma once

#include <nlohmann/json.hpp>

#include "vfilter/qdrant/filter.hpp"

namespace vfilter::qdrant
{

/**
 * Serialize a filter in the Qdrant REST shape.
 *
 * {"must": [...], "should": [...], "must_not": [...]} with empty groups
 * omitted. Field conditions become {"key": k, "match": {...}} or
 * {"key": k, "range": {...}}; nested filters are inlined as filter objects.
 */
[[nodiscard]] nlohmann::json to_json(const Filter & filter);

[[nodiscard]] nlohmann::json to_json(const Condition & condition);

}  // namespace vfilter::qdrant
