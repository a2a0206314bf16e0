// vfilter/qdrant/filter_json.cpp
#include "vfilter/qdrant/filter_json.hpp"

#include <type_traits>

namespace vfilter::qdrant
{
namespace
{

using nlohmann::json;

json j_range(const Range & r)
{
  json j = json::object();
  if (r.lt) j["lt"] = *r.lt;
  if (r.lte) j["lte"] = *r.lte;
  if (r.gt) j["gt"] = *r.gt;
  if (r.gte) j["gte"] = *r.gte;
  return j;
}

json j_field(const FieldCondition & field)
{
  json j{{"key", field.key}};
  std::visit(
    [&j](const auto & p) {
      using T = std::decay_t<decltype(p)>;
      if constexpr (std::is_same_v<T, Range>) {
        j["range"] = j_range(p);
      } else if constexpr (std::is_same_v<T, MatchKeywords> || std::is_same_v<T, MatchIntegers>) {
        j["match"] = json{{"any", p.values}};
      } else if constexpr (std::is_same_v<T, MatchText>) {
        j["match"] = json{{"text", p.text}};
      } else {
        j["match"] = json{{"value", p.value}};
      }
    },
    field.payload);
  return j;
}

json j_group(const std::vector<Condition> & group)
{
  json arr = json::array();
  for (const auto & c : group) {
    arr.push_back(to_json(c));
  }
  return arr;
}

}  // namespace

json to_json(const Condition & condition)
{
  if (const FieldCondition * field = condition.field()) {
    return j_field(*field);
  }
  if (const Filter * nested = condition.filter()) {
    return to_json(*nested);
  }
  return nullptr;
}

json to_json(const Filter & filter)
{
  json j = json::object();
  if (!filter.must.empty()) j["must"] = j_group(filter.must);
  if (!filter.should.empty()) j["should"] = j_group(filter.should);
  if (!filter.must_not.empty()) j["must_not"] = j_group(filter.must_not);
  return j;
}

}  // namespace vfilter::qdrant
