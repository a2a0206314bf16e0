// vfilter/qdrant/filter.cpp - Construction and structural equality
#include "vfilter/qdrant/filter.hpp"

#include <utility>

namespace vfilter::qdrant
{

bool operator==(const MatchKeyword & a, const MatchKeyword & b) { return a.value == b.value; }
bool operator==(const MatchInteger & a, const MatchInteger & b) { return a.value == b.value; }
bool operator==(const MatchBool & a, const MatchBool & b) { return a.value == b.value; }
bool operator==(const MatchKeywords & a, const MatchKeywords & b) { return a.values == b.values; }
bool operator==(const MatchIntegers & a, const MatchIntegers & b) { return a.values == b.values; }
bool operator==(const MatchText & a, const MatchText & b) { return a.text == b.text; }

bool operator==(const Range & a, const Range & b)
{
  return a.lt == b.lt && a.lte == b.lte && a.gt == b.gt && a.gte == b.gte;
}

bool operator==(const FieldCondition & a, const FieldCondition & b)
{
  return a.key == b.key && a.payload == b.payload;
}

Condition Condition::make_field(std::string key, FieldPayload payload)
{
  return Condition(FieldCondition{std::move(key), std::move(payload)});
}

Condition Condition::make_nested(Filter filter)
{
  return Condition(std::make_shared<const Filter>(std::move(filter)));
}

const Filter * Condition::filter() const noexcept
{
  const auto * nested = std::get_if<std::shared_ptr<const Filter>>(&value_);
  return nested != nullptr ? nested->get() : nullptr;
}

bool operator==(const Condition & a, const Condition & b)
{
  if (const FieldCondition * fa = a.field()) {
    const FieldCondition * fb = b.field();
    return fb != nullptr && *fa == *fb;
  }
  const Filter * na = a.filter();
  const Filter * nb = b.filter();
  return na != nullptr && nb != nullptr && *na == *nb;
}

bool operator==(const Filter & a, const Filter & b)
{
  return a.must == b.must && a.should == b.should && a.must_not == b.must_not;
}

}  // namespace vfilter::qdrant
