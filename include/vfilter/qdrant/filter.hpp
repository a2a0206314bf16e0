// vfilter/qdrant/filter.hpp - Backend boolean filter model
//
// Mirrors the Qdrant filter shape: three ordered clause groups whose
// entries are either field conditions or nested filters.
//
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace vfilter::qdrant
{

// ============================================================================
// Field payloads
// ============================================================================

struct MatchKeyword
{
  std::string value;
};

struct MatchInteger
{
  int64_t value = 0;
};

struct MatchBool
{
  bool value = false;
};

struct MatchKeywords
{
  std::vector<std::string> values;
};

struct MatchIntegers
{
  std::vector<int64_t> values;
};

/// Full-text match; the pattern is passed through untouched.
struct MatchText
{
  std::string text;
};

/// Numeric range; unset bounds are open.
struct Range
{
  std::optional<double> lt;
  std::optional<double> lte;
  std::optional<double> gt;
  std::optional<double> gte;
};

using FieldPayload = std::variant<
  MatchKeyword, MatchInteger, MatchBool, MatchKeywords, MatchIntegers, MatchText, Range>;

[[nodiscard]] bool operator==(const MatchKeyword & a, const MatchKeyword & b);
[[nodiscard]] bool operator==(const MatchInteger & a, const MatchInteger & b);
[[nodiscard]] bool operator==(const MatchBool & a, const MatchBool & b);
[[nodiscard]] bool operator==(const MatchKeywords & a, const MatchKeywords & b);
[[nodiscard]] bool operator==(const MatchIntegers & a, const MatchIntegers & b);
[[nodiscard]] bool operator==(const MatchText & a, const MatchText & b);
[[nodiscard]] bool operator==(const Range & a, const Range & b);

struct FieldCondition
{
  std::string key;  ///< Dotted payload path, e.g. "user.profile.name"
  FieldPayload payload;

  [[nodiscard]] bool is_range() const noexcept { return std::holds_alternative<Range>(payload); }
  [[nodiscard]] bool is_match() const noexcept { return !is_range(); }
};

[[nodiscard]] bool operator==(const FieldCondition & a, const FieldCondition & b);

// ============================================================================
// Filter / Condition
// ============================================================================

struct Filter;

/**
 * One entry of a clause group: a field condition or a nested filter.
 *
 * Exactly one of field() and filter() is non-null. Nested filters are
 * shared immutably, so copying a Condition is cheap.
 */
class Condition
{
public:
  [[nodiscard]] static Condition make_field(std::string key, FieldPayload payload);
  [[nodiscard]] static Condition make_nested(Filter filter);

  [[nodiscard]] const FieldCondition * field() const noexcept
  {
    return std::get_if<FieldCondition>(&value_);
  }

  [[nodiscard]] const Filter * filter() const noexcept;

  friend bool operator==(const Condition & a, const Condition & b);

private:
  explicit Condition(FieldCondition field) : value_(std::move(field)) {}
  explicit Condition(std::shared_ptr<const Filter> nested) : value_(std::move(nested)) {}

  std::variant<FieldCondition, std::shared_ptr<const Filter>> value_;
};

struct Filter
{
  std::vector<Condition> must;
  std::vector<Condition> should;
  std::vector<Condition> must_not;

  [[nodiscard]] bool empty() const noexcept
  {
    return must.empty() && should.empty() && must_not.empty();
  }
  [[nodiscard]] size_t condition_count() const noexcept
  {
    return must.size() + should.size() + must_not.size();
  }
};

[[nodiscard]] bool operator==(const Filter & a, const Filter & b);

inline bool operator!=(const Filter & a, const Filter & b) { return !(a == b); }
inline bool operator!=(const Condition & a, const Condition & b) { return !(a == b); }

}  // namespace vfilter::qdrant
