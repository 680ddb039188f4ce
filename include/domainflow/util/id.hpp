#pragma once

#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace domainflow {

struct CampaignTag {};
struct JobTag {};
struct PersonaTag {};
struct ProxyTag {};
struct KeywordSetTag {};

// Phantom-typed identifier; a CampaignId cannot be passed where a JobId is
// expected.
template <typename Tag> class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

private:
  std::string value_;
};

using CampaignId = TypedId<CampaignTag>;
using JobId = TypedId<JobTag>;
using PersonaId = TypedId<PersonaTag>;
using ProxyId = TypedId<ProxyTag>;
using KeywordSetId = TypedId<KeywordSetTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

namespace detail {
[[nodiscard]] auto generate_uuid_v7_like() -> std::string;
} // namespace detail

/// Time-ordered random identifier; lexical order follows creation order.
template <typename Id> [[nodiscard]] auto generate_id() -> Id {
  return Id{detail::generate_uuid_v7_like()};
}

} // namespace domainflow

// `is_avalanching` makes ankerl::unordered_dense use this hash directly
// instead of hashing the object representation.
template <typename Tag> struct std::hash<domainflow::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const domainflow::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<domainflow::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const domainflow::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
