#pragma once

#include <quorum/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Notification emitted by the approval automaton (submission, approval,
// revocation, execution, cancellation).
namespace quorum::schema {

inline constexpr std::string_view kSubmissionEvent{"quorum.submission"};
inline constexpr std::string_view kApprovalEvent{"quorum.approval"};
inline constexpr std::string_view kRevocationEvent{"quorum.revocation"};
inline constexpr std::string_view kExecutionEvent{"quorum.execution"};
inline constexpr std::string_view kCancellationEvent{"quorum.cancellation"};

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

inline std::optional<std::string> find_attribute(
    const transaction_event_t& event,
    const std::string_view key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return attribute.value;
    }
  }
  return std::nullopt;
}

}  // namespace quorum::schema
