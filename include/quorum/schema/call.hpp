#pragma once
#include <quorum/schema/primitives.hpp>
#include <cstdint>
#include <variant>

// Schema type: automaton call.
// Envelope the host ledger delivers to the approval automaton: who is calling
// and which operation they invoke.
namespace quorum::schema {

template <uint16_t Version>
struct submit;

template <>
struct submit<1> final {
  uint16_t version{1};
  address_t to{};
  amount_t amount;
};

using submit_t = submit<1>;

template <uint16_t Version>
struct approve;

template <>
struct approve<1> final {
  uint16_t version{1};
  uint64_t proposal_id{};
};

using approve_t = approve<1>;

template <uint16_t Version>
struct revoke;

template <>
struct revoke<1> final {
  uint16_t version{1};
  uint64_t proposal_id{};
};

using revoke_t = revoke<1>;

template <uint16_t Version>
struct cancel_expired;

template <>
struct cancel_expired<1> final {
  uint16_t version{1};
  uint64_t proposal_id{};
};

using cancel_expired_t = cancel_expired<1>;

using call_payload_t =
    std::variant<submit_t, approve_t, revoke_t, cancel_expired_t>;

template <uint16_t Version>
struct call;

template <>
struct call<1> final {
  uint16_t version{1};
  address_t caller{};
  call_payload_t payload{};
};

using call_t = call<1>;

}  // namespace quorum::schema
