#pragma once
#include <quorum/common/critical.hpp>
#include <quorum/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace quorum::schema::encoding {

struct scale_encoder_tag {};

// Schema types are plain aggregates; the SCALE library encodes them field by
// field in declaration order.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  quorum::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, quorum::schema::bytes_t& out);

  /// Decode trusted bytes (our own store); failure is fatal.
  template <typename T>
  T decode(const quorum::schema::bytes_view_t& bytes);

  /// Decode untrusted bytes; trailing input counts as malformed.
  template <typename T>
  std::optional<T> try_decode(const quorum::schema::bytes_view_t& bytes);
};

template <typename T>
quorum::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    quorum::common::critical("failed to encode SCALE object",
                             encoded.error().message());
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        quorum::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const quorum::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    quorum::common::critical("failed to decode SCALE bytes");
  }
  return std::move(decoded).value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const quorum::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  if (encode(decoded.value()).size() != bytes.size()) {
    return std::nullopt;
  }
  return std::move(decoded).value();
}

}  // namespace quorum::schema::encoding
