#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace beacon::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using symbol_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using price_t = boost::multiprecision::uint256_t;
// Intermediate for products and sums of amounts that may exceed 256 bits.
using wide_amount_t = boost::multiprecision::uint512_t;
using intent_id_t = uint64_t;
using sequence_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

hash32_t make_hash32(const bytes_t& bytes);
/// Parse a 64 digit hex account or symbol id, with or without "0x".
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// True for the all-zero identity, used as the "no account" sentinel.
bool is_zero(const hash32_t& hash);

std::optional<bytes_t> try_from_hex(std::string_view hex);
std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);

}  // namespace beacon::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
