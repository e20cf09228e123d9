#include <algorithm>
#include <beacon/schema/key/builder.hpp>
#include <boost/endian/buffers.hpp>
#include <iterator>
#include <ranges>

using namespace beacon::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const hash32_t& hash) {
  return write(std::span<const uint8_t>{hash.data(), hash.size()});
}

builder& builder::write_ordered(const uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  return write(std::span<const uint8_t>{
      reinterpret_cast<const uint8_t*>(buffer.data()), sizeof(buffer)});
}
