#include <beacon/blake3/hash.hpp>
#include <beacon/schema/symbol.hpp>

namespace beacon::schema {

symbol_id_t make_symbol_id(const std::string_view& ticker) {
  return beacon::blake3::hash(ticker);
}

}  // namespace beacon::schema
