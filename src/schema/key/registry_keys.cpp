#include <beacon/schema/key/builder.hpp>
#include <beacon/schema/key/registry_keys.hpp>

namespace beacon::schema::key {

namespace {

bytes_t make_ordered_key(std::string_view prefix, uint64_t value) {
  auto b = builder{};
  b.write(prefix).write_ordered(value);
  return b.data;
}

bytes_t make_hashed_key(std::string_view prefix, const hash32_t& hash) {
  auto b = builder{};
  b.write(prefix).write(hash);
  return b.data;
}

}  // namespace

bytes_t make_prefix_key(std::string_view prefix) {
  return make_bytes(prefix);
}

bytes_t make_config_key() {
  return make_bytes(kConfigKey);
}

bytes_t make_treasury_key() {
  return make_bytes(kTreasuryKey);
}

bytes_t make_intent_count_key() {
  return make_bytes(kIntentCountKey);
}

bytes_t make_execution_count_key() {
  return make_bytes(kExecutionCountKey);
}

bytes_t make_event_count_key() {
  return make_bytes(kEventCountKey);
}

bytes_t make_intent_key(intent_id_t intent_id) {
  return make_ordered_key(kIntentKeyPrefix, intent_id);
}

bytes_t make_execution_key(intent_id_t intent_id) {
  return make_ordered_key(kExecutionKeyPrefix, intent_id);
}

bytes_t make_intent_order_key(uint64_t position) {
  return make_ordered_key(kIntentOrderPrefix, position);
}

bytes_t make_execution_order_key(uint64_t position) {
  return make_ordered_key(kExecutionOrderPrefix, position);
}

bytes_t make_submitter_index_prefix(const account_id_t& submitter) {
  return make_hashed_key(kSubmitterIndexPrefix, submitter);
}

bytes_t make_submitter_index_key(const account_id_t& submitter,
                                 uint64_t position) {
  auto b = builder{};
  b.write(kSubmitterIndexPrefix).write(submitter).write_ordered(position);
  return b.data;
}

bytes_t make_submitter_count_key(const account_id_t& submitter) {
  return make_hashed_key(kSubmitterCountPrefix, submitter);
}

bytes_t make_symbol_index_prefix(const symbol_id_t& symbol) {
  return make_hashed_key(kSymbolIndexPrefix, symbol);
}

bytes_t make_symbol_index_key(const symbol_id_t& symbol, uint64_t position) {
  auto b = builder{};
  b.write(kSymbolIndexPrefix).write(symbol).write_ordered(position);
  return b.data;
}

bytes_t make_symbol_count_key(const symbol_id_t& symbol) {
  return make_hashed_key(kSymbolCountPrefix, symbol);
}

bytes_t make_event_key(uint64_t event_id) {
  return make_ordered_key(kEventPrefix, event_id);
}

}  // namespace beacon::schema::key
