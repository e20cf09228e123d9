#pragma once

#include <array>
#include <beacon/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Schema key type: registry keys.
// Canonical key prefixes and key builders for registry state, the append-only
// indexes, and the event log.
namespace beacon::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kConfigKey{"SYS|STATE|CONFIG"};
inline constexpr std::string_view kTreasuryKey{"SYS|STATE|TREASURY"};
inline constexpr std::string_view kIntentCountKey{"SYS|STATE|INTENT_COUNT"};
inline constexpr std::string_view kExecutionCountKey{
    "SYS|STATE|EXECUTION_COUNT"};
inline constexpr std::string_view kEventCountKey{"SYS|STATE|EVENT_COUNT"};
inline constexpr std::string_view kIntentKeyPrefix{"SYS|STATE|INTENT|"};
inline constexpr std::string_view kExecutionKeyPrefix{"SYS|STATE|EXECUTION|"};
inline constexpr std::string_view kIndexPrefix{"SYS|INDEX|"};
inline constexpr std::string_view kIntentOrderPrefix{"SYS|INDEX|INTENT_ORDER|"};
inline constexpr std::string_view kSubmitterIndexPrefix{
    "SYS|INDEX|SUBMITTER|"};
inline constexpr std::string_view kSubmitterCountPrefix{
    "SYS|INDEX|SUBMITTER_COUNT|"};
inline constexpr std::string_view kSymbolIndexPrefix{"SYS|INDEX|SYMBOL|"};
inline constexpr std::string_view kSymbolCountPrefix{"SYS|INDEX|SYMBOL_COUNT|"};
inline constexpr std::string_view kExecutionOrderPrefix{
    "SYS|INDEX|EXECUTION_ORDER|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline constexpr std::array<std::string_view, 3> kRegistryKeyspaces{
    kStatePrefix, kIndexPrefix, kEventPrefix};

bytes_t make_prefix_key(std::string_view prefix);

bytes_t make_config_key();
bytes_t make_treasury_key();
bytes_t make_intent_count_key();
bytes_t make_execution_count_key();
bytes_t make_event_count_key();

bytes_t make_intent_key(intent_id_t intent_id);
bytes_t make_execution_key(intent_id_t intent_id);

bytes_t make_intent_order_key(uint64_t position);
bytes_t make_execution_order_key(uint64_t position);

bytes_t make_submitter_index_prefix(const account_id_t& submitter);
bytes_t make_submitter_index_key(const account_id_t& submitter,
                                 uint64_t position);
bytes_t make_submitter_count_key(const account_id_t& submitter);

bytes_t make_symbol_index_prefix(const symbol_id_t& symbol);
bytes_t make_symbol_index_key(const symbol_id_t& symbol, uint64_t position);
bytes_t make_symbol_count_key(const symbol_id_t& symbol);

bytes_t make_event_key(uint64_t event_id);

}  // namespace beacon::schema::key
