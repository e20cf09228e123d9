#include <beacon/common/critical.hpp>
#include <beacon/execution/treasury_account.hpp>
#include <beacon/schema/key/registry_keys.hpp>
#include <limits>

using namespace beacon::schema;

namespace beacon::execution {

treasury_account::treasury_account(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

amount_t treasury_account::balance() const {
  return storage_.get<amount_t>(encoder_, key::make_treasury_key())
      .value_or(amount_t{});
}

amount_t treasury_account::balance(const write_batch_t& batch) const {
  return storage_.get<amount_t>(encoder_, batch, key::make_treasury_key())
      .value_or(amount_t{});
}

registry_error_code treasury_account::deposit(const amount_t& amount,
                                              write_batch_t& batch) {
  auto current = balance(batch);
  if (amount > std::numeric_limits<amount_t>::max() - current) {
    return registry_error_code::balance_overflow;
  }
  batch.put(encoder_, key::make_treasury_key(), amount_t{current + amount});
  return registry_error_code::ok;
}

registry_error_code treasury_account::check_withdraw(
    const account_id_t& to,
    const amount_t& amount) const {
  if (is_zero(to)) {
    return registry_error_code::zero_address;
  }
  if (amount == 0) {
    return registry_error_code::zero_amount;
  }
  if (amount > balance()) {
    return registry_error_code::transfer_failed;
  }
  return registry_error_code::ok;
}

void treasury_account::debit(const amount_t& amount, write_batch_t& batch) {
  auto current = balance(batch);
  if (amount > current) {
    beacon::common::critical("treasury debit exceeds balance");
  }
  batch.put(encoder_, key::make_treasury_key(), amount_t{current - amount});
}

}  // namespace beacon::execution
