#pragma once

#include <beacon/execution/backend.hpp>
#include <beacon/schema/primitives.hpp>
#include <beacon/schema/registry_error_code.hpp>

namespace beacon::execution {

/// Fee balance of the registry. Never negative; only the owner-gated
/// withdrawal path in the registry debits it.
class treasury_account final {
 public:
  treasury_account(encoder_t& encoder, storage_t& storage);

  beacon::schema::amount_t balance() const;
  beacon::schema::amount_t balance(const write_batch_t& batch) const;

  /// Stage a credit of `amount`. Fails with balance_overflow, staging
  /// nothing, when the balance would no longer fit in an amount.
  beacon::schema::registry_error_code deposit(
      const beacon::schema::amount_t& amount,
      write_batch_t& batch);

  /// Checks a withdrawal of `amount` to `to` against the committed balance.
  beacon::schema::registry_error_code check_withdraw(
      const beacon::schema::account_id_t& to,
      const beacon::schema::amount_t& amount) const;

  /// Stage a debit of a previously checked amount.
  void debit(const beacon::schema::amount_t& amount, write_batch_t& batch);

 private:
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace beacon::execution
