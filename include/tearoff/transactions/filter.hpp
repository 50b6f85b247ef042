#pragma once
#include <tearoff/common/result.hpp>
#include <tearoff/schema/component.hpp>
#include <tearoff/transactions/filtered_transaction.hpp>
#include <tearoff/transactions/wire_transaction.hpp>

namespace tearoff::transactions {

/// Tears off every component of `transaction` for which `predicate` is
/// false. Revealing any command also reveals the whole signers group.
/// A predicate matching nothing gives a transaction with no groups that
/// still verifies on its id.
tearoff::common::result<filtered_transaction> build_filtered_transaction(
    const wire_transaction& transaction,
    const tearoff::schema::component_predicate_t& predicate);

}  // namespace tearoff::transactions
