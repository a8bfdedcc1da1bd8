#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <abacus/program/program.hpp>
#include <abacus/protocol/account.hpp>
#include <abacus/protocol/transaction.hpp>
#include <abacus/runtime/error.hpp>
#include <abacus/runtime/rent.hpp>

namespace abacus::runtime {

constexpr std::uint64_t max_permitted_data_length = 10ull * 1'024u * 1'024u;

struct bank_options
{
  rent rent_schedule{};
  std::uint64_t lamports_per_signature = 5'000;
};

/*
 * In-memory account store that executes transactions against registered
 * programs. A transaction either commits every account change its
 * instructions made or none of them; the fee is charged either way.
 */
class bank final
{
public:
  explicit bank( bank_options options = {} );
  bank( const bank& ) = delete;
  bank( bank&& )      = delete;
  ~bank()             = default;

  bank& operator=( const bank& ) = delete;
  bank& operator=( bank&& )      = delete;

  void register_program( const protocol::account& id, std::unique_ptr< program::program > program );
  void deposit( const protocol::account& key, std::uint64_t lamports );

  std::optional< protocol::account_info > get_account( const protocol::account& key ) const;
  std::uint64_t minimum_balance( std::size_t data_length ) const noexcept;
  const bank_options& options() const noexcept;

  // Charged once per distinct signer
  result< std::uint64_t > transaction_fee( const protocol::transaction& transaction ) const;
  result< protocol::transaction_receipt > process( const protocol::transaction& transaction );

private:
  using account_map = std::map< protocol::account, protocol::account_info >;

  std::error_code
  execute( account_map& accounts, const protocol::instruction& instruction, std::vector< std::string >& logs );

  bank_options _options;
  account_map _accounts;
  std::map< protocol::account, std::unique_ptr< program::program > > _programs;
};

} // namespace abacus::runtime
