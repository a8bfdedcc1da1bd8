#pragma once

#include <cstddef>
#include <cstdint>

namespace abacus::runtime {

struct rent
{
  // Bytes charged for every account on top of its data
  static constexpr std::uint64_t account_storage_overhead = 128;

  std::uint64_t lamports_per_byte_year = 3'480;
  double exemption_threshold           = 2.0;

  std::uint64_t minimum_balance( std::size_t data_length ) const noexcept;
};

} // namespace abacus::runtime
