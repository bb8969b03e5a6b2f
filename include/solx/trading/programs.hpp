// SolX Trading SDK - Native Program Instructions
// System, Compute Budget, SPL Token and Associated Token Account builders

#pragma once

#include <solx/trading/types.hpp>
#include <vector>

namespace solx::trading::programs {

namespace system {
Instruction transfer(const Pubkey& from, const Pubkey& to, uint64_t lamports);
}  // namespace system

namespace compute_budget {
Instruction set_compute_unit_limit(uint32_t units);
Instruction set_compute_unit_price(uint64_t micro_lamports);
Instruction set_loaded_accounts_data_size_limit(uint32_t bytes);
}  // namespace compute_budget

namespace token {
Instruction sync_native(const Pubkey& account);
Instruction close_account(const Pubkey& account, const Pubkey& destination, const Pubkey& owner);
}  // namespace token

namespace ata {
Instruction create_idempotent(const Pubkey& payer,
                              const Pubkey& wallet,
                              const Pubkey& mint,
                              const Pubkey& token_program);
}  // namespace ata

// ATA create + lamport transfer + sync_native, leaving `lamports` of WSOL in the wallet's ATA
std::vector<Instruction> wrap_sol(const Pubkey& wallet, uint64_t lamports);

// Closes the wallet's WSOL ATA, returning its lamports
Instruction unwrap_sol(const Pubkey& wallet);

}  // namespace solx::trading::programs
