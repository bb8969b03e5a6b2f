// SolX Trading SDK - Native Program Instructions Implementation

#include <solx/trading/programs.hpp>
#include <solx/trading/borsh.hpp>
#include <solx/trading/constants.hpp>
#include <solx/trading/crypto.hpp>

namespace solx::trading::programs {

namespace system {

Instruction transfer(const Pubkey& from, const Pubkey& to, uint64_t lamports) {
    Instruction ix;
    ix.program_id = constants::SYSTEM_PROGRAM;
    ix.accounts = {AccountMeta::writable(from, true), AccountMeta::writable(to)};
    ix.data = BorshWriter().u32(2).u64(lamports).take();
    return ix;
}

}  // namespace system

namespace compute_budget {

Instruction set_compute_unit_limit(uint32_t units) {
    return Instruction{constants::COMPUTE_BUDGET_PROGRAM, {}, BorshWriter().u8(2).u32(units).take()};
}

Instruction set_compute_unit_price(uint64_t micro_lamports) {
    return Instruction{constants::COMPUTE_BUDGET_PROGRAM, {}, BorshWriter().u8(3).u64(micro_lamports).take()};
}

Instruction set_loaded_accounts_data_size_limit(uint32_t bytes) {
    return Instruction{constants::COMPUTE_BUDGET_PROGRAM, {}, BorshWriter().u8(4).u32(bytes).take()};
}

}  // namespace compute_budget

namespace token {

Instruction sync_native(const Pubkey& account) {
    return Instruction{constants::TOKEN_PROGRAM, {AccountMeta::writable(account)}, {17}};
}

Instruction close_account(const Pubkey& account, const Pubkey& destination, const Pubkey& owner) {
    return Instruction{
        constants::TOKEN_PROGRAM,
        {AccountMeta::writable(account), AccountMeta::writable(destination),
         AccountMeta::readonly(owner, true)},
        {9}};
}

}  // namespace token

namespace ata {

Instruction create_idempotent(const Pubkey& payer,
                              const Pubkey& wallet,
                              const Pubkey& mint,
                              const Pubkey& token_program) {
    auto address = associated_token_address(wallet, mint, token_program);
    return Instruction{
        constants::ASSOCIATED_TOKEN_PROGRAM,
        {AccountMeta::writable(payer, true),
         AccountMeta::writable(address),
         AccountMeta::readonly(wallet),
         AccountMeta::readonly(mint),
         AccountMeta::readonly(constants::SYSTEM_PROGRAM),
         AccountMeta::readonly(token_program)},
        {1}};
}

}  // namespace ata

std::vector<Instruction> wrap_sol(const Pubkey& wallet, uint64_t lamports) {
    auto wsol_account = associated_token_address(wallet, constants::WSOL_MINT);
    return {
        ata::create_idempotent(wallet, wallet, constants::WSOL_MINT, constants::TOKEN_PROGRAM),
        system::transfer(wallet, wsol_account, lamports),
        token::sync_native(wsol_account),
    };
}

Instruction unwrap_sol(const Pubkey& wallet) {
    auto wsol_account = associated_token_address(wallet, constants::WSOL_MINT);
    return token::close_account(wsol_account, wallet, wallet);
}

}  // namespace solx::trading::programs
