#include "contract_errors.hpp"
#include <unordered_map>

namespace contract_error {

std::string message(int code) {
    static const std::unordered_map<int, std::string> messages = {
        {Unauthorized, "Unauthorized access"},
        {InvalidTokenMints, "Invalid token mints - ensure correct ordering (smaller pubkey = Token A)"},
        {InvalidRatio, "Invalid pool ratio - ensure one side equals 10^decimals"},
        {SystemPaused, "System is paused - no operations allowed"},
        {PoolPaused, "Pool is paused - no liquidity operations allowed"},
        {AlreadyPaused, "Already paused"},
        {NotPaused, "Not paused"},
        {InvalidOwner, "Invalid owner"},
        {InvalidSystem, "Invalid system account"},
        {InvalidTokenDecimals, "Invalid token decimals"},
        {PoolAlreadyExists, "Pool already exists for this token pair"},
        {PoolNotFound, "Pool not found"},
        {InvalidPoolState, "Invalid pool state"},
        {InvalidTokenAccount, "Invalid token account"},
        {InsufficientFunds, "Insufficient funds for operation"},
        {InvalidFeeRate, "Invalid fee rate"},
        {FeeTooHigh, "Fee exceeds maximum allowed"},
        {InvalidTreasury, "Invalid treasury account"},
        {InvalidAmount, "Invalid amount - must be greater than 0"},
        {InsufficientLiquidity, "Insufficient liquidity in pool"},
        {InvalidLpTokenType, "Invalid LP token type for this operation"},
        {InsufficientLpTokens, "Insufficient LP tokens for withdrawal"},
        {DepositTooSmall, "Deposit amount too small"},
        {WithdrawalTooSmall, "Withdrawal amount too small"},
        {SwapAmountTooSmall, "Swap amount too small"},
        {SlippageExceeded, "Slippage tolerance exceeded"},
        {InvalidSwapDirection, "Invalid swap direction"},
        {InvalidInputAmount, "Invalid input amount"},
        {InvalidMinimumOutput, "Invalid minimum output amount"},
        {PoolSwapsPaused, "Pool swaps are paused"},
        {InvalidAccountOwner, "Invalid account owner"},
        {InvalidMintAuthority, "Invalid mint authority"},
        {InvalidPda, "Invalid PDA derivation"},
        {AccountAlreadyInitialized, "Account already initialized"},
        {AccountNotInitialized, "Account not initialized"},
        {InvalidSigner, "Invalid signer"},
        {InvalidInstruction, "Invalid instruction"},
        {MissingRequiredSignature, "Missing required signature"},
        {InvalidProgramId, "Invalid program ID"},
        {InvalidAccountData, "Invalid account data"},
        {AccountBorrowFailed, "Account borrow failed"},
        {InstructionPackError, "Instruction pack error"}
    };

    auto it = messages.find(code);
    if (it != messages.end()) {
        return it->second;
    }
    return "Unknown error code: " + std::to_string(code);
}

std::string program_log(int code) {
    return "Program log: Error: Custom(" + std::to_string(code) + ") " + message(code);
}

} // namespace contract_error
