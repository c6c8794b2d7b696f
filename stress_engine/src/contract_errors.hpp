#pragma once
#include <string>

// Custom error codes returned by the fixed-ratio trading program
namespace contract_error {

// System and configuration
constexpr int Unauthorized = 1001;
constexpr int InvalidTokenMints = 1002;
constexpr int InvalidRatio = 1003;
constexpr int SystemPaused = 1004;
constexpr int PoolPaused = 1005;
constexpr int AlreadyPaused = 1006;
constexpr int NotPaused = 1007;
constexpr int InvalidOwner = 1008;
constexpr int InvalidSystem = 1009;
constexpr int InvalidTokenDecimals = 1010;

// Pool state
constexpr int PoolAlreadyExists = 1011;
constexpr int PoolNotFound = 1012;
constexpr int InvalidPoolState = 1013;
constexpr int InvalidTokenAccount = 1014;

// Fees
constexpr int InsufficientFunds = 1015;
constexpr int InvalidFeeRate = 1016;
constexpr int FeeTooHigh = 1017;
constexpr int InvalidTreasury = 1018;

// Liquidity
constexpr int InvalidAmount = 1019;
constexpr int InsufficientLiquidity = 1020;
constexpr int InvalidLpTokenType = 1021;
constexpr int InsufficientLpTokens = 1022;
constexpr int DepositTooSmall = 1023;
constexpr int WithdrawalTooSmall = 1024;

// Swaps
constexpr int SwapAmountTooSmall = 1025;
constexpr int SlippageExceeded = 1026;
constexpr int InvalidSwapDirection = 1027;
constexpr int InvalidInputAmount = 1028;
constexpr int InvalidMinimumOutput = 1029;
constexpr int PoolSwapsPaused = 1030;

// Accounts and PDAs
constexpr int InvalidAccountOwner = 1031;
constexpr int InvalidMintAuthority = 1032;
constexpr int InvalidPda = 1033;
constexpr int AccountAlreadyInitialized = 1034;
constexpr int AccountNotInitialized = 1035;
constexpr int InvalidSigner = 1036;

// Program
constexpr int InvalidInstruction = 1037;
constexpr int MissingRequiredSignature = 1038;
constexpr int InvalidProgramId = 1039;
constexpr int InvalidAccountData = 1040;
constexpr int AccountBorrowFailed = 1041;
constexpr int InstructionPackError = 1042;

std::string message(int code);

// Renders a failure the way the program log reports it, e.g.
// "Program log: Error: Custom(1015) Insufficient funds for operation"
std::string program_log(int code);

} // namespace contract_error
