// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

/// The table of all 256 opcode values in order, one row per high nibble.
///
/// EVMCORE_FOR_EACH_OPCODE(D, U) expands D(OPCODE, IDENTIFIER) for every opcode defined in any
/// supported revision, where IDENTIFIER names the implementation in the instr::core namespace,
/// and U(OPCODE) for every opcode value undefined in all of them.
#define EVMCORE_FOR_EACH_OPCODE(D, U) \
    /* 0x00 */                                                                                     \
    D(OP_STOP, stop) D(OP_ADD, add) D(OP_MUL, mul) D(OP_SUB, sub) D(OP_DIV, div)                   \
    D(OP_SDIV, sdiv) D(OP_MOD, mod) D(OP_SMOD, smod) D(OP_ADDMOD, addmod) D(OP_MULMOD, mulmod)     \
    D(OP_EXP, exp) D(OP_SIGNEXTEND, signextend) U(0x0c) U(0x0d) U(0x0e) U(0x0f)                    \
    /* 0x10 */                                                                                     \
    D(OP_LT, lt) D(OP_GT, gt) D(OP_SLT, slt) D(OP_SGT, sgt) D(OP_EQ, eq) D(OP_ISZERO, iszero)      \
    D(OP_AND, and_) D(OP_OR, or_) D(OP_XOR, xor_) D(OP_NOT, not_) D(OP_BYTE, byte)                 \
    D(OP_SHL, shl) D(OP_SHR, shr) D(OP_SAR, sar) U(0x1e) U(0x1f)                                   \
    /* 0x20 */                                                                                     \
    D(OP_KECCAK256, keccak256) U(0x21) U(0x22) U(0x23) U(0x24) U(0x25) U(0x26) U(0x27) U(0x28)     \
    U(0x29) U(0x2a) U(0x2b) U(0x2c) U(0x2d) U(0x2e) U(0x2f)                                        \
    /* 0x30 */                                                                                     \
    D(OP_ADDRESS, address) D(OP_BALANCE, balance) D(OP_ORIGIN, origin) D(OP_CALLER, caller)        \
    D(OP_CALLVALUE, callvalue) D(OP_CALLDATALOAD, calldataload) D(OP_CALLDATASIZE, calldatasize)   \
    D(OP_CALLDATACOPY, calldatacopy) D(OP_CODESIZE, codesize) D(OP_CODECOPY, codecopy)             \
    D(OP_GASPRICE, gasprice) D(OP_EXTCODESIZE, extcodesize) D(OP_EXTCODECOPY, extcodecopy)         \
    D(OP_RETURNDATASIZE, returndatasize) D(OP_RETURNDATACOPY, returndatacopy)                      \
    D(OP_EXTCODEHASH, extcodehash)                                                                 \
    /* 0x40 */                                                                                     \
    D(OP_BLOCKHASH, blockhash) D(OP_COINBASE, coinbase) D(OP_TIMESTAMP, timestamp)                 \
    D(OP_NUMBER, number) D(OP_PREVRANDAO, prevrandao) D(OP_GASLIMIT, gaslimit)                     \
    D(OP_CHAINID, chainid) D(OP_SELFBALANCE, selfbalance) D(OP_BASEFEE, basefee)                   \
    D(OP_BLOBHASH, blobhash) D(OP_BLOBBASEFEE, blobbasefee) U(0x4b) U(0x4c) U(0x4d) U(0x4e)        \
    U(0x4f)                                                                                        \
    /* 0x50 */                                                                                     \
    D(OP_POP, pop) D(OP_MLOAD, mload) D(OP_MSTORE, mstore) D(OP_MSTORE8, mstore8)                  \
    D(OP_SLOAD, sload) D(OP_SSTORE, sstore) D(OP_JUMP, jump) D(OP_JUMPI, jumpi) D(OP_PC, pc)       \
    D(OP_MSIZE, msize) D(OP_GAS, gas) D(OP_JUMPDEST, jumpdest) D(OP_TLOAD, tload)                  \
    D(OP_TSTORE, tstore) D(OP_MCOPY, mcopy) D(OP_PUSH0, push0)                                     \
    /* 0x60 */                                                                                     \
    D(OP_PUSH1, push<1>) D(OP_PUSH2, push<2>) D(OP_PUSH3, push<3>) D(OP_PUSH4, push<4>)            \
    D(OP_PUSH5, push<5>) D(OP_PUSH6, push<6>) D(OP_PUSH7, push<7>) D(OP_PUSH8, push<8>)            \
    D(OP_PUSH9, push<9>) D(OP_PUSH10, push<10>) D(OP_PUSH11, push<11>) D(OP_PUSH12, push<12>)      \
    D(OP_PUSH13, push<13>) D(OP_PUSH14, push<14>) D(OP_PUSH15, push<15>) D(OP_PUSH16, push<16>)    \
    /* 0x70 */                                                                                     \
    D(OP_PUSH17, push<17>) D(OP_PUSH18, push<18>) D(OP_PUSH19, push<19>) D(OP_PUSH20, push<20>)    \
    D(OP_PUSH21, push<21>) D(OP_PUSH22, push<22>) D(OP_PUSH23, push<23>) D(OP_PUSH24, push<24>)    \
    D(OP_PUSH25, push<25>) D(OP_PUSH26, push<26>) D(OP_PUSH27, push<27>) D(OP_PUSH28, push<28>)    \
    D(OP_PUSH29, push<29>) D(OP_PUSH30, push<30>) D(OP_PUSH31, push<31>) D(OP_PUSH32, push<32>)    \
    /* 0x80 */                                                                                     \
    D(OP_DUP1, dup<1>) D(OP_DUP2, dup<2>) D(OP_DUP3, dup<3>) D(OP_DUP4, dup<4>)                    \
    D(OP_DUP5, dup<5>) D(OP_DUP6, dup<6>) D(OP_DUP7, dup<7>) D(OP_DUP8, dup<8>)                    \
    D(OP_DUP9, dup<9>) D(OP_DUP10, dup<10>) D(OP_DUP11, dup<11>) D(OP_DUP12, dup<12>)              \
    D(OP_DUP13, dup<13>) D(OP_DUP14, dup<14>) D(OP_DUP15, dup<15>) D(OP_DUP16, dup<16>)            \
    /* 0x90 */                                                                                     \
    D(OP_SWAP1, swap<1>) D(OP_SWAP2, swap<2>) D(OP_SWAP3, swap<3>) D(OP_SWAP4, swap<4>)            \
    D(OP_SWAP5, swap<5>) D(OP_SWAP6, swap<6>) D(OP_SWAP7, swap<7>) D(OP_SWAP8, swap<8>)            \
    D(OP_SWAP9, swap<9>) D(OP_SWAP10, swap<10>) D(OP_SWAP11, swap<11>) D(OP_SWAP12, swap<12>)      \
    D(OP_SWAP13, swap<13>) D(OP_SWAP14, swap<14>) D(OP_SWAP15, swap<15>) D(OP_SWAP16, swap<16>)    \
    /* 0xa0 */                                                                                     \
    D(OP_LOG0, log<0>) D(OP_LOG1, log<1>) D(OP_LOG2, log<2>) D(OP_LOG3, log<3>)                    \
    D(OP_LOG4, log<4>) U(0xa5) U(0xa6) U(0xa7) U(0xa8) U(0xa9) U(0xaa) U(0xab) U(0xac) U(0xad)     \
    U(0xae) U(0xaf)                                                                                \
    /* 0xb0 */                                                                                     \
    U(0xb0) U(0xb1) U(0xb2) U(0xb3) U(0xb4) U(0xb5) U(0xb6) U(0xb7) U(0xb8) U(0xb9) U(0xba)        \
    U(0xbb) U(0xbc) U(0xbd) U(0xbe) U(0xbf)                                                        \
    /* 0xc0 */                                                                                     \
    U(0xc0) U(0xc1) U(0xc2) U(0xc3) U(0xc4) U(0xc5) U(0xc6) U(0xc7) U(0xc8) U(0xc9) U(0xca)        \
    U(0xcb) U(0xcc) U(0xcd) U(0xce) U(0xcf)                                                        \
    /* 0xd0 */                                                                                     \
    U(0xd0) U(0xd1) U(0xd2) U(0xd3) U(0xd4) U(0xd5) U(0xd6) U(0xd7) U(0xd8) U(0xd9) U(0xda)        \
    U(0xdb) U(0xdc) U(0xdd) U(0xde) U(0xdf)                                                        \
    /* 0xe0 */                                                                                     \
    U(0xe0) U(0xe1) U(0xe2) U(0xe3) U(0xe4) U(0xe5) U(0xe6) U(0xe7) U(0xe8) U(0xe9) U(0xea)        \
    U(0xeb) U(0xec) U(0xed) U(0xee) U(0xef)                                                        \
    /* 0xf0 */                                                                                     \
    D(OP_CREATE, create) D(OP_CALL, call) D(OP_CALLCODE, callcode) D(OP_RETURN, return_)           \
    D(OP_DELEGATECALL, delegatecall) D(OP_CREATE2, create2) U(0xf6) U(0xf7) U(0xf8) U(0xf9)        \
    D(OP_STATICCALL, staticcall) U(0xfb) U(0xfc) D(OP_REVERT, revert) D(OP_INVALID, invalid)       \
    D(OP_SELFDESTRUCT, selfdestruct)

/// Expands to nothing. Use it for the opcode kind the expansion skips.
#define EVMCORE_OPCODE_IGNORED(...)
