#pragma once

#include "general/errors_forward.hpp"
#include <cstdint>
////////////////////////////////////
// LIST OF ERROR CODES            //
////////////////////////////////////
// These codes describe why an operation was not applied.

// REGISTRY REJECTIONS, range [1-99]
// ---------------------------------
// Returned by the ownership registry. A rejected operation
// leaves the registry untouched and emits no event.

// INPUT ERRORS, range [300-399]
// -----------------------------
// Raised while parsing addresses, ids and commands.
#define ADDITIONAL_ERRNO_MAP(XX)                                         \
    XX(0, ENOERROR, "no error")                                          \
    /*001 - 099: Registry rejections*/                                   \
    XX(1, EUNKNOWNTOKEN, "unknown token")                                \
    XX(2, EALREADYMINTED, "token already minted")                        \
    XX(3, EINVRECIPIENT, "invalid recipient")                            \
    XX(4, EINVACCOUNT, "invalid account")                                \
    XX(5, EOWNERMISMATCH, "from is not the token owner")                 \
    XX(6, ESELFTRANSFER, "self transfer not allowed")                    \
    XX(7, ENOTAUTHORIZED, "caller not authorized")                       \
    XX(8, ESELFAPPROVAL, "operator cannot be the caller")                \
    /*300 - 399: Input errors*/                                          \
    XX(300, EBADADDRESS, "invalid address")                              \
    XX(301, EBADTOKENID, "invalid token id")                             \
    XX(302, EBADINTERFACEID, "invalid interface id")                     \
    XX(303, EBADBOOL, "invalid boolean")                                 \
    XX(304, EINV_COMMAND, "unknown command")                             \
    XX(305, EINV_ARGS, "invalid command arguments")

#define ERR_DEFINE(code, name, _) constexpr int32_t name = code;
ADDITIONAL_ERRNO_MAP(ERR_DEFINE)
#undef ERR_DEFINE
