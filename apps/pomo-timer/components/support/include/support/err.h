#pragma once

#include <cstdint>

#include "support/log.h"

namespace pomo {

using pomo_err_t = int32_t;

constexpr pomo_err_t POMO_OK = 0;
constexpr pomo_err_t POMO_FAIL = -1;
constexpr pomo_err_t POMO_ERR_INVALID_ARG = 0x102;
constexpr pomo_err_t POMO_ERR_INVALID_STATE = 0x103;

const char* pomo_err_to_name(pomo_err_t err);

}  // namespace pomo

// Logs `msg` under `tag` and returns the status from the enclosing function
// when `x` does not evaluate to POMO_OK.
#define POMO_RETURN_ON_ERROR(x, tag, msg)                                                   \
    do {                                                                                    \
        const ::pomo::pomo_err_t err_rc_ = (x);                                             \
        if (err_rc_ != ::pomo::POMO_OK) {                                                   \
            POMO_LOGE(tag, "%s (%s)", msg, ::pomo::pomo_err_to_name(err_rc_));              \
            return err_rc_;                                                                 \
        }                                                                                   \
    } while (0)
