#include "support/err.h"

namespace pomo {

const char* pomo_err_to_name(pomo_err_t err) {
    switch (err) {
        case POMO_OK:
            return "POMO_OK";
        case POMO_FAIL:
            return "POMO_FAIL";
        case POMO_ERR_INVALID_ARG:
            return "POMO_ERR_INVALID_ARG";
        case POMO_ERR_INVALID_STATE:
            return "POMO_ERR_INVALID_STATE";
        default:
            return "POMO_ERR_UNKNOWN";
    }
}

}  // namespace pomo
