#include "core/response_translator.hpp"

namespace wafgate {

int translate(const Interruption& interruption, int default_status) noexcept {
    if (interruption.action == kActionDeny) {
        if (interruption.status != 0) {
            return interruption.status;
        }
        return kDefaultBlockStatus;
    }
    return default_status;
}

} // namespace wafgate
