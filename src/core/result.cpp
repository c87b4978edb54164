// SPDX-License-Identifier: BSD-3-Clause
#include "recede/core/result.hpp"

namespace recede {

std::optional<ExitStatus> exitStatusFromString(std::string_view s) noexcept {
    for (auto status : {ExitStatus::kConverged,
                        ExitStatus::kNotConvergedIterations,
                        ExitStatus::kNotConvergedOutOfTime}) {
        if (toString(status) == s) return status;
    }
    return std::nullopt;
}

}  // namespace recede
