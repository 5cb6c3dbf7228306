#pragma once

#include <string>

#include "typemaster/types.hpp"

namespace typemaster {

[[nodiscard]] Result summarize(const Session& session);

[[nodiscard]] std::string result_title(const Result& result);
[[nodiscard]] std::string format_result(const Result& result);
[[nodiscard]] std::string format_duration(Seconds duration);

} // namespace typemaster
