#pragma once

namespace gate {

constexpr const char* VERSION = "1.0.0";

} // namespace gate
