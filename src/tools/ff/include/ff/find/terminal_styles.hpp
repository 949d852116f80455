#pragma once

#include <string_view>

namespace ff::find::styles
{

inline constexpr std::string_view kNone = "\x1B[0m";
inline constexpr std::string_view kBold = "\x1B[1m";
inline constexpr std::string_view kYellow = "\x1B[33m";
inline constexpr std::string_view kBlue = "\x1B[94m";
inline constexpr std::string_view kGray = "\x1B[37m";

} // namespace ff::find::styles
