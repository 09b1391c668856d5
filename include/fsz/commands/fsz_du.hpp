#pragma once

#include <cstdint>

namespace fsz::commands::disk_usage
{

inline constexpr std::uint16_t RevealInFileManager = 2001;
inline constexpr std::uint16_t ParentFolder = 2002;
inline constexpr std::uint16_t RefreshFolder = 2003;

inline constexpr std::uint16_t About = 2100;

inline constexpr std::uint16_t UnitAuto = 2200;
inline constexpr std::uint16_t UnitBytes = 2201;
inline constexpr std::uint16_t UnitKB = 2202;
inline constexpr std::uint16_t UnitMB = 2203;
inline constexpr std::uint16_t UnitGB = 2204;
inline constexpr std::uint16_t UnitTB = 2205;

} // namespace fsz::commands::disk_usage
