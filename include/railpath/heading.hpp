#pragma once
#include <optional>
#include <string_view>
#include <vector>

namespace railpath {

// Midspin: no turning geometry, inherits the predecessor's heading.
inline constexpr double kMidspin = 999.0;

// Reserved path codes '5'..'8' decode to these; they are not valid headings.
inline constexpr double kReservedSentinels[] = {555.0, 666.0, 777.0, 888.0};

inline bool is_midspin(double heading) { return heading == kMidspin; }
bool is_reserved_sentinel(double heading);

// Path code character -> heading in degrees (or a sentinel). nullopt if the
// character is not in the table.
std::optional<double> decode_path_code(char c);

// Decodes a whole path string. On failure returns nullopt and, if bad_pos is
// given, the offset of the first undecodable character.
std::optional<std::vector<double>> decode_path_data(std::string_view path,
                                                    std::size_t* bad_pos = nullptr);

} // namespace railpath
