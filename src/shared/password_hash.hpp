/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

password_hash.hpp declarations.*/

#pragma once

#include <string>
#include <string_view>

namespace mmq {

// Lowercase hex SHA-256 digest of the input.
std::string Sha256Hex(std::string_view input);

bool ConstantTimeEquals(std::string_view a, std::string_view b);

} // namespace mmq
